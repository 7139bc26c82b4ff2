// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "merkle.h"

namespace xbridge {
namespace Merkle {

void Interpret(Hash& out, const Hash& hA, const Hash& hB)
{
	Keccak256 hp;
	if (hA < hB)
		hp << hB << hA;
	else
		hp << hA << hB;

	hp >> out;
}

void Interpret(Hash& hash, const Hash& hSibling)
{
	Interpret(hash, hash, hSibling);
}

void Interpret(Hash& hash, const Path& p)
{
	for (Path::const_iterator it = p.begin(); p.end() != it; it++)
		Interpret(hash, *it);
}

/////////////////////////////
// Builder
void Builder::NextLevel(std::vector<Hash>& vOut, const std::vector<Hash>& vIn)
{
	vOut.resize((vIn.size() + 1) >> 1);

	for (size_t i = 0; i < vOut.size(); i++)
	{
		size_t i0 = i << 1;
		if (i0 + 1 < vIn.size())
			Interpret(vOut[i], vIn[i0], vIn[i0 + 1]);
		else
			vOut[i] = vIn[i0];
	}
}

void Builder::get_Root(Hash& hv) const
{
	if (m_vLeafs.empty())
	{
		hv = Zero;
		return;
	}

	std::vector<Hash> vLevel = m_vLeafs, vNext;
	while (vLevel.size() > 1)
	{
		NextLevel(vNext, vLevel);
		vLevel.swap(vNext);
	}

	hv = vLevel.front();
}

void Builder::get_Path(Path& path, size_t iLeaf) const
{
	path.clear();
	if (iLeaf >= m_vLeafs.size())
		return;

	std::vector<Hash> vLevel = m_vLeafs, vNext;
	for (size_t i = iLeaf; vLevel.size() > 1; i >>= 1)
	{
		size_t iSibling = i ^ 1;
		if (iSibling < vLevel.size())
			path.push_back(vLevel[iSibling]);

		NextLevel(vNext, vLevel);
		vLevel.swap(vNext);
	}
}

} // namespace Merkle
} // namespace xbridge
