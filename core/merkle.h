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

#pragma once
#include "keccak.h"

namespace xbridge {
namespace Merkle {

	typedef uintBig_t<32> Hash;
	typedef std::vector<Hash> Path;

	// Order-free pair hashing: keccak256(max(a,b) || min(a,b)), compared as big-endian numbers
	void Interpret(Hash&, const Hash& hA, const Hash& hB);
	void Interpret(Hash&, const Hash& hSibling);
	void Interpret(Hash&, const Path&);

	// Builds the tree over a batch of leaves, the way relayers do, and extracts per-leaf paths.
	// Odd nodes are promoted to the next level unchanged.
	struct Builder
	{
		std::vector<Hash> m_vLeafs;

		void get_Root(Hash&) const;
		void get_Path(Path&, size_t iLeaf) const;

	private:
		static void NextLevel(std::vector<Hash>& vOut, const std::vector<Hash>& vIn);
	};

} // namespace Merkle
} // namespace xbridge
