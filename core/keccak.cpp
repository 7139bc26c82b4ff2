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

#include "keccak.h"
#include "../utility/byteorder.h"
#include <ethash/keccak.h>

namespace xbridge {

KeccakProcessorBase::KeccakProcessorBase()
	:m_nBlock(0)
{
	ZeroObject(m_pState);
}

void KeccakProcessorBase::XorBlock(uint32_t nSizeBlock)
{
	for (uint32_t i = 0; i < nSizeBlock / nSizeWord; i++)
		m_pState[i] ^= ByteOrder::ImportLE<uint64_t>(m_pBlock + i * nSizeWord);

	ethash_keccakf1600(m_pState);
	m_nBlock = 0;
}

void KeccakProcessorBase::Absorb(const uint8_t* pSrc, uint32_t nSrc, uint32_t nSizeBlock)
{
	while (nSrc)
	{
		uint32_t nPortion = std::min(nSrc, nSizeBlock - m_nBlock);
		memcpy(m_pBlock + m_nBlock, pSrc, nPortion);

		m_nBlock += nPortion;
		pSrc += nPortion;
		nSrc -= nPortion;

		if (nSizeBlock == m_nBlock)
			XorBlock(nSizeBlock);
	}
}

void KeccakProcessorBase::Squeeze(uint8_t* pRes, uint32_t nBytes, uint32_t nSizeBlock)
{
	// m_nBlock < nSizeBlock here, there's always room for the padding
	memset0(m_pBlock + m_nBlock, nSizeBlock - m_nBlock);
	m_pBlock[m_nBlock] = 0x01;
	m_pBlock[nSizeBlock - 1] |= 0x80;

	XorBlock(nSizeBlock);

	for (uint32_t i = 0; i < nBytes / nSizeWord; i++)
		ByteOrder::ExportLE(pRes + i * nSizeWord, m_pState[i]);
}

} // namespace xbridge
