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
#include "uintBig.h"

namespace xbridge
{
	// Streaming keccak with the original 0x01 padding (ethereum and solana flavor, not SHA-3).
	// The permutation is ethash's keccak-f[1600].
	struct KeccakProcessorBase
	{
		static const uint32_t nSizeWord = sizeof(uint64_t);
		static const uint32_t nSizeState = 25 * nSizeWord;

	protected:

		KeccakProcessorBase();

		void Absorb(const uint8_t* pSrc, uint32_t nSrc, uint32_t nSizeBlock);
		void Squeeze(uint8_t* pRes, uint32_t nBytes, uint32_t nSizeBlock);

	private:
		void XorBlock(uint32_t nSizeBlock);

		uint64_t m_pState[25];
		uint8_t m_pBlock[nSizeState];
		uint32_t m_nBlock; // bytes pending in m_pBlock
	};

	template <uint32_t nBits_>
	struct KeccakProcessor
		:public KeccakProcessorBase
	{
		static const uint32_t nBits = nBits_;
		static const uint32_t nBytes = nBits / 8;
		static const uint32_t nSizeBlock = (1600 - nBits * 2) / 8; // rate

		static_assert(!(nSizeBlock % nSizeWord), "");

		void Write(const void* pSrc, uint32_t nSrc)
		{
			Absorb(static_cast<const uint8_t*>(pSrc), nSrc, nSizeBlock);
		}

		void Write(const Blob& x) { Write(x.p, x.n); }
		void Write(const std::string& s) { Write(s.data(), static_cast<uint32_t>(s.size())); }

		template <uint32_t nBytes_>
		void Write(const uintBig_t<nBytes_>& x) { Write(x.m_pData, x.nBytes); }

		template <typename T>
		KeccakProcessor& operator << (const T& t) { Write(t); return *this; }

		// finalizes the hash, the processor must not be reused
		void Read(uint8_t* pRes)
		{
			Squeeze(pRes, nBytes, nSizeBlock);
		}

		void operator >> (uintBig_t<nBytes>& hv)
		{
			Read(hv.m_pData);
		}
	};

	typedef KeccakProcessor<256> Keccak256;

} // namespace xbridge
