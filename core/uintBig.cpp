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

#include "uintBig.h"
#include "../utility/helpers.h"

namespace xbridge {

	namespace
	{
		bool HexFromCh(uint8_t& v, char c)
		{
			if (c >= '0' && c <= '9')
				v = c - '0';
			else
			{
				c |= 0x20; // lowercase
				if (c < 'a' || c > 'f')
					return false;
				v = c - 'a' + 10;
			}
			return true;
		}
	}

	void uintBigImpl::_Print(const uint8_t* pDst, uint32_t nDst, std::ostream& s)
	{
		s << to_hex(pDst, nDst);
	}

	void uintBigImpl::_Print(const uint8_t* pDst, uint32_t nDst, char* sz)
	{
		to_hex(sz, pDst, nDst);
	}

	bool uintBigImpl::_Scan(uint8_t* pDst, uint32_t nDst, const char* sz, uint32_t nTxtLen)
	{
		if (nTxtLen != (nDst << 1))
			return false;

		// parse into a temporary, the destination is left intact on failure
		std::vector<uint8_t> v(nDst);
		for (uint32_t i = 0; i < nDst; i++)
		{
			uint8_t hi, lo;
			if (!HexFromCh(hi, sz[i * 2]) || !HexFromCh(lo, sz[i * 2 + 1]))
				return false;

			v[i] = static_cast<uint8_t>((hi << 4) | lo);
		}

		if (nDst)
			memcpy(pDst, v.data(), nDst);
		return true;
	}

	void uintBigImpl::_Assign(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc)
	{
		// right-aligned: truncates the leading bytes, or pads with leading zeroes
		uint32_t nCopy = std::min(nSrc, nDst);
		memset0(pDst, nDst - nCopy);
		if (nCopy)
			memcpy(pDst + nDst - nCopy, pSrc + nSrc - nCopy, nCopy);
	}

	int uintBigImpl::_Cmp(const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1)
	{
		// the excess leading bytes of the wider operand must be zero for the values to compare by the rest
		if (nSrc0 > nSrc1)
		{
			uint32_t nDiff = nSrc0 - nSrc1;
			if (!memis0(pSrc0, nDiff))
				return 1;
			pSrc0 += nDiff;
		}
		else if (nSrc1 > nSrc0)
		{
			uint32_t nDiff = nSrc1 - nSrc0;
			if (!memis0(pSrc1, nDiff))
				return -1;
			pSrc1 += nDiff;
		}

		return memcmp(pSrc0, pSrc1, std::min(nSrc0, nSrc1));
	}

} // namespace xbridge
