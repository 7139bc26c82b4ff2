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
#include "common.h"

#if !defined(__LITTLE_ENDIAN__) && !defined(__BIG_ENDIAN__)
#	if (defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__) || defined(__AARCH64EB__) || defined(__ARMEB__)
#		define __BIG_ENDIAN__
#	elif (defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__) || defined(_M_IX86) || defined(_M_X64) || defined(_M_ARM) || defined(_M_ARM64)
#		define __LITTLE_ENDIAN__
#	else
#		error can not detect endian-ness
#	endif
#endif

namespace xbridge
{
	// Fixed-width integers in the little-endian layouts of the persistent records and the keccak state
	namespace ByteOrder
	{
		inline uint16_t bswap(uint16_t x) {
#ifdef _MSC_VER
			return _byteswap_ushort(x);
#else
			return __builtin_bswap16(x);
#endif // _MSC_VER
		}

		inline uint32_t bswap(uint32_t x) {
#ifdef _MSC_VER
			return _byteswap_ulong(x);
#else
			return __builtin_bswap32(x);
#endif // _MSC_VER
		}

		inline uint64_t bswap(uint64_t x) {
#ifdef _MSC_VER
			return _byteswap_uint64(x);
#else
			return __builtin_bswap64(x);
#endif // _MSC_VER
		}

		// the conversion is symmetric
		template <typename T>
		inline T le(T x)
		{
#ifdef __LITTLE_ENDIAN__
			return x;
#else // __LITTLE_ENDIAN__
			return bswap(x);
#endif // __LITTLE_ENDIAN__
		}

		// unaligned access
		template <typename T>
		inline void ExportLE(uint8_t* pDst, T x)
		{
			static_assert(std::is_unsigned_v<T>);
			x = le(x);
			memcpy(pDst, &x, sizeof(x));
		}

		template <typename T>
		inline T ImportLE(const uint8_t* pSrc)
		{
			static_assert(std::is_unsigned_v<T>);
			T x;
			memcpy(&x, pSrc, sizeof(x));
			return le(x);
		}
	}
}
