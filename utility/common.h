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

#include <assert.h>
#include <vector>
#include <string>
#include <utility>
#include <cstdint>
#include <memory>
#include <iostream>
#include <algorithm>
#include <type_traits>
#include <stdint.h>
#include <string.h> // memcmp

#ifndef XBRIDGE_VERIFY
#	ifdef  NDEBUG
#		define XBRIDGE_VERIFY(x) ((void)(x))
#	else //  NDEBUG
#		define XBRIDGE_VERIFY(x) assert(x)
#	endif //  NDEBUG
#endif // verify

#ifndef _countof
#	define _countof(_Array) (sizeof(_Array) / sizeof(_Array[0]))
#endif // _countof

inline void memset0(void* p, size_t n) { memset(p, 0, n); }
bool memis0(const void* p, size_t n); // Not constant-time. Must not be used for secret data

template <typename T>
inline void ZeroObject(T& x)
{
	static_assert(std::is_trivially_destructible_v<T>);
	memset0(&x, sizeof(x));
}

#define COMPARISON_VIA_CMP \
	template <typename T> bool operator < (const T& x) const { return cmp(x) < 0; } \
	template <typename T> bool operator > (const T& x) const { return cmp(x) > 0; } \
	template <typename T> bool operator <= (const T& x) const { return cmp(x) <= 0; } \
	template <typename T> bool operator >= (const T& x) const { return cmp(x) >= 0; } \
	template <typename T> bool operator == (const T& x) const { return cmp(x) == 0; } \
	template <typename T> bool operator != (const T& x) const { return cmp(x) != 0; }

namespace xbridge
{
	typedef uint64_t Amount;
	typedef std::vector<uint8_t> ByteBuffer;

	template <uint32_t nBytes_>
	struct uintBig_t;

	struct CorruptionException
	{
		std::string m_sErr;
		// indicates critical unrecoverable corruption of the persistent state. Not derived from std::exception,
		// and should not be caught in the intermediate scopes.
		static void Throw(const char*);
	};

	struct Blob
	{
		const void* p = nullptr;
		uint32_t n = 0;

		Blob() = default;
		Blob(const void* p_, uint32_t n_) :p(p_), n(n_) {}
		Blob(const ByteBuffer& bb);
		Blob(const std::string& s) :p(s.data()), n(static_cast<uint32_t>(s.size())) {}

		template <uint32_t nBytes_>
		Blob(const uintBig_t<nBytes_>& x) :p(x.m_pData), n(x.nBytes) {}

		void Export(ByteBuffer&) const;

		int cmp(const Blob&) const;
		COMPARISON_VIA_CMP
	};
}
