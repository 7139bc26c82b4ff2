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

namespace xbridge {
namespace Ecdsa {

	typedef uintBig_t<32> Hash;
	typedef uintBig_t<32> Secret;
	typedef uintBig_t<64> PubKey; // uncompressed secp256k1 point, without the 0x04 prefix
	typedef uintBig_t<64> Signature; // compact r || s

	static const uint8_t s_RecoveryIdMax = 3;

	// Returns false if the recovery id is out of range, the signature is malformed, or the point is invalid
	bool RecoverPublicKey(PubKey&, const Hash& msg, const Signature&, uint8_t nRecoveryId);

	bool Sign(Signature&, uint8_t& nRecoveryId, const Secret&, const Hash& msg);
	bool get_PublicKey(PubKey&, const Secret&);

	// keccak256 of an arbitrary buffer, the message format used for key rotation and leaves
	void get_Hash(Hash&, const void* p, uint32_t n);

} // namespace Ecdsa
} // namespace xbridge
