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

#include "ecdsa.h"
#include <bitcoin/bitcoin.hpp>
#include <ethash/keccak.hpp>

namespace xbridge {
namespace Ecdsa {

namespace
{
	void ToDigest(libbitcoin::hash_digest& hashDigest, const Hash& msg)
	{
		std::copy(std::begin(msg.m_pData), std::end(msg.m_pData), hashDigest.begin());
	}

	bool ExportUncompressed(PubKey& pk, const libbitcoin::ec_uncompressed& point)
	{
		if (0x04 != point[0])
			return false;

		std::copy(point.begin() + 1, point.end(), std::begin(pk.m_pData));
		return true;
	}
}

bool RecoverPublicKey(PubKey& pk, const Hash& msg, const Signature& sig, uint8_t nRecoveryId)
{
	// secp256k1 aborts on an out-of-range recid instead of failing
	if (nRecoveryId > s_RecoveryIdMax)
		return false;

	libbitcoin::recoverable_signature recSig;
	std::copy(std::begin(sig.m_pData), std::end(sig.m_pData), recSig.signature.begin());
	recSig.recovery_id = nRecoveryId;

	libbitcoin::hash_digest hashDigest;
	ToDigest(hashDigest, msg);

	libbitcoin::ec_uncompressed point;
	if (!libbitcoin::recover_public(point, recSig, hashDigest))
		return false;

	return ExportUncompressed(pk, point);
}

bool Sign(Signature& sig, uint8_t& nRecoveryId, const Secret& sk, const Hash& msg)
{
	libbitcoin::ec_secret secretEC;
	std::copy(std::begin(sk.m_pData), std::end(sk.m_pData), secretEC.begin());

	libbitcoin::hash_digest hashDigest;
	ToDigest(hashDigest, msg);

	libbitcoin::recoverable_signature recSig;
	if (!libbitcoin::sign_recoverable(recSig, secretEC, hashDigest))
		return false;

	std::copy(recSig.signature.begin(), recSig.signature.end(), std::begin(sig.m_pData));
	nRecoveryId = recSig.recovery_id;
	return true;
}

bool get_PublicKey(PubKey& pk, const Secret& sk)
{
	libbitcoin::ec_secret secretEC;
	std::copy(std::begin(sk.m_pData), std::end(sk.m_pData), secretEC.begin());

	libbitcoin::ec_uncompressed point;
	if (!libbitcoin::secret_to_public(point, secretEC))
		return false;

	return ExportUncompressed(pk, point);
}

void get_Hash(Hash& hv, const void* p, uint32_t n)
{
	auto hash = ethash::keccak256(reinterpret_cast<const uint8_t*>(p), n);
	std::move(std::begin(hash.bytes), std::end(hash.bytes), std::begin(hv.m_pData));
}

} // namespace Ecdsa
} // namespace xbridge
