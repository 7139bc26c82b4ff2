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

#include "../uintBig.h"
#include "../keccak.h"
#include "../merkle.h"
#include "../ecdsa.h"
#include "../../utility/test_helpers.h"
#include <sstream>

XBRIDGE_TEST_MAIN_DEFS

namespace xbridge
{
	typedef uintBig_t<32> Hash;

	Hash HashOf(const std::string& s)
	{
		Hash hv;
		Keccak256 hp;
		hp << s;
		hp >> hv;
		return hv;
	}

	bool EqualsHex(const Hash& hv, const char* sz)
	{
		Hash hvExp;
		return hvExp.Scan(sz) && (hvExp == hv);
	}

	void TestKeccak()
	{
		verify_test(EqualsHex(HashOf(""), "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"));
		verify_test(EqualsHex(HashOf("abc"), "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"));
		verify_test(EqualsHex(HashOf("hello"), "1c8aff950685c2ed4bc3174f3472287b56d9517b9c948127319a09a7a36deac8"));

		// multi-block input, fed in uneven portions
		uint8_t pBuf[500];
		for (uint32_t i = 0; i < _countof(pBuf); i++)
			pBuf[i] = static_cast<uint8_t>(i * 7 + 3);

		Hash hvRef;
		Ecdsa::get_Hash(hvRef, pBuf, sizeof(pBuf));

		const uint32_t pPortions[] = { 1, 3, 8, 13, 64, 135, 136, 137 };
		for (uint32_t nPortion : pPortions)
		{
			Keccak256 hp;
			for (uint32_t nDone = 0; nDone < sizeof(pBuf); )
			{
				uint32_t n = std::min<uint32_t>(nPortion, sizeof(pBuf) - nDone);
				hp.Write(pBuf + nDone, n);
				nDone += n;
			}

			Hash hv;
			hp >> hv;
			verify_test(hv == hvRef);
		}

		// exact block boundary
		Hash hv;
		Keccak256 hp;
		hp.Write(pBuf, Keccak256::nSizeBlock);
		hp >> hv;

		Ecdsa::get_Hash(hvRef, pBuf, Keccak256::nSizeBlock);
		verify_test(hv == hvRef);
	}

	void TestUintBig()
	{
		Hash a = Zero, b = Zero;
		verify_test(a == Zero);
		verify_test(a == b);

		b.m_pData[31] = 1;
		verify_test(b != Zero);
		verify_test(a < b);

		a.m_pData[0] = 1; // big-endian: the first byte dominates
		verify_test(a > b);

		uint64_t val = 0;
		verify_test(b.ExportSafe(val) && (1 == val));
		verify_test(!a.ExportSafe(val));

		Hash c = uint64_t(0x0102030405060708ULL);
		verify_test(c.m_pData[24] == 1);
		verify_test(c.m_pData[31] == 8);
		verify_test(c.ExportSafe(val) && (0x0102030405060708ULL == val));

		// different widths compare numerically
		uintBig_t<8> d = uint64_t(0x0102030405060708ULL);
		verify_test(!c.cmp(d));

		Hash e;
		verify_test(e.Scan(("0x" + c.str()).c_str()));
		verify_test(e == c);
		verify_test(e.Scan(c.str().c_str()));
		verify_test(!e.Scan("0x1234"));
		verify_test(!e.Scan(std::string(64, 'g').c_str()));
		verify_test(e == c); // untouched on failure

		verify_test(e.Scan(std::string(64, 'F').c_str()));
		verify_test(e.str() == std::string(64, 'f'));

		std::ostringstream os;
		os << c;
		verify_test(os.str() == c.str());
		verify_test(os.str().size() == Hash::nTxtLen);
	}

	void TestMerkle()
	{
		Hash h1 = HashOf("leaf1"), h2 = HashOf("leaf2"), h3 = HashOf("leaf3");

		// the pair is hashed greater-first, regardless of the argument order
		Hash hvA, hvB, hvExp;
		Merkle::Interpret(hvA, h1, h2);
		Merkle::Interpret(hvB, h2, h1);
		verify_test(hvA == hvB);

		Keccak256 hp;
		if (h1 < h2)
			hp << h2 << h1;
		else
			hp << h1 << h2;
		hp >> hvExp;
		verify_test(hvA == hvExp);

		// path folding
		Hash hvRoot = h1;
		Merkle::Path path = { h2, h3 };
		Merkle::Interpret(hvRoot, path);

		Hash hv12, hvRootExp;
		Merkle::Interpret(hv12, h1, h2);
		Merkle::Interpret(hvRootExp, hv12, h3);
		verify_test(hvRoot == hvRootExp);

		// builder paths reproduce the root, including a promoted odd leaf
		Merkle::Builder bld;
		for (uint32_t i = 0; i < 5; i++)
			bld.m_vLeafs.push_back(HashOf("item" + std::to_string(i)));

		Hash hvTree;
		bld.get_Root(hvTree);

		for (size_t i = 0; i < bld.m_vLeafs.size(); i++)
		{
			bld.get_Path(path, i);
			verify_test(!path.empty());

			Hash hv = bld.m_vLeafs[i];
			Merkle::Interpret(hv, path);
			verify_test(hv == hvTree);
		}

		// a wrong leaf doesn't fold to the same root
		bld.get_Path(path, 0);
		Hash hv = bld.m_vLeafs[1];
		Merkle::Interpret(hv, path);
		verify_test(hv != hvTree);

		// a single leaf is its own root, there's nothing to prove it with
		Merkle::Builder bld1;
		bld1.m_vLeafs.push_back(h1);
		bld1.get_Root(hvTree);
		bld1.get_Path(path, 0);
		verify_test(hvTree == h1);
		verify_test(path.empty());
	}

	void TestEcdsa()
	{
		Ecdsa::Secret sk = Zero;
		sk.m_pData[31] = 1;

		// the generator point
		Ecdsa::PubKey pk;
		verify_test(Ecdsa::get_PublicKey(pk, sk));

		Ecdsa::PubKey pkG;
		verify_test(pkG.Scan("79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
			"483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8"));
		verify_test(pk == pkG);

		sk = HashOf("secret");
		verify_test(Ecdsa::get_PublicKey(pk, sk));

		Hash msg = HashOf("message");
		Ecdsa::Signature sig;
		uint8_t nRecId = 0;
		verify_test(Ecdsa::Sign(sig, nRecId, sk, msg));
		verify_test(nRecId <= Ecdsa::s_RecoveryIdMax);

		Ecdsa::PubKey pk2;
		verify_test(Ecdsa::RecoverPublicKey(pk2, msg, sig, nRecId));
		verify_test(pk2 == pk);

		// another message recovers another key (or none)
		Hash msg2 = HashOf("message2");
		if (Ecdsa::RecoverPublicKey(pk2, msg2, sig, nRecId))
			verify_test(pk2 != pk);

		// wrong recovery id
		if (Ecdsa::RecoverPublicKey(pk2, msg, sig, nRecId ^ 1))
			verify_test(pk2 != pk);

		verify_test(!Ecdsa::RecoverPublicKey(pk2, msg, sig, 4));
		verify_test(!Ecdsa::RecoverPublicKey(pk2, msg, sig, 27));

		// bit flips in the signature
		for (uint32_t iBit = 0; iBit < Ecdsa::Signature::nBits; iBit += 37)
		{
			Ecdsa::Signature sig2 = sig;
			sig2.m_pData[iBit >> 3] ^= (1 << (iBit & 7));

			if (Ecdsa::RecoverPublicKey(pk2, msg, sig2, nRecId))
				verify_test(pk2 != pk);
		}

		// zero signature is invalid
		Ecdsa::Signature sigZero = Zero;
		verify_test(!Ecdsa::RecoverPublicKey(pk2, msg, sigZero, 0));
	}

} // namespace xbridge

int main()
{
	xbridge::TestKeccak();
	xbridge::TestUintBig();
	xbridge::TestMerkle();
	xbridge::TestEcdsa();

	return g_TestsFailed ? -1 : 0;
}
