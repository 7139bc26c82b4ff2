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

#include "verifier.h"

namespace xbridge::bridge
{
    void ComputeRoot(Hash& root, const Hash& leaf, const Merkle::Path& path, uint32_t nMaxPath)
    {
        Test(!path.empty() && (path.size() <= nMaxPath), ErrorCode::MalformedProof);

        root = leaf;
        Merkle::Interpret(root, path);
    }

    void BuildBatch(Hash& root, std::vector<Merkle::Path>& vPaths, const Merkle::Builder& bld, uint32_t nMaxPath)
    {
        Test(bld.m_vLeafs.size() >= 2, ErrorCode::MalformedProof);

        bld.get_Root(root);

        vPaths.resize(bld.m_vLeafs.size());
        for (size_t i = 0; i < vPaths.size(); i++)
        {
            bld.get_Path(vPaths[i], i);

            Hash hv;
            ComputeRoot(hv, bld.m_vLeafs[i], vPaths[i], nMaxPath);
            Test(hv == root, ErrorCode::MalformedProof);
        }
    }

    void VerifySignature(const Hash& msg, const Signature& sig, uint8_t nRecoveryId, const PubKey& expected)
    {
        PubKey pk;
        Test(Ecdsa::RecoverPublicKey(pk, msg, sig, nRecoveryId), ErrorCode::InvalidSignature);
        Test(pk == expected, ErrorCode::WrongSignature);
    }

} // namespace xbridge::bridge
