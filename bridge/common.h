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

#include "core/merkle.h"
#include "core/ecdsa.h"
#include "utility/serialize_fwd.h"
#include <string>
#include <vector>

namespace xbridge::bridge
{
    using Address = uintBig_t<32>;   // program ids, accounts, mints
    using Origin = uintBig_t<32>;    // source-chain event id
    using Seed = uintBig_t<32>;
    using Hash = Merkle::Hash;
    using PubKey = Ecdsa::PubKey;
    using Signature = Ecdsa::Signature;

    enum class TokenKind : uint8_t
    {
        Native = 0,
        FT = 1,
        NFT = 2,
        Count
    };

    const char* get_TokenKindName(TokenKind);
    bool TokenKindFromString(TokenKind&, const std::string&);

    // Deployment parameters, exposed as options by the tool
#define XBRIDGE_BRIDGE_PARAMS(macro) \
    macro(std::string, NetworkTag,     "network_tag",      "network tag hashed into content leaves") \
    macro(std::string, CommissionSeed, "commission_seed",  "domain seed of the commission-admin account") \
    macro(uint32_t,    MaxAddressSize, "max_address_size", "max length of a deposit receiver address [bytes]") \
    macro(uint32_t,    MaxNetworkSize, "max_network_size", "max length of a deposit network name [bytes]") \
    macro(uint32_t,    MaxPathLength,  "max_path_length",  "max number of siblings in a merkle path")

    struct Config
    {
        std::string NetworkTag = "Solana";
        std::string CommissionSeed = "commission-admin";
        uint32_t MaxAddressSize = 100;
        uint32_t MaxNetworkSize = 20;
        uint32_t MaxPathLength = 64;

        Address ProgramID = Zero; // the bridge's own identity
    };

    struct SignedMetadata
    {
        static const uint32_t s_MaxName = 32;
        static const uint32_t s_MaxSymbol = 10;
        static const uint32_t s_MaxUri = 200;

        std::string m_Name;
        std::string m_Symbol;
        std::string m_Uri;
        uint8_t m_Decimals = 0;

        SERIALIZE(m_Name, m_Symbol, m_Uri, m_Decimals);

        void Validate() const;
    };

    // Metadata record as exposed by the ledger. Strings may carry trailing NUL padding.
    struct TokenMetadata
    {
        std::string m_Name;
        std::string m_Symbol;
        std::string m_Uri;
        bool m_HasCollection = false;
        Address m_Collection = Zero;
    };

    std::string TrimNul(const std::string&);

} // namespace xbridge::bridge
