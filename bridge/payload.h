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
#include <optional>
#include <variant>

namespace xbridge::bridge
{
    namespace Payload
    {
        struct Native
        {
            Amount m_Amount = 0;
        };

        struct FungibleTransfer
        {
            Address m_Mint = Zero;
            Amount m_Amount = 0;
            std::string m_Name;
            std::string m_Symbol;
            std::string m_Uri;
            uint8_t m_Decimals = 0; // not part of the leaf
        };

        struct NonFungibleTransfer
        {
            Address m_Mint = Zero;
            std::optional<Address> m_Collection;
            std::string m_Name;
            std::string m_Symbol;
            std::string m_Uri;
        };
    }

    using TransferPayload = std::variant<Payload::Native, Payload::FungibleTransfer, Payload::NonFungibleTransfer>;

    TokenKind get_Kind(const TransferPayload&);
    Amount get_Amount(const TransferPayload&); // 1 for NFT

    // Canonical encoding of a transfer intent:
    // origin | network tag | receiver | destination program | payload bytes
    //
    // payload bytes:
    //   Native: 32 zero bytes | amount (32 bytes, big-endian)
    //   FT:     mint | amount (32 bytes, big-endian) | name | symbol | uri
    //   NFT:    mint | collection or 32 zero bytes | 1 (32 bytes, big-endian) | name | symbol | uri
    //
    // Strings are raw, without length prefixes or trailing NULs.
    struct ContentLeaf
    {
        Origin m_Origin = Zero;
        Address m_Receiver = Zero;
        Address m_Program = Zero;
        TransferPayload m_Payload;

        void Encode(ByteBuffer&, const std::string& sNetworkTag) const;
        void get_Hash(Hash&, const std::string& sNetworkTag) const;
    };

} // namespace xbridge::bridge
