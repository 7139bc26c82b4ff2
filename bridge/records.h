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

namespace xbridge::bridge
{
    // Fixed-size little-endian account layouts, shared with the off-chain relayers

    struct AdminRecord
    {
        static const uint32_t s_Size = 1 + PubKey::nBytes + Address::nBytes; // 97

        bool m_Initialized = false;
        PubKey m_Key = Zero;
        Address m_CommissionProgram = Zero;

        void Export(ByteBuffer&) const;
        bool Import(const ByteBuffer&); // all-zero data imports as an uninitialized record
    };

    struct WithdrawRecord
    {
        static const uint32_t s_Size = 1 + 1 + Origin::nBytes + 1 + Address::nBytes + sizeof(Amount) + Address::nBytes; // 107

        bool m_Initialized = false;
        TokenKind m_Kind = TokenKind::Native;
        Origin m_Origin = Zero;
        std::optional<Address> m_Mint; // absent for Native
        Amount m_Amount = 0;
        Address m_Receiver = Zero;

        void Export(ByteBuffer&) const;
        bool Import(const ByteBuffer&);
    };

} // namespace xbridge::bridge
