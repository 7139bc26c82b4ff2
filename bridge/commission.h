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

#include "capabilities.h"
#include "records.h"
#include "errors.h"

namespace xbridge::bridge
{
    // Message of the commission program, as it appears in a bundled operation
    struct CommissionInstruction
    {
        enum Type : uint8_t
        {
            ChargeCommission = 0,
            Count
        };

        uint8_t m_Type = ChargeCommission;
        TokenKind m_Kind = TokenKind::Native;
        Amount m_Amount = 0;

        void Encode(ByteBuffer&) const;
        bool Decode(const ByteBuffer&); // false on malformed or trailing data
    };

    // Asserts that a deposit was preceded, in the same unit, by a matching commission charge
    class CommissionChecker
    {
    public:
        CommissionChecker(ICoTransactionInspector&, IAddressDeriver&, const Config&);

        Address get_CommissionAccount(const Address& bridgeAdmin, const Address& commissionProgram);

        void Check(const Address& bridgeAdmin, const AdminRecord&, TokenKind, Amount);

    private:
        ICoTransactionInspector& m_Inspector;
        IAddressDeriver& m_Deriver;
        const Config& m_Config;
    };

} // namespace xbridge::bridge
