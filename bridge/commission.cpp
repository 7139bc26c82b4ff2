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

#include "commission.h"
#include "utility/serialize.h"
#include "utility/logger.h"

namespace xbridge::bridge
{
    void CommissionInstruction::Encode(ByteBuffer& buf) const
    {
        Serializer ser;
        ser & m_Type & static_cast<uint8_t>(m_Kind) & m_Amount;
        ser.swap_buf(buf);
    }

    bool CommissionInstruction::Decode(const ByteBuffer& buf)
    {
        Deserializer der;
        der.reset(buf);

        uint8_t nKind = 0;
        if (!der.deserialize(m_Type) || !der.deserialize(nKind) || !der.deserialize(m_Amount))
            return false;

        if ((m_Type >= Count) || (nKind >= static_cast<uint8_t>(TokenKind::Count)) || der.bytes_left())
            return false;

        m_Kind = static_cast<TokenKind>(nKind);
        return true;
    }

    CommissionChecker::CommissionChecker(ICoTransactionInspector& inspector, IAddressDeriver& deriver, const Config& cfg)
        : m_Inspector(inspector)
        , m_Deriver(deriver)
        , m_Config(cfg)
    {
    }

    Address CommissionChecker::get_CommissionAccount(const Address& bridgeAdmin, const Address& commissionProgram)
    {
        return m_Deriver.get_ProgramAddress({ Blob(m_Config.CommissionSeed), bridgeAdmin }, commissionProgram);
    }

    void CommissionChecker::Check(const Address& bridgeAdmin, const AdminRecord& admin, TokenKind kind, Amount amount)
    {
        Operation op;
        Test(m_Inspector.get_PrecedingOperation(op) && (op.m_Program == admin.m_CommissionProgram), ErrorCode::WrongCommissionProgram);

        Test(!op.m_Accounts.empty() && (op.m_Accounts.front() == get_CommissionAccount(bridgeAdmin, op.m_Program)),
            ErrorCode::WrongCommissionAccount);

        CommissionInstruction ci;
        Test(ci.Decode(op.m_Data) &&
            (CommissionInstruction::ChargeCommission == ci.m_Type) &&
            (ci.m_Kind == kind) &&
            (ci.m_Amount == amount),
            ErrorCode::WrongCommissionArguments);

        LOG_DEBUG() << "Commission charged for " << get_TokenKindName(kind) << ", amount=" << amount;
    }

} // namespace xbridge::bridge
