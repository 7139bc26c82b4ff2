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

#include "replay_guard.h"
#include "utility/logger.h"

namespace xbridge::bridge
{
    ReplayGuard::ReplayGuard(IAccountStore& store, IAddressDeriver& deriver, const Address& program)
        : m_Store(store)
        , m_Deriver(deriver)
        , m_Program(program)
    {
    }

    Address ReplayGuard::get_RecordAddress(const Origin& origin)
    {
        return m_Deriver.get_ProgramAddress({ origin }, m_Program);
    }

    void ReplayGuard::Claim(const Address& recordAccount, const Origin& origin, const Address& payer)
    {
        Test(get_RecordAddress(origin) == recordAccount, ErrorCode::WrongNonce);

        LOG_DEBUG() << "Creating withdraw account " << recordAccount;
        Test(m_Store.CreateAt(recordAccount, WithdrawRecord::s_Size, payer), ErrorCode::AlreadyInUse);

        // a fresh account must carry no finalized record
        ByteBuffer buf;
        if (!m_Store.Load(recordAccount, buf))
            CorruptionException::Throw("withdraw account vanished");

        WithdrawRecord rec;
        Test(rec.Import(buf), ErrorCode::MalformedPayload);
        Test(!rec.m_Initialized, ErrorCode::AlreadyInUse);
    }

    void ReplayGuard::Finalize(const Address& recordAccount, const WithdrawRecord& rec)
    {
        assert(rec.m_Initialized);

        ByteBuffer buf;
        rec.Export(buf);
        m_Store.Save(recordAccount, buf);

        LOG_DEBUG() << "Withdraw account initialized, origin=" << rec.m_Origin;
    }

    bool ReplayGuard::get_Record(const Origin& origin, WithdrawRecord& rec)
    {
        ByteBuffer buf;
        if (!m_Store.Load(get_RecordAddress(origin), buf))
            return false;

        Test(rec.Import(buf), ErrorCode::MalformedPayload);
        return rec.m_Initialized;
    }

    bool ReplayGuard::IsRedeemed(const Origin& origin)
    {
        WithdrawRecord rec;
        return get_Record(origin, rec);
    }

} // namespace xbridge::bridge
