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

#include "admin_store.h"
#include "verifier.h"
#include "utility/logger.h"

namespace xbridge::bridge
{
    AdminKeyStore::AdminKeyStore(IAccountStore& store, const Address& adminAccount)
        : m_Store(store)
        , m_Account(adminAccount)
    {
    }

    void AdminKeyStore::get_RotationMessage(Hash& hv, const PubKey& newKey)
    {
        Keccak256 hp;
        hp << newKey;
        hp >> hv;
    }

    bool AdminKeyStore::TryLoad()
    {
        if (m_Loaded)
            return true;

        ByteBuffer buf;
        if (!m_Store.Load(m_Account, buf))
            return false;

        Test(m_Record.Import(buf), ErrorCode::MalformedPayload);
        m_Loaded = true;
        return true;
    }

    void AdminKeyStore::Initialize(const Address& payer, const PubKey& key, const Address& commissionProgram)
    {
        Test(m_Store.CreateAt(m_Account, AdminRecord::s_Size, payer), ErrorCode::AlreadyInUse);
        LOG_DEBUG() << "Admin account created " << m_Account;

        if (!TryLoad())
            CorruptionException::Throw("admin account vanished");
        Test(!m_Record.m_Initialized, ErrorCode::AlreadyInUse);

        m_Record.m_Initialized = true;
        m_Record.m_Key = key;
        m_Record.m_CommissionProgram = commissionProgram;

        ByteBuffer buf;
        m_Record.Export(buf);
        m_Store.Save(m_Account, buf);
    }

    const AdminRecord& AdminKeyStore::get_Record()
    {
        Test(TryLoad() && m_Record.m_Initialized, ErrorCode::NotInitialized);
        return m_Record;
    }

    void AdminKeyStore::RotateKey(const PubKey& newKey, const Signature& sig, uint8_t nRecoveryId)
    {
        const AdminRecord& rec = get_Record();

        Hash hvMsg;
        get_RotationMessage(hvMsg, newKey);
        VerifySignature(hvMsg, sig, nRecoveryId, rec.m_Key);

        m_Record.m_Key = newKey;

        ByteBuffer buf;
        m_Record.Export(buf);
        m_Store.Save(m_Account, buf);
    }

} // namespace xbridge::bridge
