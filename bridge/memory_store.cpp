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

#include "memory_store.h"
#include "utility/logger.h"

namespace xbridge::bridge
{
    struct MemoryAccountStore::Action_Create
        : public UndoLog<MemoryAccountStore>::Action
    {
        Address m_Address;

        void Undo(MemoryAccountStore& s) override
        {
            s.m_Accounts.erase(m_Address);
        }
    };

    struct MemoryAccountStore::Action_Save
        : public UndoLog<MemoryAccountStore>::Action
    {
        Address m_Address;
        ByteBuffer m_Prev;

        void Undo(MemoryAccountStore& s) override
        {
            auto it = s.m_Accounts.find(m_Address);
            if (s.m_Accounts.end() != it)
                it->second.m_Data.swap(m_Prev);
        }
    };

    void MemoryAccountStore::Begin()
    {
        if (m_InUnit)
            CorruptionException::Throw("nested unit");

        m_Undo.Forget();
        m_InUnit = true;
    }

    void MemoryAccountStore::Commit()
    {
        m_Undo.Forget();
        m_InUnit = false;
    }

    void MemoryAccountStore::Rollback()
    {
        LOG_DEBUG() << "Reverting " << m_Undo.get_Pos() << " account changes";
        m_Undo.UndoTo(*this);
        m_InUnit = false;
    }

    bool MemoryAccountStore::CreateAt(const Address& addr, uint32_t nSize, const Address& owner)
    {
        auto res = m_Accounts.emplace(addr, Account());
        if (!res.second)
            return false;

        Account& acc = res.first->second;
        acc.m_Owner = owner;
        acc.m_Data.assign(nSize, 0);

        if (m_InUnit)
        {
            auto pUndo = std::make_unique<Action_Create>();
            pUndo->m_Address = addr;
            m_Undo.Push(std::move(pUndo));
        }

        return true;
    }

    bool MemoryAccountStore::Load(const Address& addr, ByteBuffer& buf)
    {
        auto it = m_Accounts.find(addr);
        if (m_Accounts.end() == it)
            return false;

        buf = it->second.m_Data;
        return true;
    }

    void MemoryAccountStore::Save(const Address& addr, const ByteBuffer& buf)
    {
        auto it = m_Accounts.find(addr);
        if (m_Accounts.end() == it)
            CorruptionException::Throw("account not found");

        ByteBuffer bufPrev = buf;
        it->second.m_Data.swap(bufPrev);

        if (m_InUnit)
        {
            auto pUndo = std::make_unique<Action_Save>();
            pUndo->m_Address = addr;
            pUndo->m_Prev = std::move(bufPrev);
            m_Undo.Push(std::move(pUndo));
        }
    }

    void MemoryAccountStore::EnumAccounts(IAccountWalker& w)
    {
        for (const auto& v : m_Accounts)
            if (!w.OnAccount(v.first, v.second.m_Owner, v.second.m_Data))
                break;
    }

} // namespace xbridge::bridge
