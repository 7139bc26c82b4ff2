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
#include "utility/containers.h"
#include <map>

namespace xbridge::bridge
{
    // Volatile account store. Modifications made within a unit are reverted on Rollback.
    class MemoryAccountStore
        : public IAccountStore
    {
    public:
        struct Account
        {
            Address m_Owner = Zero;
            ByteBuffer m_Data;
        };

        using AccountMap = std::map<Address, Account>;

        const AccountMap& get_Accounts() const { return m_Accounts; }
        bool IsInUnit() const { return m_InUnit; }

        // IAccountStore
        void Begin() override;
        void Commit() override;
        void Rollback() override;
        bool CreateAt(const Address&, uint32_t nSize, const Address& owner) override;
        bool Load(const Address&, ByteBuffer&) override;
        void Save(const Address&, const ByteBuffer&) override;
        void EnumAccounts(IAccountWalker&) override;

    private:
        struct Action_Create;
        struct Action_Save;

        AccountMap m_Accounts;
        UndoLog<MemoryAccountStore> m_Undo;
        bool m_InUnit = false;
    };

} // namespace xbridge::bridge
