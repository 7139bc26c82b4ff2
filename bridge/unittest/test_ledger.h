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

#include "bridge/capabilities.h"
#include "utility/containers.h"
#include "utility/test_helpers.h"
#include <map>
#include <optional>

namespace xbridge::bridge
{
    // Ledger double: plain maps, every modification within a unit is reverted on Rollback
    struct TestLedger
        :public ILedger
    {
        struct MintInfo {
            Address m_Authority = Zero;
            uint8_t m_Decimals = 0;
            Amount m_Supply = 0;
        };

        struct TokenAccount {
            Address m_Owner = Zero;
            Address m_Mint = Zero;
            Amount m_Amount = 0;
        };

        typedef std::map<Address, Amount> NativeMap;
        typedef std::map<Address, MintInfo> MintMap;
        typedef std::map<Address, TokenAccount> TokenAccountMap;
        typedef std::map<Address, TokenMetadata> MetadataMap;

        NativeMap m_Native;
        MintMap m_Mints;
        TokenAccountMap m_TokenAccounts;
        MetadataMap m_Metadata;

        UndoLog<TestLedger> m_Undo;
        bool m_InUnit = false;

        template <typename TMap>
        struct Action_Restore
            :public UndoLog<TestLedger>::Action
        {
            TMap TestLedger::* m_pMap;
            typename TMap::key_type m_Key;
            std::optional<typename TMap::mapped_type> m_Prev;

            void Undo(TestLedger& t) override
            {
                TMap& m = t.*m_pMap;
                if (m_Prev)
                    m[m_Key] = *m_Prev;
                else
                    m.erase(m_Key);
            }
        };

        // remember the entry before it's modified
        template <typename TMap>
        void Backup(TMap TestLedger::* pMap, const typename TMap::key_type& key)
        {
            if (!m_InUnit)
                return;

            auto pUndo = std::make_unique<Action_Restore<TMap> >();
            pUndo->m_pMap = pMap;
            pUndo->m_Key = key;

            const TMap& m = this->*pMap;
            auto it = m.find(key);
            if (m.end() != it)
                pUndo->m_Prev = it->second;

            m_Undo.Push(std::move(pUndo));
        }

        void Begin() override
        {
            verify_test(!m_InUnit);
            m_Undo.Forget();
            m_InUnit = true;
        }

        void Commit() override
        {
            m_Undo.Forget();
            m_InUnit = false;
        }

        void Rollback() override
        {
            m_Undo.UndoTo(*this);
            m_InUnit = false;
        }

        Amount get_NativeBalance(const Address& addr) override
        {
            auto it = m_Native.find(addr);
            return (m_Native.end() == it) ? 0 : it->second;
        }

        void SetNative(const Address& addr, Amount val)
        {
            Backup(&TestLedger::m_Native, addr);
            m_Native[addr] = val;
        }

        void TransferNative(const Address& from, const Address& to, Amount val) override
        {
            Amount nFrom = get_NativeBalance(from);
            if (nFrom < val)
                throw LedgerException("insufficient native funds");

            SetNative(from, nFrom - val);
            SetNative(to, get_NativeBalance(to) + val);
        }

        bool MintExists(const Address& mint) override
        {
            return m_Mints.end() != m_Mints.find(mint);
        }

        void CreateMint(const Address& mint, const Address& authority, uint8_t nDecimals) override
        {
            if (MintExists(mint))
                throw LedgerException("mint exists");

            Backup(&TestLedger::m_Mints, mint);
            MintInfo& mi = m_Mints[mint];
            mi.m_Authority = authority;
            mi.m_Decimals = nDecimals;
        }

        bool AssociatedAccountExists(const Address& account) override
        {
            return m_TokenAccounts.end() != m_TokenAccounts.find(account);
        }

        void CreateAssociatedAccount(const Address& account, const Address& owner, const Address& mint) override
        {
            if (AssociatedAccountExists(account))
                throw LedgerException("token account exists");
            if (!MintExists(mint))
                throw LedgerException("no mint");

            Backup(&TestLedger::m_TokenAccounts, account);
            TokenAccount& ta = m_TokenAccounts[account];
            ta.m_Owner = owner;
            ta.m_Mint = mint;
        }

        TokenAccount& get_TokenAccount(const Address& account)
        {
            auto it = m_TokenAccounts.find(account);
            if (m_TokenAccounts.end() == it)
                throw LedgerException("no token account");
            return it->second;
        }

        Amount get_AssetBalance(const Address& account) override
        {
            return get_TokenAccount(account).m_Amount;
        }

        void MintAsset(const Address& mint, const Address& to, const Address& authority, Amount val) override
        {
            auto it = m_Mints.find(mint);
            if ((m_Mints.end() == it) || (it->second.m_Authority != authority))
                throw LedgerException("mint authority mismatch");

            TokenAccount& ta = get_TokenAccount(to);
            if (ta.m_Mint != mint)
                throw LedgerException("mint mismatch");

            Backup(&TestLedger::m_Mints, mint);
            Backup(&TestLedger::m_TokenAccounts, to);
            it->second.m_Supply += val;
            ta.m_Amount += val;
        }

        void TransferAsset(const Address& from, const Address& to, const Address& authority, Amount val) override
        {
            TokenAccount& taFrom = get_TokenAccount(from);
            TokenAccount& taTo = get_TokenAccount(to);

            if ((taFrom.m_Owner != authority) || (taFrom.m_Mint != taTo.m_Mint))
                throw LedgerException("transfer not allowed");
            if (taFrom.m_Amount < val)
                throw LedgerException("insufficient token funds");

            Backup(&TestLedger::m_TokenAccounts, from);
            Backup(&TestLedger::m_TokenAccounts, to);
            taFrom.m_Amount -= val;
            taTo.m_Amount += val;
        }

        void BurnAsset(const Address& from, const Address& mint, const Address& authority, Amount val) override
        {
            TokenAccount& ta = get_TokenAccount(from);
            if ((ta.m_Owner != authority) || (ta.m_Mint != mint))
                throw LedgerException("burn not allowed");
            if (ta.m_Amount < val)
                throw LedgerException("insufficient token funds");

            Backup(&TestLedger::m_TokenAccounts, from);
            Backup(&TestLedger::m_Mints, mint);
            ta.m_Amount -= val;
            m_Mints[mint].m_Supply -= val;
        }

        bool get_Metadata(const Address& metadataAccount, TokenMetadata& md) override
        {
            auto it = m_Metadata.find(metadataAccount);
            if (m_Metadata.end() == it)
                return false;

            md = it->second;
            return true;
        }

        void CreateMetadataRecord(const Address& metadataAccount, const Address& mint, const SignedMetadata& sm) override
        {
            if (!MintExists(mint))
                throw LedgerException("no mint");
            if (m_Metadata.end() != m_Metadata.find(metadataAccount))
                throw LedgerException("metadata exists");

            Backup(&TestLedger::m_Metadata, metadataAccount);
            TokenMetadata& md = m_Metadata[metadataAccount];
            md.m_Name = sm.m_Name;
            md.m_Symbol = sm.m_Symbol;
            md.m_Uri = sm.m_Uri;
        }
    };

    // Returns whatever operation the test put in front of the current one
    struct TestInspector
        :public ICoTransactionInspector
    {
        std::optional<Operation> m_Preceding;

        bool get_PrecedingOperation(Operation& op) override
        {
            if (!m_Preceding)
                return false;

            op = *m_Preceding;
            return true;
        }
    };

} // namespace xbridge::bridge
