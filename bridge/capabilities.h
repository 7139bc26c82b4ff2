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
#include <memory>
#include <stdexcept>

namespace xbridge::bridge
{
    // Failure of an external collaborator (insufficient funds of the owner, missing account, etc.)
    class LedgerException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Value movement on the underlying ledger. Every call belongs to the currently open unit.
    struct ILedger
    {
        using Ptr = std::shared_ptr<ILedger>;
        virtual ~ILedger() = default;

        virtual void Begin() = 0;
        virtual void Commit() = 0;
        virtual void Rollback() = 0;

        virtual Amount get_NativeBalance(const Address&) = 0;
        virtual void TransferNative(const Address& from, const Address& to, Amount) = 0;

        virtual bool MintExists(const Address& mint) = 0;
        virtual void CreateMint(const Address& mint, const Address& authority, uint8_t nDecimals) = 0;

        // token accounts are addressed by their associated address
        virtual bool AssociatedAccountExists(const Address& account) = 0;
        virtual void CreateAssociatedAccount(const Address& account, const Address& owner, const Address& mint) = 0;
        virtual Amount get_AssetBalance(const Address& account) = 0;

        virtual void MintAsset(const Address& mint, const Address& to, const Address& authority, Amount) = 0;
        virtual void TransferAsset(const Address& from, const Address& to, const Address& authority, Amount) = 0;
        virtual void BurnAsset(const Address& from, const Address& mint, const Address& authority, Amount) = 0;

        virtual bool get_Metadata(const Address& metadataAccount, TokenMetadata&) = 0;
        virtual void CreateMetadataRecord(const Address& metadataAccount, const Address& mint, const SignedMetadata&) = 0;
    };

    struct IAddressDeriver
    {
        using Ptr = std::shared_ptr<IAddressDeriver>;
        virtual ~IAddressDeriver() = default;

        virtual Address get_ProgramAddress(const std::vector<Blob>& seeds, const Address& program) = 0;
        virtual Address get_AssociatedAccount(const Address& owner, const Address& mint) = 0;
        virtual Address get_MetadataAccount(const Address& mint) = 0;
    };

    // Default deriver: every address is a keccak256 over the seeds, the program and a domain marker
    struct KeccakAddressDeriver
        : public IAddressDeriver
    {
        static const Address& get_AssociatedTokenProgram();
        static const Address& get_MetadataProgram();

        Address get_ProgramAddress(const std::vector<Blob>& seeds, const Address& program) override;
        Address get_AssociatedAccount(const Address& owner, const Address& mint) override;
        Address get_MetadataAccount(const Address& mint) override;
    };

    struct IAccountWalker
    {
        virtual bool OnAccount(const Address&, const Address& owner, const ByteBuffer& data) = 0;
    };

    // Account-keyed persistent state
    struct IAccountStore
    {
        using Ptr = std::shared_ptr<IAccountStore>;
        virtual ~IAccountStore() = default;

        virtual void Begin() = 0;
        virtual void Commit() = 0;
        virtual void Rollback() = 0;

        // Exclusive creation of a zero-filled account. Returns false if the address is occupied.
        virtual bool CreateAt(const Address&, uint32_t nSize, const Address& owner) = 0;

        virtual bool Load(const Address&, ByteBuffer&) = 0; // false if absent
        virtual void Save(const Address&, const ByteBuffer&) = 0; // the account must exist

        virtual void EnumAccounts(IAccountWalker&) = 0;
    };

    // An operation bundled in the same atomic unit as the current one
    struct Operation
    {
        Address m_Program = Zero;
        std::vector<Address> m_Accounts;
        ByteBuffer m_Data;
    };

    struct ICoTransactionInspector
    {
        using Ptr = std::shared_ptr<ICoTransactionInspector>;
        virtual ~ICoTransactionInspector() = default;

        // the operation immediately preceding the current one, false if there's none
        virtual bool get_PrecedingOperation(Operation&) = 0;
    };

} // namespace xbridge::bridge
