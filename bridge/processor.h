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
#include "requests.h"
#include "records.h"
#include "payload.h"

namespace xbridge::bridge
{
    Address get_BridgeAdminAddress(IAddressDeriver&, const Config&, const Seed&);

    // Executes bridge requests. Every request is one all-or-nothing unit over the account store
    // and the ledger: on any failure both are rolled back and the exception is propagated.
    class Processor
    {
    public:
        Processor(const Config&, IAccountStore&, ILedger&, IAddressDeriver&, ICoTransactionInspector&);

#define THE_MACRO(code, name) void name(const Request::name&);
        XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO

        // Decodes a tagged request and executes it. Undecodable input fails with MalformedPayload.
        void InvokeRaw(const ByteBuffer&);

        const Config& get_Config() const { return m_Config; }

    private:
        class AtomicUnit;

        template <typename TRequest>
        void Run(const TRequest&);

#define THE_MACRO(code, name) void OnRequest(const Request::name&);
        XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO

        void CheckSeeds(const Seed&, const Address& bridgeAdmin);
        Address DeriveFromSeed(const Seed&);

        struct TokenAccounts
        {
            const Address& m_Mint;
            const Address& m_Owner;
            const Address& m_OwnerAssociated;
            const Address& m_BridgeAssociated;
        };

        void DepositToken(const Address& bridgeAdmin, const TokenAccounts&, const boost::optional<Seed>& tokenSeed, Amount);
        void EnsureAssociatedAccount(const Address& account, const Address& owner, const Address& mint);
        void TryMintTokenWithMeta(const Address& bridgeAdmin, const Seed& tokenSeed, const boost::optional<SignedMetadata>&,
            const Address& mint, const Address& metadata);
        void ReadMetadata(const Address& metadataAccount, TokenMetadata&);
        void Authorize(const AdminRecord&, const ContentLeaf&, const Merkle::Path&, const Signature&, uint8_t nRecoveryId);
        void PayoutToken(const Address& bridgeAdmin, const TokenAccounts&, Amount);

        const Config& m_Config;
        IAccountStore& m_Store;
        ILedger& m_Ledger;
        IAddressDeriver& m_Deriver;
        ICoTransactionInspector& m_Inspector;
    };

} // namespace xbridge::bridge
