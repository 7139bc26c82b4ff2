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

#include "processor.h"
#include "admin_store.h"
#include "replay_guard.h"
#include "commission.h"
#include "verifier.h"
#include "core/serialization_adapters.h"
#include "utility/logger.h"
#include <exception>

namespace xbridge::bridge
{
    Address get_BridgeAdminAddress(IAddressDeriver& deriver, const Config& cfg, const Seed& seeds)
    {
        return deriver.get_ProgramAddress({ seeds }, cfg.ProgramID);
    }

    /////////////////////////////
    // AtomicUnit
    class Processor::AtomicUnit
    {
    public:
        AtomicUnit(IAccountStore& store, ILedger& ledger)
            : m_Store(store)
            , m_Ledger(ledger)
        {
            m_Store.Begin();
            m_StoreOpen = true;

            try
            {
                m_Ledger.Begin();
            }
            catch (...)
            {
                m_Store.Rollback();
                throw;
            }
            m_LedgerOpen = true;
        }

        ~AtomicUnit() // by default - rolls back whatever is still open
        {
            if (!m_StoreOpen && !m_LedgerOpen)
                return;

            if (std::uncaught_exceptions())
            {
                // the original failure is what gets reported
                try {
                    Rollback();
                }
                catch (const std::exception& e) {
                    LOG_ERROR() << "Rollback failed: " << e.what();
                }
                catch (const CorruptionException& e) {
                    LOG_ERROR() << "Rollback failed: " << e.m_sErr;
                }
            }
            else
                Rollback();
        }

        // Store first: the payout must not become final while its withdraw record can still be lost
        void Commit()
        {
            assert(m_StoreOpen && m_LedgerOpen);

            m_Store.Commit();
            m_StoreOpen = false;

            m_Ledger.Commit();
            m_LedgerOpen = false;
        }

    private:
        void Rollback()
        {
            if (m_StoreOpen)
            {
                m_StoreOpen = false;
                m_Store.Rollback();
            }

            if (m_LedgerOpen)
            {
                m_LedgerOpen = false;
                m_Ledger.Rollback();
            }
        }

        IAccountStore& m_Store;
        ILedger& m_Ledger;
        bool m_StoreOpen = false;
        bool m_LedgerOpen = false;
    };

    /////////////////////////////
    // Processor
    Processor::Processor(const Config& cfg, IAccountStore& store, ILedger& ledger, IAddressDeriver& deriver, ICoTransactionInspector& inspector)
        : m_Config(cfg)
        , m_Store(store)
        , m_Ledger(ledger)
        , m_Deriver(deriver)
        , m_Inspector(inspector)
    {
    }

    template <typename TRequest>
    void Processor::Run(const TRequest& req)
    {
        const char* szName = get_InstructionName(TRequest::s_Type);
        LOG_INFO() << "Instruction: " << szName;

        try
        {
            req.Validate(m_Config);

            AtomicUnit unit(m_Store, m_Ledger);
            OnRequest(req);
            unit.Commit();
        }
        catch (const Exc& e)
        {
            LOG_WARNING() << szName << " rejected: " << get_ErrorName(e.get_Code()) << " (" << get_CategoryName(e.get_Category()) << ")";
            throw;
        }
        catch (const LedgerException& e)
        {
            LOG_WARNING() << szName << " rejected by the ledger: " << e.what();
            throw;
        }
    }

#define THE_MACRO(code, name) \
    void Processor::name(const Request::name& req) \
    { \
        Run(req); \
    }
    XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO

    void Processor::InvokeRaw(const ByteBuffer& buf)
    {
        Deserializer der;
        der.reset(buf);

        uint8_t nType = 0;
        if (!der.deserialize(nType))
        {
            LOG_WARNING() << "Empty request";
            Fail(ErrorCode::MalformedPayload);
        }

        switch (nType)
        {
#define THE_MACRO(code, name) \
        case code: \
            { \
                Request::name req; \
                if (!der.deserialize(req) || der.bytes_left()) \
                { \
                    LOG_WARNING() << "Malformed " #name " request"; \
                    Fail(ErrorCode::MalformedPayload); \
                } \
                name(req); \
            } \
            break;

        XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO

        default:
            LOG_WARNING() << "Unknown instruction " << static_cast<uint32_t>(nType);
            Fail(ErrorCode::MalformedPayload);
        }
    }

    Address Processor::DeriveFromSeed(const Seed& seed)
    {
        return m_Deriver.get_ProgramAddress({ seed }, m_Config.ProgramID);
    }

    void Processor::CheckSeeds(const Seed& seeds, const Address& bridgeAdmin)
    {
        Test(DeriveFromSeed(seeds) == bridgeAdmin, ErrorCode::WrongSeeds);
    }

    void Processor::EnsureAssociatedAccount(const Address& account, const Address& owner, const Address& mint)
    {
        Test(m_Deriver.get_AssociatedAccount(owner, mint) == account, ErrorCode::WrongTokenAccount);

        if (!m_Ledger.AssociatedAccountExists(account))
        {
            LOG_DEBUG() << "Creating associated account " << account << " of " << owner;
            m_Ledger.CreateAssociatedAccount(account, owner, mint);
        }
    }

    void Processor::ReadMetadata(const Address& metadataAccount, TokenMetadata& md)
    {
        Test(m_Ledger.get_Metadata(metadataAccount, md), ErrorCode::NoTokenMeta);
    }

    void Processor::Authorize(const AdminRecord& admin, const ContentLeaf& leaf, const Merkle::Path& path, const Signature& sig, uint8_t nRecoveryId)
    {
        Hash hvLeaf, hvRoot;
        leaf.get_Hash(hvLeaf, m_Config.NetworkTag);
        ComputeRoot(hvRoot, hvLeaf, path, m_Config.MaxPathLength);

        LOG_DEBUG() << "Leaf " << hvLeaf << ", root " << hvRoot;
        VerifySignature(hvRoot, sig, nRecoveryId, admin.m_Key);
    }

    /////////////////////////////
    // Admin
    void Processor::OnRequest(const Request::InitializeAdmin& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        ks.Initialize(req.m_Payer, req.m_Key, req.m_CommissionProgram);
    }

    void Processor::OnRequest(const Request::RotateKey& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        ks.RotateKey(req.m_NewKey, req.m_Signature, req.m_RecoveryId);
    }

    /////////////////////////////
    // Deposits
    void Processor::OnRequest(const Request::DepositNative& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        const AdminRecord& admin = ks.get_Record();

        CommissionChecker(m_Inspector, m_Deriver, m_Config).Check(req.m_BridgeAdmin, admin, TokenKind::Native, req.m_Amount);

        LOG_DEBUG() << "Transferring " << req.m_Amount << " to the bridge, receiver " << req.m_NetworkTo << ":" << req.m_ReceiverAddress;
        m_Ledger.TransferNative(req.m_Owner, req.m_BridgeAdmin, req.m_Amount);
    }

    void Processor::DepositToken(const Address& bridgeAdmin, const TokenAccounts& acc, const boost::optional<Seed>& tokenSeed, Amount amount)
    {
        EnsureAssociatedAccount(acc.m_BridgeAssociated, bridgeAdmin, acc.m_Mint);

        if (tokenSeed)
        {
            Test(DeriveFromSeed(*tokenSeed) == acc.m_Mint, ErrorCode::WrongTokenSeed);

            LOG_DEBUG() << "Burning " << amount << " of " << acc.m_Mint;
            m_Ledger.BurnAsset(acc.m_OwnerAssociated, acc.m_Mint, acc.m_Owner, amount);
        }
        else
        {
            LOG_DEBUG() << "Transferring " << amount << " of " << acc.m_Mint << " to the bridge";
            m_Ledger.TransferAsset(acc.m_OwnerAssociated, acc.m_BridgeAssociated, acc.m_Owner, amount);
        }
    }

    void Processor::OnRequest(const Request::DepositFT& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        const AdminRecord& admin = ks.get_Record();

        CommissionChecker(m_Inspector, m_Deriver, m_Config).Check(req.m_BridgeAdmin, admin, TokenKind::FT, req.m_Amount);

        TokenAccounts acc{ req.m_Mint, req.m_Owner, req.m_OwnerAssociated, req.m_BridgeAssociated };
        DepositToken(req.m_BridgeAdmin, acc, req.m_TokenSeed, req.m_Amount);
    }

    void Processor::OnRequest(const Request::DepositNFT& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        const AdminRecord& admin = ks.get_Record();

        CommissionChecker(m_Inspector, m_Deriver, m_Config).Check(req.m_BridgeAdmin, admin, TokenKind::NFT, 1);

        TokenAccounts acc{ req.m_Mint, req.m_Owner, req.m_OwnerAssociated, req.m_BridgeAssociated };
        DepositToken(req.m_BridgeAdmin, acc, req.m_TokenSeed, 1);
    }

    /////////////////////////////
    // Withdrawals
    void Processor::OnRequest(const Request::WithdrawNative& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        const AdminRecord& admin = ks.get_Record();

        ContentLeaf leaf;
        leaf.m_Origin = req.m_Origin;
        leaf.m_Receiver = req.m_Owner;
        leaf.m_Program = m_Config.ProgramID;
        leaf.m_Payload = Payload::Native{ req.m_Amount };

        Authorize(admin, leaf, req.m_Path, req.m_Signature, req.m_RecoveryId);

        ReplayGuard guard(m_Store, m_Deriver, m_Config.ProgramID);
        guard.Claim(req.m_WithdrawAccount, req.m_Origin, req.m_Owner);

        Test(m_Ledger.get_NativeBalance(req.m_BridgeAdmin) >= req.m_Amount, ErrorCode::WrongBalance);

        LOG_DEBUG() << "Transferring " << req.m_Amount << " to " << req.m_Owner;
        m_Ledger.TransferNative(req.m_BridgeAdmin, req.m_Owner, req.m_Amount);

        WithdrawRecord rec;
        rec.m_Initialized = true;
        rec.m_Kind = TokenKind::Native;
        rec.m_Origin = req.m_Origin;
        rec.m_Amount = req.m_Amount;
        rec.m_Receiver = req.m_Owner;
        guard.Finalize(req.m_WithdrawAccount, rec);
    }

    void Processor::TryMintTokenWithMeta(const Address& bridgeAdmin, const Seed& tokenSeed, const boost::optional<SignedMetadata>& meta,
        const Address& mint, const Address& metadata)
    {
        Test(DeriveFromSeed(tokenSeed) == mint, ErrorCode::WrongTokenSeed);
        Test(!!meta, ErrorCode::NoTokenMeta);

        if (m_Ledger.MintExists(mint))
            return;

        LOG_DEBUG() << "Creating mint " << mint << ", decimals=" << static_cast<uint32_t>(meta->m_Decimals);
        m_Ledger.CreateMint(mint, bridgeAdmin, meta->m_Decimals);

        LOG_DEBUG() << "Creating metadata " << metadata;
        m_Ledger.CreateMetadataRecord(metadata, mint, *meta);
    }

    void Processor::PayoutToken(const Address& bridgeAdmin, const TokenAccounts& acc, Amount amount)
    {
        EnsureAssociatedAccount(acc.m_BridgeAssociated, bridgeAdmin, acc.m_Mint);
        Amount nBridge = m_Ledger.get_AssetBalance(acc.m_BridgeAssociated);

        EnsureAssociatedAccount(acc.m_OwnerAssociated, acc.m_Owner, acc.m_Mint);

        if (nBridge < amount)
        {
            LOG_DEBUG() << "Minting " << (amount - nBridge) << " of " << acc.m_Mint << " to the bridge";
            m_Ledger.MintAsset(acc.m_Mint, acc.m_BridgeAssociated, bridgeAdmin, amount - nBridge);
        }

        LOG_DEBUG() << "Transferring " << amount << " of " << acc.m_Mint << " to " << acc.m_Owner;
        m_Ledger.TransferAsset(acc.m_BridgeAssociated, acc.m_OwnerAssociated, bridgeAdmin, amount);
    }

    void Processor::OnRequest(const Request::WithdrawFT& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        const AdminRecord& admin = ks.get_Record();

        Test(m_Deriver.get_MetadataAccount(req.m_Mint) == req.m_Metadata, ErrorCode::WrongMetadataAccount);

        if (req.m_TokenSeed)
            TryMintTokenWithMeta(req.m_BridgeAdmin, *req.m_TokenSeed, req.m_SignedMeta, req.m_Mint, req.m_Metadata);

        TokenMetadata md;
        ReadMetadata(req.m_Metadata, md);

        Payload::FungibleTransfer pl;
        pl.m_Mint = req.m_Mint;
        pl.m_Amount = req.m_Amount;
        pl.m_Name = TrimNul(md.m_Name);
        pl.m_Symbol = TrimNul(md.m_Symbol);
        pl.m_Uri = TrimNul(md.m_Uri);

        ContentLeaf leaf;
        leaf.m_Origin = req.m_Origin;
        leaf.m_Receiver = req.m_Owner;
        leaf.m_Program = m_Config.ProgramID;
        leaf.m_Payload = std::move(pl);

        Authorize(admin, leaf, req.m_Path, req.m_Signature, req.m_RecoveryId);

        ReplayGuard guard(m_Store, m_Deriver, m_Config.ProgramID);
        guard.Claim(req.m_WithdrawAccount, req.m_Origin, req.m_Owner);

        TokenAccounts acc{ req.m_Mint, req.m_Owner, req.m_OwnerAssociated, req.m_BridgeAssociated };
        PayoutToken(req.m_BridgeAdmin, acc, req.m_Amount);

        WithdrawRecord rec;
        rec.m_Initialized = true;
        rec.m_Kind = TokenKind::FT;
        rec.m_Origin = req.m_Origin;
        rec.m_Mint = req.m_Mint;
        rec.m_Amount = req.m_Amount;
        rec.m_Receiver = req.m_Owner;
        guard.Finalize(req.m_WithdrawAccount, rec);
    }

    void Processor::OnRequest(const Request::WithdrawNFT& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        const AdminRecord& admin = ks.get_Record();

        Test(m_Deriver.get_MetadataAccount(req.m_Mint) == req.m_Metadata, ErrorCode::WrongMetadataAccount);

        if (req.m_TokenSeed)
            TryMintTokenWithMeta(req.m_BridgeAdmin, *req.m_TokenSeed, req.m_SignedMeta, req.m_Mint, req.m_Metadata);

        TokenMetadata md;
        ReadMetadata(req.m_Metadata, md);

        Payload::NonFungibleTransfer pl;
        pl.m_Mint = req.m_Mint;
        pl.m_Name = md.m_Name;
        pl.m_Symbol = md.m_Symbol;
        pl.m_Uri = md.m_Uri;

        if (md.m_HasCollection)
        {
            // the collection's name and symbol are signed instead of the token's
            Test(req.m_CollectionMetadata && (m_Deriver.get_MetadataAccount(md.m_Collection) == *req.m_CollectionMetadata),
                ErrorCode::WrongMetadataAccount);

            TokenMetadata mdCollection;
            ReadMetadata(*req.m_CollectionMetadata, mdCollection);

            pl.m_Name = mdCollection.m_Name;
            pl.m_Symbol = mdCollection.m_Symbol;
            pl.m_Collection = md.m_Collection;
        }

        pl.m_Name = TrimNul(pl.m_Name);
        pl.m_Symbol = TrimNul(pl.m_Symbol);
        pl.m_Uri = TrimNul(pl.m_Uri);

        ContentLeaf leaf;
        leaf.m_Origin = req.m_Origin;
        leaf.m_Receiver = req.m_Owner;
        leaf.m_Program = m_Config.ProgramID;
        leaf.m_Payload = std::move(pl);

        Authorize(admin, leaf, req.m_Path, req.m_Signature, req.m_RecoveryId);

        ReplayGuard guard(m_Store, m_Deriver, m_Config.ProgramID);
        guard.Claim(req.m_WithdrawAccount, req.m_Origin, req.m_Owner);

        TokenAccounts acc{ req.m_Mint, req.m_Owner, req.m_OwnerAssociated, req.m_BridgeAssociated };
        PayoutToken(req.m_BridgeAdmin, acc, 1);

        WithdrawRecord rec;
        rec.m_Initialized = true;
        rec.m_Kind = TokenKind::NFT;
        rec.m_Origin = req.m_Origin;
        rec.m_Mint = req.m_Mint;
        rec.m_Amount = 1;
        rec.m_Receiver = req.m_Owner;
        guard.Finalize(req.m_WithdrawAccount, rec);
    }

    /////////////////////////////
    // Collections
    void Processor::OnRequest(const Request::MintCollection& req)
    {
        CheckSeeds(req.m_Seeds, req.m_BridgeAdmin);

        AdminKeyStore ks(m_Store, req.m_BridgeAdmin);
        ks.get_Record();

        Test(m_Deriver.get_AssociatedAccount(req.m_BridgeAdmin, req.m_Mint) == req.m_BridgeAssociated, ErrorCode::WrongTokenAccount);
        Test(DeriveFromSeed(req.m_TokenSeed) == req.m_Mint, ErrorCode::WrongTokenSeed);
        Test(m_Deriver.get_MetadataAccount(req.m_Mint) == req.m_Metadata, ErrorCode::WrongMetadataAccount);

        LOG_DEBUG() << "Creating collection mint " << req.m_Mint;
        m_Ledger.CreateMint(req.m_Mint, req.m_BridgeAdmin, 0);

        LOG_DEBUG() << "Creating associated account " << req.m_BridgeAssociated;
        m_Ledger.CreateAssociatedAccount(req.m_BridgeAssociated, req.m_BridgeAdmin, req.m_Mint);

        LOG_DEBUG() << "Minting collection token to the bridge";
        m_Ledger.MintAsset(req.m_Mint, req.m_BridgeAssociated, req.m_BridgeAdmin, 1);

        LOG_DEBUG() << "Creating metadata " << req.m_Metadata;
        m_Ledger.CreateMetadataRecord(req.m_Metadata, req.m_Mint, req.m_Data);
    }

} // namespace xbridge::bridge
