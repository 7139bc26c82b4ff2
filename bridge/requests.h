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
#include "errors.h"
#include <boost/optional.hpp>

namespace xbridge::bridge
{
#define XBRIDGE_INSTRUCTIONS(macro) \
    macro(0, InitializeAdmin) \
    macro(1, RotateKey) \
    macro(2, DepositNative) \
    macro(3, DepositFT) \
    macro(4, DepositNFT) \
    macro(5, WithdrawNative) \
    macro(6, WithdrawFT) \
    macro(7, WithdrawNFT) \
    macro(8, MintCollection)

    enum class Instruction : uint8_t
    {
#define THE_MACRO(code, name) name = code,
        XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO
    };

    const char* get_InstructionName(Instruction);

    // Request records. Every one names the bridge admin account and the seeds it's derived from.
    namespace Request
    {
        struct InitializeAdmin
        {
            static constexpr Instruction s_Type = Instruction::InitializeAdmin;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Payer = Zero;
            PubKey m_Key = Zero;
            Address m_CommissionProgram = Zero;

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Payer, m_Key, m_CommissionProgram);
            void Validate(const Config&) const {}
        };

        struct RotateKey
        {
            static constexpr Instruction s_Type = Instruction::RotateKey;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            PubKey m_NewKey = Zero;
            Signature m_Signature = Zero;
            uint8_t m_RecoveryId = 0;

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_NewKey, m_Signature, m_RecoveryId);
            void Validate(const Config&) const {}
        };

        struct DepositNative
        {
            static constexpr Instruction s_Type = Instruction::DepositNative;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Owner = Zero;
            std::string m_NetworkTo;
            std::string m_ReceiverAddress;
            Amount m_Amount = 0;

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Owner, m_NetworkTo, m_ReceiverAddress, m_Amount);
            void Validate(const Config&) const;
        };

        struct DepositFT
        {
            static constexpr Instruction s_Type = Instruction::DepositFT;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Mint = Zero;
            Address m_Owner = Zero;
            Address m_OwnerAssociated = Zero;
            Address m_BridgeAssociated = Zero;
            std::string m_NetworkTo;
            std::string m_ReceiverAddress;
            Amount m_Amount = 0;
            boost::optional<Seed> m_TokenSeed; // set for tokens minted by the bridge, they are burned

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Mint, m_Owner, m_OwnerAssociated, m_BridgeAssociated,
                m_NetworkTo, m_ReceiverAddress, m_Amount, m_TokenSeed);
            void Validate(const Config&) const;
        };

        struct DepositNFT
        {
            static constexpr Instruction s_Type = Instruction::DepositNFT;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Mint = Zero;
            Address m_Owner = Zero;
            Address m_OwnerAssociated = Zero;
            Address m_BridgeAssociated = Zero;
            std::string m_NetworkTo;
            std::string m_ReceiverAddress;
            boost::optional<Seed> m_TokenSeed;

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Mint, m_Owner, m_OwnerAssociated, m_BridgeAssociated,
                m_NetworkTo, m_ReceiverAddress, m_TokenSeed);
            void Validate(const Config&) const;
        };

        struct WithdrawNative
        {
            static constexpr Instruction s_Type = Instruction::WithdrawNative;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Owner = Zero;
            Address m_WithdrawAccount = Zero;
            Signature m_Signature = Zero;
            uint8_t m_RecoveryId = 0;
            Merkle::Path m_Path;
            Origin m_Origin = Zero;
            Amount m_Amount = 0;

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Owner, m_WithdrawAccount, m_Signature, m_RecoveryId,
                m_Path, m_Origin, m_Amount);
            void Validate(const Config&) const {}
        };

        struct WithdrawFT
        {
            static constexpr Instruction s_Type = Instruction::WithdrawFT;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Mint = Zero;
            Address m_Metadata = Zero;
            Address m_Owner = Zero;
            Address m_OwnerAssociated = Zero;
            Address m_BridgeAssociated = Zero;
            Address m_WithdrawAccount = Zero;
            Signature m_Signature = Zero;
            uint8_t m_RecoveryId = 0;
            Merkle::Path m_Path;
            Origin m_Origin = Zero;
            Amount m_Amount = 0;
            boost::optional<Seed> m_TokenSeed;
            boost::optional<SignedMetadata> m_SignedMeta; // needed if the bridge creates the mint

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Mint, m_Metadata, m_Owner, m_OwnerAssociated, m_BridgeAssociated,
                m_WithdrawAccount, m_Signature, m_RecoveryId, m_Path, m_Origin, m_Amount, m_TokenSeed, m_SignedMeta);
            void Validate(const Config&) const;
        };

        struct WithdrawNFT
        {
            static constexpr Instruction s_Type = Instruction::WithdrawNFT;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Mint = Zero;
            Address m_Metadata = Zero;
            Address m_Owner = Zero;
            Address m_OwnerAssociated = Zero;
            Address m_BridgeAssociated = Zero;
            Address m_WithdrawAccount = Zero;
            Signature m_Signature = Zero;
            uint8_t m_RecoveryId = 0;
            Merkle::Path m_Path;
            Origin m_Origin = Zero;
            boost::optional<Seed> m_TokenSeed;
            boost::optional<SignedMetadata> m_SignedMeta;
            boost::optional<Address> m_CollectionMetadata; // required if the token belongs to a collection

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Mint, m_Metadata, m_Owner, m_OwnerAssociated, m_BridgeAssociated,
                m_WithdrawAccount, m_Signature, m_RecoveryId, m_Path, m_Origin, m_TokenSeed, m_SignedMeta, m_CollectionMetadata);
            void Validate(const Config&) const;
        };

        struct MintCollection
        {
            static constexpr Instruction s_Type = Instruction::MintCollection;

            Seed m_Seeds = Zero;
            Address m_BridgeAdmin = Zero;
            Address m_Mint = Zero;
            Address m_BridgeAssociated = Zero;
            Address m_Metadata = Zero;
            Address m_Payer = Zero;
            SignedMetadata m_Data;
            Seed m_TokenSeed = Zero;

            SERIALIZE(m_Seeds, m_BridgeAdmin, m_Mint, m_BridgeAssociated, m_Metadata, m_Payer, m_Data, m_TokenSeed);
            void Validate(const Config&) const;
        };
    }

    // Tagged wire form: instruction tag, then the request body
    template <typename TRequest>
    void EncodeRequest(ByteBuffer&, const TRequest&);

} // namespace xbridge::bridge
