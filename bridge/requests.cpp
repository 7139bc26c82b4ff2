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

#include "requests.h"
#include "core/serialization_adapters.h"

namespace xbridge::bridge
{
    const char* get_InstructionName(Instruction type)
    {
        switch (type)
        {
#define THE_MACRO(code, name) case Instruction::name: return #name;
            XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO
        }
        return "Unknown";
    }

    namespace
    {
        void ValidateDeposit(const Config& cfg, const std::string& sNetworkTo, const std::string& sReceiver)
        {
            Test(
                (sNetworkTo.size() <= cfg.MaxNetworkSize) &&
                (sReceiver.size() <= cfg.MaxAddressSize),
                ErrorCode::WrongArgsSize);
        }
    }

    namespace Request
    {
        void DepositNative::Validate(const Config& cfg) const
        {
            ValidateDeposit(cfg, m_NetworkTo, m_ReceiverAddress);
        }

        void DepositFT::Validate(const Config& cfg) const
        {
            ValidateDeposit(cfg, m_NetworkTo, m_ReceiverAddress);
        }

        void DepositNFT::Validate(const Config& cfg) const
        {
            ValidateDeposit(cfg, m_NetworkTo, m_ReceiverAddress);
        }

        void WithdrawFT::Validate(const Config&) const
        {
            if (m_SignedMeta)
                m_SignedMeta->Validate();
        }

        void WithdrawNFT::Validate(const Config&) const
        {
            if (m_SignedMeta)
                m_SignedMeta->Validate();
        }

        void MintCollection::Validate(const Config&) const
        {
            m_Data.Validate();
        }
    }

    template <typename TRequest>
    void EncodeRequest(ByteBuffer& buf, const TRequest& req)
    {
        Serializer ser;
        ser & static_cast<uint8_t>(TRequest::s_Type);
        ser & req;
        ser.swap_buf(buf);
    }

#define THE_MACRO(code, name) template void EncodeRequest<Request::name>(ByteBuffer&, const Request::name&);
    XBRIDGE_INSTRUCTIONS(THE_MACRO)
#undef THE_MACRO

} // namespace xbridge::bridge
