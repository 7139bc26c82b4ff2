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

#include "payload.h"

namespace xbridge::bridge
{
    namespace
    {
        typedef uintBig_t<32> AmountBig;

        template <uint32_t nBytes>
        void Append(ByteBuffer& buf, const uintBig_t<nBytes>& x)
        {
            buf.insert(buf.end(), std::begin(x.m_pData), std::end(x.m_pData));
        }

        void Append(ByteBuffer& buf, const std::string& s)
        {
            const std::string sTrimmed = TrimNul(s);
            buf.insert(buf.end(), sTrimmed.begin(), sTrimmed.end());
        }

        void AppendAmount(ByteBuffer& buf, Amount val)
        {
            Append(buf, AmountBig(val));
        }

        struct PayloadEncoder
        {
            ByteBuffer& m_Buf;

            void operator () (const Payload::Native& x) const
            {
                Append(m_Buf, Address(Zero));
                AppendAmount(m_Buf, x.m_Amount);
            }

            void operator () (const Payload::FungibleTransfer& x) const
            {
                Append(m_Buf, x.m_Mint);
                AppendAmount(m_Buf, x.m_Amount);
                Append(m_Buf, x.m_Name);
                Append(m_Buf, x.m_Symbol);
                Append(m_Buf, x.m_Uri);
            }

            void operator () (const Payload::NonFungibleTransfer& x) const
            {
                Append(m_Buf, x.m_Mint);
                Append(m_Buf, x.m_Collection ? *x.m_Collection : Address(Zero));
                AppendAmount(m_Buf, 1U);
                Append(m_Buf, x.m_Name);
                Append(m_Buf, x.m_Symbol);
                Append(m_Buf, x.m_Uri);
            }
        };
    }

    TokenKind get_Kind(const TransferPayload& p)
    {
        struct Visitor
        {
            TokenKind operator () (const Payload::Native&) const { return TokenKind::Native; }
            TokenKind operator () (const Payload::FungibleTransfer&) const { return TokenKind::FT; }
            TokenKind operator () (const Payload::NonFungibleTransfer&) const { return TokenKind::NFT; }
        };
        return std::visit(Visitor(), p);
    }

    Amount get_Amount(const TransferPayload& p)
    {
        struct Visitor
        {
            Amount operator () (const Payload::Native& x) const { return x.m_Amount; }
            Amount operator () (const Payload::FungibleTransfer& x) const { return x.m_Amount; }
            Amount operator () (const Payload::NonFungibleTransfer&) const { return 1; }
        };
        return std::visit(Visitor(), p);
    }

    void ContentLeaf::Encode(ByteBuffer& buf, const std::string& sNetworkTag) const
    {
        buf.clear();
        Append(buf, m_Origin);
        buf.insert(buf.end(), sNetworkTag.begin(), sNetworkTag.end());
        Append(buf, m_Receiver);
        Append(buf, m_Program);

        std::visit(PayloadEncoder{ buf }, m_Payload);
    }

    void ContentLeaf::get_Hash(Hash& hv, const std::string& sNetworkTag) const
    {
        ByteBuffer buf;
        Encode(buf, sNetworkTag);

        Keccak256 hp;
        hp.Write(Blob(buf));
        hp >> hv;
    }

} // namespace xbridge::bridge
