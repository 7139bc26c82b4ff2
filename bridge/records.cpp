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

#include "records.h"
#include "utility/byteorder.h"

namespace xbridge::bridge
{
    namespace
    {
        struct Writer
        {
            ByteBuffer& m_Buf;
            uint32_t m_Pos = 0;

            void WriteRaw(const void* p, uint32_t n)
            {
                assert(m_Pos + n <= m_Buf.size());
                memcpy(&m_Buf[m_Pos], p, n);
                m_Pos += n;
            }

            void operator & (uint8_t x) { WriteRaw(&x, sizeof(x)); }

            void operator & (uint64_t x)
            {
                assert(m_Pos + sizeof(x) <= m_Buf.size());
                ByteOrder::ExportLE(&m_Buf[m_Pos], x);
                m_Pos += sizeof(x);
            }

            template <uint32_t nBytes>
            void operator & (const uintBig_t<nBytes>& x) { WriteRaw(x.m_pData, nBytes); }
        };

        struct Reader
        {
            const ByteBuffer& m_Buf;
            uint32_t m_Pos = 0;

            bool ReadRaw(void* p, uint32_t n)
            {
                if (m_Pos + n > m_Buf.size())
                    return false;
                memcpy(p, &m_Buf[m_Pos], n);
                m_Pos += n;
                return true;
            }

            bool operator & (uint8_t& x) { return ReadRaw(&x, sizeof(x)); }

            bool operator & (uint64_t& x)
            {
                if (m_Pos + sizeof(x) > m_Buf.size())
                    return false;
                x = ByteOrder::ImportLE<uint64_t>(&m_Buf[m_Pos]);
                m_Pos += sizeof(x);
                return true;
            }

            template <uint32_t nBytes>
            bool operator & (uintBig_t<nBytes>& x) { return ReadRaw(x.m_pData, nBytes); }

            bool ReadBool(bool& b)
            {
                uint8_t x;
                if (!(*this & x) || (x > 1))
                    return false;
                b = !!x;
                return true;
            }
        };
    }

    void AdminRecord::Export(ByteBuffer& buf) const
    {
        buf.assign(s_Size, 0);
        Writer w{ buf };
        w & static_cast<uint8_t>(m_Initialized);
        w & m_Key;
        w & m_CommissionProgram;
    }

    bool AdminRecord::Import(const ByteBuffer& buf)
    {
        Reader r{ buf };
        return
            r.ReadBool(m_Initialized) &&
            (r & m_Key) &&
            (r & m_CommissionProgram);
    }

    void WithdrawRecord::Export(ByteBuffer& buf) const
    {
        buf.assign(s_Size, 0);
        Writer w{ buf };
        w & static_cast<uint8_t>(m_Initialized);
        w & static_cast<uint8_t>(m_Kind);
        w & m_Origin;

        if (m_Mint)
        {
            w & static_cast<uint8_t>(1);
            w & *m_Mint;
        }
        else
            w & static_cast<uint8_t>(0);

        w & m_Amount;
        w & m_Receiver;
        // the rest is zero padding
    }

    bool WithdrawRecord::Import(const ByteBuffer& buf)
    {
        Reader r{ buf };

        uint8_t nKind = 0, nMintTag = 0;
        if (!r.ReadBool(m_Initialized) || !(r & nKind) || !(r & m_Origin) || !(r & nMintTag))
            return false;

        if (nKind >= static_cast<uint8_t>(TokenKind::Count))
            return false;
        m_Kind = static_cast<TokenKind>(nKind);

        switch (nMintTag)
        {
        case 0:
            m_Mint.reset();
            break;

        case 1:
            m_Mint.emplace();
            if (!(r & *m_Mint))
                return false;
            break;

        default:
            return false;
        }

        return (r & m_Amount) && (r & m_Receiver);
    }

} // namespace xbridge::bridge
