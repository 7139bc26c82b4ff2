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

#include "common.h"
#include "errors.h"

namespace xbridge::bridge
{
    const char* get_TokenKindName(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::Native: return "native";
        case TokenKind::FT: return "ft";
        case TokenKind::NFT: return "nft";
        default:
            break;
        }
        return "unknown";
    }

    bool TokenKindFromString(TokenKind& kind, const std::string& s)
    {
        for (uint8_t i = 0; i < static_cast<uint8_t>(TokenKind::Count); i++)
        {
            if (s == get_TokenKindName(static_cast<TokenKind>(i)))
            {
                kind = static_cast<TokenKind>(i);
                return true;
            }
        }
        return false;
    }

    std::string TrimNul(const std::string& s)
    {
        size_t n = s.find_last_not_of('\0');
        return (std::string::npos == n) ? std::string() : s.substr(0, n + 1);
    }

    void SignedMetadata::Validate() const
    {
        Test(
            (m_Name.size() <= s_MaxName) &&
            (m_Symbol.size() <= s_MaxSymbol) &&
            (m_Uri.size() <= s_MaxUri),
            ErrorCode::WrongArgsSize);
    }

} // namespace xbridge::bridge
