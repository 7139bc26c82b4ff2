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

#include <stdexcept>
#include <stdint.h>

namespace xbridge::bridge
{
#define XBRIDGE_ERROR_CATEGORY_MAP(MACRO) \
    MACRO(Config,   "ConfigError") \
    MACRO(State,    "StateError") \
    MACRO(Auth,     "AuthError") \
    MACRO(Data,     "DataError") \
    MACRO(Resource, "ResourceError")

    enum class ErrorCategory : uint8_t
    {
#define MACRO(name, _) name,
        XBRIDGE_ERROR_CATEGORY_MAP(MACRO)
#undef MACRO
    };

#define XBRIDGE_ERROR_MAP(MACRO) \
    MACRO(WrongSeeds,               0,  Config,   "Wrong seeds") \
    MACRO(WrongNonce,               1,  Config,   "Wrong nonce") \
    MACRO(WrongTokenAccount,        2,  Config,   "Wrong token account") \
    MACRO(WrongMetadataAccount,     3,  Config,   "Wrong token metadata account") \
    MACRO(WrongTokenSeed,           4,  Config,   "Wrong token seed") \
    MACRO(AlreadyInUse,             5,  State,    "Already in use") \
    MACRO(NotInitialized,           6,  State,    "Not initialized") \
    MACRO(NoTokenMeta,              7,  State,    "No token metadata provided") \
    MACRO(InvalidSignature,         8,  Auth,     "Invalid signature") \
    MACRO(WrongSignature,           9,  Auth,     "Wrong signature") \
    MACRO(WrongCommissionProgram,   10, Auth,     "Wrong commission program") \
    MACRO(WrongCommissionAccount,   11, Auth,     "Wrong commission account") \
    MACRO(WrongCommissionArguments, 12, Auth,     "Wrong commission arguments") \
    MACRO(MalformedProof,           13, Data,     "Malformed merkle proof") \
    MACRO(MalformedPayload,         14, Data,     "Malformed payload") \
    MACRO(WrongArgsSize,            15, Data,     "Wrong arguments size") \
    MACRO(WrongBalance,             16, Resource, "Insufficient balance")

    enum class ErrorCode : uint32_t
    {
#define MACRO(name, code, category, _) name = code,
        XBRIDGE_ERROR_MAP(MACRO)
#undef MACRO
    };

    const char* get_ErrorName(ErrorCode);
    const char* get_ErrorMessage(ErrorCode);
    ErrorCategory get_ErrorCategory(ErrorCode);
    const char* get_CategoryName(ErrorCategory);

    // Rejection of a request. The whole atomic unit it belongs to is discarded.
    class Exc : public std::runtime_error
    {
    public:
        explicit Exc(ErrorCode);

        ErrorCode get_Code() const { return m_Code; }
        ErrorCategory get_Category() const { return get_ErrorCategory(m_Code); }

    private:
        ErrorCode m_Code;
    };

    [[noreturn]] void Fail(ErrorCode);

    inline void Test(bool b, ErrorCode code)
    {
        if (!b)
            Fail(code);
    }

} // namespace xbridge::bridge
