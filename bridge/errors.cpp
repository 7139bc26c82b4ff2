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

#include "errors.h"

namespace xbridge::bridge
{
    const char* get_ErrorName(ErrorCode code)
    {
        switch (code)
        {
#define MACRO(name, code, category, _) case ErrorCode::name: return #name;
            XBRIDGE_ERROR_MAP(MACRO)
#undef MACRO
        }
        return "Unknown";
    }

    const char* get_ErrorMessage(ErrorCode code)
    {
        switch (code)
        {
#define MACRO(name, code, category, message) case ErrorCode::name: return message;
            XBRIDGE_ERROR_MAP(MACRO)
#undef MACRO
        }
        return "Unknown error";
    }

    ErrorCategory get_ErrorCategory(ErrorCode code)
    {
        switch (code)
        {
#define MACRO(name, code, category, _) case ErrorCode::name: return ErrorCategory::category;
            XBRIDGE_ERROR_MAP(MACRO)
#undef MACRO
        }
        return ErrorCategory::Data;
    }

    const char* get_CategoryName(ErrorCategory cat)
    {
        switch (cat)
        {
#define MACRO(name, text) case ErrorCategory::name: return text;
            XBRIDGE_ERROR_CATEGORY_MAP(MACRO)
#undef MACRO
        }
        return "Error";
    }

    Exc::Exc(ErrorCode code)
        : std::runtime_error(get_ErrorMessage(code))
        , m_Code(code)
    {
    }

    void Fail(ErrorCode code)
    {
        throw Exc(code);
    }

} // namespace xbridge::bridge
