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

#include "capabilities.h"

namespace xbridge::bridge
{
    namespace
    {
        const char s_szDerivedMarker[] = "ProgramDerivedAddress";

        Address ProgramIdFromName(const char* szName)
        {
            Address res;
            Keccak256 hp;
            hp.Write(szName, static_cast<uint32_t>(strlen(szName)));
            hp >> res;
            return res;
        }
    }

    const Address& KeccakAddressDeriver::get_AssociatedTokenProgram()
    {
        static const Address s_Val = ProgramIdFromName("xbridge.associated-token");
        return s_Val;
    }

    const Address& KeccakAddressDeriver::get_MetadataProgram()
    {
        static const Address s_Val = ProgramIdFromName("xbridge.token-metadata");
        return s_Val;
    }

    Address KeccakAddressDeriver::get_ProgramAddress(const std::vector<Blob>& seeds, const Address& program)
    {
        Keccak256 hp;
        for (const auto& seed : seeds)
            hp.Write(seed);

        hp << program;
        hp.Write(s_szDerivedMarker, static_cast<uint32_t>(sizeof(s_szDerivedMarker) - 1));

        Address res;
        hp >> res;
        return res;
    }

    Address KeccakAddressDeriver::get_AssociatedAccount(const Address& owner, const Address& mint)
    {
        return get_ProgramAddress({ owner, mint }, get_AssociatedTokenProgram());
    }

    Address KeccakAddressDeriver::get_MetadataAccount(const Address& mint)
    {
        static const char szPrefix[] = "metadata";
        const Address& program = get_MetadataProgram();

        return get_ProgramAddress({ Blob(szPrefix, sizeof(szPrefix) - 1), program, mint }, program);
    }

} // namespace xbridge::bridge
