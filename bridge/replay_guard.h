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
#include "records.h"
#include "errors.h"

namespace xbridge::bridge
{
    // One redemption per origin: the withdraw record lives at an address derived from the origin,
    // and its exclusive creation is what rejects a replay.
    class ReplayGuard
    {
    public:
        ReplayGuard(IAccountStore&, IAddressDeriver&, const Address& program);

        Address get_RecordAddress(const Origin&);

        // WrongNonce if recordAccount isn't derived from the origin, AlreadyInUse if it's occupied or finalized
        void Claim(const Address& recordAccount, const Origin&, const Address& payer);

        // Writes the final fields of a claimed record
        void Finalize(const Address& recordAccount, const WithdrawRecord&);

        bool IsRedeemed(const Origin&);
        bool get_Record(const Origin&, WithdrawRecord&);

    private:
        IAccountStore& m_Store;
        IAddressDeriver& m_Deriver;
        Address m_Program;
    };

} // namespace xbridge::bridge
