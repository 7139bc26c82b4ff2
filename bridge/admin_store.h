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
    // Holds the authority key of one bridge deployment.
    // Uninitialized -> Initialized(key, commission program), then only key rotation.
    class AdminKeyStore
    {
    public:
        AdminKeyStore(IAccountStore&, const Address& adminAccount);

        // AlreadyInUse if the admin account exists
        void Initialize(const Address& payer, const PubKey&, const Address& commissionProgram);

        // The new key must be signed (its keccak256) by the current one
        void RotateKey(const PubKey& newKey, const Signature&, uint8_t nRecoveryId);

        // NotInitialized if absent or uninitialized
        const AdminRecord& get_Record();

        static void get_RotationMessage(Hash&, const PubKey& newKey);

    private:
        bool TryLoad();

        IAccountStore& m_Store;
        Address m_Account;
        AdminRecord m_Record;
        bool m_Loaded = false;
    };

} // namespace xbridge::bridge
