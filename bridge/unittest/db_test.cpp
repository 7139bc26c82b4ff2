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

#include "bridge/db.h"
#include "bridge/processor.h"
#include "bridge/admin_store.h"
#include "bridge/replay_guard.h"
#include "bridge/commission.h"
#include "test_ledger.h"

XBRIDGE_TEST_MAIN_DEFS

namespace xbridge::bridge
{
    Address MakeAddr(const std::string& s)
    {
        Address res;
        Ecdsa::get_Hash(res, s.data(), static_cast<uint32_t>(s.size()));
        return res;
    }

    struct AccountCollector
        :public IAccountWalker
    {
        std::vector<Address> m_vAddrs;

        bool OnAccount(const Address& addr, const Address&, const ByteBuffer&) override
        {
            m_vAddrs.push_back(addr);
            return true;
        }
    };

    bool IsCorruption(BridgeDB& db, const Address& addr)
    {
        try {
            db.Save(addr, ByteBuffer(4, 1));
        }
        catch (const CorruptionException&) {
            return true;
        }
        return false;
    }

    void TestAccounts(const char* szPath)
    {
        Address a1 = MakeAddr("a1"), a2 = MakeAddr("a2"), a3 = MakeAddr("a3");
        Address owner = MakeAddr("owner");

        {
            BridgeDB db;
            db.Open(szPath);
            verify_test(db.IsOpen());
            verify_test(!db.get_AccountsCount());

            verify_test(db.CreateAt(a1, 16, owner));
            verify_test(!db.CreateAt(a1, 16, owner));

            ByteBuffer buf;
            verify_test(db.Load(a1, buf));
            verify_test((16 == buf.size()) && memis0(&buf.front(), buf.size()));
            verify_test(!db.Load(a2, buf));

            buf.assign(16, 0x5a);
            db.Save(a1, buf);
            verify_test(IsCorruption(db, a2));

            // a unit that's rolled back leaves nothing behind
            db.Begin();
            verify_test(db.IsInTransaction());
            verify_test(db.CreateAt(a2, 8, owner));
            db.Save(a1, ByteBuffer(16, 0));
            db.Rollback();
            verify_test(!db.IsInTransaction());

            // a repeated rollback is a no-op, and the next unit starts normally
            db.Rollback();
            db.Begin();
            db.Rollback();

            verify_test(!db.Load(a2, buf));
            verify_test(db.Load(a1, buf) && (0x5a == buf[0]));

            {
                BridgeDB::Transaction t(db);
                verify_test(db.CreateAt(a3, 8, owner));
                verify_test(db.CreateAt(a2, 8, owner));
                t.Commit();
            }

            {
                // rolls back by default
                BridgeDB::Transaction t(db);
                db.Save(a2, ByteBuffer(8, 7));
            }

            verify_test(db.Load(a2, buf) && memis0(&buf.front(), buf.size()));
            verify_test(3 == db.get_AccountsCount());
        }

        {
            // persisted
            BridgeDB db;
            db.Open(szPath);

            ByteBuffer buf;
            verify_test(db.Load(a1, buf) && (16 == buf.size()) && (0x5a == buf[15]));
            verify_test(!db.CreateAt(a3, 8, owner));

            AccountCollector ac;
            db.EnumAccounts(ac);
            verify_test(3 == ac.m_vAddrs.size());
            for (size_t i = 1; i < ac.m_vAddrs.size(); i++)
                verify_test(ac.m_vAddrs[i - 1] < ac.m_vAddrs[i]);

            db.Close();
            verify_test(!db.IsOpen());
        }
    }

    void TestProcessorOverDb(const char* szPath)
    {
        Config cfg;
        cfg.ProgramID = MakeAddr("bridge-program");

        KeccakAddressDeriver deriver;
        TestLedger ledger;
        TestInspector inspector;

        Ecdsa::Secret sk = MakeAddr("secret");
        PubKey pk;
        verify_test(Ecdsa::get_PublicKey(pk, sk));

        Seed seeds = MakeAddr("seeds");
        Address bridgeAdmin = get_BridgeAdminAddress(deriver, cfg, seeds);
        Address user = MakeAddr("user");

        ledger.m_Native[bridgeAdmin] = 1000;

        Origin origin = MakeAddr("event");

        Request::WithdrawNative req;
        req.m_Seeds = seeds;
        req.m_BridgeAdmin = bridgeAdmin;
        req.m_Owner = user;
        req.m_Origin = origin;
        req.m_Amount = 600;

        {
            BridgeDB db;
            db.Open(szPath);

            req.m_WithdrawAccount = ReplayGuard(db, deriver, cfg.ProgramID).get_RecordAddress(origin);

            ContentLeaf leaf;
            leaf.m_Origin = origin;
            leaf.m_Receiver = user;
            leaf.m_Program = cfg.ProgramID;
            leaf.m_Payload = Payload::Native{ req.m_Amount };

            Merkle::Builder bld;
            bld.m_vLeafs.resize(2);
            leaf.get_Hash(bld.m_vLeafs[0], cfg.NetworkTag);
            bld.m_vLeafs[1] = MakeAddr("another-leaf");

            Hash hvRoot;
            bld.get_Root(hvRoot);
            bld.get_Path(req.m_Path, 0);
            verify_test(Ecdsa::Sign(req.m_Signature, req.m_RecoveryId, sk, hvRoot));

            Processor proc(cfg, db, ledger, deriver, inspector);

            Request::InitializeAdmin reqInit;
            reqInit.m_Seeds = seeds;
            reqInit.m_BridgeAdmin = bridgeAdmin;
            reqInit.m_Payer = user;
            reqInit.m_Key = pk;
            reqInit.m_CommissionProgram = MakeAddr("commission");
            proc.InitializeAdmin(reqInit);

            // the signature covers the amount
            Request::WithdrawNative reqBig = req;
            reqBig.m_Amount = 5000;
            try {
                proc.WithdrawNative(reqBig);
                verify_test(false);
            }
            catch (const Exc& e) {
                verify_test(ErrorCode::WrongSignature == e.get_Code());
            }

            // not enough funds: the record creation is rolled back with the rest
            ledger.m_Native[bridgeAdmin] = 500;
            try {
                proc.WithdrawNative(req);
                verify_test(false);
            }
            catch (const Exc& e) {
                verify_test(ErrorCode::WrongBalance == e.get_Code());
            }

            ByteBuffer buf;
            verify_test(!db.Load(req.m_WithdrawAccount, buf));

            ledger.m_Native[bridgeAdmin] = 1000;
            proc.WithdrawNative(req);
            verify_test(400 == ledger.get_NativeBalance(bridgeAdmin));
        }

        {
            // the redemption survives a restart
            BridgeDB db;
            db.Open(szPath);

            verify_test(ReplayGuard(db, deriver, cfg.ProgramID).IsRedeemed(origin));
            verify_test(AdminKeyStore(db, bridgeAdmin).get_Record().m_Key == pk);

            Processor proc(cfg, db, ledger, deriver, inspector);
            try {
                proc.WithdrawNative(req);
                verify_test(false);
            }
            catch (const Exc& e) {
                verify_test(ErrorCode::AlreadyInUse == e.get_Code());
            }

            verify_test(400 == ledger.get_NativeBalance(bridgeAdmin));
        }
    }

} // namespace xbridge::bridge

int main()
{
    using namespace xbridge;

    try
    {
        helpers::TempFile fAccounts("xbridge_db_test.db");
        bridge::TestAccounts(fAccounts.c_str());

        helpers::TempFile fProcessor("xbridge_db_processor_test.db");
        bridge::TestProcessorOverDb(fProcessor.c_str());
    }
    catch (const std::exception& e)
    {
        printf("Exception: %s\n", e.what());
        g_TestsFailed++;
    }
    catch (const CorruptionException& e)
    {
        printf("Corruption: %s\n", e.m_sErr.c_str());
        g_TestsFailed++;
    }

    return g_TestsFailed ? -1 : 0;
}
