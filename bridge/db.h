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
#include <sqlite3.h>

namespace xbridge::bridge {

// SQLite-backed account store. Exclusive creation relies on the primary key,
// atomic units are plain sqlite transactions.
class BridgeDB
    :public IAccountStore
{
public:

    struct ParamID {
        enum Enum {
            DbVer,
        };
    };

    struct Query
    {
        enum Enum
        {
            Begin,
            Commit,
            Rollback,
            Scheme,
            ParamGet,
            ParamSet,
            AccountIns,
            AccountGet,
            AccountUpd,
            AccountEnum,
            AccountCount,

            count
        };
    };

    BridgeDB();
    ~BridgeDB();

    void Open(const char* szPath);
    void Close();
    bool IsOpen() const { return nullptr != m_pDb; }
    bool IsInTransaction() const;

    class Recordset
    {
        sqlite3_stmt* m_pStmt;
        BridgeDB* m_pDB;

    public:
        Recordset(BridgeDB&, Query::Enum, const char*);
        ~Recordset();

        void Reset();

        // Perform the query step. SELECT only: returns true while there're rows to read
        bool Step();
        // INSERT/UPDATE only: returns false on a constraint violation
        bool StepModifySafe();

        void put(int col, uint32_t);
        void put(int col, uint64_t);
        void put(int col, const Blob&);
        void put(int col, const char*);
        void putZeroBlob(int col, uint32_t nSize);
        void get(int col, uint64_t&);
        void get(int col, Blob&);
        void get(int col, ByteBuffer&);

        const void* get_BlobStrict(int col, uint32_t n);

        template <typename T> void get_As(int col, T& out) { memcpy(&out, get_BlobStrict(col, sizeof(T)), sizeof(T)); }

        void put(int col, const Address& x) { put(col, Blob(x)); }
        void get(int col, Address& x) { get_As(col, x); }
    };

    class Transaction {
        BridgeDB* m_pDB;
    public:
        Transaction(BridgeDB& db);
        ~Transaction(); // by default - rolls back

        void Commit();
        void Rollback();
    };

    void ParamIntSet(uint32_t ID, uint64_t val);
    bool ParamIntGet(uint32_t ID, uint64_t& val);

    uint64_t get_AccountsCount();

    // IAccountStore
    void Begin() override;
    void Commit() override;
    void Rollback() override;
    bool CreateAt(const Address&, uint32_t nSize, const Address& owner) override;
    bool Load(const Address&, ByteBuffer&) override;
    void Save(const Address&, const ByteBuffer&) override;
    void EnumAccounts(IAccountWalker&) override;

private:

    struct Statement
    {
        sqlite3_stmt* m_pStmt;
        Statement() :m_pStmt(nullptr) {}
        ~Statement() { Close(); }

        void Close();
    };

    sqlite3* m_pDb;
    Statement m_pPrep[Query::count];

    void Create();
    void TestRet(int);
    void ThrowSqliteError(int);
    static void ThrowError(const char*);
    void TestChanged1Row();

    void ExecQuick(const char*);
    bool ExecStep(sqlite3_stmt*);
    bool ExecStep(Query::Enum, const char*);
    void Prepare(Statement&, const char*);
    sqlite3_stmt* get_Statement(Query::Enum, const char*);
};

} // namespace xbridge::bridge
