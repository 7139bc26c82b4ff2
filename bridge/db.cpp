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

#include "db.h"
#include "utility/logger.h"
#include <exception>
#include <cstdio>

namespace xbridge::bridge {

// Literal constants
#define TblParams           "Params"
#define TblParams_ID        "ID"
#define TblParams_Int       "ParamInt"
#define TblParams_Blob      "ParamBlob"

#define TblAccounts         "Accounts"
#define TblAccounts_Address "Address"
#define TblAccounts_Owner   "Owner"
#define TblAccounts_Data    "Data"

BridgeDB::BridgeDB()
    :m_pDb(nullptr)
{
}

BridgeDB::~BridgeDB()
{
    Close();
}

void BridgeDB::TestRet(int ret)
{
    if (SQLITE_OK != ret)
        ThrowSqliteError(ret);
}

void BridgeDB::ThrowSqliteError(int ret)
{
    char sz[0x1000];
    snprintf(sz, _countof(sz), "sqlite err %d, %s", ret, sqlite3_errmsg(m_pDb));
    ThrowError(sz);
}

void BridgeDB::ThrowError(const char* sz)
{
    // all DB errors are treated as corruption
    CorruptionException::Throw(sz);
}

void BridgeDB::Statement::Close()
{
    if (m_pStmt)
    {
        sqlite3_finalize(m_pStmt); // don't care about retval
        m_pStmt = nullptr;
    }
}

void BridgeDB::Close()
{
    if (m_pDb)
    {
        for (size_t i = 0; i < _countof(m_pPrep); i++)
            m_pPrep[i].Close();

        XBRIDGE_VERIFY(SQLITE_OK == sqlite3_close(m_pDb));
        m_pDb = nullptr;
    }
}

BridgeDB::Recordset::Recordset(BridgeDB& db, Query::Enum val, const char* sql)
    :m_pStmt(nullptr)
    ,m_pDB(&db)
{
    m_pStmt = db.get_Statement(val, sql);
}

BridgeDB::Recordset::~Recordset()
{
    Reset();
}

void BridgeDB::Recordset::Reset()
{
    if (m_pStmt)
    {
        sqlite3_reset(m_pStmt); // don't care about retval
        sqlite3_clear_bindings(m_pStmt);
    }
}

bool BridgeDB::Recordset::Step()
{
    return m_pDB->ExecStep(m_pStmt);
}

bool BridgeDB::Recordset::StepModifySafe()
{
    int nVal = sqlite3_step(m_pStmt);
    switch (nVal)
    {

    default:
        m_pDB->ThrowSqliteError(nVal);
        // no break

    case SQLITE_DONE:
        return true;

    case SQLITE_CONSTRAINT:
        return false;
    }
}

void BridgeDB::Recordset::put(int col, uint32_t x)
{
    m_pDB->TestRet(sqlite3_bind_int(m_pStmt, col+1, x));
}

void BridgeDB::Recordset::put(int col, uint64_t x)
{
    m_pDB->TestRet(sqlite3_bind_int64(m_pStmt, col+1, x));
}

void BridgeDB::Recordset::put(int col, const Blob& x)
{
    // an empty blob must not be bound as NULL
    const void* pPtr = x.n ? x.p : this;
    m_pDB->TestRet(sqlite3_bind_blob(m_pStmt, col+1, pPtr, x.n, NULL));
}

void BridgeDB::Recordset::put(int col, const char* sz)
{
    m_pDB->TestRet(sqlite3_bind_text(m_pStmt, col+1, sz, -1, NULL));
}

void BridgeDB::Recordset::putZeroBlob(int col, uint32_t nSize)
{
    m_pDB->TestRet(sqlite3_bind_zeroblob(m_pStmt, col+1, nSize));
}

void BridgeDB::Recordset::get(int col, uint64_t& x)
{
    x = sqlite3_column_int64(m_pStmt, col);
}

void BridgeDB::Recordset::get(int col, Blob& x)
{
    x.p = sqlite3_column_blob(m_pStmt, col);
    x.n = sqlite3_column_bytes(m_pStmt, col);
}

void BridgeDB::Recordset::get(int col, ByteBuffer& x)
{
    Blob b;
    get(col, b);
    b.Export(x);
}

const void* BridgeDB::Recordset::get_BlobStrict(int col, uint32_t n)
{
    Blob x;
    get(col, x);

    if (x.n != n)
    {
        char sz[0x80];
        snprintf(sz, sizeof(sz), "Blob size expected=%u, actual=%u", n, x.n);
        ThrowError(sz);
    }

    return x.p;
}

void BridgeDB::Open(const char* szPath)
{
    TestRet(sqlite3_open_v2(szPath, &m_pDb, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_CREATE, NULL));
    sqlite3_busy_timeout(m_pDb, 5000);

    bool bCreate;
    {
        Recordset rs(*this, Query::Scheme, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
        rs.put(0, TblParams);
        bCreate = !rs.Step();
    }

    const uint64_t nVersionTop = 1;

    Transaction t(*this);

    if (bCreate)
    {
        LOG_INFO() << "Creating bridge storage " << szPath;
        Create();
        ParamIntSet(ParamID::DbVer, nVersionTop);
    }
    else
    {
        uint64_t nVer = 0;
        if (!ParamIntGet(ParamID::DbVer, nVer) || (nVer != nVersionTop))
            ThrowError("Unsupported db version");
    }

    t.Commit();
}

void BridgeDB::Create()
{
    ExecQuick("CREATE TABLE [" TblParams "] ("
        "[" TblParams_ID    "] INTEGER NOT NULL PRIMARY KEY,"
        "[" TblParams_Int   "] INTEGER,"
        "[" TblParams_Blob  "] BLOB)");

    ExecQuick("CREATE TABLE [" TblAccounts "] ("
        "[" TblAccounts_Address "] BLOB NOT NULL PRIMARY KEY,"
        "[" TblAccounts_Owner   "] BLOB NOT NULL,"
        "[" TblAccounts_Data    "] BLOB NOT NULL)");
}

void BridgeDB::ExecQuick(const char* szSql)
{
    TestRet(sqlite3_exec(m_pDb, szSql, NULL, NULL, NULL));
}

bool BridgeDB::ExecStep(sqlite3_stmt* pStmt)
{
    int nVal = sqlite3_step(pStmt);
    switch (nVal)
    {

    default:
        ThrowSqliteError(nVal);
        // no break

    case SQLITE_DONE:
        return false;

    case SQLITE_ROW:
        return true;
    }
}

bool BridgeDB::ExecStep(Query::Enum val, const char* sql)
{
    sqlite3_stmt* pStmt = get_Statement(val, sql);

    // reset before reporting a failure, the cached statement must stay reusable
    int nVal = sqlite3_step(pStmt);
    sqlite3_reset(pStmt); // don't care about retval

    if ((SQLITE_DONE != nVal) && (SQLITE_ROW != nVal))
        ThrowSqliteError(nVal);

    return (SQLITE_ROW == nVal);
}

void BridgeDB::Prepare(Statement& s, const char* szSql)
{
    assert(!s.m_pStmt);

    const char* szTail;
    int nRet = sqlite3_prepare_v2(m_pDb, szSql, -1, &s.m_pStmt, &szTail);
    TestRet(nRet);
    assert(s.m_pStmt);
}

sqlite3_stmt* BridgeDB::get_Statement(Query::Enum val, const char* sql)
{
    if (!m_pDb)
        ThrowError("db not open");

    assert(val < _countof(m_pPrep));
    Statement& s = m_pPrep[val];

    if (!s.m_pStmt)
        Prepare(s, sql);
    return s.m_pStmt;
}

void BridgeDB::TestChanged1Row()
{
    if (1 != sqlite3_changes(m_pDb))
        ThrowError("1row change failed");
}

void BridgeDB::ParamIntSet(uint32_t ID, uint64_t val)
{
    Recordset rs(*this, Query::ParamSet, "INSERT OR REPLACE INTO " TblParams " (" TblParams_ID "," TblParams_Int ") VALUES(?,?)");
    rs.put(0, ID);
    rs.put(1, val);
    rs.Step();
}

bool BridgeDB::ParamIntGet(uint32_t ID, uint64_t& val)
{
    Recordset rs(*this, Query::ParamGet, "SELECT " TblParams_Int " FROM " TblParams " WHERE " TblParams_ID "=?");
    rs.put(0, ID);

    if (!rs.Step())
        return false;

    rs.get(0, val);
    return true;
}

/////////////////////////////
// Transaction
BridgeDB::Transaction::Transaction(BridgeDB& db)
    :m_pDB(nullptr)
{
    db.Begin();
    m_pDB = &db;
}

BridgeDB::Transaction::~Transaction()
{
    if (std::uncaught_exceptions())
    {
        try {
            Rollback();
        }
        catch (const CorruptionException& e) {
            LOG_ERROR() << "Rollback failed: " << e.m_sErr;
        }
    }
    else
        Rollback();
}

void BridgeDB::Transaction::Commit()
{
    assert(m_pDB);
    m_pDB->Commit();
    m_pDB = nullptr;
}

void BridgeDB::Transaction::Rollback()
{
    if (m_pDB)
    {
        BridgeDB* pDB = m_pDB;
        m_pDB = nullptr;
        pDB->Rollback();
    }
}

/////////////////////////////
// IAccountStore
void BridgeDB::Begin()
{
    ExecStep(Query::Begin, "BEGIN");
}

void BridgeDB::Commit()
{
    ExecStep(Query::Commit, "COMMIT");
}

void BridgeDB::Rollback()
{
    // a failed COMMIT may have already ended the transaction
    if (!IsInTransaction())
        return;

    ExecStep(Query::Rollback, "ROLLBACK");
}

bool BridgeDB::IsInTransaction() const
{
    return m_pDb && !sqlite3_get_autocommit(m_pDb);
}

bool BridgeDB::CreateAt(const Address& addr, uint32_t nSize, const Address& owner)
{
    Recordset rs(*this, Query::AccountIns, "INSERT INTO " TblAccounts "(" TblAccounts_Address "," TblAccounts_Owner "," TblAccounts_Data ") VALUES(?,?,?)");
    rs.put(0, addr);
    rs.put(1, owner);
    rs.putZeroBlob(2, nSize);

    if (!rs.StepModifySafe())
        return false;

    TestChanged1Row();
    return true;
}

bool BridgeDB::Load(const Address& addr, ByteBuffer& buf)
{
    Recordset rs(*this, Query::AccountGet, "SELECT " TblAccounts_Data " FROM " TblAccounts " WHERE " TblAccounts_Address "=?");
    rs.put(0, addr);

    if (!rs.Step())
        return false;

    rs.get(0, buf);
    return true;
}

void BridgeDB::Save(const Address& addr, const ByteBuffer& buf)
{
    Recordset rs(*this, Query::AccountUpd, "UPDATE " TblAccounts " SET " TblAccounts_Data "=? WHERE " TblAccounts_Address "=?");
    rs.put(0, Blob(buf));
    rs.put(1, addr);
    rs.Step();

    TestChanged1Row();
}

void BridgeDB::EnumAccounts(IAccountWalker& w)
{
    Recordset rs(*this, Query::AccountEnum, "SELECT " TblAccounts_Address "," TblAccounts_Owner "," TblAccounts_Data " FROM " TblAccounts " ORDER BY " TblAccounts_Address);

    while (rs.Step())
    {
        Address addr, owner;
        ByteBuffer buf;
        rs.get(0, addr);
        rs.get(1, owner);
        rs.get(2, buf);

        if (!w.OnAccount(addr, owner, buf))
            break;
    }
}

uint64_t BridgeDB::get_AccountsCount()
{
    Recordset rs(*this, Query::AccountCount, "SELECT COUNT(*) FROM " TblAccounts);
    if (!rs.Step())
        ThrowError("count failed");

    uint64_t n = 0;
    rs.get(0, n);
    return n;
}

} // namespace xbridge::bridge
