// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "database.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <limits>

DEFINE_int32 (lastchair_sqlite_slow_query_ms, 0,
              "if non-zero, warn about statement steps taking longer than"
              " this many milliseconds");

namespace lastchair
{

namespace
{

/**
 * Routes SQLite's internal error log to glog.
 */
void
LogSQLiteError (void* ctx, const int code, const char* msg)
{
  LOG (ERROR) << "SQLite error " << code << ": " << msg;
}

/**
 * Converts an integer column value to a narrower type, failing if it does
 * not fit.
 */
template <typename T>
  T
  NarrowColumn (const int64_t val)
{
  CHECK_GE (val, static_cast<int64_t> (std::numeric_limits<T>::min ()))
      << "Column value out of range: " << val;
  CHECK_LE (val, static_cast<int64_t> (std::numeric_limits<T>::max ()))
      << "Column value out of range: " << val;
  return static_cast<T> (val);
}

} // anonymous namespace

/* ************************************************************************** */

SQLiteDatabase::Statement::Statement (Statement&& o)
{
  *this = std::move (o);
}

SQLiteDatabase::Statement&
SQLiteDatabase::Statement::operator= (Statement&& o)
{
  if (this == &o)
    return *this;

  Return ();

  db = o.db;
  sql = std::move (o.sql);
  stmt = o.stmt;
  steps = o.steps;

  o.db = nullptr;
  o.stmt = nullptr;
  o.steps = 0;

  return *this;
}

SQLiteDatabase::Statement::~Statement ()
{
  Return ();
}

void
SQLiteDatabase::Statement::Return ()
{
  if (stmt == nullptr)
    return;

  CHECK (db != nullptr);
  db->Release (sql, stmt);

  stmt = nullptr;
  db = nullptr;
  steps = 0;
}

sqlite3_stmt*
SQLiteDatabase::Statement::operator* () const
{
  CHECK (stmt != nullptr) << "Using an empty statement";
  return stmt;
}

void
SQLiteDatabase::Statement::Execute ()
{
  CHECK (!Step ()) << "Statement returned rows:\n" << sql;
}

bool
SQLiteDatabase::Statement::Step ()
{
  CHECK (db != nullptr);

  const auto start = std::chrono::steady_clock::now ();
  int rc;
  std::string err;
  {
    std::lock_guard<std::mutex> lock(db->mutDb);
    rc = sqlite3_step (**this);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
      err = sqlite3_errmsg (db->db);
  }
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds> (
      std::chrono::steady_clock::now () - start).count ();

  ++steps;
  if (FLAGS_lastchair_sqlite_slow_query_ms > 0
        && ms >= FLAGS_lastchair_sqlite_slow_query_ms)
    LOG (WARNING)
        << "Slow SQLite step #" << steps << " (" << ms << " ms):\n" << sql;
  else
    VLOG (steps == 1 ? 1 : 2) << "SQLite step #" << steps << ":\n" << sql;

  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;

  LOG (FATAL) << "SQLite step failed (" << rc << "): " << err << "\n" << sql;
}

void
SQLiteDatabase::Statement::Reset ()
{
  CHECK (db != nullptr);
  std::lock_guard<std::mutex> lock(db->mutDb);
  /* The return value repeats the error of the last step, if any, which
     has already been handled there.  */
  sqlite3_reset (**this);
  steps = 0;
}

void
SQLiteDatabase::Statement::CheckBound (const int rc, const int ind) const
{
  CHECK_EQ (rc, SQLITE_OK)
      << "Failed to bind parameter " << ind << " of:\n" << sql;
}

void
SQLiteDatabase::Statement::BindNull (const int ind)
{
  CheckBound (sqlite3_bind_null (**this, ind), ind);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<int64_t> (const int ind, const int64_t& val)
{
  CheckBound (sqlite3_bind_int64 (**this, ind, val), ind);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<int> (const int ind, const int& val)
{
  Bind<int64_t> (ind, val);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<unsigned> (const int ind, const unsigned& val)
{
  Bind<int64_t> (ind, val);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<std::string> (const int ind,
                                                const std::string& val)
{
  CheckBound (sqlite3_bind_text (**this, ind, val.data (), val.size (),
                                 SQLITE_TRANSIENT),
              ind);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<uint256> (const int ind, const uint256& val)
{
  CheckBound (sqlite3_bind_blob (**this, ind, val.GetBlob (),
                                 uint256::NUM_BYTES, SQLITE_TRANSIENT),
              ind);
}

void
SQLiteDatabase::Statement::BindBlob (const int ind, const std::string& val)
{
  CheckBound (sqlite3_bind_blob (**this, ind, val.data (), val.size (),
                                 SQLITE_TRANSIENT),
              ind);
}

bool
SQLiteDatabase::Statement::IsNull (const int ind) const
{
  return sqlite3_column_type (**this, ind) == SQLITE_NULL;
}

template <>
  int64_t
  SQLiteDatabase::Statement::Get<int64_t> (const int ind) const
{
  return sqlite3_column_int64 (**this, ind);
}

template <>
  int
  SQLiteDatabase::Statement::Get<int> (const int ind) const
{
  return NarrowColumn<int> (Get<int64_t> (ind));
}

template <>
  unsigned
  SQLiteDatabase::Statement::Get<unsigned> (const int ind) const
{
  return NarrowColumn<unsigned> (Get<int64_t> (ind));
}

template <>
  std::string
  SQLiteDatabase::Statement::Get<std::string> (const int ind) const
{
  /* sqlite3_column_bytes must be called after sqlite3_column_text, so that
     it reports the size of the UTF-8 text.  */
  const auto* text
      = reinterpret_cast<const char*> (sqlite3_column_text (**this, ind));
  const int len = sqlite3_column_bytes (**this, ind);
  if (text == nullptr)
    return "";
  return std::string (text, len);
}

template <>
  uint256
  SQLiteDatabase::Statement::Get<uint256> (const int ind) const
{
  const std::string bytes = GetBlob (ind);
  CHECK_EQ (bytes.size (), uint256::NUM_BYTES)
      << "Column " << ind << " is not a uint256";

  uint256 res;
  res.FromBlob (reinterpret_cast<const unsigned char*> (bytes.data ()));
  return res;
}

std::string
SQLiteDatabase::Statement::GetBlob (const int ind) const
{
  const auto* data
      = static_cast<const char*> (sqlite3_column_blob (**this, ind));
  const int len = sqlite3_column_bytes (**this, ind);
  if (data == nullptr)
    return "";
  return std::string (data, len);
}

/* ************************************************************************** */

std::once_flag SQLiteDatabase::sqliteConfigured;

SQLiteDatabase::SQLiteDatabase (const std::string& file, const int flags)
{
  std::call_once (sqliteConfigured, [] ()
    {
      LOG (INFO) << "SQLite library version " << sqlite3_libversion ();
      CHECK_EQ (sqlite3_libversion_number (), SQLITE_VERSION_NUMBER)
          << "SQLite header is " << SQLITE_VERSION;

      /* Configuration can only fail if SQLite is already in use, in which
         case we keep its defaults.  */
      if (sqlite3_config (SQLITE_CONFIG_LOG, &LogSQLiteError, nullptr)
            != SQLITE_OK)
        LOG (WARNING) << "Could not install the SQLite error logger";
      CHECK_EQ (sqlite3_config (SQLITE_CONFIG_MULTITHREAD), SQLITE_OK)
          << "Could not put SQLite into multi-thread mode";
    });

  const int rc = sqlite3_open_v2 (file.c_str (), &db, flags, nullptr);
  if (rc != SQLITE_OK)
    {
      const std::string err = (db == nullptr ? "out of memory"
                                             : sqlite3_errmsg (db));
      sqlite3_close (db);
      LOG (FATAL) << "Could not open SQLite database " << file << ": " << err;
    }

  LOG (INFO) << "Opened SQLite database " << file;
  Execute ("PRAGMA `foreign_keys` = ON");
}

SQLiteDatabase::~SQLiteDatabase ()
{
  std::lock_guard<std::mutex> poolLock(mutPool);
  CHECK_EQ (numActive, 0u) << "Statements still in use on close";
  for (auto& entry : idleStatements)
    for (auto* stmt : entry.second)
      sqlite3_finalize (stmt);
  idleStatements.clear ();

  std::lock_guard<std::mutex> lock(mutDb);
  if (sqlite3_close (db) != SQLITE_OK)
    LOG (ERROR) << "Closing SQLite database failed: " << sqlite3_errmsg (db);
}

void
SQLiteDatabase::Execute (const std::string& sql)
{
  std::lock_guard<std::mutex> lock(mutDb);

  char* err = nullptr;
  const int rc = sqlite3_exec (db, sql.c_str (),
      [] (void*, int, char**, char**)
        {
          LOG (FATAL) << "Direct SQL execution returned rows";
          return 1;
        },
      nullptr, &err);

  if (rc != SQLITE_OK)
    {
      const std::string msg = (err == nullptr ? "" : err);
      sqlite3_free (err);
      LOG (FATAL) << "SQL failed (" << rc << "): " << msg << "\n" << sql;
    }
}

sqlite3_stmt*
SQLiteDatabase::Acquire (const std::string& sql) const
{
  {
    std::lock_guard<std::mutex> lock(mutPool);
    ++numActive;

    auto mit = idleStatements.find (sql);
    if (mit != idleStatements.end () && !mit->second.empty ())
      {
        sqlite3_stmt* res = mit->second.back ();
        mit->second.pop_back ();
        VLOG (2) << "Reusing pooled statement " << res;
        return res;
      }
  }

  std::lock_guard<std::mutex> lock(mutDb);
  sqlite3_stmt* res = nullptr;
  const int rc = sqlite3_prepare_v2 (db, sql.c_str (), sql.size () + 1,
                                     &res, nullptr);
  CHECK_EQ (rc, SQLITE_OK)
      << "Preparing SQL failed: " << sqlite3_errmsg (db) << "\n" << sql;
  VLOG (2) << "Prepared new statement " << res << ":\n" << sql;

  return res;
}

void
SQLiteDatabase::Release (const std::string& sql, sqlite3_stmt* stmt) const
{
  /* Resetting also ends the implicit read transaction of an unfinished
     SELECT.  */
  {
    std::lock_guard<std::mutex> lock(mutDb);
    sqlite3_reset (stmt);
    sqlite3_clear_bindings (stmt);
  }

  std::lock_guard<std::mutex> lock(mutPool);
  CHECK_GT (numActive, 0u);
  --numActive;
  idleStatements[sql].push_back (stmt);
}

SQLiteDatabase::Statement
SQLiteDatabase::Prepare (const std::string& sql)
{
  return PrepareRo (sql);
}

SQLiteDatabase::Statement
SQLiteDatabase::PrepareRo (const std::string& sql) const
{
  CHECK (db != nullptr);
  return Statement (*this, sql, Acquire (sql));
}

} // namespace lastchair
