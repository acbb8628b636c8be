// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAIRDB_DATABASE_HPP
#define CHAIRDB_DATABASE_HPP

#include <chairutil/uint256.hpp>

#include <sqlite3.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lastchair
{

class SQLiteReadView;
class SQLiteTransaction;

/**
 * A single SQLite connection shared by all threads of the game.  The
 * instance owns the sqlite3 handle and keeps a pool of prepared statements,
 * which are handed out as Statement objects and returned to the pool
 * when those go out of scope.
 *
 * SQLite runs in multi-thread mode, so all direct use of the handle
 * (preparing, stepping, resetting) is serialised through mutDb.  Code that
 * may run concurrently with other threads must in addition hold the
 * connection through SQLiteTransaction or SQLiteReadView while it has
 * statements in use.
 */
class SQLiteDatabase
{

public:

  class Statement;

private:

  /** Guards the one-time global configuration of SQLite.  */
  static std::once_flag sqliteConfigured;

  /** Lock for every call into SQLite with the connection handle.  */
  mutable std::mutex mutDb;

  /**
   * Held by whoever uses the connection for a sequence of statements that
   * must not interleave with other threads:  an open SQLiteTransaction or
   * an SQLiteReadView.
   */
  mutable std::mutex mutConnection;

  /** The connection handle.  */
  sqlite3* db = nullptr;

  /** Lock for idleStatements and numActive.  */
  mutable std::mutex mutPool;

  /**
   * Prepared statements that are not handed out at the moment, keyed by
   * their SQL text.  They are reset and have no bindings.
   */
  mutable std::map<std::string, std::vector<sqlite3_stmt*>> idleStatements;

  /** Number of statements currently handed out.  */
  mutable unsigned numActive = 0;

  /**
   * Takes a statement for the given SQL out of the pool, or prepares
   * a fresh one if none is idle.
   */
  sqlite3_stmt* Acquire (const std::string& sql) const;

  /**
   * Resets a statement and puts it back into the pool.
   */
  void Release (const std::string& sql, sqlite3_stmt* stmt) const;

  friend class SQLiteReadView;
  friend class SQLiteTransaction;

public:

  /**
   * Opens the database file with the given flags for sqlite3_open_v2
   * and enables foreign-key enforcement.
   */
  explicit SQLiteDatabase (const std::string& file, int flags);

  ~SQLiteDatabase ();

  SQLiteDatabase () = delete;
  SQLiteDatabase (const SQLiteDatabase&) = delete;
  void operator= (const SQLiteDatabase&) = delete;

  /**
   * Runs one or more SQL statements that return no rows (e.g. the
   * schema setup) directly on the connection.
   */
  void Execute (const std::string& sql);

  /**
   * Returns a statement for the given SQL, ready for binding.  Multiple
   * threads may call this concurrently, but each returned Statement must
   * only be used by one thread.
   */
  Statement Prepare (const std::string& sql);

  /**
   * Same as Prepare, for read-only queries on a const database.
   */
  Statement PrepareRo (const std::string& sql) const;

};

/**
 * A prepared statement borrowed from the pool of an SQLiteDatabase.  It is
 * move-only and gives the statement back when destructed.
 *
 * Column and parameter indices follow SQLite:  Parameters (?1, ?2, ...)
 * start at one, result columns at zero.
 */
class SQLiteDatabase::Statement
{

private:

  /** The database whose pool the statement came from.  */
  const SQLiteDatabase* db = nullptr;

  /** The SQL text, which is also the pool key.  */
  std::string sql;

  /** The borrowed statement handle.  */
  sqlite3_stmt* stmt = nullptr;

  /** Steps done since the last reset, for logging.  */
  unsigned steps = 0;

  explicit Statement (const SQLiteDatabase& d, const std::string& s,
                      sqlite3_stmt* h)
    : db(&d), sql(s), stmt(h)
  {}

  /**
   * Gives the statement back to the pool (if there is one).
   */
  void Return ();

  /**
   * Checks the result of an sqlite3_bind_* call.
   */
  void CheckBound (int rc, int ind) const;

  friend class SQLiteDatabase;

public:

  Statement () = default;
  Statement (Statement&& o);
  Statement& operator= (Statement&& o);

  ~Statement ();

  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  /**
   * Returns the raw statement handle.
   */
  sqlite3_stmt* operator* () const;

  /**
   * Runs a statement that returns no rows.
   */
  void Execute ();

  /**
   * Steps the statement.  Returns true if a row is available and false
   * when the statement is done.  Any other result is fatal.
   */
  bool Step ();

  /**
   * Resets the statement for another execution.  Bindings are kept.
   */
  void Reset ();

  const std::string&
  GetSql () const
  {
    return sql;
  }

  void BindNull (int ind);

  /**
   * Binds a value to a parameter.  Supported are int64_t, int and unsigned
   * (as INTEGER), std::string (as TEXT) and uint256 (as BLOB).
   */
  template <typename T>
    void Bind (int ind, const T& val);

  /**
   * Binds raw bytes as BLOB.
   */
  void BindBlob (int ind, const std::string& val);

  bool IsNull (int ind) const;

  /**
   * Reads a column of the current row.  The supported types match Bind.
   * Values out of range for the requested type are fatal.
   */
  template <typename T>
    T Get (int ind) const;

  /**
   * Reads a BLOB column as raw bytes.
   */
  std::string GetBlob (int ind) const;

};

} // namespace lastchair

#endif // CHAIRDB_DATABASE_HPP
