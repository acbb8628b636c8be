// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAIRDB_TRANSACTION_HPP
#define CHAIRDB_TRANSACTION_HPP

#include "database.hpp"

#include <mutex>
#include <string>

namespace lastchair
{

/**
 * Holds the connection of an SQLiteDatabase for a sequence of reads.  While
 * it is alive, no transaction of another thread can be open, so all reads
 * see the same committed state.
 *
 * A read view must not be opened while the same thread holds another view
 * or a transaction on the database.
 */
class SQLiteReadView
{

private:

  /** Lock on the database's connection mutex.  */
  std::unique_lock<std::mutex> lock;

public:

  explicit SQLiteReadView (const SQLiteDatabase& db);

  SQLiteReadView () = delete;
  SQLiteReadView (const SQLiteReadView&) = delete;
  void operator= (const SQLiteReadView&) = delete;

};

/**
 * Helper class that starts a transaction on an SQLiteDatabase and either
 * commits or rolls it back later based on RAII semantics.  While the
 * instance is alive, it holds the database's connection lock, so that
 * transactions and read views from different threads do not interleave
 * on the single connection.
 *
 * Transactions are implemented as named savepoints and must not be nested.
 */
class SQLiteTransaction
{

private:

  /** The database on which the transaction is open.  */
  SQLiteDatabase& db;

  /** Lock on the database's connection mutex.  */
  std::unique_lock<std::mutex> lock;

  /** Name of the savepoint.  */
  const std::string name;

  /**
   * Whether the transaction has been committed.  If this is still false
   * when the instance is destructed, everything is rolled back.
   */
  bool committed = false;

public:

  /**
   * Opens a new transaction on the database, blocking until no other
   * transaction is open.
   */
  explicit SQLiteTransaction (SQLiteDatabase& d,
                              const std::string& n = "lastchair-op");

  ~SQLiteTransaction ();

  SQLiteTransaction () = delete;
  SQLiteTransaction (const SQLiteTransaction&) = delete;
  void operator= (const SQLiteTransaction&) = delete;

  /**
   * Commits all changes made while the transaction was open.  This must
   * be called at most once.
   */
  void Commit ();

};

} // namespace lastchair

#endif // CHAIRDB_TRANSACTION_HPP
