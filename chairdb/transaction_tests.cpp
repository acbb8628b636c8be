// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "transaction.hpp"

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace lastchair
{
namespace
{

class SQLiteTransactionTests : public testing::Test
{

protected:

  SQLiteDatabase db;

  SQLiteTransactionTests ()
    : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
  {
    db.Execute (R"(
      CREATE TABLE `values` (`val` INTEGER NOT NULL);
    )");
  }

  void
  Insert (const int64_t val)
  {
    auto stmt = db.Prepare ("INSERT INTO `values` (`val`) VALUES (?1)");
    stmt.Bind (1, val);
    stmt.Execute ();
  }

  int64_t
  Count ()
  {
    auto stmt = db.PrepareRo ("SELECT COUNT(*) FROM `values`");
    CHECK (stmt.Step ());
    return stmt.Get<int64_t> (0);
  }

};

TEST_F (SQLiteTransactionTests, Commit)
{
  {
    SQLiteTransaction tx(db);
    Insert (1);
    Insert (2);
    tx.Commit ();
  }

  EXPECT_EQ (Count (), 2);
}

TEST_F (SQLiteTransactionTests, RollbackWithoutCommit)
{
  Insert (1);
  {
    SQLiteTransaction tx(db);
    Insert (2);
    EXPECT_EQ (Count (), 2);
  }

  EXPECT_EQ (Count (), 1);
}

TEST_F (SQLiteTransactionTests, RollbackOnException)
{
  try
    {
      SQLiteTransaction tx(db);
      Insert (5);
      throw std::runtime_error ("failure");
    }
  catch (const std::runtime_error& exc)
    {
      EXPECT_EQ (std::string (exc.what ()), "failure");
    }

  EXPECT_EQ (Count (), 0);
}

TEST_F (SQLiteTransactionTests, WritersAreSerialised)
{
  constexpr int threads = 8;
  constexpr int perThread = 20;

  std::vector<std::thread> workers;
  for (int i = 0; i < threads; ++i)
    workers.emplace_back ([this, i] ()
      {
        for (int j = 0; j < perThread; ++j)
          {
            SQLiteTransaction tx(db);
            Insert (i * perThread + j);
            if (j % 2 == 0)
              tx.Commit ();
          }
      });
  for (auto& w : workers)
    w.join ();

  EXPECT_EQ (Count (), threads * perThread / 2);
}

TEST_F (SQLiteTransactionTests, ReadViewSeesOnlyCommittedState)
{
  std::promise<void> inserted;
  std::thread writer([this, &inserted] ()
    {
      SQLiteTransaction tx(db);
      Insert (1);
      inserted.set_value ();

      std::this_thread::sleep_for (std::chrono::milliseconds (50));
      Insert (2);
      tx.Commit ();
    });

  inserted.get_future ().wait ();
  {
    SQLiteReadView view(db);
    EXPECT_EQ (Count (), 2);
  }

  writer.join ();
}

} // anonymous namespace
} // namespace lastchair
