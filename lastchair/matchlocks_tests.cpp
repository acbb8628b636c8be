// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "matchlocks.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace lastchair
{
namespace
{

class MatchLocksTests : public testing::Test
{

protected:

  MatchLocks locks;

};

TEST_F (MatchLocksTests, EntriesRemoved)
{
  EXPECT_EQ (locks.GetNumEntries (), 0u);
  {
    auto l1 = locks.Acquire (TestMatchId (1));
    auto l2 = locks.Acquire (TestMatchId (2));
    EXPECT_EQ (locks.GetNumEntries (), 2u);
  }
  EXPECT_EQ (locks.GetNumEntries (), 0u);
}

TEST_F (MatchLocksTests, MovedLock)
{
  {
    auto l1 = locks.Acquire (TestMatchId (1));
    MatchLocks::Lock l2(std::move (l1));
    EXPECT_EQ (locks.GetNumEntries (), 1u);
  }
  EXPECT_EQ (locks.GetNumEntries (), 0u);
}

TEST_F (MatchLocksTests, DifferentMatchesInParallel)
{
  auto l1 = locks.Acquire (TestMatchId (1));

  bool done = false;
  std::thread other([this, &done] ()
    {
      auto l2 = locks.Acquire (TestMatchId (2));
      done = true;
    });
  other.join ();

  EXPECT_TRUE (done);
}

TEST_F (MatchLocksTests, SameMatchSerialised)
{
  constexpr unsigned threads = 8;
  constexpr unsigned perThread = 50;

  std::atomic<unsigned> inside(0);
  std::atomic<bool> overlap(false);
  unsigned counter = 0;

  std::vector<std::thread> workers;
  for (unsigned i = 0; i < threads; ++i)
    workers.emplace_back ([&] ()
      {
        for (unsigned j = 0; j < perThread; ++j)
          {
            auto l = locks.Acquire (TestMatchId (1));
            if (inside.fetch_add (1) != 0)
              overlap = true;
            ++counter;
            std::this_thread::yield ();
            inside.fetch_sub (1);
          }
      });

  for (auto& w : workers)
    w.join ();

  EXPECT_FALSE (overlap);
  EXPECT_EQ (counter, threads * perThread);
  EXPECT_EQ (locks.GetNumEntries (), 0u);
}

} // anonymous namespace
} // namespace lastchair
