// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_MATCHLOCKS_HPP
#define LASTCHAIR_MATCHLOCKS_HPP

#include <chairutil/uint256.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace lastchair
{

/**
 * Registry of one mutex per match ID, so that operations on the same match
 * are serialised while operations on different matches can proceed in
 * parallel.  Entries are created on demand and removed again once nobody
 * holds or waits for them.
 */
class MatchLocks
{

private:

  /** Data for one match being locked.  */
  struct Entry
  {

    /** The mutex for the match itself.  */
    std::mutex mut;

    /** Number of Lock instances holding or waiting for mut.  */
    unsigned refs = 0;

  };

  /** Lock for the map of entries.  */
  mutable std::mutex mutEntries;

  /** The currently used entries.  */
  std::map<uint256, std::unique_ptr<Entry>> entries;

  /**
   * Drops a reference to the entry of the given ID, removing it if
   * it is no longer used.
   */
  void Release (const uint256& id);

public:

  class Lock;

  MatchLocks () = default;
  ~MatchLocks ();

  MatchLocks (const MatchLocks&) = delete;
  void operator= (const MatchLocks&) = delete;

  /**
   * Blocks until the lock for the given match is available and returns
   * it.  The lock is held until the returned instance is destructed.
   */
  Lock Acquire (const uint256& id);

  /**
   * Returns the number of matches for which locks are currently held
   * or waited for.
   */
  size_t GetNumEntries () const;

};

/**
 * The lock of one match.  While an instance exists (and has not been moved
 * from), it holds the mutex of the match.
 */
class MatchLocks::Lock
{

private:

  /** The registry this belongs to, or null if moved from.  */
  MatchLocks* registry;

  /** The match ID locked.  */
  uint256 id;

  /** The lock on the entry's mutex.  */
  std::unique_lock<std::mutex> held;

  explicit Lock (MatchLocks& r, const uint256& i, std::mutex& m);

  friend class MatchLocks;

public:

  Lock (Lock&& o);
  ~Lock ();

  Lock () = delete;
  Lock (const Lock&) = delete;
  void operator= (const Lock&) = delete;
  void operator= (Lock&&) = delete;

};

} // namespace lastchair

#endif // LASTCHAIR_MATCHLOCKS_HPP
