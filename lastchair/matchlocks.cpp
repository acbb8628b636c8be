// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "matchlocks.hpp"

#include <glog/logging.h>

namespace lastchair
{

MatchLocks::~MatchLocks ()
{
  std::lock_guard<std::mutex> lock(mutEntries);
  CHECK (entries.empty ())
      << "MatchLocks destructed while " << entries.size ()
      << " locks are still in use";
}

MatchLocks::Lock
MatchLocks::Acquire (const uint256& id)
{
  std::mutex* mut;
  {
    std::lock_guard<std::mutex> lock(mutEntries);
    auto& entry = entries[id];
    if (entry == nullptr)
      entry = std::make_unique<Entry> ();
    ++entry->refs;
    mut = &entry->mut;
  }

  return Lock (*this, id, *mut);
}

void
MatchLocks::Release (const uint256& id)
{
  std::lock_guard<std::mutex> lock(mutEntries);

  auto mit = entries.find (id);
  CHECK (mit != entries.end ()) << "No lock entry for " << id.ToHex ();
  CHECK_GT (mit->second->refs, 0);

  --mit->second->refs;
  if (mit->second->refs == 0)
    entries.erase (mit);
}

size_t
MatchLocks::GetNumEntries () const
{
  std::lock_guard<std::mutex> lock(mutEntries);
  return entries.size ();
}

MatchLocks::Lock::Lock (MatchLocks& r, const uint256& i, std::mutex& m)
  : registry(&r), id(i), held(m)
{}

MatchLocks::Lock::Lock (Lock&& o)
  : registry(o.registry), id(o.id), held(std::move (o.held))
{
  o.registry = nullptr;
}

MatchLocks::Lock::~Lock ()
{
  if (registry == nullptr)
    return;

  held.unlock ();
  registry->Release (id);
}

} // namespace lastchair
