// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rules.hpp"

#include <glog/logging.h>

namespace lastchair
{

Json::Value
AmountToJson (const Amount n)
{
  return static_cast<Json::Int64> (n);
}

bool
AmountFromJson (const Json::Value& val, Amount& n)
{
  if (!val.isInt64 ())
    return false;

  n = val.asInt64 ();
  return n >= 0 && n <= MAX_STAKE;
}

Side
operator! (const Side s)
{
  switch (s)
    {
    case Side::A:
      return Side::B;
    case Side::B:
      return Side::A;
    }

  LOG (FATAL) << "Invalid side: " << static_cast<int> (s);
}

std::ostream&
operator<< (std::ostream& out, const Side s)
{
  switch (s)
    {
    case Side::A:
      return out << "A";
    case Side::B:
      return out << "B";
    }

  return out << "invalid";
}

bool
IsChairOnTable (const unsigned val)
{
  return val >= 1 && val <= NUM_CHAIRS;
}

bool
IsValidRound (const unsigned round)
{
  return round >= 1 && round <= NUM_ROUNDS;
}

bool
Selection::IsValid () const
{
  if (!IsChairOnTable (chair))
    return false;

  for (unsigned i = 0; i < NUM_TRAPS; ++i)
    {
      if (!IsChairOnTable (traps[i]))
        return false;
      if (traps[i] == chair)
        return false;
      for (unsigned j = 0; j < i; ++j)
        if (traps[i] == traps[j])
          return false;
    }

  return true;
}

std::ostream&
operator<< (std::ostream& out, const Selection& s)
{
  out << "chair " << s.chair << ", traps [";
  for (unsigned i = 0; i < NUM_TRAPS; ++i)
    {
      if (i > 0)
        out << ", ";
      out << s.traps[i];
    }
  return out << "]";
}

} // namespace lastchair
