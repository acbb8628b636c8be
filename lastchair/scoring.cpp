// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scoring.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace lastchair
{

std::ostream&
operator<< (std::ostream& out, const ScaledScore& s)
{
  return out << s.GetScaled () << "/" << SCORE_SCALE;
}

double
ScaledToReal (const ScaledScore& s)
{
  return static_cast<double> (s.GetScaled ()) / SCORE_SCALE;
}

std::string
RoundOutcomeToString (const RoundOutcome o)
{
  switch (o)
    {
    case RoundOutcome::BOTH_SAFE:
      return "both safe";
    case RoundOutcome::A_TRAPPED:
      return "a trapped";
    case RoundOutcome::B_TRAPPED:
      return "b trapped";
    case RoundOutcome::BOTH_TRAPPED:
      return "both trapped";
    }

  LOG (FATAL) << "Invalid round outcome: " << static_cast<int> (o);
}

bool
IsTrapped (const unsigned position, const Traps& traps)
{
  return std::find (traps.begin (), traps.end (), position) != traps.end ();
}

namespace
{

/**
 * Computes the score of one player, given whether they and their
 * opponent were trapped.
 */
ScaledScore
PlayerScore (const unsigned chair, const bool trapped,
             const bool opponentTrapped)
{
  const int64_t multiplier = trapped ? TRAPPED_MULTIPLIER : SCORE_SCALE;
  const int64_t bonus = opponentTrapped ? TRAP_BONUS : 0;
  return ScaledScore (static_cast<int64_t> (chair) * multiplier + bonus);
}

} // anonymous namespace

RoundScore
ScoreRound (const unsigned chairA, const Traps& trapsB,
            const unsigned chairB, const Traps& trapsA)
{
  CHECK (IsChairOnTable (chairA)) << "Invalid chair: " << chairA;
  CHECK (IsChairOnTable (chairB)) << "Invalid chair: " << chairB;

  const bool aTrapped = IsTrapped (chairA, trapsB);
  const bool bTrapped = IsTrapped (chairB, trapsA);

  RoundScore res;
  res.a = PlayerScore (chairA, aTrapped, bTrapped);
  res.b = PlayerScore (chairB, bTrapped, aTrapped);

  if (aTrapped && bTrapped)
    res.outcome = RoundOutcome::BOTH_TRAPPED;
  else if (aTrapped)
    res.outcome = RoundOutcome::A_TRAPPED;
  else if (bTrapped)
    res.outcome = RoundOutcome::B_TRAPPED;
  else
    res.outcome = RoundOutcome::BOTH_SAFE;

  return res;
}

} // namespace lastchair
