// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "statejson.hpp"

#include "database.hpp"
#include "errors.hpp"
#include "payout.hpp"
#include "rules.hpp"
#include "scoring.hpp"

#include <chairdb/transaction.hpp>

#include <glog/logging.h>

#include <sstream>

namespace lastchair
{

namespace
{

/**
 * Returns a JSON object with the scaled and real value of a score.
 */
Json::Value
ScoreToJson (const ScaledScore& s)
{
  Json::Value res(Json::objectValue);
  res["scaled"] = static_cast<Json::Int64> (s.GetScaled ());
  res["real"] = ScaledToReal (s);
  return res;
}

/**
 * Returns the name of a player, or null if unset.
 */
Json::Value
PlayerToJson (const std::string& name)
{
  if (name.empty ())
    return Json::Value ();
  return name;
}

Json::Value
SelectionToJson (const Selection& sel)
{
  if (sel.IsUnset ())
    return Json::Value ();

  Json::Value traps(Json::arrayValue);
  for (const unsigned t : sel.traps)
    traps.append (t);

  Json::Value res(Json::objectValue);
  res["chair"] = sel.chair;
  res["traps"] = traps;
  return res;
}

Json::Value
CommitmentToJson (const uint256& c)
{
  if (c.IsNull ())
    return Json::Value ();
  return c.ToHex ();
}

/**
 * Builds an object with "a" and "b" members from a per-side function.
 */
template <typename Fcn>
  Json::Value
  PerSide (const Fcn& f)
{
  Json::Value res(Json::objectValue);
  res["a"] = f (Side::A);
  res["b"] = f (Side::B);
  return res;
}

void
CheckRound (const unsigned round)
{
  if (!IsValidRound (round))
    {
      std::ostringstream msg;
      msg << "invalid round: " << round;
      throw GameError (ErrorKind::VALIDATION_FAILURE, msg.str ());
    }
}

} // anonymous namespace

Json::Value
StateJsonExtractor::MatchToJson (const MatchData& m)
{
  Json::Value res(Json::objectValue);
  res["id"] = m.GetId ().ToHex ();
  res["players"] = PerSide ([&m] (const Side s)
    {
      return PlayerToJson (m.GetPlayer (s));
    });
  res["stake"] = AmountToJson (m.GetStake ());
  res["round"] = m.GetCurrentRound ();
  res["status"] = MatchStatusToString (m.GetStatus ());
  res["scores"] = PerSide ([&m] (const Side s)
    {
      return ScoreToJson (m.GetScore (s));
    });
  res["split_a_bps"] = static_cast<Json::Int64> (
      ComputeSplitBps (m.GetScore (Side::A), m.GetScore (Side::B)));

  return res;
}

Json::Value
StateJsonExtractor::RoundToJson (const RoundData& r)
{
  Json::Value res(Json::objectValue);
  res["round"] = r.GetRound ();
  res["status"] = RoundStatusToString (r.GetStatus ());
  res["commitments"] = PerSide ([&r] (const Side s)
    {
      return CommitmentToJson (r.GetCommitment (s));
    });
  res["reveals"] = PerSide ([&r] (const Side s)
    {
      return SelectionToJson (r.GetSelection (s));
    });
  res["scores"] = PerSide ([&r] (const Side s)
    {
      return ScoreToJson (r.GetScore (s));
    });

  if (r.GetStatus () == RoundStatus::SCORED)
    {
      const Selection& a = r.GetSelection (Side::A);
      const Selection& b = r.GetSelection (Side::B);
      const auto sc = ScoreRound (a.chair, b.traps, b.chair, a.traps);
      res["outcome"] = RoundOutcomeToString (sc.outcome);
    }

  return res;
}

Json::Value
StateJsonExtractor::GetMatch (const uint256& id) const
{
  SQLiteReadView view(db);

  MatchesTable matches(db);
  auto m = matches.GetById (id);
  if (m == nullptr)
    throw GameError (ErrorKind::NOT_FOUND, "no match " + id.ToHex ());

  return MatchToJson (*m);
}

Json::Value
StateJsonExtractor::GetRound (const uint256& id, const unsigned round) const
{
  CheckRound (round);

  SQLiteReadView view(db);

  RoundsTable rounds(db);
  auto r = rounds.Get (id, round);
  if (r == nullptr)
    throw GameError (ErrorKind::NOT_FOUND, "no match " + id.ToHex ());

  return RoundToJson (*r);
}

Json::Value
StateJsonExtractor::GetCommitment (const uint256& id, const std::string& player,
                                   const unsigned round) const
{
  CheckRound (round);

  SQLiteReadView view(db);

  if (MatchesTable (db).GetById (id) == nullptr)
    throw GameError (ErrorKind::NOT_FOUND, "no match " + id.ToHex ());

  uint256 commitment;
  if (!PendingCommitments (db).Get (id, player, round, commitment))
    return Json::Value ();

  return commitment.ToHex ();
}

Json::Value
StateJsonExtractor::FullState () const
{
  SQLiteReadView view(db);

  MatchesTable matches(db);
  RoundsTable rounds(db);

  Json::Value res(Json::arrayValue);
  auto stmt = matches.QueryAll ();
  while (stmt.Step ())
    {
      auto m = matches.GetFromResult (stmt);
      Json::Value cur = MatchToJson (*m);

      Json::Value roundsJson(Json::arrayValue);
      auto rstmt = rounds.QueryForMatch (m->GetId ());
      while (rstmt.Step ())
        roundsJson.append (RoundToJson (*rounds.GetFromResult (rstmt)));
      CHECK_EQ (roundsJson.size (), NUM_ROUNDS);

      cur["rounds"] = roundsJson;
      res.append (cur);
    }

  return res;
}

} // namespace lastchair
