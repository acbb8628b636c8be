// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "database.hpp"

#include <glog/logging.h>

namespace lastchair
{

namespace
{

/* Indices of the columns for the matches table from SELECT's.  */
constexpr int MATCH_ID = 0;
constexpr int MATCH_PLAYER_A = 1;
constexpr int MATCH_PLAYER_B = 2;
constexpr int MATCH_STAKE = 3;
constexpr int MATCH_CURRENT_ROUND = 4;
constexpr int MATCH_STATUS = 5;
constexpr int MATCH_SCORE_A = 6;
constexpr int MATCH_SCORE_B = 7;

/* Indices of the columns for the rounds table.  The per-side columns
   (commitment, chair, traps, score) are given for side A, and side B's
   follow at a fixed offset.  */
constexpr int ROUND_MATCH_ID = 0;
constexpr int ROUND_NUMBER = 1;
constexpr int ROUND_COMMITMENT_A = 2;
constexpr int ROUND_CHAIR_A = 4;
constexpr int ROUND_CHAIR_B_OFFSET = 4;
constexpr int ROUND_STATUS = 12;
constexpr int ROUND_SCORE_A = 13;

const std::string MATCH_COLUMNS = R"(
  `id`, `player_a`, `player_b`, `stake`,
  `current_round`, `status`, `score_a`, `score_b`
)";

const std::string ROUND_COLUMNS = R"(
  `match_id`, `round`, `commitment_a`, `commitment_b`,
  `chair_a`, `trap1_a`, `trap2_a`, `trap3_a`,
  `chair_b`, `trap1_b`, `trap2_b`, `trap3_b`,
  `status`, `score_a`, `score_b`
)";

/**
 * Returns the array index for storing per-side data.
 */
unsigned
SideIndex (const Side s)
{
  switch (s)
    {
    case Side::A:
      return 0;
    case Side::B:
      return 1;
    }

  LOG (FATAL) << "Invalid side: " << static_cast<int> (s);
}

MatchStatus
MatchStatusFromInt (const int val)
{
  switch (val)
    {
    case static_cast<int> (MatchStatus::WAITING):
    case static_cast<int> (MatchStatus::ACTIVE):
    case static_cast<int> (MatchStatus::FINISHED):
      return static_cast<MatchStatus> (val);
    default:
      LOG (FATAL) << "Invalid match status in database: " << val;
    }
}

RoundStatus
RoundStatusFromInt (const int val)
{
  switch (val)
    {
    case static_cast<int> (RoundStatus::PENDING):
    case static_cast<int> (RoundStatus::REVEALED_A):
    case static_cast<int> (RoundStatus::REVEALED_B):
    case static_cast<int> (RoundStatus::BOTH_REVEALED):
    case static_cast<int> (RoundStatus::SCORED):
      return static_cast<RoundStatus> (val);
    default:
      LOG (FATAL) << "Invalid round status in database: " << val;
    }
}

} // anonymous namespace

std::string
MatchStatusToString (const MatchStatus s)
{
  switch (s)
    {
    case MatchStatus::WAITING:
      return "waiting";
    case MatchStatus::ACTIVE:
      return "active";
    case MatchStatus::FINISHED:
      return "finished";
    }

  LOG (FATAL) << "Invalid match status: " << static_cast<int> (s);
}

std::string
RoundStatusToString (const RoundStatus s)
{
  switch (s)
    {
    case RoundStatus::PENDING:
      return "pending";
    case RoundStatus::REVEALED_A:
      return "revealed a";
    case RoundStatus::REVEALED_B:
      return "revealed b";
    case RoundStatus::BOTH_REVEALED:
      return "both revealed";
    case RoundStatus::SCORED:
      return "scored";
    }

  LOG (FATAL) << "Invalid round status: " << static_cast<int> (s);
}

/* ************************************************************************** */

MatchData::MatchData (SQLiteDatabase& d, const uint256& i)
  : db(d), id(i), stake(0), currentRound(1), status(MatchStatus::WAITING),
    dirty(true)
{
  VLOG (1) << "Created new MatchData instance for ID " << id.ToHex ();
}

MatchData::MatchData (SQLiteDatabase& d, const SQLiteDatabase::Statement& row)
  : db(d), dirty(false)
{
  id = row.Get<uint256> (MATCH_ID);
  players[0] = row.Get<std::string> (MATCH_PLAYER_A);
  players[1] = row.Get<std::string> (MATCH_PLAYER_B);
  stake = row.Get<int64_t> (MATCH_STAKE);
  currentRound = row.Get<unsigned> (MATCH_CURRENT_ROUND);
  status = MatchStatusFromInt (row.Get<int> (MATCH_STATUS));
  scores[0] = ScaledScore (row.Get<int64_t> (MATCH_SCORE_A));
  scores[1] = ScaledScore (row.Get<int64_t> (MATCH_SCORE_B));

  CHECK (IsValidRound (currentRound))
      << "Match " << id.ToHex () << " has invalid current round "
      << currentRound;

  VLOG (1) << "Created MatchData instance from result row, ID " << id.ToHex ();
}

MatchData::~MatchData ()
{
  if (!dirty)
    {
      VLOG (1) << "MatchData " << id.ToHex () << " is not dirty";
      return;
    }

  VLOG (1) << "MatchData " << id.ToHex () << " is dirty, updating...";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `matches`
      ()" + MATCH_COLUMNS + R"()
      VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
  )");

  stmt.Bind (1, id);
  stmt.Bind (2, players[0]);
  stmt.Bind (3, players[1]);
  stmt.Bind<int64_t> (4, stake);
  stmt.Bind (5, currentRound);
  stmt.Bind (6, static_cast<int> (status));
  stmt.Bind<int64_t> (7, scores[0].GetScaled ());
  stmt.Bind<int64_t> (8, scores[1].GetScaled ());

  stmt.Execute ();
}

const std::string&
MatchData::GetPlayer (const Side s) const
{
  return players[SideIndex (s)];
}

void
MatchData::SetPlayer (const Side s, const std::string& name)
{
  CHECK (!name.empty ());
  CHECK (GetPlayer (s).empty ())
      << "Player " << s << " of match " << id.ToHex () << " is already set";
  CHECK_NE (GetPlayer (!s), name)
      << "Both players of match " << id.ToHex () << " would be " << name;

  players[SideIndex (s)] = name;
  dirty = true;
}

bool
MatchData::GetSideOf (const std::string& name, Side& s) const
{
  if (name.empty ())
    return false;

  for (const Side cur : {Side::A, Side::B})
    if (GetPlayer (cur) == name)
      {
        s = cur;
        return true;
      }

  return false;
}

void
MatchData::SetStake (const Amount s)
{
  CHECK_GT (s, 0);
  CHECK_LE (s, MAX_STAKE);
  stake = s;
  dirty = true;
}

void
MatchData::AdvanceRound ()
{
  if (currentRound < NUM_ROUNDS)
    {
      ++currentRound;
      dirty = true;
    }
}

void
MatchData::SetStatus (const MatchStatus s)
{
  status = s;
  dirty = true;
}

const ScaledScore&
MatchData::GetScore (const Side s) const
{
  return scores[SideIndex (s)];
}

void
MatchData::AddScores (const RoundScore& sc)
{
  CHECK_GE (sc.a.GetScaled (), 0);
  CHECK_GE (sc.b.GetScaled (), 0);

  scores[0] += sc.a;
  scores[1] += sc.b;
  dirty = true;
}

MatchesTable::Handle
MatchesTable::GetFromResult (const SQLiteDatabase::Statement& row)
{
  return Handle (new MatchData (db, row));
}

MatchesTable::Handle
MatchesTable::GetById (const uint256& id)
{
  auto stmt = db.Prepare (R"(
    SELECT )" + MATCH_COLUMNS + R"(
      FROM `matches`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, id);

  if (!stmt.Step ())
    return nullptr;

  auto h = GetFromResult (stmt);
  CHECK (!stmt.Step ());

  return h;
}

MatchesTable::Handle
MatchesTable::CreateNew (const uint256& id)
{
  LOG (INFO) << "Creating new match with ID " << id.ToHex ();
  return Handle (new MatchData (db, id));
}

SQLiteDatabase::Statement
MatchesTable::QueryAll ()
{
  return db.Prepare (R"(
    SELECT )" + MATCH_COLUMNS + R"(
      FROM `matches`
      ORDER BY `id`
  )");
}

/* ************************************************************************** */

RoundData::RoundData (SQLiteDatabase& d, const uint256& id, const unsigned r)
  : db(d), matchId(id), round(r), status(RoundStatus::PENDING), dirty(true)
{
  CHECK (IsValidRound (round)) << "Invalid round number " << round;
}

RoundData::RoundData (SQLiteDatabase& d, const SQLiteDatabase::Statement& row)
  : db(d), dirty(false)
{
  matchId = row.Get<uint256> (ROUND_MATCH_ID);
  round = row.Get<unsigned> (ROUND_NUMBER);
  CHECK (IsValidRound (round)) << "Invalid round number " << round;

  for (const Side s : {Side::A, Side::B})
    {
      const unsigned ind = SideIndex (s);

      const int commitmentCol = ROUND_COMMITMENT_A + ind;
      if (row.IsNull (commitmentCol))
        commitments[ind].SetNull ();
      else
        commitments[ind] = row.Get<uint256> (commitmentCol);

      const int chairCol = ROUND_CHAIR_A + ind * ROUND_CHAIR_B_OFFSET;
      Selection& sel = selections[ind];
      sel.chair = row.Get<unsigned> (chairCol);
      for (unsigned i = 0; i < NUM_TRAPS; ++i)
        sel.traps[i] = row.Get<unsigned> (chairCol + 1 + i);

      scores[ind] = ScaledScore (row.Get<int64_t> (ROUND_SCORE_A + ind));
    }

  status = RoundStatusFromInt (row.Get<int> (ROUND_STATUS));
}

RoundData::~RoundData ()
{
  if (!dirty)
    return;

  VLOG (1)
      << "Round " << round << " of match " << matchId.ToHex ()
      << " is dirty, updating...";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `rounds`
      ()" + ROUND_COLUMNS + R"()
      VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8,
              ?9, ?10, ?11, ?12, ?13, ?14, ?15)
  )");

  stmt.Bind (ROUND_MATCH_ID + 1, matchId);
  stmt.Bind (ROUND_NUMBER + 1, round);

  for (const Side s : {Side::A, Side::B})
    {
      const unsigned ind = SideIndex (s);

      const int commitmentParam = ROUND_COMMITMENT_A + ind + 1;
      if (commitments[ind].IsNull ())
        stmt.BindNull (commitmentParam);
      else
        stmt.Bind (commitmentParam, commitments[ind]);

      const int chairParam = ROUND_CHAIR_A + ind * ROUND_CHAIR_B_OFFSET + 1;
      const Selection& sel = selections[ind];
      stmt.Bind (chairParam, sel.chair);
      for (unsigned i = 0; i < NUM_TRAPS; ++i)
        stmt.Bind (chairParam + 1 + i, sel.traps[i]);

      stmt.Bind<int64_t> (ROUND_SCORE_A + ind + 1, scores[ind].GetScaled ());
    }

  stmt.Bind (ROUND_STATUS + 1, static_cast<int> (status));

  stmt.Execute ();
}

const uint256&
RoundData::GetCommitment (const Side s) const
{
  return commitments[SideIndex (s)];
}

void
RoundData::SetCommitment (const Side s, const uint256& c)
{
  CHECK (!c.IsNull ());
  CHECK (GetCommitment (s).IsNull ())
      << "Commitment of " << s << " for round " << round
      << " of match " << matchId.ToHex () << " is already bound";

  commitments[SideIndex (s)] = c;
  dirty = true;
}

const Selection&
RoundData::GetSelection (const Side s) const
{
  return selections[SideIndex (s)];
}

void
RoundData::RecordReveal (const Side s, const Selection& sel)
{
  CHECK (sel.IsValid ()) << "Recording invalid selection " << sel;
  CHECK (!HasRevealed (s))
      << s << " has already revealed round " << round
      << " of match " << matchId.ToHex ();

  switch (status)
    {
    case RoundStatus::PENDING:
      status = (s == Side::A ? RoundStatus::REVEALED_A
                             : RoundStatus::REVEALED_B);
      break;

    case RoundStatus::REVEALED_A:
      CHECK (s == Side::B);
      status = RoundStatus::BOTH_REVEALED;
      break;

    case RoundStatus::REVEALED_B:
      CHECK (s == Side::A);
      status = RoundStatus::BOTH_REVEALED;
      break;

    default:
      LOG (FATAL)
          << "Reveal in round with status " << RoundStatusToString (status);
    }

  selections[SideIndex (s)] = sel;
  dirty = true;
}

const ScaledScore&
RoundData::GetScore (const Side s) const
{
  return scores[SideIndex (s)];
}

void
RoundData::SetScores (const RoundScore& sc)
{
  CHECK (status == RoundStatus::BOTH_REVEALED)
      << "Scoring round " << round << " of match " << matchId.ToHex ()
      << " in status " << RoundStatusToString (status);
  CHECK (scores[0] == ScaledScore () && scores[1] == ScaledScore ());

  scores[0] = sc.a;
  scores[1] = sc.b;
  status = RoundStatus::SCORED;
  dirty = true;
}

RoundsTable::Handle
RoundsTable::GetFromResult (const SQLiteDatabase::Statement& row)
{
  return Handle (new RoundData (db, row));
}

RoundsTable::Handle
RoundsTable::Get (const uint256& matchId, const unsigned round)
{
  auto stmt = db.Prepare (R"(
    SELECT )" + ROUND_COLUMNS + R"(
      FROM `rounds`
      WHERE `match_id` = ?1 AND `round` = ?2
  )");
  stmt.Bind (1, matchId);
  stmt.Bind (2, round);

  if (!stmt.Step ())
    return nullptr;

  auto h = GetFromResult (stmt);
  CHECK (!stmt.Step ());

  return h;
}

RoundsTable::Handle
RoundsTable::CreateNew (const uint256& matchId, const unsigned round)
{
  return Handle (new RoundData (db, matchId, round));
}

SQLiteDatabase::Statement
RoundsTable::QueryForMatch (const uint256& matchId)
{
  auto stmt = db.Prepare (R"(
    SELECT )" + ROUND_COLUMNS + R"(
      FROM `rounds`
      WHERE `match_id` = ?1
      ORDER BY `round`
  )");
  stmt.Bind (1, matchId);

  return stmt;
}

/* ************************************************************************** */

void
PendingCommitments::Insert (const uint256& matchId, const std::string& player,
                            const Commitments& c)
{
  auto stmt = db.Prepare (R"(
    INSERT INTO `pending_commitments`
      (`match_id`, `player`, `round`, `commitment`)
      VALUES (?1, ?2, ?3, ?4)
  )");

  for (unsigned i = 0; i < NUM_ROUNDS; ++i)
    {
      CHECK (!c[i].IsNull ());

      stmt.Reset ();
      stmt.Bind (1, matchId);
      stmt.Bind (2, player);
      stmt.Bind (3, i + 1);
      stmt.Bind (4, c[i]);
      stmt.Execute ();
    }
}

bool
PendingCommitments::Get (const uint256& matchId, const std::string& player,
                         const unsigned round, uint256& commitment) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `commitment`
      FROM `pending_commitments`
      WHERE `match_id` = ?1 AND `player` = ?2 AND `round` = ?3
  )");
  stmt.Bind (1, matchId);
  stmt.Bind (2, player);
  stmt.Bind (3, round);

  if (!stmt.Step ())
    return false;

  commitment = stmt.Get<uint256> (0);
  CHECK (!stmt.Step ());

  return true;
}

bool
PendingCommitments::GetAll (const uint256& matchId, const std::string& player,
                            Commitments& c) const
{
  for (unsigned i = 0; i < NUM_ROUNDS; ++i)
    if (!Get (matchId, player, i + 1, c[i]))
      return false;

  return true;
}

} // namespace lastchair
