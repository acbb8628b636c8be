// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include <glog/logging.h>

namespace lastchair
{

namespace
{

proto::RoundSettled::Outcome
OutcomeToProto (const RoundOutcome o)
{
  switch (o)
    {
    case RoundOutcome::BOTH_SAFE:
      return proto::RoundSettled::BOTH_SAFE;
    case RoundOutcome::A_TRAPPED:
      return proto::RoundSettled::A_TRAPPED;
    case RoundOutcome::B_TRAPPED:
      return proto::RoundSettled::B_TRAPPED;
    case RoundOutcome::BOTH_TRAPPED:
      return proto::RoundSettled::BOTH_TRAPPED;
    }

  LOG (FATAL) << "Invalid round outcome: " << static_cast<int> (o);
}

} // anonymous namespace

proto::GameEvent
MatchQueuedEvent (const uint256& id, const std::string& player,
                  const Amount stake)
{
  proto::GameEvent res;
  auto& ev = *res.mutable_match_queued ();
  ev.set_match_id (id.GetBinaryString ());
  ev.set_player (player);
  ev.set_stake (stake);
  return res;
}

proto::GameEvent
MatchStartedEvent (const uint256& id, const std::string& playerA,
                   const std::string& playerB, const Amount stake)
{
  proto::GameEvent res;
  auto& ev = *res.mutable_match_started ();
  ev.set_match_id (id.GetBinaryString ());
  ev.set_player_a (playerA);
  ev.set_player_b (playerB);
  ev.set_stake (stake);
  return res;
}

proto::GameEvent
RevealSubmittedEvent (const uint256& id, const unsigned round,
                      const std::string& player, const unsigned chair)
{
  proto::GameEvent res;
  auto& ev = *res.mutable_reveal_submitted ();
  ev.set_match_id (id.GetBinaryString ());
  ev.set_round (round);
  ev.set_player (player);
  ev.set_chair (chair);
  return res;
}

proto::GameEvent
RoundSettledEvent (const uint256& id, const unsigned round,
                   const RoundScore& sc, const int64_t splitBps)
{
  proto::GameEvent res;
  auto& ev = *res.mutable_round_settled ();
  ev.set_match_id (id.GetBinaryString ());
  ev.set_round (round);
  ev.set_score_a (sc.a.GetScaled ());
  ev.set_score_b (sc.b.GetScaled ());
  ev.set_split_a_bps (splitBps);
  ev.set_outcome (OutcomeToProto (sc.outcome));
  return res;
}

proto::GameEvent
MatchFinishedEvent (const uint256& id, const Payout& p)
{
  proto::GameEvent res;
  auto& ev = *res.mutable_match_finished ();
  ev.set_match_id (id.GetBinaryString ());
  ev.set_payout_a (p.payoutA);
  ev.set_payout_b (p.payoutB);
  ev.set_fee (p.fee);
  ev.set_split_a_bps (p.splitBps);
  return res;
}

void
LoggingEventSink::Publish (const proto::GameEvent& ev)
{
  LOG (INFO) << "Game event:\n" << ev.DebugString ();
}

void
RecordingEventSink::Publish (const proto::GameEvent& ev)
{
  std::lock_guard<std::mutex> lock(mut);
  events.push_back (ev);
}

EventList
RecordingEventSink::GetEvents () const
{
  std::lock_guard<std::mutex> lock(mut);
  return events;
}

EventList
RecordingEventSink::Take ()
{
  std::lock_guard<std::mutex> lock(mut);
  EventList res;
  res.swap (events);
  return res;
}

} // namespace lastchair
