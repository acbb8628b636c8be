// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_EVENTS_HPP
#define LASTCHAIR_EVENTS_HPP

#include "payout.hpp"
#include "rules.hpp"
#include "scoring.hpp"

#include "proto/events.pb.h"

#include <chairutil/uint256.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace lastchair
{

/** Events produced by a single operation, in order.  */
using EventList = std::vector<proto::GameEvent>;

proto::GameEvent MatchQueuedEvent (const uint256& id, const std::string& player,
                                   Amount stake);
proto::GameEvent MatchStartedEvent (const uint256& id,
                                    const std::string& playerA,
                                    const std::string& playerB, Amount stake);
proto::GameEvent RevealSubmittedEvent (const uint256& id, unsigned round,
                                       const std::string& player,
                                       unsigned chair);
proto::GameEvent RoundSettledEvent (const uint256& id, unsigned round,
                                    const RoundScore& sc, int64_t splitBps);
proto::GameEvent MatchFinishedEvent (const uint256& id, const Payout& p);

/**
 * Receiver of game events.  Events are only published for operations that
 * have been committed to the database.
 */
class EventSink
{

public:

  EventSink () = default;
  virtual ~EventSink () = default;

  EventSink (const EventSink&) = delete;
  void operator= (const EventSink&) = delete;

  virtual void Publish (const proto::GameEvent& ev) = 0;

};

/**
 * Event sink that writes all events to the log.
 */
class LoggingEventSink : public EventSink
{

public:

  LoggingEventSink () = default;

  void Publish (const proto::GameEvent& ev) override;

};

/**
 * Event sink that keeps all events in memory, so they can be inspected
 * later.  This is thread-safe.
 */
class RecordingEventSink : public EventSink
{

private:

  /** Lock for the events list.  */
  mutable std::mutex mut;

  /** The events published so far.  */
  EventList events;

public:

  RecordingEventSink () = default;

  void Publish (const proto::GameEvent& ev) override;

  /**
   * Returns a copy of the recorded events.
   */
  EventList GetEvents () const;

  /**
   * Returns all recorded events and clears the list.
   */
  EventList Take ();

};

} // namespace lastchair

#endif // LASTCHAIR_EVENTS_HPP
