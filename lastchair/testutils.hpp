// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_TESTUTILS_HPP
#define LASTCHAIR_TESTUTILS_HPP

#include "database.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "game.hpp"
#include "ledger.hpp"
#include "rules.hpp"
#include "verifier.hpp"

#include <chairdb/database.hpp>
#include <chairutil/uint256.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <json/json.h>

#include <array>
#include <string>

namespace lastchair
{

/**
 * Parses JSON from a string.
 */
Json::Value ParseJson (const std::string& val);

/**
 * Returns a match ID for tests, based on a small number.
 */
uint256 TestMatchId (unsigned num);

/**
 * Constructs a selection from chair and traps.
 */
Selection Sel (unsigned chair, unsigned t1, unsigned t2, unsigned t3);

/**
 * Returns the salt used in tests for the given player and round.  The salts
 * differ so that commitments of equal selections are distinct.
 */
std::string TestSalt (const std::string& player, unsigned round);

/** The selections of one player for all rounds.  */
using RoundSelections = std::array<Selection, NUM_ROUNDS>;

/**
 * Computes the commitments (with TestSalt) for a player's selections.
 */
Commitments CommitmentsFor (const std::string& player,
                            const RoundSelections& sel);

/**
 * Builds a valid credential for the given selection with TestSalt.
 */
proto::RevealCredential TestCredential (const std::string& player,
                                        unsigned round, const Selection& sel);

/**
 * Expects that the given function throws a GameError of the given kind.
 */
template <typename Fcn>
  void
  ExpectGameError (const ErrorKind kind, const Fcn& f)
{
  try
    {
      f ();
      ADD_FAILURE () << "Expected GameError " << ErrorKindToString (kind);
    }
  catch (const GameError& exc)
    {
      EXPECT_EQ (exc.GetKind (), kind)
          << "Got " << ErrorKindToString (exc.GetKind ())
          << ": " << exc.what ();
    }
}

/**
 * Ledger mock for tests.
 */
class MockLedger : public Ledger
{

public:

  MockLedger ();

  MOCK_METHOD (void, Lock, (const std::string&, Amount), (override));
  MOCK_METHOD (void, Pay, (const std::string&, Amount), (override));

};

/**
 * Verifier mock for tests.  By default, it rejects everything.
 */
class MockRevealVerifier : public RevealVerifier
{

public:

  MockRevealVerifier ();

  MOCK_METHOD (bool, Verify,
               (const uint256&, const proto::RevealCredential&, Selection&),
               (const, override));

  /**
   * Sets up the mock to accept any credential as proof of the given
   * selection.
   */
  void AcceptAs (const Selection& sel);

};

/**
 * Test fixture with a temporary, in-memory SQLite database and our
 * database schema applied.
 */
class DBTest : public testing::Test
{

private:

  SQLiteDatabase db;

protected:

  DBTest ();

  /**
   * Returns a Database instance for the test.
   */
  SQLiteDatabase&
  GetDb ()
  {
    return db;
  }

};

/**
 * Test fixture with a full Game instance, using the SQLite ledger, the
 * hash verifier and a recording event sink.
 */
class GameTest : public DBTest
{

protected:

  SQLiteLedger ledger;
  HashRevealVerifier verifier;
  RecordingEventSink events;
  Game game;

  GameTest ();

  /**
   * Starts (or joins) a match for the given player, with commitments to
   * the given selections.
   */
  void Start (const uint256& id, const std::string& player, Amount stake,
              const RoundSelections& sel);

  /**
   * Reveals a selection with a valid credential.
   */
  void Reveal (const uint256& id, const std::string& player, unsigned round,
               const Selection& sel);

};

} // namespace lastchair

#endif // LASTCHAIR_TESTUTILS_HPP
