// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "schema.hpp"

#include <glog/logging.h>

namespace lastchair
{

namespace
{

constexpr const char SCHEMA_SQL[] = R"(

-- One row per match.  Player names are empty strings while unset,
-- scores are in scaled units.
CREATE TABLE IF NOT EXISTS `matches` (
  `id` BLOB PRIMARY KEY,
  `player_a` TEXT NOT NULL,
  `player_b` TEXT NOT NULL,
  `stake` INTEGER NOT NULL,
  `current_round` INTEGER NOT NULL,
  `status` INTEGER NOT NULL,
  `score_a` INTEGER NOT NULL,
  `score_b` INTEGER NOT NULL
);

-- Per-round state, created together with the match.  Commitments are
-- NULL until the match is activated, chairs and traps are zero until
-- the respective player revealed.
CREATE TABLE IF NOT EXISTS `rounds` (
  `match_id` BLOB NOT NULL REFERENCES `matches` (`id`),
  `round` INTEGER NOT NULL,
  `commitment_a` BLOB NULL,
  `commitment_b` BLOB NULL,
  `chair_a` INTEGER NOT NULL,
  `trap1_a` INTEGER NOT NULL,
  `trap2_a` INTEGER NOT NULL,
  `trap3_a` INTEGER NOT NULL,
  `chair_b` INTEGER NOT NULL,
  `trap1_b` INTEGER NOT NULL,
  `trap2_b` INTEGER NOT NULL,
  `trap3_b` INTEGER NOT NULL,
  `status` INTEGER NOT NULL,
  `score_a` INTEGER NOT NULL,
  `score_b` INTEGER NOT NULL,
  PRIMARY KEY (`match_id`, `round`)
);

-- Commitments submitted with StartMatch, keyed by the submitting player.
-- The first player's commitments wait here until the match has a second
-- player, and the rows are kept afterwards for audit.
CREATE TABLE IF NOT EXISTS `pending_commitments` (
  `match_id` BLOB NOT NULL,
  `player` TEXT NOT NULL,
  `round` INTEGER NOT NULL,
  `commitment` BLOB NOT NULL,
  PRIMARY KEY (`match_id`, `player`, `round`)
);

-- Account balances held by SQLiteLedger.
CREATE TABLE IF NOT EXISTS `balances` (
  `name` TEXT PRIMARY KEY,
  `balance` INTEGER NOT NULL
);

-- Total amount locked in custody by SQLiteLedger (a single row).
CREATE TABLE IF NOT EXISTS `custody` (
  `id` INTEGER PRIMARY KEY CHECK (`id` = 1),
  `amount` INTEGER NOT NULL
);

)";

} // anonymous namespace

void
SetupDatabaseSchema (SQLiteDatabase& db)
{
  LOG (INFO) << "Setting up the database schema for lastchair...";
  db.Execute (SCHEMA_SQL);
}

} // namespace lastchair
