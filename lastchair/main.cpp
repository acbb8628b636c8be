// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "events.hpp"
#include "game.hpp"
#include "ledger.hpp"
#include "moveprocessor.hpp"
#include "schema.hpp"
#include "statejson.hpp"
#include "verifier.hpp"

#include <chairdb/database.hpp>
#include <chairdb/transaction.hpp>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace
{

DEFINE_string (db, "", "the SQLite database file holding the game state");

DEFINE_string (moves, "",
               "JSON file with an array of moves to process"
               " ('-' to read from stdin)");

DEFINE_string (funding, "",
               "JSON object mapping names to amounts that are credited"
               " to their balances before processing moves");

DEFINE_bool (dump_state, false,
             "whether to print the full game state as JSON at the end");

/**
 * Parses JSON from a stream.  Returns false if it is not valid.
 */
bool
ParseJson (std::istream& in, Json::Value& res)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  std::string parseErrs;
  if (!Json::parseFromStream (rbuilder, in, &res, &parseErrs))
    {
      LOG (ERROR) << "Failed to parse JSON: " << parseErrs;
      return false;
    }

  return true;
}

/**
 * Credits the initial balances given as JSON object.
 */
bool
ApplyFunding (lastchair::SQLiteDatabase& db, lastchair::SQLiteLedger& ledger,
              const Json::Value& funding)
{
  if (!funding.isObject ())
    {
      LOG (ERROR) << "Funding is not a JSON object: " << funding;
      return false;
    }

  lastchair::SQLiteTransaction tx(db, "funding");
  for (auto it = funding.begin (); it != funding.end (); ++it)
    {
      lastchair::Amount amount;
      if (!lastchair::AmountFromJson (*it, amount) || amount <= 0)
        {
          LOG (ERROR) << "Invalid funding for " << it.name () << ": " << *it;
          return false;
        }

      ledger.Credit (it.name (), amount);
      LOG (INFO) << "Credited " << amount << " to " << it.name ();
    }
  tx.Commit ();

  return true;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Process Last Chair moves");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_db.empty ())
    {
      std::cerr << "Error: --db must be set" << std::endl;
      return EXIT_FAILURE;
    }

  lastchair::SQLiteDatabase db(FLAGS_db,
                               SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  lastchair::SetupDatabaseSchema (db);

  lastchair::SQLiteLedger ledger(db);
  if (!FLAGS_funding.empty ())
    {
      std::istringstream in(FLAGS_funding);
      Json::Value funding;
      if (!ParseJson (in, funding) || !ApplyFunding (db, ledger, funding))
        return EXIT_FAILURE;
    }

  lastchair::HashRevealVerifier verifier;
  lastchair::LoggingEventSink sink;
  lastchair::Game game(db, ledger, verifier, sink);

  if (!FLAGS_moves.empty ())
    {
      Json::Value moves;
      if (FLAGS_moves == "-")
        {
          if (!ParseJson (std::cin, moves))
            return EXIT_FAILURE;
        }
      else
        {
          std::ifstream in(FLAGS_moves);
          if (!in)
            {
              std::cerr << "Error: cannot open " << FLAGS_moves << std::endl;
              return EXIT_FAILURE;
            }
          if (!ParseJson (in, moves))
            return EXIT_FAILURE;
        }

      if (!moves.isArray ())
        {
          std::cerr << "Error: moves must be a JSON array" << std::endl;
          return EXIT_FAILURE;
        }

      lastchair::MoveProcessor proc(game);
      proc.ProcessAll (moves);
      LOG (INFO)
          << "Accepted " << proc.GetNumAccepted () << " operations, rejected "
          << proc.GetNumRejected ();
    }

  if (FLAGS_dump_state)
    {
      lastchair::StateJsonExtractor ext(db);
      Json::Value state(Json::objectValue);
      state["matches"] = ext.FullState ();
      state["custody"] = lastchair::AmountToJson (ledger.GetCustody ());
      std::cout << state << std::endl;
    }

  return EXIT_SUCCESS;
}
