// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LASTCHAIR_SCHEMA_HPP
#define LASTCHAIR_SCHEMA_HPP

#include <chairdb/database.hpp>

namespace lastchair
{

/**
 * Sets up the database schema (if it is not already present) on the given
 * SQLite connection.  This covers the match state as well as the tables
 * used by SQLiteLedger.
 */
void SetupDatabaseSchema (SQLiteDatabase& db);

} // namespace lastchair

#endif // LASTCHAIR_SCHEMA_HPP
