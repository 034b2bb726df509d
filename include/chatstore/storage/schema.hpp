#pragma once

#include <SQLiteCpp/SQLiteCpp.h>

namespace chatstore::storage {

/// Creates the channels, channel_members and messages tables and their
/// indexes if they do not exist. Throws SQLite::Exception on failure.
void create_tables(SQLite::Database& db);

} // namespace chatstore::storage
