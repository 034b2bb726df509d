#pragma once

#include <string>

#include <SQLiteCpp/SQLiteCpp.h>

#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"

namespace chatstore::storage {

/// Maps a SQLite failure onto the error taxonomy. Busy, locked, I/O and
/// open failures become StorageUnavailable; an interrupted statement becomes
/// Cancelled or Timeout depending on `ctx`.
auto map_sqlite_error(const SQLite::Exception& e, std::string message,
                      const RequestContext* ctx = nullptr) -> Error;

/// True when `e` is a UNIQUE constraint violation (not a primary key clash).
auto is_unique_violation(const SQLite::Exception& e) -> bool;

} // namespace chatstore::storage
