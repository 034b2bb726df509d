#include "chatstore/storage/sqlite_error.hpp"

#include <sqlite3.h>

namespace chatstore::storage {

auto map_sqlite_error(const SQLite::Exception& e, std::string message,
                      const RequestContext* ctx) -> Error {
    switch (e.getErrorCode() & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
        case SQLITE_PROTOCOL:
            return make_error(ErrorCode::StorageUnavailable, std::move(message), e.what());
        case SQLITE_INTERRUPT:
            if (ctx && ctx->cancelled()) {
                return make_error(ErrorCode::Cancelled, std::move(message), "request cancelled");
            }
            return make_error(ErrorCode::Timeout, std::move(message), "statement deadline exceeded");
        default:
            return make_error(ErrorCode::DatabaseError, std::move(message), e.what());
    }
}

auto is_unique_violation(const SQLite::Exception& e) -> bool {
    return e.getExtendedErrorCode() == SQLITE_CONSTRAINT_UNIQUE;
}

} // namespace chatstore::storage
