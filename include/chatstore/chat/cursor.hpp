#pragma once

#include <string>
#include <string_view>

#include "chatstore/core/error.hpp"
#include "chatstore/core/types.hpp"

namespace chatstore::chat {

/// Continuation token for descending history pages: URL-safe base64 of the
/// decimal nanosecond creation time of the last message returned.
auto encode_cursor(Timestamp created_at) -> std::string;

/// Inverse of encode_cursor. Anything else is InvalidArgument.
auto decode_cursor(std::string_view token) -> Result<Timestamp>;

} // namespace chatstore::chat
