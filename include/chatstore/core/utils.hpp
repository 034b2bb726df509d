#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "chatstore/core/types.hpp"

namespace chatstore::utils {

auto generate_uuid() -> std::string;
auto timestamp_ns() -> int64_t;

/// URL-safe base64 ("-" and "_"), padded with "=".
auto base64url_encode(std::string_view data) -> std::string;

/// Strict inverse of base64url_encode. Returns nullopt for characters outside
/// the alphabet, a length that is not a multiple of four, or misplaced padding.
auto base64url_decode(std::string_view data) -> std::optional<std::string>;

/// RFC 3339 in UTC with nanoseconds, trailing zeros trimmed
/// ("2026-03-01T10:00:00.5Z").
auto format_rfc3339(Timestamp ts) -> std::string;

/// Parses "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
auto parse_rfc3339(std::string_view s) -> std::optional<Timestamp>;

} // namespace chatstore::utils
