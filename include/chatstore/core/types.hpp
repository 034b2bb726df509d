#pragma once

#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace chatstore {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

/// Nanoseconds since the Unix epoch. Storage and cursors use this form.
inline auto to_unix_nanos(Timestamp ts) -> int64_t {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        ts.time_since_epoch()
    ).count();
}

inline auto from_unix_nanos(int64_t ns) -> Timestamp {
    return Timestamp{std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds{ns})};
}

} // namespace chatstore
