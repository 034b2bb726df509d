#include "chatstore/chat/cursor.hpp"

#include <charconv>
#include <cstdint>

#include "chatstore/core/utils.hpp"

namespace chatstore::chat {

auto encode_cursor(Timestamp created_at) -> std::string {
    return utils::base64url_encode(std::to_string(to_unix_nanos(created_at)));
}

auto decode_cursor(std::string_view token) -> Result<Timestamp> {
    auto raw = utils::base64url_decode(token);
    if (!raw || raw->empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "invalid cursor encoding",
                       std::string(token)));
    }

    int64_t nanos = 0;
    const char* first = raw->data();
    const char* last = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(first, last, nanos);
    if (ec != std::errc{} || ptr != last) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "invalid cursor timestamp", *raw));
    }

    return from_unix_nanos(nanos);
}

} // namespace chatstore::chat
