#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "chatstore/chat/message.hpp"
#include "chatstore/chat/message_repository.hpp"
#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"

namespace chatstore::chat {

inline constexpr int kDefaultPageLimit = 50;
inline constexpr int kMaxPageLimit = 100;

/// Limits in [1, kMaxPageLimit] are kept; anything else is kDefaultPageLimit.
constexpr auto clamp_limit(int limit) noexcept -> int {
    if (limit <= 0 || limit > kMaxPageLimit) {
        return kDefaultPageLimit;
    }
    return limit;
}

/// Newest first, older than `cursor`. No cursor means the latest page.
struct CursorFilter {
    std::optional<std::string> cursor;
};

/// Oldest first, strictly after `since`.
struct SinceTimeFilter {
    Timestamp since{};
};

/// Oldest first, strictly after the creation time of `message_id`.
struct SinceMessageFilter {
    std::string message_id;
};

using HistoryFilter = std::variant<CursorFilter, SinceTimeFilter, SinceMessageFilter>;

/// Picks the filter named by a request. More than one of cursor, since and
/// since_id is InvalidArgument.
auto filter_from_request(const HistoryRequest& request) -> Result<HistoryFilter>;

/// Runs history reads against a MessageRepository and shapes the page.
///
/// Each read fetches one row past the limit to learn whether more exist.
/// A next_cursor is only issued for descending (cursor or plain) reads.
/// Messages sharing a created_at value are not tie-broken, so a page
/// boundary that falls between them skips the rest of that group.
class PaginationEngine {
public:
    explicit PaginationEngine(MessageRepository& repository);

    auto list_messages(std::string_view channel_id, const HistoryFilter& filter, int limit,
                       const RequestContext& ctx) -> awaitable<Result<MessagePage>>;

    /// Trims `rows` (fetched with limit + 1) to `limit` and fills has_more
    /// and, when `issue_cursor`, next_cursor.
    static auto assemble_page(std::vector<Message> rows, int limit, bool issue_cursor,
                              int64_t total) -> MessagePage;

private:
    auto build_query(std::string_view channel_id, const HistoryFilter& filter, int limit,
                     const RequestContext& ctx) -> awaitable<Result<PageQuery>>;

    MessageRepository& repository_;
};

} // namespace chatstore::chat
