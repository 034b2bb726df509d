#include "chatstore/chat/pagination.hpp"

#include "chatstore/chat/cursor.hpp"
#include "chatstore/core/logger.hpp"

namespace chatstore::chat {

auto filter_from_request(const HistoryRequest& request) -> Result<HistoryFilter> {
    int selected = static_cast<int>(request.cursor.has_value()) +
                   static_cast<int>(request.since.has_value()) +
                   static_cast<int>(request.since_id.has_value());
    if (selected > 1) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument,
                       "Only one of cursor, since and since_id may be given"));
    }

    if (request.since) {
        return SinceTimeFilter{*request.since};
    }
    if (request.since_id) {
        if (request.since_id->empty()) {
            return std::unexpected(
                make_error(ErrorCode::InvalidArgument, "since_id must not be empty"));
        }
        return SinceMessageFilter{*request.since_id};
    }
    return CursorFilter{request.cursor};
}

PaginationEngine::PaginationEngine(MessageRepository& repository)
    : repository_(repository) {}

auto PaginationEngine::build_query(std::string_view channel_id, const HistoryFilter& filter,
                                   int limit, const RequestContext& ctx)
    -> awaitable<Result<PageQuery>> {
    PageQuery query;
    query.channel_id = std::string(channel_id);
    query.fetch_limit = limit + 1;

    if (const auto* cursor = std::get_if<CursorFilter>(&filter)) {
        query.order = SortOrder::NewestFirst;
        if (cursor->cursor && !cursor->cursor->empty()) {
            auto before = decode_cursor(*cursor->cursor);
            if (!before) {
                co_return std::unexpected(before.error());
            }
            query.before = *before;
        }
    } else if (const auto* since = std::get_if<SinceTimeFilter>(&filter)) {
        query.order = SortOrder::OldestFirst;
        query.after = since->since;
    } else {
        const auto& since_id = std::get<SinceMessageFilter>(filter);
        auto anchor = co_await repository_.get_message(since_id.message_id, channel_id, ctx);
        if (!anchor) {
            co_return std::unexpected(anchor.error());
        }
        query.order = SortOrder::OldestFirst;
        query.after = anchor->created_at;
    }

    co_return query;
}

auto PaginationEngine::list_messages(std::string_view channel_id, const HistoryFilter& filter,
                                     int limit, const RequestContext& ctx)
    -> awaitable<Result<MessagePage>> {
    limit = clamp_limit(limit);

    auto query = co_await build_query(channel_id, filter, limit, ctx);
    if (!query) {
        co_return std::unexpected(query.error());
    }

    auto rows = co_await repository_.query_messages(*query, ctx);
    if (!rows) {
        co_return std::unexpected(rows.error());
    }

    auto total = co_await repository_.count_messages(channel_id, ctx);
    if (!total) {
        co_return std::unexpected(total.error());
    }

    bool issue_cursor = std::holds_alternative<CursorFilter>(filter);
    auto page = assemble_page(std::move(*rows), limit, issue_cursor, *total);

    LOG_DEBUG("Listed {} message(s) for channel {} (has_more={}, total={})",
              page.messages.size(), channel_id, page.has_more, page.total);
    co_return page;
}

auto PaginationEngine::assemble_page(std::vector<Message> rows, int limit, bool issue_cursor,
                                     int64_t total) -> MessagePage {
    MessagePage page;
    page.total = total;
    page.has_more = rows.size() > static_cast<size_t>(limit);
    if (page.has_more) {
        rows.resize(static_cast<size_t>(limit));
    }
    if (issue_cursor && page.has_more && !rows.empty()) {
        page.next_cursor = encode_cursor(rows.back().created_at);
    }
    page.messages = std::move(rows);
    return page;
}

} // namespace chatstore::chat
