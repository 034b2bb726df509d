#include "chatstore/chat/history_service.hpp"

#include "chatstore/core/logger.hpp"

#include <exception>

namespace chatstore::chat {

namespace {

auto require_ids(std::string_view channel_id, std::string_view user_id) -> VoidResult {
    if (channel_id.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "channel_id is required"));
    }
    if (user_id.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "user_id is required"));
    }
    return {};
}

} // anonymous namespace

HistoryService::HistoryService(MessageRepository& repository, ChannelDirectory& directory,
                               EventPublisher& publisher)
    : repository_(repository),
      directory_(directory),
      publisher_(publisher),
      pagination_(repository) {}

auto HistoryService::require_member(std::string_view channel_id, std::string_view user_id,
                                    const RequestContext& ctx) -> awaitable<VoidResult> {
    auto member = co_await directory_.is_member(channel_id, user_id, ctx);
    if (!member) {
        co_return std::unexpected(member.error());
    }
    if (!*member) {
        co_return std::unexpected(
            make_error(ErrorCode::PermissionDenied, "User is not a member of this channel",
                       std::string(channel_id)));
    }
    co_return VoidResult{};
}

auto HistoryService::authorize_read(std::string_view channel_id, std::string_view user_id,
                                    const RequestContext& ctx) -> awaitable<VoidResult> {
    auto channel = co_await directory_.get_channel(channel_id, ctx);
    if (!channel) {
        co_return std::unexpected(channel.error());
    }
    co_return co_await require_member(channel_id, user_id, ctx);
}

auto HistoryService::send_message(const SendMessageRequest& request, const RequestContext& ctx)
    -> awaitable<Result<Message>> {
    if (auto valid = require_ids(request.channel_id, request.user_id); !valid) {
        co_return std::unexpected(valid.error());
    }
    if (request.content.empty()) {
        co_return std::unexpected(make_error(ErrorCode::InvalidArgument, "content is required"));
    }
    if (request.idempotency_key.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "idempotency_key is required"));
    }

    auto allowed = co_await require_member(request.channel_id, request.user_id, ctx);
    if (!allowed) {
        co_return std::unexpected(allowed.error());
    }

    NewMessage input;
    input.channel_id = request.channel_id;
    input.user_id = request.user_id;
    input.content = request.content;
    input.message_type = request.message_type;
    input.idempotency_key = request.idempotency_key;

    auto message = co_await repository_.create_message(input, ctx);
    if (!message) {
        co_return std::unexpected(message.error());
    }

    // The message is committed; announcing it is best effort.
    try {
        auto published = publisher_.publish(channel_topic(message->channel_id),
                                            make_message_event(*message));
        if (!published) {
            LOG_WARN("Failed to publish message {} to channel {}: {}",
                     message->id, message->channel_id, published.error().what());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Publisher threw for message {} in channel {}: {}",
                 message->id, message->channel_id, e.what());
    }

    co_return message;
}

auto HistoryService::read_page(std::string_view channel_id, std::string_view user_id,
                               const HistoryFilter& filter, int limit,
                               const RequestContext& ctx) -> awaitable<Result<MessagePage>> {
    if (auto valid = require_ids(channel_id, user_id); !valid) {
        co_return std::unexpected(valid.error());
    }

    auto allowed = co_await authorize_read(channel_id, user_id, ctx);
    if (!allowed) {
        co_return std::unexpected(allowed.error());
    }

    co_return co_await pagination_.list_messages(channel_id, filter, limit, ctx);
}

auto HistoryService::get_history(const HistoryRequest& request, const RequestContext& ctx)
    -> awaitable<Result<MessagePage>> {
    auto filter = filter_from_request(request);
    if (!filter) {
        co_return std::unexpected(filter.error());
    }
    co_return co_await read_page(request.channel_id, request.user_id, *filter, request.limit,
                                 ctx);
}

auto HistoryService::get_messages_since(std::string_view channel_id, std::string_view user_id,
                                        Timestamp since, int limit, const RequestContext& ctx)
    -> awaitable<Result<MessagePage>> {
    co_return co_await read_page(channel_id, user_id, SinceTimeFilter{since}, limit, ctx);
}

auto HistoryService::get_messages_since_id(std::string_view channel_id,
                                           std::string_view user_id,
                                           std::string_view since_id, int limit,
                                           const RequestContext& ctx)
    -> awaitable<Result<MessagePage>> {
    if (since_id.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "since_id must not be empty"));
    }
    co_return co_await read_page(channel_id, user_id,
                                 SinceMessageFilter{std::string(since_id)}, limit, ctx);
}

auto HistoryService::get_messages_with_cursor(std::string_view channel_id,
                                              std::string_view user_id,
                                              std::string_view cursor, int limit,
                                              const RequestContext& ctx)
    -> awaitable<Result<MessagePage>> {
    CursorFilter filter;
    if (!cursor.empty()) {
        filter.cursor = std::string(cursor);
    }
    co_return co_await read_page(channel_id, user_id, filter, limit, ctx);
}

auto HistoryService::get_message(std::string_view channel_id, std::string_view user_id,
                                 std::string_view message_id, const RequestContext& ctx)
    -> awaitable<Result<Message>> {
    if (auto valid = require_ids(channel_id, user_id); !valid) {
        co_return std::unexpected(valid.error());
    }
    if (message_id.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "message_id is required"));
    }

    auto allowed = co_await authorize_read(channel_id, user_id, ctx);
    if (!allowed) {
        co_return std::unexpected(allowed.error());
    }

    co_return co_await repository_.get_message(message_id, channel_id, ctx);
}

auto HistoryService::mark_read(const ReadReceiptRequest& request, const RequestContext& ctx)
    -> awaitable<VoidResult> {
    if (auto valid = require_ids(request.channel_id, request.user_id); !valid) {
        co_return std::unexpected(valid.error());
    }
    if (request.message_id.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "message_id is required"));
    }

    auto allowed = co_await require_member(request.channel_id, request.user_id, ctx);
    if (!allowed) {
        co_return std::unexpected(allowed.error());
    }

    auto message = co_await repository_.get_message(request.message_id, request.channel_id, ctx);
    if (!message) {
        co_return std::unexpected(message.error());
    }

    LOG_DEBUG("User {} read message {} in channel {}",
              request.user_id, request.message_id, request.channel_id);
    co_return VoidResult{};
}

} // namespace chatstore::chat
