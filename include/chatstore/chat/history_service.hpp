#pragma once

#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatstore/chat/channel_directory.hpp"
#include "chatstore/chat/events.hpp"
#include "chatstore/chat/message.hpp"
#include "chatstore/chat/message_repository.hpp"
#include "chatstore/chat/pagination.hpp"
#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"

namespace chatstore::chat {

using boost::asio::awaitable;

/// Membership-checked reads and writes of channel messages.
///
/// Reads are validated in a fixed order and the first failure wins:
/// malformed request (InvalidArgument), unknown channel (NotFound), caller
/// not a member (PermissionDenied), then the filter itself (bad cursor is
/// InvalidArgument, unknown since_id is NotFound). Reporting NotFound
/// before PermissionDenied tells non-members which channels exist.
class HistoryService {
public:
    HistoryService(MessageRepository& repository, ChannelDirectory& directory,
                   EventPublisher& publisher);

    /// Stores the message once per idempotency key and announces it on the
    /// channel topic. Publish failures are logged and do not fail the send.
    auto send_message(const SendMessageRequest& request, const RequestContext& ctx)
        -> awaitable<Result<Message>>;

    auto get_history(const HistoryRequest& request, const RequestContext& ctx)
        -> awaitable<Result<MessagePage>>;

    auto get_messages_since(std::string_view channel_id, std::string_view user_id,
                            Timestamp since, int limit, const RequestContext& ctx)
        -> awaitable<Result<MessagePage>>;

    auto get_messages_since_id(std::string_view channel_id, std::string_view user_id,
                               std::string_view since_id, int limit,
                               const RequestContext& ctx) -> awaitable<Result<MessagePage>>;

    auto get_messages_with_cursor(std::string_view channel_id, std::string_view user_id,
                                  std::string_view cursor, int limit,
                                  const RequestContext& ctx) -> awaitable<Result<MessagePage>>;

    auto get_message(std::string_view channel_id, std::string_view user_id,
                     std::string_view message_id, const RequestContext& ctx)
        -> awaitable<Result<Message>>;

    /// Checks membership and that the message exists. Nothing is stored.
    auto mark_read(const ReadReceiptRequest& request, const RequestContext& ctx)
        -> awaitable<VoidResult>;

private:
    /// Channel exists and `user_id` belongs to it.
    auto authorize_read(std::string_view channel_id, std::string_view user_id,
                        const RequestContext& ctx) -> awaitable<VoidResult>;

    auto require_member(std::string_view channel_id, std::string_view user_id,
                        const RequestContext& ctx) -> awaitable<VoidResult>;

    auto read_page(std::string_view channel_id, std::string_view user_id,
                   const HistoryFilter& filter, int limit, const RequestContext& ctx)
        -> awaitable<Result<MessagePage>>;

    MessageRepository& repository_;
    ChannelDirectory& directory_;
    EventPublisher& publisher_;
    PaginationEngine pagination_;
};

} // namespace chatstore::chat
