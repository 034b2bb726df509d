#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <SQLiteCpp/SQLiteCpp.h>

#include "chatstore/chat/message.hpp"
#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"
#include "chatstore/storage/shard_router.hpp"

namespace chatstore::chat {

using boost::asio::awaitable;

enum class SortOrder {
    NewestFirst,
    OldestFirst,
};

/// One bounded, ordered scan of a channel. `before` and `after` are
/// exclusive bounds on created_at.
struct PageQuery {
    std::string channel_id;
    std::optional<Timestamp> before;
    std::optional<Timestamp> after;
    SortOrder order = SortOrder::NewestFirst;
    int fetch_limit = 0;
};

class MessageRepository {
public:
    virtual ~MessageRepository() = default;

    /// Idempotent create. With an idempotency key that is already stored in
    /// the same channel, the stored message is returned unchanged.
    virtual auto create_message(const NewMessage& input, const RequestContext& ctx)
        -> awaitable<Result<Message>> = 0;

    virtual auto get_message(std::string_view message_id, std::string_view channel_id,
                             const RequestContext& ctx) -> awaitable<Result<Message>> = 0;

    virtual auto query_messages(const PageQuery& query, const RequestContext& ctx)
        -> awaitable<Result<std::vector<Message>>> = 0;

    /// Unfiltered number of messages stored for the channel.
    virtual auto count_messages(std::string_view channel_id, const RequestContext& ctx)
        -> awaitable<Result<int64_t>> = 0;
};

/// Messages stored in the shard that owns their channel.
class SqliteMessageRepository : public MessageRepository {
public:
    explicit SqliteMessageRepository(storage::ShardRouter& router);

    auto create_message(const NewMessage& input, const RequestContext& ctx)
        -> awaitable<Result<Message>> override;
    auto get_message(std::string_view message_id, std::string_view channel_id,
                     const RequestContext& ctx) -> awaitable<Result<Message>> override;
    auto query_messages(const PageQuery& query, const RequestContext& ctx)
        -> awaitable<Result<std::vector<Message>>> override;
    auto count_messages(std::string_view channel_id, const RequestContext& ctx)
        -> awaitable<Result<int64_t>> override;

private:
    static auto read_row(SQLite::Statement& stmt) -> Message;
    static auto find_by_key(SQLite::Database& db, const std::string& key)
        -> std::optional<Message>;
    static auto claim_existing(Message existing, std::string_view channel_id) -> Result<Message>;

    storage::ShardRouter& router_;
};

} // namespace chatstore::chat
