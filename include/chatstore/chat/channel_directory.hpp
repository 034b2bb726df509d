#pragma once

#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatstore/chat/message.hpp"
#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"
#include "chatstore/storage/shard_router.hpp"

namespace chatstore::chat {

using boost::asio::awaitable;

/// Channel lookup and membership, as seen by the history service.
class ChannelDirectory {
public:
    virtual ~ChannelDirectory() = default;

    /// NotFound when the channel does not exist.
    virtual auto get_channel(std::string_view channel_id, const RequestContext& ctx)
        -> awaitable<Result<Channel>> = 0;

    virtual auto is_member(std::string_view channel_id, std::string_view user_id,
                           const RequestContext& ctx) -> awaitable<Result<bool>> = 0;
};

/// Reads the channels and channel_members tables on the channel's shard.
class SqliteChannelDirectory : public ChannelDirectory {
public:
    explicit SqliteChannelDirectory(storage::ShardRouter& router);

    auto get_channel(std::string_view channel_id, const RequestContext& ctx)
        -> awaitable<Result<Channel>> override;
    auto is_member(std::string_view channel_id, std::string_view user_id,
                   const RequestContext& ctx) -> awaitable<Result<bool>> override;

    /// Provisioning. AlreadyExists if the id is taken.
    auto create_channel(const Channel& channel, const RequestContext& ctx)
        -> awaitable<Result<Channel>>;

    /// Adds a member, or updates the role of an existing one. NotFound if
    /// the channel does not exist.
    auto add_member(const ChannelMember& member, const RequestContext& ctx)
        -> awaitable<Result<ChannelMember>>;

private:
    storage::ShardRouter& router_;
};

} // namespace chatstore::chat
