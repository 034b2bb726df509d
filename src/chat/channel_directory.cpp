#include "chatstore/chat/channel_directory.hpp"

#include <sqlite3.h>

#include "chatstore/core/logger.hpp"
#include "chatstore/storage/sqlite_error.hpp"

namespace chatstore::chat {

SqliteChannelDirectory::SqliteChannelDirectory(storage::ShardRouter& router)
    : router_(router) {}

auto SqliteChannelDirectory::get_channel(std::string_view channel_id, const RequestContext& ctx)
    -> awaitable<Result<Channel>> {
    auto lease = router_.shard_for_channel(channel_id).acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    try {
        SQLite::Statement stmt(lease->db(),
            "SELECT id, name, type, created_by, created_at, updated_at "
            "FROM channels WHERE id = ?");
        stmt.bind(1, std::string(channel_id));

        if (!stmt.executeStep()) {
            co_return std::unexpected(
                make_error(ErrorCode::NotFound, "Channel not found", std::string(channel_id)));
        }

        Channel channel;
        channel.id = stmt.getColumn(0).getString();
        channel.name = stmt.getColumn(1).getString();
        channel.type = parse_channel_type(stmt.getColumn(2).getString())
                           .value_or(ChannelType::Public);
        channel.created_by = stmt.getColumn(3).getString();
        channel.created_at = from_unix_nanos(stmt.getColumn(4).getInt64());
        channel.updated_at = from_unix_nanos(stmt.getColumn(5).getInt64());
        co_return channel;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to get channel {}: {}", channel_id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to get channel", &ctx));
    }
}

auto SqliteChannelDirectory::is_member(std::string_view channel_id, std::string_view user_id,
                                       const RequestContext& ctx) -> awaitable<Result<bool>> {
    auto lease = router_.shard_for_channel(channel_id).acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    try {
        SQLite::Statement stmt(lease->db(),
            "SELECT 1 FROM channel_members WHERE channel_id = ? AND user_id = ?");
        stmt.bind(1, std::string(channel_id));
        stmt.bind(2, std::string(user_id));
        co_return stmt.executeStep();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Membership check failed for {} in {}: {}", user_id, channel_id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to check channel membership", &ctx));
    }
}

auto SqliteChannelDirectory::create_channel(const Channel& channel, const RequestContext& ctx)
    -> awaitable<Result<Channel>> {
    if (channel.id.empty() || channel.name.empty() || channel.created_by.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "id, name and created_by are required"));
    }

    auto& pool = router_.shard_for_channel(channel.id);
    auto lease = pool.acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    Channel created = channel;
    created.created_at = pool.next_timestamp();
    created.updated_at = created.created_at;

    try {
        SQLite::Statement stmt(lease->db(),
            "INSERT INTO channels (id, name, type, created_by, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        stmt.bind(1, created.id);
        stmt.bind(2, created.name);
        stmt.bind(3, channel_type_to_string(created.type));
        stmt.bind(4, created.created_by);
        stmt.bind(5, to_unix_nanos(created.created_at));
        stmt.bind(6, to_unix_nanos(created.updated_at));
        stmt.exec();

        LOG_INFO("Created channel {} on shard {}", created.id, pool.shard_index());
        co_return created;
    } catch (const SQLite::Exception& e) {
        if (e.getExtendedErrorCode() == SQLITE_CONSTRAINT_PRIMARYKEY) {
            co_return std::unexpected(
                make_error(ErrorCode::AlreadyExists, "Channel already exists", created.id));
        }
        LOG_ERROR("Failed to create channel {}: {}", created.id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to create channel", &ctx));
    }
}

auto SqliteChannelDirectory::add_member(const ChannelMember& member, const RequestContext& ctx)
    -> awaitable<Result<ChannelMember>> {
    if (member.channel_id.empty() || member.user_id.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "channel_id and user_id are required"));
    }

    auto& pool = router_.shard_for_channel(member.channel_id);
    auto lease = pool.acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    ChannelMember added = member;
    if (added.role.empty()) added.role = "member";
    added.joined_at = pool.next_timestamp();

    try {
        SQLite::Statement exists(lease->db(), "SELECT 1 FROM channels WHERE id = ?");
        exists.bind(1, added.channel_id);
        if (!exists.executeStep()) {
            co_return std::unexpected(
                make_error(ErrorCode::NotFound, "Channel not found", added.channel_id));
        }

        SQLite::Statement stmt(lease->db(),
            "INSERT INTO channel_members (channel_id, user_id, role, joined_at) "
            "VALUES (?, ?, ?, ?) "
            "ON CONFLICT(channel_id, user_id) DO UPDATE SET role = excluded.role");
        stmt.bind(1, added.channel_id);
        stmt.bind(2, added.user_id);
        stmt.bind(3, added.role);
        stmt.bind(4, to_unix_nanos(added.joined_at));
        stmt.exec();

        LOG_INFO("Added {} to channel {} as {}", added.user_id, added.channel_id, added.role);
        co_return added;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to add {} to channel {}: {}", added.user_id, added.channel_id,
                  e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to add channel member", &ctx));
    }
}

} // namespace chatstore::chat
