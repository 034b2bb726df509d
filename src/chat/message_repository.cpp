#include "chatstore/chat/message_repository.hpp"

#include "chatstore/core/logger.hpp"
#include "chatstore/core/utils.hpp"
#include "chatstore/storage/sqlite_error.hpp"

namespace chatstore::chat {

namespace {

constexpr const char* kSelectMessage =
    "SELECT id, channel_id, user_id, content, message_type, created_at, updated_at, "
    "idempotency_key FROM messages";

} // anonymous namespace

SqliteMessageRepository::SqliteMessageRepository(storage::ShardRouter& router)
    : router_(router) {}

auto SqliteMessageRepository::read_row(SQLite::Statement& stmt) -> Message {
    Message msg;
    msg.id = stmt.getColumn(0).getString();
    msg.channel_id = stmt.getColumn(1).getString();
    msg.user_id = stmt.getColumn(2).getString();
    msg.content = stmt.getColumn(3).getString();
    msg.message_type = stmt.getColumn(4).getString();
    msg.created_at = from_unix_nanos(stmt.getColumn(5).getInt64());
    msg.updated_at = from_unix_nanos(stmt.getColumn(6).getInt64());
    if (!stmt.getColumn(7).isNull()) {
        msg.idempotency_key = stmt.getColumn(7).getString();
    }
    return msg;
}

auto SqliteMessageRepository::find_by_key(SQLite::Database& db, const std::string& key)
    -> std::optional<Message> {
    SQLite::Statement stmt(db, std::string(kSelectMessage) + " WHERE idempotency_key = ?");
    stmt.bind(1, key);
    if (!stmt.executeStep()) {
        return std::nullopt;
    }
    return read_row(stmt);
}

auto SqliteMessageRepository::claim_existing(Message existing, std::string_view channel_id)
    -> Result<Message> {
    // Keys are unique per shard, so another channel on this shard may own it.
    if (existing.channel_id != channel_id) {
        LOG_WARN("Idempotency key reused across channels ({} vs {})",
                 existing.channel_id, channel_id);
        return std::unexpected(
            make_error(ErrorCode::AlreadyExists,
                       "Idempotency key already used in another channel"));
    }
    return existing;
}

auto SqliteMessageRepository::create_message(const NewMessage& input, const RequestContext& ctx)
    -> awaitable<Result<Message>> {
    if (input.channel_id.empty() || input.user_id.empty() || input.content.empty()) {
        co_return std::unexpected(
            make_error(ErrorCode::InvalidArgument,
                       "channel_id, user_id and content are required"));
    }

    // An empty key means the caller did not ask for idempotency.
    std::optional<std::string> key = input.idempotency_key;
    if (key && key->empty()) {
        key.reset();
    }

    auto& pool = router_.shard_for_channel(input.channel_id);
    auto lease = pool.acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    try {
        if (key) {
            if (auto existing = find_by_key(lease->db(), *key)) {
                LOG_DEBUG("Idempotent replay of message {} in channel {}",
                          existing->id, input.channel_id);
                co_return claim_existing(std::move(*existing), input.channel_id);
            }
        }

        Message msg;
        msg.id = utils::generate_uuid();
        msg.channel_id = input.channel_id;
        msg.user_id = input.user_id;
        msg.content = input.content;
        msg.message_type = input.message_type.empty() ? kDefaultMessageType
                                                      : input.message_type;
        msg.created_at = pool.next_timestamp();
        msg.updated_at = msg.created_at;
        msg.idempotency_key = key;

        try {
            SQLite::Statement insert(lease->db(),
                "INSERT INTO messages (id, channel_id, user_id, content, message_type, "
                "created_at, updated_at, idempotency_key) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");

            insert.bind(1, msg.id);
            insert.bind(2, msg.channel_id);
            insert.bind(3, msg.user_id);
            insert.bind(4, msg.content);
            insert.bind(5, msg.message_type);
            insert.bind(6, to_unix_nanos(msg.created_at));
            insert.bind(7, to_unix_nanos(msg.updated_at));

            if (msg.idempotency_key) {
                insert.bind(8, *msg.idempotency_key);
            } else {
                insert.bind(8);  // bind NULL
            }

            insert.exec();
        } catch (const SQLite::Exception& e) {
            if (!key || !storage::is_unique_violation(e)) {
                throw;
            }

            // A concurrent writer stored the same key first.
            auto winner = find_by_key(lease->db(), *key);
            if (!winner) {
                LOG_ERROR("Idempotency key conflict in channel {} but no row found",
                          input.channel_id);
                co_return std::unexpected(
                    make_error(ErrorCode::StorageUnavailable,
                               "Idempotency conflict could not be resolved",
                               "shard " + std::to_string(pool.shard_index())));
            }
            LOG_DEBUG("Lost idempotent create race in channel {} to message {}",
                      input.channel_id, winner->id);
            co_return claim_existing(std::move(*winner), input.channel_id);
        }

        LOG_DEBUG("Created message {} in channel {} on shard {}",
                  msg.id, msg.channel_id, pool.shard_index());
        co_return msg;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to create message in channel {}: {}", input.channel_id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to create message", &ctx));
    }
}

auto SqliteMessageRepository::get_message(std::string_view message_id,
                                          std::string_view channel_id,
                                          const RequestContext& ctx)
    -> awaitable<Result<Message>> {
    auto lease = router_.shard_for_channel(channel_id).acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    try {
        SQLite::Statement stmt(lease->db(),
            std::string(kSelectMessage) + " WHERE id = ? AND channel_id = ?");
        stmt.bind(1, std::string(message_id));
        stmt.bind(2, std::string(channel_id));

        if (!stmt.executeStep()) {
            co_return std::unexpected(
                make_error(ErrorCode::NotFound, "Message not found", std::string(message_id)));
        }
        co_return read_row(stmt);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to get message {}: {}", message_id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to get message", &ctx));
    }
}

auto SqliteMessageRepository::query_messages(const PageQuery& query, const RequestContext& ctx)
    -> awaitable<Result<std::vector<Message>>> {
    auto lease = router_.shard_for_channel(query.channel_id).acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    std::string sql = std::string(kSelectMessage) + " WHERE channel_id = ?";
    if (query.before) sql += " AND created_at < ?";
    if (query.after) sql += " AND created_at > ?";
    sql += query.order == SortOrder::NewestFirst ? " ORDER BY created_at DESC"
                                                 : " ORDER BY created_at ASC";
    sql += " LIMIT ?";

    try {
        SQLite::Statement stmt(lease->db(), sql);
        int index = 1;
        stmt.bind(index++, query.channel_id);
        if (query.before) stmt.bind(index++, to_unix_nanos(*query.before));
        if (query.after) stmt.bind(index++, to_unix_nanos(*query.after));
        stmt.bind(index, query.fetch_limit);

        std::vector<Message> rows;
        while (stmt.executeStep()) {
            rows.push_back(read_row(stmt));
        }
        co_return rows;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to query messages for channel {}: {}", query.channel_id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to query messages", &ctx));
    }
}

auto SqliteMessageRepository::count_messages(std::string_view channel_id,
                                             const RequestContext& ctx)
    -> awaitable<Result<int64_t>> {
    auto lease = router_.shard_for_channel(channel_id).acquire(ctx);
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    try {
        SQLite::Statement stmt(lease->db(),
            "SELECT COUNT(*) FROM messages WHERE channel_id = ?");
        stmt.bind(1, std::string(channel_id));
        stmt.executeStep();
        co_return stmt.getColumn(0).getInt64();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to count messages for channel {}: {}", channel_id, e.what());
        co_return std::unexpected(
            storage::map_sqlite_error(e, "Failed to count messages", &ctx));
    }
}

} // namespace chatstore::chat
