#include "chatstore/storage/shard_router.hpp"

#include <stdexcept>

#include "chatstore/core/logger.hpp"
#include "chatstore/storage/schema.hpp"
#include "chatstore/storage/sqlite_error.hpp"

namespace chatstore::storage {

auto pool_options(const StorageConfig& config) -> PoolOptions {
    PoolOptions options;
    options.size = config.pool_size;
    options.acquire_timeout = std::chrono::milliseconds(config.acquire_timeout_ms);
    options.busy_timeout = std::chrono::milliseconds(config.busy_timeout_ms);
    options.query_timeout = std::chrono::milliseconds(config.query_timeout_ms);
    return options;
}

ShardRouter::ShardRouter(std::vector<std::string> shard_paths, PoolOptions options) {
    if (shard_paths.empty()) {
        throw std::invalid_argument("ShardRouter requires at least one shard");
    }

    pools_.reserve(shard_paths.size());
    for (size_t i = 0; i < shard_paths.size(); ++i) {
        pools_.push_back(std::make_unique<ConnectionPool>(i, std::move(shard_paths[i]), options));
    }
    LOG_INFO("Shard router ready with {} shard(s)", pools_.size());
}

ShardRouter::~ShardRouter() {
    close();
}

auto ShardRouter::shard_index(std::string_view routing_key) const noexcept -> size_t {
    if (pools_.size() == 1) {
        return 0;
    }
    return static_cast<size_t>(fnv1a_32(routing_key)) % pools_.size();
}

auto ShardRouter::resolve(std::string_view routing_key) -> ConnectionPool& {
    return *pools_[shard_index(routing_key)];
}

auto ShardRouter::shard_for_channel(std::string_view channel_id) -> ConnectionPool& {
    return resolve(channel_id);
}

auto ShardRouter::shard_for_user(std::string_view user_id) -> ConnectionPool& {
    return resolve(user_id);
}

auto ShardRouter::shard(size_t index) -> ConnectionPool& {
    return *pools_.at(index);
}

auto ShardRouter::init_schema(const RequestContext& ctx) -> VoidResult {
    for (auto& pool : pools_) {
        auto lease = pool->acquire(ctx);
        if (!lease) {
            return std::unexpected(lease.error());
        }
        try {
            create_tables(lease->db());
            LOG_DEBUG("Schema ready on shard {} ({})", pool->shard_index(), pool->path());
        } catch (const SQLite::Exception& e) {
            LOG_ERROR("Failed to create tables on shard {}: {}", pool->shard_index(), e.what());
            return std::unexpected(map_sqlite_error(
                e, "Failed to create tables on shard " + std::to_string(pool->shard_index()),
                &ctx));
        }
    }
    LOG_INFO("Schema initialised on {} shard(s)", pools_.size());
    return {};
}

auto ShardRouter::health(const RequestContext& ctx) -> VoidResult {
    for (auto& pool : pools_) {
        auto result = pool->ping(ctx);
        if (!result) {
            return std::unexpected(make_error(
                result.error().code(),
                "Shard " + std::to_string(pool->shard_index()) + " health check failed",
                result.error().what()));
        }
    }
    return {};
}

void ShardRouter::close() {
    for (auto& pool : pools_) {
        pool->close();
    }
}

} // namespace chatstore::storage
