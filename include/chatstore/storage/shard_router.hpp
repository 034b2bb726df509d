#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chatstore/core/config.hpp"
#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"
#include "chatstore/storage/connection_pool.hpp"

namespace chatstore::storage {

/// 32-bit FNV-1a over the raw bytes of `data`.
constexpr auto fnv1a_32(std::string_view data) noexcept -> uint32_t {
    uint32_t hash = 2166136261u;
    for (char c : data) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 16777619u;
    }
    return hash;
}

/// Pool settings taken from the storage section of the config.
auto pool_options(const StorageConfig& config) -> PoolOptions;

/// Maps routing keys onto a fixed set of shard pools and owns those pools.
///
/// The shard for a key is `fnv1a_32(key) % shard_count()`, so a key always
/// lands on the same shard as long as the shard list is unchanged. Changing
/// the number of shards re-routes every channel; there is no rebalancing.
/// All pools are closed when the router is destroyed.
class ShardRouter {
public:
    /// One pool per path, in shard-index order. Throws std::invalid_argument
    /// if `shard_paths` is empty.
    ShardRouter(std::vector<std::string> shard_paths, PoolOptions options);
    ~ShardRouter();

    ShardRouter(const ShardRouter&) = delete;
    ShardRouter& operator=(const ShardRouter&) = delete;

    [[nodiscard]] auto shard_count() const noexcept -> size_t { return pools_.size(); }

    /// Index of the shard owning `routing_key`.
    [[nodiscard]] auto shard_index(std::string_view routing_key) const noexcept -> size_t;

    auto resolve(std::string_view routing_key) -> ConnectionPool&;

    /// Routing policy for every message and channel operation.
    auto shard_for_channel(std::string_view channel_id) -> ConnectionPool&;

    /// Alternate policy keyed by user. Not used by the message path; data
    /// routed this way is not co-located with the user's channels.
    auto shard_for_user(std::string_view user_id) -> ConnectionPool&;

    auto shard(size_t index) -> ConnectionPool&;

    /// Creates the schema on every shard.
    auto init_schema(const RequestContext& ctx) -> VoidResult;

    /// Pings every shard; the error names the first shard that failed.
    auto health(const RequestContext& ctx) -> VoidResult;

    void close();

private:
    std::vector<std::unique_ptr<ConnectionPool>> pools_;
};

} // namespace chatstore::storage
