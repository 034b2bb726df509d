#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatstore/core/error.hpp"
#include "chatstore/core/types.hpp"

// std::optional serializer for nlohmann/json: enables the NLOHMANN_DEFINE
// macros to work with optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace chatstore {

inline constexpr size_t kMaxShardCount = 1024;
inline constexpr size_t kMaxPoolSize = 256;

struct StorageConfig {
    size_t shard_count = 3;
    std::vector<std::string> shards;  // explicit paths; overrides shard_count when set
    size_t pool_size = 4;
    int acquire_timeout_ms = 5000;
    int busy_timeout_ms = 5000;
    int query_timeout_ms = 10000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(StorageConfig, shard_count, shards, pool_size,
    acquire_timeout_ms, busy_timeout_ms, query_timeout_ms)

struct EventsConfig {
    std::string backend = "local";  // "local", "log"
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EventsConfig, backend)

struct Config {
    StorageConfig storage;
    EventsConfig events;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, storage, events, log_level, data_dir)

/// A missing file yields the defaults. A file that cannot be read or parsed,
/// or whose values have the wrong type, is InvalidConfig.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Non-numeric or out-of-range CHATSTORE_SHARD_COUNT and CHATSTORE_POOL_SIZE
/// values are logged and ignored.
auto load_config_from_env() -> Config;
auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Checks ranges and enumerations that the JSON schema cannot express.
auto validate_config(const Config& config) -> VoidResult;

/// Shard database paths in shard-index order. Explicit `storage.shards`
/// entries win; otherwise `shard-{i}.db` under the data directory.
/// `${VAR}` references are resolved.
auto shard_paths(const Config& config) -> std::vector<std::string>;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace chatstore
