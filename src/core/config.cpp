#include "chatstore/core/config.hpp"
#include "chatstore/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

namespace chatstore {

namespace {

// Positive count from an environment variable, or nullopt with a warning.
auto parse_count(const char* name, const char* val, size_t max) -> std::optional<size_t> {
    long long parsed = 0;
    try {
        size_t used = 0;
        parsed = std::stoll(val, &used);
        if (used != std::string_view(val).size()) {
            LOG_WARN("Ignoring {}='{}': not a number", name, val);
            return std::nullopt;
        }
    } catch (const std::exception&) {
        LOG_WARN("Ignoring {}='{}': not a number", name, val);
        return std::nullopt;
    }
    if (parsed < 1 || static_cast<unsigned long long>(parsed) > max) {
        LOG_WARN("Ignoring {}='{}': must be between 1 and {}", name, val, max);
        return std::nullopt;
    }
    return static_cast<size_t>(parsed);
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "Cannot open config file", path.string()));
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "Failed to parse config " + path.string(),
                       e.what()));
    }
}

auto load_config_from_env() -> Config {
    Config config;

    if (auto* val = std::getenv("CHATSTORE_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("CHATSTORE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CHATSTORE_SHARD_COUNT")) {
        if (auto count = parse_count("CHATSTORE_SHARD_COUNT", val, kMaxShardCount)) {
            config.storage.shard_count = *count;
        }
    }
    if (auto* val = std::getenv("CHATSTORE_POOL_SIZE")) {
        if (auto size = parse_count("CHATSTORE_POOL_SIZE", val, kMaxPoolSize)) {
            config.storage.pool_size = *size;
        }
    }
    if (auto* val = std::getenv("CHATSTORE_EVENTS_BACKEND")) {
        config.events.backend = val;
    }

    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("CHATSTORE_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".chatstore";
}

auto validate_config(const Config& config) -> VoidResult {
    const auto& s = config.storage;
    if (s.shards.empty() && s.shard_count == 0) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "storage.shard_count must be at least 1"));
    }
    if (s.shards.empty() && s.shard_count > kMaxShardCount) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "storage.shard_count is too large",
                       std::to_string(s.shard_count)));
    }
    if (s.shards.size() > kMaxShardCount) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "storage.shards lists too many shards",
                       std::to_string(s.shards.size())));
    }
    if (s.pool_size == 0) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "storage.pool_size must be at least 1"));
    }
    if (s.pool_size > kMaxPoolSize) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "storage.pool_size is too large",
                       std::to_string(s.pool_size)));
    }
    if (s.acquire_timeout_ms <= 0 || s.busy_timeout_ms <= 0 || s.query_timeout_ms <= 0) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "storage timeouts must be positive"));
    }
    for (const auto& path : s.shards) {
        if (path.empty()) {
            return std::unexpected(
                make_error(ErrorCode::InvalidConfig, "storage.shards contains an empty path"));
        }
    }
    if (config.events.backend != "local" && config.events.backend != "log") {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "Unknown events backend",
                       config.events.backend));
    }
    return {};
}

auto shard_paths(const Config& config) -> std::vector<std::string> {
    std::vector<std::string> paths;

    if (!config.storage.shards.empty()) {
        paths.reserve(config.storage.shards.size());
        for (const auto& p : config.storage.shards) {
            paths.push_back(resolve_env_refs(p));
        }
        return paths;
    }

    auto dir = config.data_dir
        ? std::filesystem::path(resolve_env_refs(*config.data_dir))
        : default_data_dir();

    paths.reserve(config.storage.shard_count);
    for (size_t i = 0; i < config.storage.shard_count; ++i) {
        paths.push_back((dir / ("shard-" + std::to_string(i) + ".db")).string());
    }
    return paths;
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Escaped: $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Unresolved refs are kept verbatim.
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace chatstore
