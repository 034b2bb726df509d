#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <boost/asio.hpp>

#include "chatstore/core/context.hpp"
#include "chatstore/storage/shard_router.hpp"

namespace chatstore::testing {

// Helper to run a coroutine synchronously in tests.
template <typename T>
T run_sync(boost::asio::awaitable<T> coro) {
    boost::asio::io_context ioc;
    T result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await std::move(coro);
        },
        boost::asio::detached);
    ioc.run();
    return result;
}

// RAII helper: a fresh directory under the system temp dir, removed on
// destruction, ignoring errors.
struct TmpDir {
    std::filesystem::path path;

    explicit TmpDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("chatstore_test_" + name)) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    auto file(const std::string& name) const -> std::string {
        return (path / name).string();
    }

    auto shard_files(size_t count) const -> std::vector<std::string> {
        std::vector<std::string> files;
        for (size_t i = 0; i < count; ++i) {
            files.push_back(file("shard-" + std::to_string(i) + ".db"));
        }
        return files;
    }
};

// Router over `shards` files in `dir` with the schema created.
inline auto make_router(const TmpDir& dir, size_t shards,
                        storage::PoolOptions options = {})
    -> std::unique_ptr<storage::ShardRouter> {
    auto router = std::make_unique<storage::ShardRouter>(dir.shard_files(shards), options);
    auto ready = router->init_schema(RequestContext::background());
    if (!ready) {
        throw std::runtime_error(ready.error().what());
    }
    return router;
}

} // namespace chatstore::testing
