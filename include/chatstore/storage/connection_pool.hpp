#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <SQLiteCpp/SQLiteCpp.h>

#include "chatstore/core/context.hpp"
#include "chatstore/core/error.hpp"
#include "chatstore/core/types.hpp"

namespace chatstore::storage {

struct PoolOptions {
    size_t size = 4;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds busy_timeout{5000};
    std::chrono::milliseconds query_timeout{10000};
};

class ConnectionPool;

/// A connection borrowed from a ConnectionPool. Statements run on it are
/// interrupted once the request deadline passes or stop is requested. The
/// connection goes back to the pool when the lease is destroyed; the pool
/// must outlive its leases.
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    [[nodiscard]] auto db() -> SQLite::Database& { return *db_; }
    auto operator->() -> SQLite::Database* { return db_.get(); }

    [[nodiscard]] auto shard_index() const noexcept -> size_t;

private:
    friend class ConnectionPool;

    struct Interrupt {
        RequestContext::SteadyClock::time_point deadline;
        std::stop_token stop;
    };

    Lease(ConnectionPool* pool, std::unique_ptr<SQLite::Database> db,
          RequestContext::SteadyClock::time_point deadline, std::stop_token stop);

    void release();
    static auto on_progress(void* state) -> int;

    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<SQLite::Database> db_;
    // Heap-allocated so the progress handler's pointer survives moves.
    std::unique_ptr<Interrupt> interrupt_;
};

/// Bounded set of SQLite connections to one shard's database file.
/// Connections are opened lazily up to `options.size` and reused.
class ConnectionPool {
public:
    ConnectionPool(size_t shard_index, std::string db_path, PoolOptions options);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    /// Borrow a connection, waiting for one to be returned if the pool is at
    /// capacity. Fails with Timeout at the earlier of the context deadline
    /// and the pool's acquire timeout, Cancelled on stop, ConnectionClosed
    /// after close(), StorageUnavailable if the database cannot be opened.
    auto acquire(const RequestContext& ctx) -> Result<Lease>;

    /// Runs `SELECT 1` on a leased connection.
    auto ping(const RequestContext& ctx) -> VoidResult;

    /// Drops idle connections and rejects further acquisitions. Leased
    /// connections are closed as they come back.
    void close();

    /// Shard wall clock: nanosecond time that never repeats or goes
    /// backwards within this process.
    auto next_timestamp() -> Timestamp;

    [[nodiscard]] auto shard_index() const noexcept -> size_t { return shard_index_; }
    [[nodiscard]] auto path() const -> const std::string& { return path_; }
    [[nodiscard]] auto options() const -> const PoolOptions& { return options_; }
    [[nodiscard]] auto idle_count() const -> size_t;
    [[nodiscard]] auto open_count() const -> size_t;
    [[nodiscard]] auto is_closed() const -> bool;

private:
    friend class Lease;

    void give_back(std::unique_ptr<SQLite::Database> db);
    auto open_connection() -> std::unique_ptr<SQLite::Database>;

    size_t shard_index_;
    std::string path_;
    PoolOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable_any available_;
    std::vector<std::unique_ptr<SQLite::Database>> idle_;
    size_t open_ = 0;
    bool closed_ = false;

    std::atomic<int64_t> last_ns_{0};
};

} // namespace chatstore::storage
