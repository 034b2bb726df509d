#include "chatstore/storage/connection_pool.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include <sqlite3.h>

#include "chatstore/core/logger.hpp"
#include "chatstore/core/utils.hpp"
#include "chatstore/storage/sqlite_error.hpp"

namespace chatstore::storage {

// ---------------------------------------------------------------------------
// Lease
// ---------------------------------------------------------------------------

Lease::Lease(ConnectionPool* pool, std::unique_ptr<SQLite::Database> db,
             RequestContext::SteadyClock::time_point deadline, std::stop_token stop)
    : pool_(pool),
      db_(std::move(db)),
      interrupt_(std::make_unique<Interrupt>(Interrupt{deadline, std::move(stop)})) {
    // Checked every 1000 VM instructions.
    sqlite3_progress_handler(db_->getHandle(), 1000, &Lease::on_progress, interrupt_.get());
}

Lease::~Lease() {
    release();
}

Lease::Lease(Lease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      db_(std::move(other.db_)),
      interrupt_(std::move(other.interrupt_)) {}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        db_ = std::move(other.db_);
        interrupt_ = std::move(other.interrupt_);
    }
    return *this;
}

auto Lease::shard_index() const noexcept -> size_t {
    return pool_ ? pool_->shard_index() : 0;
}

void Lease::release() {
    if (!db_) return;
    sqlite3_progress_handler(db_->getHandle(), 0, nullptr, nullptr);
    if (pool_) {
        pool_->give_back(std::move(db_));
    }
    db_.reset();
    pool_ = nullptr;
}

auto Lease::on_progress(void* state) -> int {
    auto* interrupt = static_cast<Interrupt*>(state);
    if (interrupt->stop.stop_requested()) return 1;
    if (RequestContext::SteadyClock::now() >= interrupt->deadline) return 1;
    return 0;
}

// ---------------------------------------------------------------------------
// ConnectionPool
// ---------------------------------------------------------------------------

ConnectionPool::ConnectionPool(size_t shard_index, std::string db_path, PoolOptions options)
    : shard_index_(shard_index), path_(std::move(db_path)), options_(options) {
    options_.size = std::max<size_t>(options_.size, 1);
    LOG_DEBUG("Shard {} pool created for {} (size={})", shard_index_, path_, options_.size);
}

ConnectionPool::~ConnectionPool() {
    close();
}

auto ConnectionPool::open_connection() -> std::unique_ptr<SQLite::Database> {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_WARN("Cannot create directory {} for shard {}: {}",
                     parent.string(), shard_index_, ec.message());
        }
    }

    auto db = std::make_unique<SQLite::Database>(
        path_, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    db->setBusyTimeout(static_cast<int>(options_.busy_timeout.count()));
    db->exec("PRAGMA journal_mode=WAL");
    db->exec("PRAGMA synchronous=NORMAL");
    return db;
}

auto ConnectionPool::acquire(const RequestContext& ctx) -> Result<Lease> {
    if (ctx.cancelled()) {
        return std::unexpected(
            make_error(ErrorCode::Cancelled, "Connection acquisition cancelled",
                       "shard " + std::to_string(shard_index_)));
    }
    if (ctx.expired()) {
        return std::unexpected(
            make_error(ErrorCode::Timeout, "Request deadline already passed",
                       "shard " + std::to_string(shard_index_)));
    }

    auto wait_deadline = ctx.bounded_by(options_.acquire_timeout);
    std::unique_ptr<SQLite::Database> db;
    bool open_new = false;

    {
        std::unique_lock lock(mutex_);
        bool ready = available_.wait_until(lock, ctx.stop, wait_deadline, [this] {
            return closed_ || !idle_.empty() || open_ < options_.size;
        });

        if (closed_) {
            return std::unexpected(
                make_error(ErrorCode::ConnectionClosed, "Shard pool is closed",
                           "shard " + std::to_string(shard_index_)));
        }
        if (!ready) {
            if (ctx.cancelled()) {
                return std::unexpected(
                    make_error(ErrorCode::Cancelled, "Connection acquisition cancelled",
                               "shard " + std::to_string(shard_index_)));
            }
            LOG_WARN("Shard {} pool exhausted ({} connections in use)",
                     shard_index_, open_);
            return std::unexpected(
                make_error(ErrorCode::Timeout, "Timed out waiting for a connection",
                           "shard " + std::to_string(shard_index_)));
        }

        if (!idle_.empty()) {
            db = std::move(idle_.back());
            idle_.pop_back();
        } else {
            ++open_;
            open_new = true;
        }
    }

    if (open_new) {
        try {
            db = open_connection();
            LOG_DEBUG("Opened connection to shard {} ({})", shard_index_, path_);
        } catch (const SQLite::Exception& e) {
            {
                std::lock_guard lock(mutex_);
                --open_;
            }
            available_.notify_one();
            LOG_ERROR("Failed to open shard {} at {}: {}", shard_index_, path_, e.what());
            return std::unexpected(map_sqlite_error(e, "Failed to open shard database", &ctx));
        }
    }

    return Lease(this, std::move(db), ctx.bounded_by(options_.query_timeout), ctx.stop);
}

void ConnectionPool::give_back(std::unique_ptr<SQLite::Database> db) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            --open_;
            db.reset();
        } else {
            idle_.push_back(std::move(db));
        }
    }
    available_.notify_one();
}

auto ConnectionPool::ping(const RequestContext& ctx) -> VoidResult {
    auto lease = acquire(ctx);
    if (!lease) {
        return std::unexpected(lease.error());
    }

    try {
        SQLite::Statement stmt(lease->db(), "SELECT 1");
        stmt.executeStep();
        return {};
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Shard {} ping failed: {}", shard_index_, e.what());
        return std::unexpected(map_sqlite_error(e, "Shard ping failed", &ctx));
    }
}

void ConnectionPool::close() {
    size_t dropped = 0;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
        dropped = idle_.size();
        open_ -= dropped;
        idle_.clear();
    }
    available_.notify_all();
    LOG_DEBUG("Shard {} pool closed ({} idle connections dropped)", shard_index_, dropped);
}

auto ConnectionPool::next_timestamp() -> Timestamp {
    auto now = utils::timestamp_ns();
    auto last = last_ns_.load(std::memory_order_relaxed);
    int64_t next = 0;
    do {
        next = std::max(now, last + 1);
    } while (!last_ns_.compare_exchange_weak(last, next, std::memory_order_relaxed));
    return from_unix_nanos(next);
}

auto ConnectionPool::idle_count() const -> size_t {
    std::lock_guard lock(mutex_);
    return idle_.size();
}

auto ConnectionPool::open_count() const -> size_t {
    std::lock_guard lock(mutex_);
    return open_;
}

auto ConnectionPool::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

} // namespace chatstore::storage
