#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <tuple>
#include <libpq-fe.h>

#include "engram/config.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"

namespace engram::db {

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const DatabaseConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

/**
 * Bounded connection pool. At most max_size connections exist; acquire()
 * blocks while all are in use and raises TransientIOError(POOL_EXHAUSTED)
 * once the timeout elapses.
 */
class ConnectionPool {
public:
    ConnectionPool(std::string conninfo, size_t max_size, std::chrono::milliseconds timeout)
        : conninfo_(std::move(conninfo)), max_size_(max_size), timeout_(timeout) {}

    explicit ConnectionPool(const DatabaseConfig& config)
        : ConnectionPool(config.to_conninfo(), static_cast<size_t>(config.pool_size),
                         std::chrono::milliseconds(config.pool_timeout_ms)) {}

    std::unique_ptr<Connection> acquire() {
        std::unique_lock<std::mutex> lock(mutex_);

        bool available = cv_.wait_for(lock, timeout_, [this] {
            return !pool_.empty() || active_connections_.load() < max_size_;
        });
        if (!available) {
            throw TransientIOError("connection pool exhausted after " +
                                   std::to_string(timeout_.count()) + " ms",
                                   "pool size " + std::to_string(max_size_),
                                   ErrorCode::POOL_EXHAUSTED);
        }

        if (!pool_.empty()) {
            auto conn = std::move(pool_.front());
            pool_.pop();
            return conn;
        }

        active_connections_.fetch_add(1);
        lock.unlock();
        auto conn = std::make_unique<Connection>(conninfo_);
        if (!conn->ok()) {
            std::string err = conn->error();
            active_connections_.fetch_sub(1);
            cv_.notify_one();
            throw TransientIOError("failed to connect: " + err, "", ErrorCode::TRANSIENT_IO);
        }
        return conn;
    }

    void release(std::unique_ptr<Connection> conn) {
        if (!conn || !conn->ok()) {
            // Broken connection, let a new one take its slot
            active_connections_.fetch_sub(1);
            cv_.notify_one();
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

    // (idle, open)
    std::tuple<size_t, size_t> stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {pool_.size(), active_connections_.load()};
    }

    void drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!pool_.empty()) {
            pool_.pop();
            active_connections_.fetch_sub(1);
        }
    }

private:
    std::queue<std::unique_ptr<Connection>> pool_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    const std::string conninfo_;
    size_t max_size_;
    std::chrono::milliseconds timeout_;
    std::atomic<size_t> active_connections_{0};
};

// RAII wrapper for pooled connections
class PooledConnection {
public:
    explicit PooledConnection(ConnectionPool& pool)
        : pool_(&pool), conn_(pool.acquire()) {}

    ~PooledConnection() {
        if (conn_) {
            pool_->release(std::move(conn_));
        }
    }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection(PooledConnection&&) = delete;
    PooledConnection& operator=(PooledConnection&&) = delete;

    Connection* operator->() const { return conn_.get(); }
    Connection& operator*() const { return *conn_; }
    PGconn* get() const { return conn_->get(); }
    operator PGconn*() const { return conn_->get(); }

private:
    ConnectionPool* pool_;
    std::unique_ptr<Connection> conn_;
};

} // namespace engram::db
