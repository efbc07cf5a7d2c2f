#pragma once

#include <libpq-fe.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "counselscript/config.hpp"
#include "counselscript/db/helpers.hpp"

namespace counselscript::db {

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

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
 * BEGIN on construction, ROLLBACK on destruction unless commit() ran.
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    PGconn* conn_;
    bool done_ = false;
};

// Bounded pool; acquire() blocks while max_size connections are checked out
class ConnectionPool {
public:
    ConnectionPool(std::string conninfo, size_t max_size = 4)
        : conninfo_(std::move(conninfo)), max_size_(max_size) {}

    explicit ConnectionPool(const Config& config)
        : ConnectionPool(config.database_conninfo(),
                         static_cast<size_t>(std::max(1, config.database.pool_size))) {}

    std::unique_ptr<Connection> acquire();

    void release(std::unique_ptr<Connection> conn);

private:
    std::queue<std::unique_ptr<Connection>> pool_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    const std::string conninfo_;
    size_t max_size_;
    std::atomic<size_t> active_connections_{0};
};

// Returns its connection to the pool on scope exit
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

    PGconn* get() const { return conn_->get(); }
    operator PGconn*() const { return conn_->get(); }

private:
    ConnectionPool* pool_;
    std::unique_ptr<Connection> conn_;
};

} // namespace counselscript::db
