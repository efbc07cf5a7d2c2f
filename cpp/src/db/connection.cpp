#include "counselscript/db/connection.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

namespace counselscript::db {

Transaction::Transaction(PGconn* conn) : conn_(conn) {
    exec(conn_, "BEGIN");
}

Transaction::~Transaction() {
    if (done_) return;
    Result res(PQexec(conn_, "ROLLBACK"));
    if (!res.get() || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        LOG_ERROR("ROLLBACK failed: ", PQerrorMessage(conn_));
    } else {
        LOG_WARN("Transaction rolled back");
    }
}

void Transaction::commit() {
    exec(conn_, "COMMIT");
    done_ = true;
}

std::unique_ptr<Connection> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait for available connection or create new one
    while (pool_.empty() && active_connections_.load() >= max_size_) {
        cv_.wait(lock);
    }

    if (!pool_.empty()) {
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    active_connections_.fetch_add(1);
    auto conn = std::make_unique<Connection>(conninfo_);
    if (!conn->ok()) {
        active_connections_.fetch_sub(1);
        cv_.notify_one();
        COUNSELSCRIPT_THROW(ErrorCode::CONNECTION_FAILED, std::string("Failed to connect: ") + conn->error());
    }
    return conn;
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn || !conn->ok()) {
        // Bad connection, don't reuse
        active_connections_.fetch_sub(1);
    } else {
        pool_.push(std::move(conn));
    }
    cv_.notify_one();
}

} // namespace counselscript::db
