#include "shortkey/db/connection.hpp"
#include "shortkey/error.hpp"
#include "shortkey/logging.hpp"

namespace shortkey::db {

ConnectionPool::ConnectionPool(const DatabaseConfig& config)
    : conninfo_(config.to_conninfo())
    , max_size_(config.pool_size > 0 ? config.pool_size : 1)
    , checkout_timeout_(config.checkout_timeout_ms) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

ConnectionPool::Handle ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    const bool ready = cv_.wait_for(lock, checkout_timeout_, [this] {
        return shutdown_ || !available_.empty() || open_ < max_size_;
    });
    if (shutdown_) {
        SHORTKEY_THROW(ErrorCode::CONNECTION_FAILED, "connection pool is shut down");
    }
    if (!ready) {
        throw TransientStorageError("timed out waiting for a pooled connection",
                                    "pool_size=" + std::to_string(max_size_));
    }

    if (!available_.empty()) {
        PGconn* conn = available_.front();
        available_.pop();
        lock.unlock();

        // Reset connection if needed
        if (PQstatus(conn) != CONNECTION_OK) {
            LOG_WARN("Resetting broken pooled connection");
            PQreset(conn);
            if (PQstatus(conn) != CONNECTION_OK) {
                std::string err = PQerrorMessage(conn);
                PQfinish(conn);
                std::lock_guard<std::mutex> relock(mutex_);
                --open_;
                cv_.notify_one();
                throw TransientStorageError("connection reset failed: " + err);
            }
        }
        return Handle(this, conn);
    }

    // Open a new connection outside the lock
    ++open_;
    lock.unlock();

    PGconn* conn = PQconnectdb(conninfo_.c_str());
    if (PQstatus(conn) != CONNECTION_OK) {
        std::string err = conn ? PQerrorMessage(conn) : "out of memory";
        PQfinish(conn);
        std::lock_guard<std::mutex> relock(mutex_);
        --open_;
        cv_.notify_one();
        throw TransientStorageError("failed to connect: " + err);
    }
    LOG_DEBUG("Opened pooled connection (", open_connections(), "/", max_size_, ")");
    return Handle(this, conn);
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
}

size_t ConnectionPool::open_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    while (!available_.empty()) {
        PQfinish(available_.front());
        available_.pop();
        --open_;
    }
    cv_.notify_all();
}

void ConnectionPool::release(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || PQstatus(conn) != CONNECTION_OK) {
        PQfinish(conn);
        --open_;
    } else {
        available_.push(conn);
    }
    cv_.notify_one();
}

} // namespace shortkey::db
