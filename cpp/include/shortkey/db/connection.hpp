#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <libpq-fe.h>

#include "shortkey/config.hpp"

namespace shortkey::db {

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
 * Fixed-capacity connection pool shared by every thread of the process.
 *
 * Connections are opened lazily up to `max_size`. acquire() waits at most
 * `checkout_timeout` for a free slot and throws TransientStorageError when
 * none frees up, or when a new connection cannot be established.
 *
 * Usage:
 *   ConnectionPool pool(config.database);
 *   auto conn = pool.acquire();
 *   Result res = exec(conn, "SELECT 1");
 *   // Returns to the pool when conn goes out of scope
 */
class ConnectionPool {
public:
    /**
     * RAII handle for borrowed connection.
     */
    class Handle {
    public:
        Handle() : pool_(nullptr), conn_(nullptr) {}
        Handle(ConnectionPool* pool, PGconn* conn) : pool_(pool), conn_(conn) {}

        ~Handle() {
            if (pool_ && conn_) {
                pool_->release(conn_);
            }
        }

        // Move only
        Handle(Handle&& other) noexcept : pool_(other.pool_), conn_(other.conn_) {
            other.pool_ = nullptr;
            other.conn_ = nullptr;
        }

        Handle& operator=(Handle&& other) noexcept {
            if (this != &other) {
                if (pool_ && conn_) pool_->release(conn_);
                pool_ = other.pool_;
                conn_ = other.conn_;
                other.pool_ = nullptr;
                other.conn_ = nullptr;
            }
            return *this;
        }

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        PGconn* get() const { return conn_; }
        operator PGconn*() const { return conn_; }
        bool ok() const { return conn_ && PQstatus(conn_) == CONNECTION_OK; }

    private:
        ConnectionPool* pool_;
        PGconn* conn_;
    };

    explicit ConnectionPool(const DatabaseConfig& config);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Handle acquire();

    // Idle connections currently held by the pool.
    size_t available() const;

    // Connections opened and not yet closed (idle + borrowed).
    size_t open_connections() const;

    void shutdown();

private:
    void release(PGconn* conn);

    std::string conninfo_;
    size_t max_size_;
    std::chrono::milliseconds checkout_timeout_;
    std::queue<PGconn*> available_;
    size_t open_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace shortkey::db
