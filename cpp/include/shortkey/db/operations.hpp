/**
 * @file operations.hpp
 * @brief Transaction RAII over a pooled connection
 */

#pragma once

#include <libpq-fe.h>

#include "shortkey/db/errors.hpp"
#include "shortkey/db/helpers.hpp"

namespace shortkey::db {

/**
 * RAII transaction wrapper. Rolls back unless commit() succeeded.
 *
 * Usage:
 *   {
 *       Transaction tx(conn);
 *       check_result(exec_params(conn, "INSERT ...", params), "insert");
 *       tx.commit();
 *   }  // Rolls back if commit() not called or a statement threw
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn), done_(false) {
        Result res = exec(conn_, "BEGIN");
        check_result(res, "BEGIN");
    }

    ~Transaction() {
        if (!done_) {
            PGresult* res = PQexec(conn_, "ROLLBACK");
            PQclear(res);
        }
    }

    // Throws on failure; the transaction is finished either way.
    void commit() {
        if (done_) return;
        done_ = true;
        Result res = exec(conn_, "COMMIT");
        check_result(res, "COMMIT");
    }

    void rollback() {
        if (!done_) {
            Result res = exec(conn_, "ROLLBACK");
            done_ = true;
        }
    }

    // Non-copyable, non-movable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool done_;
};

} // namespace shortkey::db
