/**
 * @file helpers.hpp
 * @brief PostgreSQL helper functions for consistent data access
 *
 * Consolidates common patterns for:
 * - Result value extraction (with null/type handling)
 * - Parameterized query execution
 * - SQLSTATE and constraint-name inspection for error classification
 *
 * All user-supplied values travel as query parameters; SQL text is static.
 */

#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace shortkey::db {

// =============================================================================
// Result Value Extraction Helpers
// =============================================================================

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

inline std::optional<std::string> get_optional_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res) || PQgetisnull(res, row, col)) {
        return std::nullopt;
    }
    return std::string(PQgetvalue(res, row, col));
}

/**
 * Safe extraction of int64 value from PGresult.
 * Returns default_val if null, empty, or not a number.
 */
inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    const char* end = val + PQgetlength(res, row, col);
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(val, end, out);
    if (ec != std::errc() || ptr == val) {
        return default_val;
    }
    return out;
}

inline int get_int(PGresult* res, int row, int col, int default_val = 0) {
    return static_cast<int>(get_int64(res, row, col, default_val));
}

/**
 * Safe extraction of boolean value from PGresult.
 * Handles 't'/'f', 'true'/'false', '1'/'0'.
 */
inline bool get_bool(PGresult* res, int row, int col, bool default_val = false) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    return val[0] == 't' || val[0] == 'T' || val[0] == '1';
}

// =============================================================================
// Query Execution Helpers
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    bool has_rows() const {
        return res_ && PQresultStatus(res_) == PGRES_TUPLES_OK && PQntuples(res_) > 0;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    bool is_null(int row, int col) const {
        return !res_ || PQgetisnull(res_, row, col);
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    // Five-character SQLSTATE, empty when the result carries none.
    std::string sqlstate() const { return field(PG_DIAG_SQLSTATE); }
    std::string constraint_name() const { return field(PG_DIAG_CONSTRAINT_NAME); }

    // Convenience accessors using the helper functions
    std::string str(int row, int col) const { return get_string(res_, row, col); }
    std::optional<std::string> opt_str(int row, int col) const { return get_optional_string(res_, row, col); }
    int integer(int row, int col, int def = 0) const { return get_int(res_, row, col, def); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }
    bool boolean(int row, int col, bool def = false) const { return get_bool(res_, row, col, def); }

private:
    std::string field(int code) const {
        if (!res_) return {};
        const char* val = PQresultErrorField(res_, code);
        return val ? val : "";
    }

    PGresult* res_;
};

/**
 * Execute query and return RAII Result wrapper.
 */
inline Result exec(PGconn* conn, const char* sql) {
    return Result(PQexec(conn, sql));
}

inline Result exec(PGconn* conn, const std::string& sql) {
    return exec(conn, sql.c_str());
}

// Text-format query parameter; nullopt binds SQL NULL.
using Param = std::optional<std::string>;

/**
 * Execute a parameterized query ($1, $2, ...) in text format.
 */
inline Result exec_params(PGconn* conn, const char* sql, const std::vector<Param>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }
    return Result(PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                               values.data(), nullptr, nullptr, 0));
}

/**
 * Get count of rows affected by last command.
 * Use after INSERT/UPDATE/DELETE.
 */
inline int64_t cmd_tuples(PGresult* res) {
    if (!res) return 0;
    const char* val = PQcmdTuples(res);
    if (!val || *val == '\0') return 0;
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(val, val + std::char_traits<char>::length(val), out);
    return ec == std::errc() ? out : 0;
}

} // namespace shortkey::db
