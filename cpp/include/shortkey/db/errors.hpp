#pragma once

#include <string>

#include "shortkey/db/helpers.hpp"

namespace shortkey::db {

// Unique constraint names created by the schema.
inline constexpr const char* FINGERPRINT_CONSTRAINT = "allocation_records_fingerprint_key";
inline constexpr const char* IDENTIFIER_CONSTRAINT = "allocation_records_identifier_key";

enum class FailureClass {
    None,
    FingerprintConflict,
    IdentifierConflict,
    Integrity,
    Transient,
    Fatal
};

/**
 * Map a SQLSTATE (plus constraint name for 23505) onto the service's
 * failure classes. An empty SQLSTATE means the connection dropped.
 */
FailureClass classify_sqlstate(const std::string& sqlstate, const std::string& constraint);

// Values reported in UniqueConflictError when a commit hits a unique key.
struct ConflictValues {
    std::string fingerprint;
    std::string identifier;
};

/**
 * Throw the matching ShortkeyException if `res` is not a success status.
 * `context` names the operation for the error message.
 */
void check_result(const Result& res, const char* context, const ConflictValues& values = {});

} // namespace shortkey::db
