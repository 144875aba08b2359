#include "shortkey/error.hpp"

namespace shortkey {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::CONNECTION_FAILED: return "connection_failed";
        case ErrorCode::TRANSIENT_STORAGE: return "transient_storage";
        case ErrorCode::INTEGRITY_VIOLATION: return "integrity_violation";
        case ErrorCode::UNIQUE_CONFLICT: return "unique_conflict";
        case ErrorCode::SCHEMA_VERSION: return "schema_version";
        case ErrorCode::KEYSPACE_EXHAUSTED: return "keyspace_exhausted";
        case ErrorCode::CONFIG_INVALID: return "config_invalid";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

std::string ShortkeyException::format_message(ErrorCode code, const std::string& message,
                                              const std::string& context,
                                              const std::string& suggestion) {
    std::string result = "shortkey error [" + std::string(error_code_name(code)) + "]: " + message;
    if (!context.empty()) {
        result += "\nContext: " + context;
    }
    if (!suggestion.empty()) {
        result += "\nSuggestion: " + suggestion;
    }
    return result;
}

} // namespace shortkey
