#pragma once

#include <stdexcept>
#include <string>

namespace shortkey {

/**
 * Structured error reporting for the allocation service.
 *
 * Every failure that crosses a component boundary is a ShortkeyException
 * carrying an ErrorCode; callers branch on the concrete type or on code().
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    CANCELLED = 2,
    NOT_FOUND = 3,

    // Storage errors
    CONNECTION_FAILED = 100,
    TRANSIENT_STORAGE = 101,
    INTEGRITY_VIOLATION = 102,
    UNIQUE_CONFLICT = 103,
    SCHEMA_VERSION = 104,

    // Allocation errors
    KEYSPACE_EXHAUSTED = 200,

    // Configuration errors
    CONFIG_INVALID = 300,

    // Internal errors
    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code);

class ShortkeyException : public std::runtime_error {
public:
    explicit ShortkeyException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion);

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public ShortkeyException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : ShortkeyException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Every configured length is used up; needs a configuration change.
class KeyspaceExhaustedError : public ShortkeyException {
public:
    explicit KeyspaceExhaustedError(const std::string& message,
                                    const std::string& context = "")
        : ShortkeyException(ErrorCode::KEYSPACE_EXHAUSTED, message, context,
                            "raise keyspace.max_length or keyspace.max_escalations") {}
};

// Timeouts, lost connections, serialization failures. Safe to retry.
class TransientStorageError : public ShortkeyException {
public:
    explicit TransientStorageError(const std::string& message,
                                   const std::string& context = "")
        : ShortkeyException(ErrorCode::TRANSIENT_STORAGE, message, context) {}
};

// A constraint violation that is neither of the two expected unique keys.
class IntegrityViolationError : public ShortkeyException {
public:
    explicit IntegrityViolationError(const std::string& message,
                                     const std::string& context = "")
        : ShortkeyException(ErrorCode::INTEGRITY_VIOLATION, message, context) {}
};

class SchemaVersionError : public ShortkeyException {
public:
    explicit SchemaVersionError(const std::string& message)
        : ShortkeyException(ErrorCode::SCHEMA_VERSION, message, "",
                            "upgrade the shortkey binary") {}
};

class CancelledError : public ShortkeyException {
public:
    explicit CancelledError(const std::string& context = "")
        : ShortkeyException(ErrorCode::CANCELLED, "allocation cancelled", context) {}
};

enum class ConflictKind {
    Fingerprint,
    Identifier
};

/**
 * Unique-constraint violation on one of the two load-bearing keys.
 * Raised by commit operations; the Allocator turns Identifier into a retry
 * and Fingerprint into a dedup hit.
 */
class UniqueConflictError : public ShortkeyException {
public:
    UniqueConflictError(ConflictKind kind, const std::string& value)
        : ShortkeyException(ErrorCode::UNIQUE_CONFLICT,
                            std::string(kind == ConflictKind::Fingerprint ? "fingerprint" : "identifier")
                                + " already taken: " + value)
        , kind_(kind)
        , value_(value) {}

    ConflictKind kind() const noexcept { return kind_; }
    const std::string& value() const noexcept { return value_; }

private:
    ConflictKind kind_;
    std::string value_;
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define SHORTKEY_CHECK_ARGUMENT(condition, message) \
    shortkey::ErrorHandler::check_argument(condition, message, __func__)

#define SHORTKEY_THROW(code, message) \
    throw shortkey::ShortkeyException(code, message, __func__)

} // namespace shortkey
