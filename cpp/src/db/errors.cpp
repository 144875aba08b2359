#include "shortkey/db/errors.hpp"
#include "shortkey/error.hpp"
#include "shortkey/logging.hpp"

namespace shortkey::db {

FailureClass classify_sqlstate(const std::string& sqlstate, const std::string& constraint) {
    if (sqlstate.empty()) {
        return FailureClass::Transient;
    }
    if (sqlstate == "00000") {
        return FailureClass::None;
    }
    if (sqlstate == "23505") {
        if (constraint == FINGERPRINT_CONSTRAINT) return FailureClass::FingerprintConflict;
        if (constraint == IDENTIFIER_CONSTRAINT) return FailureClass::IdentifierConflict;
        return FailureClass::Integrity;
    }

    const std::string cls = sqlstate.substr(0, 2);
    if (cls == "23") {
        return FailureClass::Integrity;
    }
    // serialization_failure, deadlock_detected, lock_not_available, query_canceled
    if (sqlstate == "40001" || sqlstate == "40P01" || sqlstate == "55P03" || sqlstate == "57014") {
        return FailureClass::Transient;
    }
    // connection exceptions, insufficient resources, admin shutdown
    if (cls == "08" || cls == "53" || sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03") {
        return FailureClass::Transient;
    }
    return FailureClass::Fatal;
}

void check_result(const Result& res, const char* context, const ConflictValues& values) {
    if (res.get() && res.ok()) {
        return;
    }

    const std::string state = res.sqlstate();
    const std::string message = res.error_message();

    switch (classify_sqlstate(state, res.constraint_name())) {
        case FailureClass::None:
            return;
        case FailureClass::FingerprintConflict:
            throw UniqueConflictError(ConflictKind::Fingerprint, values.fingerprint);
        case FailureClass::IdentifierConflict:
            throw UniqueConflictError(ConflictKind::Identifier, values.identifier);
        case FailureClass::Integrity:
            LOG_ERROR(context, " integrity violation [", state, "]: ", message);
            throw IntegrityViolationError(message, context);
        case FailureClass::Transient:
            LOG_WARN(context, " transient failure [", state, "]: ", message);
            throw TransientStorageError(message, context);
        case FailureClass::Fatal:
            break;
    }
    LOG_ERROR(context, " failed [", state, "]: ", message);
    throw ShortkeyException(ErrorCode::INTERNAL_ERROR, message, context);
}

} // namespace shortkey::db
