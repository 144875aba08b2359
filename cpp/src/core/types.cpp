#include "shortkey/types.hpp"

namespace shortkey {

const char* record_status_name(RecordStatus status) {
    switch (status) {
        case RecordStatus::Active: return "active";
        case RecordStatus::Deleted: return "deleted";
        case RecordStatus::Archived: return "archived";
    }
    return "active";
}

std::optional<RecordStatus> parse_record_status(const std::string& name) {
    if (name == "active") return RecordStatus::Active;
    if (name == "deleted") return RecordStatus::Deleted;
    if (name == "archived") return RecordStatus::Archived;
    return std::nullopt;
}

const char* operation_kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::Assign: return "assign";
        case OperationKind::DedupHit: return "dedup_hit";
        case OperationKind::Access: return "access";
        case OperationKind::Delete: return "delete";
        case OperationKind::Update: return "update";
    }
    return "update";
}

std::optional<OperationKind> parse_operation_kind(const std::string& name) {
    if (name == "assign") return OperationKind::Assign;
    if (name == "dedup_hit") return OperationKind::DedupHit;
    if (name == "access") return OperationKind::Access;
    if (name == "delete") return OperationKind::Delete;
    if (name == "update") return OperationKind::Update;
    return std::nullopt;
}

} // namespace shortkey
