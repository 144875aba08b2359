#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "shortkey/metadata.hpp"

namespace shortkey {

using Timestamp = std::chrono::system_clock::time_point;

// =============================================================================
// Allocation Record
// =============================================================================

enum class RecordStatus {
    Active,
    Deleted,
    Archived
};

const char* record_status_name(RecordStatus status);
std::optional<RecordStatus> parse_record_status(const std::string& name);

/**
 * Upload-side description of a file, supplied by the upload pipeline.
 * The fingerprint is the dedup key; everything else is descriptive.
 */
struct AllocationRequest {
    std::string fingerprint;          // lower-case hex digest
    std::string original_filename;
    std::string extension;            // lower-case, including the dot
    int64_t size_bytes = 0;
    std::string media_type = "application/octet-stream";
    std::string hash_algorithm = "sha512";
    std::optional<Metadata> metadata;
};

struct AllocationRecord {
    int64_t id = 0;
    std::string fingerprint;
    std::string content_uuid;
    std::optional<std::string> identifier;
    int identifier_length = 0;
    std::string generation_salt;

    std::string original_filename;
    std::string extension;
    int64_t size_bytes = 0;
    std::string media_type;
    std::string hash_algorithm;

    std::string storage_key;
    std::string url;

    RecordStatus status = RecordStatus::Active;
    int64_t access_count = 0;
    std::optional<Timestamp> last_accessed_at;

    std::optional<Metadata> metadata;

    Timestamp created_at{};
    std::optional<Timestamp> identifier_assigned_at;
    Timestamp updated_at{};

    bool has_identifier() const { return identifier.has_value() && !identifier->empty(); }
};

// Identifier binding produced by the Allocator before it is committed.
struct IdentifierCandidate {
    std::string identifier;
    int length = 0;
    std::string salt;
};

// =============================================================================
// Keyspace Ledger
// =============================================================================

struct LedgerEntry {
    int length = 0;
    int64_t consumed = 0;
    int64_t capacity = 0;
    bool exhausted = false;
    Timestamp created_at{};
    Timestamp updated_at{};

    double usage_ratio() const {
        return capacity > 0 ? static_cast<double>(consumed) / static_cast<double>(capacity) : 1.0;
    }
};

/**
 * Result of reserve_slot(). granted=false means the length was already
 * exhausted and nothing was consumed.
 */
struct SlotReservation {
    bool granted = false;
    int64_t sequence = 0;       // pre-increment value of consumed
    bool exhausted = false;     // state of the row after the call
};

// =============================================================================
// Reserved identifiers and operation log
// =============================================================================

struct ReservedIdentifier {
    std::string value;
    std::string reason;
};

enum class OperationKind {
    Assign,
    DedupHit,
    Access,
    Delete,
    Update
};

const char* operation_kind_name(OperationKind kind);
std::optional<OperationKind> parse_operation_kind(const std::string& name);

struct OperationLogEntry {
    int64_t id = 0;
    int64_t record_ref = 0;
    OperationKind kind = OperationKind::Update;
    std::string details;        // JSON object text
    Timestamp timestamp{};
};

} // namespace shortkey
