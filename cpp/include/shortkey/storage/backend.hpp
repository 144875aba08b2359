#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "shortkey/types.hpp"

namespace shortkey {

struct RecordCounts {
    int64_t total = 0;
    int64_t active = 0;
    int64_t with_identifier = 0;
};

/**
 * Persistent state behind the allocator: allocation records, keyspace
 * ledger rows, reserved identifiers and the operation log.
 *
 * Every method is one atomic unit against the store. The two uniqueness
 * constraints (fingerprint, identifier) are enforced here and reported as
 * UniqueConflictError; other constraint failures raise
 * IntegrityViolationError; timeouts and lost connections raise
 * TransientStorageError.
 *
 * Implementations are shared by all threads of a process.
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // -------------------------------------------------------------------------
    // Allocation records
    // -------------------------------------------------------------------------

    virtual std::optional<AllocationRecord> find_by_fingerprint(const std::string& fingerprint) = 0;
    virtual std::optional<AllocationRecord> find_by_identifier(const std::string& identifier) = 0;
    virtual bool identifier_exists(const std::string& identifier) = 0;

    /**
     * Insert a new record. When `candidate` is set the identifier is bound in
     * the same transaction and an `assign` log entry carrying
     * `assign_details` is appended.
     */
    virtual AllocationRecord insert_record(const AllocationRequest& request,
                                           const std::string& content_uuid,
                                           const std::optional<IdentifierCandidate>& candidate,
                                           const std::string& assign_details) = 0;

    /**
     * Bind an identifier to an existing record that has none. Returns the
     * updated record, or nullopt when the record is missing or already has
     * an identifier (nothing is written then).
     */
    virtual std::optional<AllocationRecord> assign_identifier(const std::string& fingerprint,
                                                              const IdentifierCandidate& candidate,
                                                              const std::string& assign_details) = 0;

    // Increments access_count, stamps last_accessed_at, appends an access entry.
    virtual bool mark_accessed(const std::string& fingerprint, const std::string& details) = 0;

    virtual bool update_upload_metadata(const std::string& fingerprint,
                                        const std::string& storage_key,
                                        const std::string& url,
                                        const std::string& details) = 0;

    // Moves an active record to `status`; false if the record is not active.
    virtual bool set_status(const std::string& fingerprint, RecordStatus status,
                            const std::string& details) = 0;

    // Active records lacking an identifier with id > after_id, ordered by id.
    virtual std::vector<AllocationRecord> records_missing_identifier(int64_t after_id, size_t limit) = 0;

    virtual RecordCounts record_counts() = 0;

    // -------------------------------------------------------------------------
    // Operation log
    // -------------------------------------------------------------------------

    virtual void append_operation(int64_t record_ref, OperationKind kind, const std::string& details) = 0;
    virtual std::vector<OperationLogEntry> operations_for(int64_t record_ref) = 0;

    // -------------------------------------------------------------------------
    // Keyspace ledger
    // -------------------------------------------------------------------------

    virtual std::vector<LedgerEntry> ledger_entries() = 0;
    virtual std::optional<LedgerEntry> ledger_entry(int length) = 0;

    // Smallest non-exhausted length >= min_length.
    virtual std::optional<LedgerEntry> first_open_length(int min_length) = 0;

    virtual std::optional<int> max_ledger_length() = 0;

    // Idempotent: returns false if the row already existed.
    virtual bool create_length(int length, int64_t capacity) = 0;

    /**
     * Atomically consume one slot. Never increments an exhausted row;
     * sets exhausted when consumed reaches capacity.
     */
    virtual SlotReservation reserve_slot(int length) = 0;

    // Marks the length exhausted, raising consumed to at least capacity.
    virtual void saturate_length(int length) = 0;

    // -------------------------------------------------------------------------
    // Reserved identifiers
    // -------------------------------------------------------------------------

    virtual std::vector<ReservedIdentifier> reserved_identifiers() = 0;

    // Idempotent: returns false if the value was already reserved.
    virtual bool add_reserved(const std::string& value, const std::string& reason) = 0;
};

} // namespace shortkey
