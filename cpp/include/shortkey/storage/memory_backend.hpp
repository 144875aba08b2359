#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "shortkey/storage/backend.hpp"

namespace shortkey {

/**
 * In-process backend with the same constraint semantics as the PostgreSQL
 * schema. Every call holds one mutex, so each method is atomic.
 */
class MemoryBackend : public StorageBackend {
public:
    MemoryBackend() = default;

    std::optional<AllocationRecord> find_by_fingerprint(const std::string& fingerprint) override;
    std::optional<AllocationRecord> find_by_identifier(const std::string& identifier) override;
    bool identifier_exists(const std::string& identifier) override;

    AllocationRecord insert_record(const AllocationRequest& request,
                                   const std::string& content_uuid,
                                   const std::optional<IdentifierCandidate>& candidate,
                                   const std::string& assign_details) override;

    std::optional<AllocationRecord> assign_identifier(const std::string& fingerprint,
                                                      const IdentifierCandidate& candidate,
                                                      const std::string& assign_details) override;

    bool mark_accessed(const std::string& fingerprint, const std::string& details) override;
    bool update_upload_metadata(const std::string& fingerprint,
                                const std::string& storage_key,
                                const std::string& url,
                                const std::string& details) override;
    bool set_status(const std::string& fingerprint, RecordStatus status,
                    const std::string& details) override;

    std::vector<AllocationRecord> records_missing_identifier(int64_t after_id, size_t limit) override;
    RecordCounts record_counts() override;

    void append_operation(int64_t record_ref, OperationKind kind, const std::string& details) override;
    std::vector<OperationLogEntry> operations_for(int64_t record_ref) override;

    std::vector<LedgerEntry> ledger_entries() override;
    std::optional<LedgerEntry> ledger_entry(int length) override;
    std::optional<LedgerEntry> first_open_length(int min_length) override;
    std::optional<int> max_ledger_length() override;
    bool create_length(int length, int64_t capacity) override;
    SlotReservation reserve_slot(int length) override;
    void saturate_length(int length) override;

    std::vector<ReservedIdentifier> reserved_identifiers() override;
    bool add_reserved(const std::string& value, const std::string& reason) override;

    // All log entries in append order (test inspection).
    std::vector<OperationLogEntry> all_operations() const;

private:
    AllocationRecord* find_locked(const std::string& fingerprint);
    void append_locked(int64_t record_ref, OperationKind kind, const std::string& details);

    mutable std::mutex mutex_;
    std::map<std::string, AllocationRecord> records_;               // by fingerprint
    std::unordered_map<std::string, std::string> identifiers_;     // identifier -> fingerprint
    std::map<int, LedgerEntry> ledger_;
    std::map<std::string, ReservedIdentifier> reserved_;
    std::vector<OperationLogEntry> operations_;
    int64_t next_record_id_ = 1;
    int64_t next_operation_id_ = 1;
};

} // namespace shortkey
