#pragma once

#include <optional>
#include <string>
#include <vector>

#include "shortkey/config.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

// Bookkeeping written into the `assign` log entry.
struct AssignAudit {
    int attempts = 1;           // commit attempts at the winning length
    int64_t slot = 0;           // ledger sequence number consumed by the winner
    int escalations = 0;
};

/**
 * Allocation records and their append-only operation history.
 *
 * Validates and normalises requests before they reach the backend, and
 * builds the JSON `details` of every log entry it appends. Each method is
 * one atomic unit; upload enrichment runs separately from allocation.
 */
class RecordStore {
public:
    RecordStore(StorageBackend& backend, FingerprintConfig config);

    /**
     * Insert a record bound to `candidate` and log `assign` atomically.
     * Throws UniqueConflictError naming the violated key.
     */
    AllocationRecord commit_new(const AllocationRequest& request,
                                const IdentifierCandidate& candidate,
                                const AssignAudit& audit);

    // Insert a record without identifier (imported legacy rows).
    AllocationRecord register_pending(const AllocationRequest& request);

    // Bind an identifier to a record lacking one; nullopt if it already has one.
    std::optional<AllocationRecord> assign_identifier(const std::string& fingerprint,
                                                      const IdentifierCandidate& candidate,
                                                      const AssignAudit& audit);

    std::optional<AllocationRecord> find_by_fingerprint(const std::string& fingerprint);
    std::optional<AllocationRecord> find_by_identifier(const std::string& identifier);
    bool identifier_exists(const std::string& identifier);

    bool mark_accessed(const std::string& fingerprint);

    // Lookup by identifier that counts as an access; returns the updated record.
    std::optional<AllocationRecord> resolve(const std::string& identifier);

    bool update_upload_metadata(const std::string& fingerprint,
                                const std::string& storage_key,
                                const std::string& url);

    // active -> deleted|archived only.
    bool set_status(const std::string& fingerprint, RecordStatus status,
                    const std::string& reason = "");

    // `source` says how the duplicate was detected ("register" or "race").
    void record_dedup_hit(const AllocationRecord& record, const std::string& source);

    std::vector<OperationLogEntry> operations_for(int64_t record_ref);

    // Normalised copy of `request`; throws InvalidArgumentError.
    AllocationRequest validate(const AllocationRequest& request) const;

    std::string normalize(const std::string& fingerprint) const;

private:
    StorageBackend& backend_;
    FingerprintConfig config_;
};

} // namespace shortkey
