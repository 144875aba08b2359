#pragma once

#include "shortkey/config.hpp"
#include "shortkey/db/connection.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey::db {

/**
 * StorageBackend over PostgreSQL. Each method borrows one pooled connection
 * and runs as a single statement or a single transaction; the unique
 * constraints of the schema are the arbiter for concurrent writers.
 */
class PgBackend : public StorageBackend {
public:
    explicit PgBackend(const DatabaseConfig& config);

    ConnectionPool& pool() { return pool_; }

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

private:
    // Runs "UPDATE ... RETURNING id" for fingerprint and logs `kind` in one transaction.
    bool update_and_log(const char* sql, const std::vector<std::optional<std::string>>& params,
                        OperationKind kind, const std::string& details, const char* context);

    ConnectionPool pool_;
};

} // namespace shortkey::db
