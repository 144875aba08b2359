#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shortkey/allocator.hpp"
#include "shortkey/cancellation.hpp"
#include "shortkey/config.hpp"
#include "shortkey/error.hpp"
#include "shortkey/fingerprint_register.hpp"
#include "shortkey/identifier_generator.hpp"
#include "shortkey/keyspace_ledger.hpp"
#include "shortkey/record_store.hpp"
#include "shortkey/reserved_filter.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

// Per-request result of allocate_batch(): an allocation or the error that stopped it.
struct BatchResult {
    std::optional<Allocation> allocation;
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool ok() const { return allocation.has_value(); }
};

/**
 * Entry point for the upload pipeline.
 *
 * allocate() checks the fingerprint register first: a hit with an
 * identifier is a dedup hit, a hit without one gets an identifier through
 * the allocator, a miss mints a new record. Transient storage failures
 * retry the whole call with exponential backoff (retry.*).
 */
class AllocationService {
public:
    // Uses a SecureIdentifierGenerator over keyspace.charset.
    AllocationService(StorageBackend& backend, const Config& config);

    // Borrows `generator`, which must outlive the service.
    AllocationService(StorageBackend& backend, const Config& config, IdentifierGenerator& generator);

    Allocation allocate(const AllocationRequest& request, CancellationToken* cancel = nullptr);

    /**
     * Allocate every request on `workers` threads. Results are in request
     * order; a failing request never affects the others.
     */
    std::vector<BatchResult> allocate_batch(const std::vector<AllocationRequest>& requests,
                                            size_t workers, CancellationToken* cancel = nullptr);

    std::optional<AllocationRecord> lookup(const std::string& fingerprint);
    std::optional<AllocationRecord> resolve(const std::string& identifier);

    bool record_upload(const std::string& fingerprint, const std::string& storage_key,
                       const std::string& url);

    // Storage key and URL the upload pipeline should use for an allocation.
    std::string storage_key_for(const AllocationRecord& record) const;
    std::string public_url_for(const AllocationRecord& record) const;

    FingerprintRegister& fingerprints() { return register_; }
    KeyspaceLedger& ledger() { return ledger_; }
    ReservedWordFilter& reserved() { return reserved_; }
    RecordStore& store() { return store_; }
    Allocator& allocator() { return allocator_; }
    StorageBackend& backend() { return backend_; }
    const Config& config() const { return config_; }

private:
    Allocation allocate_once(const AllocationRequest& request, CancellationToken* cancel);

    StorageBackend& backend_;
    Config config_;
    std::unique_ptr<IdentifierGenerator> owned_generator_;
    IdentifierGenerator& generator_;

    FingerprintRegister register_;
    KeyspaceLedger ledger_;
    ReservedWordFilter reserved_;
    RecordStore store_;
    Allocator allocator_;
};

} // namespace shortkey
