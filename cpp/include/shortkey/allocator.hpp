#pragma once

#include <functional>
#include <optional>
#include <string>

#include "shortkey/cancellation.hpp"
#include "shortkey/config.hpp"
#include "shortkey/identifier_generator.hpp"
#include "shortkey/keyspace_ledger.hpp"
#include "shortkey/record_store.hpp"
#include "shortkey/reserved_filter.hpp"

namespace shortkey {

enum class AllocationOutcome {
    Assigned,       // a new identifier was minted by this call
    DedupHit        // the fingerprint already had one; record is the existing row
};

const char* allocation_outcome_name(AllocationOutcome outcome);

struct Allocation {
    AllocationOutcome outcome = AllocationOutcome::Assigned;
    AllocationRecord record;
    int attempts = 0;
    int escalations = 0;

    const std::string& identifier() const { return *record.identifier; }
    int length() const { return record.identifier_length; }
    const std::string& salt() const { return record.generation_salt; }
};

/**
 * Short-identifier allocator.
 *
 * Per length L (from the ledger):
 *   draw a candidate (reserved words are redrawn without consuming a slot),
 *   consume a ledger slot, skip candidates already present in the store,
 *   then commit. The store's unique key on identifier decides collisions;
 *   a conflict on fingerprint means a concurrent caller won and is returned
 *   as a dedup hit, unless the winner is a pending record without an
 *   identifier, which is then assigned one in place.
 * After allocator.max_attempts_per_length failed attempts, L is retired and
 * the ledger picks the next length. More than allocator.max_escalations
 * escalations in one call raises KeyspaceExhaustedError.
 *
 * Holds no state across calls; safe to share between threads.
 */
class Allocator {
public:
    Allocator(KeyspaceLedger& ledger, ReservedWordFilter& reserved, RecordStore& store,
              IdentifierGenerator& generator, AllocatorConfig config);

    // Mint an identifier for a fingerprint with no record yet.
    Allocation allocate(const AllocationRequest& request, const CancellationToken* cancel = nullptr);

    // Mint an identifier for an existing active record that lacks one.
    Allocation assign_missing(const std::string& fingerprint, const CancellationToken* cancel = nullptr);

    const AllocatorConfig& config() const { return config_; }

private:
    // Commits a candidate; nullopt means the record already got an identifier.
    using CommitFn = std::function<std::optional<AllocationRecord>(const IdentifierCandidate&,
                                                                   const AssignAudit&)>;

    Allocation run(const std::string& fingerprint, const CommitFn& commit,
                   const CancellationToken* cancel);

    std::optional<std::string> draw_unreserved(int length);

    // Dedup hit for the stored record, or nullopt when it is active but still
    // lacks an identifier.
    std::optional<Allocation> existing(const std::string& fingerprint, int attempts, int escalations);

    KeyspaceLedger& ledger_;
    ReservedWordFilter& reserved_;
    RecordStore& store_;
    IdentifierGenerator& generator_;
    AllocatorConfig config_;
};

} // namespace shortkey
