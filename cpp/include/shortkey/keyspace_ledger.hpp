#pragma once

#include <vector>

#include "shortkey/config.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

/**
 * Per-length allocation budget.
 *
 * The ledger never enumerates identifiers: each commit attempt consumes one
 * slot at its length, and a length is retired once its slots run out or its
 * usage reaches keyspace.saturation_ratio. Retired lengths are never handed
 * out again; the next length is created on demand.
 */
class KeyspaceLedger {
public:
    KeyspaceLedger(StorageBackend& backend, KeyspaceConfig config);

    /**
     * Smallest non-exhausted length >= keyspace.min_length. Creates
     * max(previous max + 1, min_length) when no open length exists.
     * Throws KeyspaceExhaustedError past keyspace.max_length.
     */
    int current_length();

    // Consume one slot at `length`. granted=false if it was already exhausted.
    SlotReservation reserve_slot(int length);

    // Retire `length` immediately.
    void saturate(int length);

    int64_t capacity_for(int length) const;

    std::vector<LedgerEntry> entries();

    const KeyspaceConfig& config() const { return config_; }

private:
    StorageBackend& backend_;
    KeyspaceConfig config_;
};

} // namespace shortkey
