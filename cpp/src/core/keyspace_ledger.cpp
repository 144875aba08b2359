#include "shortkey/keyspace_ledger.hpp"
#include "shortkey/error.hpp"
#include "shortkey/keyspace.hpp"
#include "shortkey/logging.hpp"

#include <algorithm>

namespace shortkey {

KeyspaceLedger::KeyspaceLedger(StorageBackend& backend, KeyspaceConfig config)
    : backend_(backend)
    , config_(std::move(config)) {}

int64_t KeyspaceLedger::capacity_for(int length) const {
    return keyspace_capacity(config_, length);
}

int KeyspaceLedger::current_length() {
    // Every pass either returns, retires a length or creates one, and both
    // are bounded by the configured range.
    const int max_passes = 2 * (config_.max_length - config_.min_length + 2);

    for (int pass = 0; pass < max_passes; ++pass) {
        auto open = backend_.first_open_length(config_.min_length);
        if (open) {
            if (open->length > config_.max_length) {
                break;
            }
            if (open->usage_ratio() >= config_.saturation_ratio) {
                LOG_INFO("Length ", open->length, " reached ", open->consumed, "/", open->capacity,
                         " slots, retiring it");
                backend_.saturate_length(open->length);
                continue;
            }
            return open->length;
        }

        auto previous = backend_.max_ledger_length();
        const int next = previous ? std::max(*previous + 1, config_.min_length) : config_.min_length;
        if (next > config_.max_length) {
            break;
        }
        if (backend_.create_length(next, capacity_for(next))) {
            LOG_INFO("Opened keyspace length ", next, " (capacity ", capacity_for(next), ")");
        }
    }

    throw KeyspaceExhaustedError("every identifier length up to "
                                 + std::to_string(config_.max_length) + " is exhausted");
}

SlotReservation KeyspaceLedger::reserve_slot(int length) {
    SlotReservation slot = backend_.reserve_slot(length);
    if (slot.granted && slot.exhausted) {
        LOG_INFO("Length ", length, " exhausted after slot ", slot.sequence);
    }
    return slot;
}

void KeyspaceLedger::saturate(int length) {
    backend_.saturate_length(length);
}

std::vector<LedgerEntry> KeyspaceLedger::entries() {
    return backend_.ledger_entries();
}

} // namespace shortkey
