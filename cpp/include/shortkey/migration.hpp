#pragma once

#include <cstdint>

#include "shortkey/allocator.hpp"
#include "shortkey/cancellation.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

struct MigrationReport {
    int64_t scanned = 0;
    int64_t assigned = 0;
    int64_t skipped = 0;        // got an identifier from someone else meanwhile
    int64_t failed = 0;
};

/**
 * Retroactively assigns identifiers to active records that lack one, using
 * the allocator's assign path. Re-running it over assigned records does
 * nothing. KeyspaceExhaustedError and cancellation stop the run; any other
 * per-record failure is counted and the run moves on.
 */
class Migration {
public:
    Migration(StorageBackend& backend, Allocator& allocator);

    MigrationReport assign_missing_identifiers(size_t batch_size = 500,
                                               const CancellationToken* cancel = nullptr);

private:
    StorageBackend& backend_;
    Allocator& allocator_;
};

} // namespace shortkey
