#include "shortkey/migration.hpp"
#include "shortkey/error.hpp"
#include "shortkey/fingerprint.hpp"
#include "shortkey/logging.hpp"

namespace shortkey {

Migration::Migration(StorageBackend& backend, Allocator& allocator)
    : backend_(backend)
    , allocator_(allocator) {}

MigrationReport Migration::assign_missing_identifiers(size_t batch_size, const CancellationToken* cancel) {
    SHORTKEY_CHECK_ARGUMENT(batch_size > 0, "batch size must be positive");

    MigrationReport report;
    int64_t cursor = 0;

    while (true) {
        auto batch = backend_.records_missing_identifier(cursor, batch_size);
        if (batch.empty()) break;

        for (const auto& rec : batch) {
            cursor = rec.id;
            ++report.scanned;
            if (cancel) cancel->throw_if_cancelled("migration");

            try {
                Allocation result = allocator_.assign_missing(rec.fingerprint, cancel);
                if (result.outcome == AllocationOutcome::Assigned) {
                    ++report.assigned;
                } else {
                    ++report.skipped;
                }
            } catch (const KeyspaceExhaustedError&) {
                throw;
            } catch (const CancelledError&) {
                throw;
            } catch (const ShortkeyException& e) {
                ++report.failed;
                LOG_ERROR("Migration could not assign record ", rec.id, " (",
                          abbreviate(rec.fingerprint), "): ", e.what());
            }
        }

        LOG_INFO("Migration progress: ", report.scanned, " scanned, ", report.assigned, " assigned");
        if (batch.size() < batch_size) break;
    }

    LOG_INFO("Migration finished: scanned=", report.scanned, " assigned=", report.assigned,
             " skipped=", report.skipped, " failed=", report.failed);
    return report;
}

} // namespace shortkey
