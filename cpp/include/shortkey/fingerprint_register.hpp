#pragma once

#include <optional>
#include <string>

#include "shortkey/config.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

/**
 * Dedup lookup: fingerprint -> existing allocation record.
 *
 * Read-only. "Not found" is nullopt; storage failures propagate as
 * TransientStorageError so the two are never confused.
 */
class FingerprintRegister {
public:
    FingerprintRegister(StorageBackend& backend, FingerprintConfig config);

    // Throws InvalidArgumentError for a malformed fingerprint.
    std::optional<AllocationRecord> lookup(const std::string& fingerprint);

    std::string normalize(const std::string& fingerprint) const;

    const FingerprintConfig& config() const { return config_; }

private:
    StorageBackend& backend_;
    FingerprintConfig config_;
};

} // namespace shortkey
