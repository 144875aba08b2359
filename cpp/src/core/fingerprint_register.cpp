#include "shortkey/fingerprint_register.hpp"
#include "shortkey/fingerprint.hpp"

namespace shortkey {

FingerprintRegister::FingerprintRegister(StorageBackend& backend, FingerprintConfig config)
    : backend_(backend)
    , config_(std::move(config)) {}

std::string FingerprintRegister::normalize(const std::string& fingerprint) const {
    return normalize_fingerprint(fingerprint, config_.hex_length);
}

std::optional<AllocationRecord> FingerprintRegister::lookup(const std::string& fingerprint) {
    return backend_.find_by_fingerprint(normalize(fingerprint));
}

} // namespace shortkey
