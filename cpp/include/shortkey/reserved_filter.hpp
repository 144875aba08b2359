#pragma once

#include <chrono>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "shortkey/config.hpp"
#include "shortkey/storage/backend.hpp"

namespace shortkey {

// Words seeded into a fresh store (URL path segments and status codes).
const std::vector<ReservedIdentifier>& default_reserved_words();

// Adds the default words to a store; returns how many were new.
size_t seed_reserved_words(StorageBackend& backend);

/**
 * Denylist of identifiers that must never be allocated.
 *
 * The set is loaded from the store on first use and cached for the life of
 * the object. It is refreshed by reload(), by add_reserved(), or, when
 * reserved.refresh_interval_s > 0, lazily once the cache is older than the
 * interval. Matching ignores case.
 */
class ReservedWordFilter {
public:
    ReservedWordFilter(StorageBackend& backend, ReservedConfig config = {});

    bool is_reserved(std::string_view candidate);

    // Re-read the set from the store; returns the number of entries.
    size_t reload();

    // Persist a new entry (stored lower-case). False if it already existed.
    bool add_reserved(const std::string& value, const std::string& reason);

    size_t size();

    static std::string fold(std::string_view value);

private:
    void ensure_fresh();

    StorageBackend& backend_;
    ReservedConfig config_;

    std::shared_mutex mutex_;
    std::unordered_set<std::string> words_;
    bool loaded_ = false;
    std::chrono::steady_clock::time_point loaded_at_{};
};

} // namespace shortkey
