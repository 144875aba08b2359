#include "shortkey/reserved_filter.hpp"
#include "shortkey/error.hpp"
#include "shortkey/logging.hpp"

#include <cctype>
#include <mutex>

namespace shortkey {

const std::vector<ReservedIdentifier>& default_reserved_words() {
    static const std::vector<ReservedIdentifier> words = {
        {"api", "API endpoint"},
        {"admin", "administration interface"},
        {"www", "site root"},
        {"help", "help pages"},
        {"test", "testing"},
        {"null", "null value"},
        {"temp", "temporary files"},
        {"data", "data directory"},
        {"file", "file keyword"},
        {"user", "user keyword"},
        {"root", "root directory"},
        {"sys", "system keyword"},
        {"app", "application keyword"},
        {"web", "web keyword"},
        {"img", "image keyword"},
        {"pic", "image keyword"},
        {"404", "error page"},
        {"500", "error page"},
        {"403", "error page"},
        {"401", "error page"},
    };
    return words;
}

size_t seed_reserved_words(StorageBackend& backend) {
    size_t added = 0;
    for (const auto& word : default_reserved_words()) {
        if (backend.add_reserved(word.value, word.reason)) ++added;
    }
    return added;
}

ReservedWordFilter::ReservedWordFilter(StorageBackend& backend, ReservedConfig config)
    : backend_(backend)
    , config_(config) {}

std::string ReservedWordFilter::fold(std::string_view value) {
    std::string out(value);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

void ReservedWordFilter::ensure_fresh() {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (loaded_) {
            if (config_.refresh_interval_s <= 0) return;
            auto age = std::chrono::steady_clock::now() - loaded_at_;
            if (age < std::chrono::seconds(config_.refresh_interval_s)) return;
        }
    }
    reload();
}

size_t ReservedWordFilter::reload() {
    std::unordered_set<std::string> fresh;
    for (const auto& entry : backend_.reserved_identifiers()) {
        fresh.insert(fold(entry.value));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    words_ = std::move(fresh);
    loaded_ = true;
    loaded_at_ = std::chrono::steady_clock::now();
    LOG_DEBUG("Loaded ", words_.size(), " reserved identifiers");
    return words_.size();
}

bool ReservedWordFilter::is_reserved(std::string_view candidate) {
    ensure_fresh();
    const std::string key = fold(candidate);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return words_.count(key) > 0;
}

bool ReservedWordFilter::add_reserved(const std::string& value, const std::string& reason) {
    SHORTKEY_CHECK_ARGUMENT(!value.empty(), "reserved value must not be empty");
    SHORTKEY_CHECK_ARGUMENT(!reason.empty(), "reserved reason must not be empty");

    const std::string key = fold(value);
    const bool added = backend_.add_reserved(key, reason);
    if (added) {
        LOG_INFO("Reserved identifier '", key, "': ", reason);
    }
    reload();
    return added;
}

size_t ReservedWordFilter::size() {
    ensure_fresh();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return words_.size();
}

} // namespace shortkey
