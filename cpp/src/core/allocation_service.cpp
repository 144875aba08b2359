#include "shortkey/allocation_service.hpp"
#include "shortkey/fingerprint.hpp"
#include "shortkey/logging.hpp"
#include "shortkey/thread_pool.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace shortkey {

AllocationService::AllocationService(StorageBackend& backend, const Config& config)
    : backend_(backend)
    , config_(config)
    , owned_generator_(std::make_unique<SecureIdentifierGenerator>(config.keyspace.charset))
    , generator_(*owned_generator_)
    , register_(backend, config.fingerprint)
    , ledger_(backend, config.keyspace)
    , reserved_(backend, config.reserved)
    , store_(backend, config.fingerprint)
    , allocator_(ledger_, reserved_, store_, generator_, config.allocator) {
    config_.validate();
}

AllocationService::AllocationService(StorageBackend& backend, const Config& config,
                                     IdentifierGenerator& generator)
    : backend_(backend)
    , config_(config)
    , generator_(generator)
    , register_(backend, config.fingerprint)
    , ledger_(backend, config.keyspace)
    , reserved_(backend, config.reserved)
    , store_(backend, config.fingerprint)
    , allocator_(ledger_, reserved_, store_, generator_, config.allocator) {
    config_.validate();
}

Allocation AllocationService::allocate_once(const AllocationRequest& request, CancellationToken* cancel) {
    auto hit = register_.lookup(request.fingerprint);
    if (!hit) {
        return allocator_.allocate(request, cancel);
    }

    if (hit->has_identifier()) {
        LOG_DEBUG("Dedup hit for ", abbreviate(hit->fingerprint), " -> ", *hit->identifier);
        store_.record_dedup_hit(*hit, "register");
        Allocation result;
        result.outcome = AllocationOutcome::DedupHit;
        result.record = std::move(*hit);
        return result;
    }

    if (hit->status != RecordStatus::Active) {
        throw InvalidArgumentError("record is " + std::string(record_status_name(hit->status))
                                   + " and has no identifier", abbreviate(hit->fingerprint));
    }
    return allocator_.assign_missing(hit->fingerprint, cancel);
}

Allocation AllocationService::allocate(const AllocationRequest& request, CancellationToken* cancel) {
    const RetryConfig& retry = config_.retry;
    double delay = retry.initial_delay_s;

    for (int attempt = 1;; ++attempt) {
        if (cancel) cancel->throw_if_cancelled(abbreviate(request.fingerprint));
        try {
            return allocate_once(request, cancel);
        } catch (const TransientStorageError& e) {
            if (attempt >= retry.max_attempts) {
                LOG_ERROR("Allocation for ", abbreviate(request.fingerprint), " failed after ",
                          attempt, " attempts: ", e.what());
                throw;
            }
            LOG_WARN("Transient storage error (attempt ", attempt, "/", retry.max_attempts,
                     "), retrying in ", delay, "s: ", e.what());
        }

        const auto wait = std::chrono::duration<double>(delay);
        if (cancel) {
            if (!cancel->sleep_for(wait)) {
                throw CancelledError(abbreviate(request.fingerprint));
            }
        } else {
            std::this_thread::sleep_for(wait);
        }
        delay = std::min(delay * retry.multiplier, retry.max_delay_s);
    }
}

std::vector<BatchResult> AllocationService::allocate_batch(const std::vector<AllocationRequest>& requests,
                                                           size_t workers, CancellationToken* cancel) {
    std::vector<BatchResult> results(requests.size());
    if (requests.empty()) return results;

    ThreadPool pool(std::min(std::max<size_t>(1, workers), requests.size()));
    pool.parallel_for(0, requests.size(), [&](size_t i) {
        BatchResult& out = results[i];
        try {
            out.allocation = allocate(requests[i], cancel);
        } catch (const ShortkeyException& e) {
            out.error = e.code();
            out.message = e.what();
            LOG_ERROR("Batch item ", i, " (", abbreviate(requests[i].fingerprint), ") failed: ",
                      error_code_name(e.code()));
        } catch (const std::exception& e) {
            out.error = ErrorCode::INTERNAL_ERROR;
            out.message = e.what();
            LOG_ERROR("Batch item ", i, " failed: ", e.what());
        }
    });

    const size_t failed = static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const BatchResult& r) { return !r.ok(); }));
    LOG_INFO("Batch of ", requests.size(), " finished, ", failed, " failed");
    return results;
}

std::optional<AllocationRecord> AllocationService::lookup(const std::string& fingerprint) {
    return register_.lookup(fingerprint);
}

std::optional<AllocationRecord> AllocationService::resolve(const std::string& identifier) {
    return store_.resolve(identifier);
}

bool AllocationService::record_upload(const std::string& fingerprint, const std::string& storage_key,
                                      const std::string& url) {
    return store_.update_upload_metadata(fingerprint, storage_key, url);
}

std::string AllocationService::storage_key_for(const AllocationRecord& record) const {
    SHORTKEY_CHECK_ARGUMENT(record.has_identifier(), "record has no identifier");
    return make_storage_key(*record.identifier, record.extension);
}

std::string AllocationService::public_url_for(const AllocationRecord& record) const {
    return make_public_url(config_.upload.custom_domain, storage_key_for(record));
}

} // namespace shortkey
