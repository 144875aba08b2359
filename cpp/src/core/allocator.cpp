#include "shortkey/allocator.hpp"
#include "shortkey/error.hpp"
#include "shortkey/fingerprint.hpp"
#include "shortkey/logging.hpp"

namespace shortkey {

const char* allocation_outcome_name(AllocationOutcome outcome) {
    switch (outcome) {
        case AllocationOutcome::Assigned: return "assigned";
        case AllocationOutcome::DedupHit: return "dedup_hit";
    }
    return "unknown";
}

Allocator::Allocator(KeyspaceLedger& ledger, ReservedWordFilter& reserved, RecordStore& store,
                     IdentifierGenerator& generator, AllocatorConfig config)
    : ledger_(ledger)
    , reserved_(reserved)
    , store_(store)
    , generator_(generator)
    , config_(config) {}

Allocation Allocator::allocate(const AllocationRequest& request, const CancellationToken* cancel) {
    const AllocationRequest req = store_.validate(request);
    return run(req.fingerprint,
               [&](const IdentifierCandidate& candidate, const AssignAudit& audit) {
                   return std::optional<AllocationRecord>(store_.commit_new(req, candidate, audit));
               },
               cancel);
}

Allocation Allocator::assign_missing(const std::string& fingerprint, const CancellationToken* cancel) {
    const std::string fp = store_.normalize(fingerprint);
    return run(fp,
               [&](const IdentifierCandidate& candidate, const AssignAudit& audit) {
                   return store_.assign_identifier(fp, candidate, audit);
               },
               cancel);
}

std::optional<std::string> Allocator::draw_unreserved(int length) {
    for (int i = 0; i < config_.reserved_draw_budget; ++i) {
        std::string candidate = generator_.draw(length);
        if (!reserved_.is_reserved(candidate)) {
            return candidate;
        }
        LOG_DEBUG("Redrawing reserved candidate '", candidate, "'");
    }
    return std::nullopt;
}

std::optional<Allocation> Allocator::existing(const std::string& fingerprint, int attempts, int escalations) {
    auto rec = store_.find_by_fingerprint(fingerprint);
    if (!rec) {
        throw IntegrityViolationError("conflicting record for fingerprint vanished", abbreviate(fingerprint));
    }
    if (!rec->has_identifier()) {
        if (rec->status != RecordStatus::Active) {
            throw InvalidArgumentError("record is " + std::string(record_status_name(rec->status))
                                       + " and has no identifier", abbreviate(fingerprint));
        }
        return std::nullopt;
    }
    store_.record_dedup_hit(*rec, "race");

    Allocation result;
    result.outcome = AllocationOutcome::DedupHit;
    result.record = std::move(*rec);
    result.attempts = attempts;
    result.escalations = escalations;
    return result;
}

Allocation Allocator::run(const std::string& fingerprint, const CommitFn& commit,
                          const CancellationToken* cancel) {
    CommitFn commit_fn = commit;
    int escalations = 0;
    int total_attempts = 0;
    int length = ledger_.current_length();

    while (true) {
        int attempts = 0;
        bool exhausted_here = false;

        while (attempts < config_.max_attempts_per_length) {
            if (cancel) cancel->throw_if_cancelled(abbreviate(fingerprint));

            auto identifier = draw_unreserved(length);
            if (!identifier) {
                LOG_WARN("No unreserved candidate at length ", length, " after ",
                         config_.reserved_draw_budget, " draws");
                attempts = config_.max_attempts_per_length;
                break;
            }

            SlotReservation slot = ledger_.reserve_slot(length);
            if (!slot.granted) {
                exhausted_here = true;
                break;
            }
            ++attempts;
            ++total_attempts;

            if (store_.identifier_exists(*identifier)) {
                LOG_DEBUG("Candidate ", *identifier, " already taken, retrying at length ", length);
                continue;
            }

            IdentifierCandidate candidate{*identifier, length, generator_.salt(config_.salt_bytes)};
            AssignAudit audit{attempts, slot.sequence, escalations};

            std::optional<AllocationRecord> rec;
            try {
                rec = commit_fn(candidate, audit);
            } catch (const UniqueConflictError& e) {
                if (e.kind() == ConflictKind::Identifier) {
                    LOG_DEBUG("Commit collision on ", *identifier, ", retrying at length ", length);
                    continue;
                }
                LOG_INFO("Fingerprint ", abbreviate(fingerprint), " committed concurrently");
            }

            if (!rec) {
                if (auto hit = existing(fingerprint, total_attempts, escalations)) {
                    return std::move(*hit);
                }
                // A pending record without an identifier won the insert; bind to it instead.
                LOG_INFO("Concurrent record for ", abbreviate(fingerprint), " has no identifier, assigning to it");
                commit_fn = [this, fingerprint](const IdentifierCandidate& c, const AssignAudit& a) {
                    return store_.assign_identifier(fingerprint, c, a);
                };
                continue;
            }

            LOG_INFO("Assigned ", candidate.identifier, " (length ", length, ", slot ", slot.sequence,
                     ") to ", abbreviate(fingerprint));
            Allocation result;
            result.outcome = AllocationOutcome::Assigned;
            result.record = std::move(*rec);
            result.attempts = total_attempts;
            result.escalations = escalations;
            return result;
        }

        if (!exhausted_here) {
            LOG_WARN("Giving up on length ", length, " after ", attempts, " attempts");
            ledger_.saturate(length);
        }

        if (++escalations > config_.max_escalations) {
            throw KeyspaceExhaustedError("allocation escalated " + std::to_string(config_.max_escalations)
                                         + " times without success", abbreviate(fingerprint));
        }
        if (cancel) cancel->throw_if_cancelled(abbreviate(fingerprint));
        length = ledger_.current_length();
        LOG_DEBUG("Escalating ", abbreviate(fingerprint), " to length ", length);
    }
}

} // namespace shortkey
