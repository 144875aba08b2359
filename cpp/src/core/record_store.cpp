#include "shortkey/record_store.hpp"
#include "shortkey/error.hpp"
#include "shortkey/fingerprint.hpp"
#include "shortkey/logging.hpp"

#include <boost/json.hpp>

namespace shortkey {

namespace json = boost::json;

namespace {

std::string assign_details(const IdentifierCandidate& candidate, const AssignAudit& audit) {
    json::object obj;
    obj["identifier"] = candidate.identifier;
    obj["length"] = candidate.length;
    obj["salt"] = candidate.salt;
    obj["attempts"] = audit.attempts;
    obj["slot"] = audit.slot;
    obj["escalations"] = audit.escalations;
    return json::serialize(obj);
}

} // namespace

RecordStore::RecordStore(StorageBackend& backend, FingerprintConfig config)
    : backend_(backend)
    , config_(std::move(config)) {}

std::string RecordStore::normalize(const std::string& fingerprint) const {
    return normalize_fingerprint(fingerprint, config_.hex_length);
}

AllocationRequest RecordStore::validate(const AllocationRequest& request) const {
    AllocationRequest out = request;
    out.fingerprint = normalize(request.fingerprint);
    out.extension = normalize_extension(request.extension);
    SHORTKEY_CHECK_ARGUMENT(request.size_bytes >= 0, "size_bytes must not be negative");
    if (out.media_type.empty()) out.media_type = "application/octet-stream";
    if (out.hash_algorithm.empty()) out.hash_algorithm = config_.algorithm;
    if (out.metadata && out.metadata->empty()) out.metadata.reset();
    return out;
}

AllocationRecord RecordStore::commit_new(const AllocationRequest& request,
                                         const IdentifierCandidate& candidate,
                                         const AssignAudit& audit) {
    const AllocationRequest req = validate(request);
    AllocationRecord rec = backend_.insert_record(req, to_content_uuid(req.fingerprint), candidate,
                                                  assign_details(candidate, audit));
    LOG_DEBUG("Committed ", candidate.identifier, " for ", abbreviate(req.fingerprint));
    return rec;
}

AllocationRecord RecordStore::register_pending(const AllocationRequest& request) {
    const AllocationRequest req = validate(request);
    return backend_.insert_record(req, to_content_uuid(req.fingerprint), std::nullopt, "");
}

std::optional<AllocationRecord> RecordStore::assign_identifier(const std::string& fingerprint,
                                                               const IdentifierCandidate& candidate,
                                                               const AssignAudit& audit) {
    return backend_.assign_identifier(normalize(fingerprint), candidate,
                                      assign_details(candidate, audit));
}

std::optional<AllocationRecord> RecordStore::find_by_fingerprint(const std::string& fingerprint) {
    return backend_.find_by_fingerprint(normalize(fingerprint));
}

std::optional<AllocationRecord> RecordStore::find_by_identifier(const std::string& identifier) {
    return backend_.find_by_identifier(identifier);
}

bool RecordStore::identifier_exists(const std::string& identifier) {
    return backend_.identifier_exists(identifier);
}

bool RecordStore::mark_accessed(const std::string& fingerprint) {
    return backend_.mark_accessed(normalize(fingerprint), "{}");
}

std::optional<AllocationRecord> RecordStore::resolve(const std::string& identifier) {
    auto rec = backend_.find_by_identifier(identifier);
    if (!rec || rec->status != RecordStatus::Active) {
        return std::nullopt;
    }

    json::object details;
    details["identifier"] = identifier;
    if (!backend_.mark_accessed(rec->fingerprint, json::serialize(details))) {
        return std::nullopt;
    }
    return backend_.find_by_fingerprint(rec->fingerprint);
}

bool RecordStore::update_upload_metadata(const std::string& fingerprint,
                                         const std::string& storage_key,
                                         const std::string& url) {
    SHORTKEY_CHECK_ARGUMENT(!storage_key.empty(), "storage key must not be empty");

    json::object details;
    details["storage_key"] = storage_key;
    details["url"] = url;
    return backend_.update_upload_metadata(normalize(fingerprint), storage_key, url,
                                           json::serialize(details));
}

bool RecordStore::set_status(const std::string& fingerprint, RecordStatus status,
                             const std::string& reason) {
    SHORTKEY_CHECK_ARGUMENT(status != RecordStatus::Active, "records cannot return to active");

    json::object details;
    details["status"] = record_status_name(status);
    if (!reason.empty()) details["reason"] = reason;

    const bool changed = backend_.set_status(normalize(fingerprint), status, json::serialize(details));
    if (changed) {
        LOG_INFO("Record ", abbreviate(fingerprint), " is now ", record_status_name(status));
    }
    return changed;
}

void RecordStore::record_dedup_hit(const AllocationRecord& record, const std::string& source) {
    json::object details;
    if (record.identifier) details["identifier"] = *record.identifier;
    details["source"] = source;
    backend_.append_operation(record.id, OperationKind::DedupHit, json::serialize(details));
}

std::vector<OperationLogEntry> RecordStore::operations_for(int64_t record_ref) {
    return backend_.operations_for(record_ref);
}

} // namespace shortkey
