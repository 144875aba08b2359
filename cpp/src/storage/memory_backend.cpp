#include "shortkey/storage/memory_backend.hpp"
#include "shortkey/error.hpp"

#include <algorithm>

namespace shortkey {

namespace {

Timestamp now() {
    return std::chrono::system_clock::now();
}

} // namespace

AllocationRecord* MemoryBackend::find_locked(const std::string& fingerprint) {
    auto it = records_.find(fingerprint);
    return it == records_.end() ? nullptr : &it->second;
}

void MemoryBackend::append_locked(int64_t record_ref, OperationKind kind, const std::string& details) {
    OperationLogEntry entry;
    entry.id = next_operation_id_++;
    entry.record_ref = record_ref;
    entry.kind = kind;
    entry.details = details;
    entry.timestamp = now();
    operations_.push_back(std::move(entry));
}

std::optional<AllocationRecord> MemoryBackend::find_by_fingerprint(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    const AllocationRecord* rec = find_locked(fingerprint);
    if (!rec) return std::nullopt;
    return *rec;
}

std::optional<AllocationRecord> MemoryBackend::find_by_identifier(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identifiers_.find(identifier);
    if (it == identifiers_.end()) return std::nullopt;
    return records_.at(it->second);
}

bool MemoryBackend::identifier_exists(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    return identifiers_.count(identifier) > 0;
}

AllocationRecord MemoryBackend::insert_record(const AllocationRequest& request,
                                              const std::string& content_uuid,
                                              const std::optional<IdentifierCandidate>& candidate,
                                              const std::string& assign_details) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (records_.count(request.fingerprint)) {
        throw UniqueConflictError(ConflictKind::Fingerprint, request.fingerprint);
    }
    if (candidate && identifiers_.count(candidate->identifier)) {
        throw UniqueConflictError(ConflictKind::Identifier, candidate->identifier);
    }

    const Timestamp ts = now();
    AllocationRecord rec;
    rec.id = next_record_id_++;
    rec.fingerprint = request.fingerprint;
    rec.content_uuid = content_uuid;
    rec.original_filename = request.original_filename;
    rec.extension = request.extension;
    rec.size_bytes = request.size_bytes;
    rec.media_type = request.media_type;
    rec.hash_algorithm = request.hash_algorithm;
    rec.metadata = request.metadata;
    rec.created_at = ts;
    rec.updated_at = ts;
    if (candidate) {
        rec.identifier = candidate->identifier;
        rec.identifier_length = candidate->length;
        rec.generation_salt = candidate->salt;
        rec.identifier_assigned_at = ts;
        identifiers_[candidate->identifier] = rec.fingerprint;
        append_locked(rec.id, OperationKind::Assign, assign_details);
    }

    records_.emplace(rec.fingerprint, rec);
    return rec;
}

std::optional<AllocationRecord> MemoryBackend::assign_identifier(const std::string& fingerprint,
                                                                 const IdentifierCandidate& candidate,
                                                                 const std::string& assign_details) {
    std::lock_guard<std::mutex> lock(mutex_);

    AllocationRecord* rec = find_locked(fingerprint);
    if (!rec || rec->has_identifier() || rec->status != RecordStatus::Active) {
        return std::nullopt;
    }
    if (identifiers_.count(candidate.identifier)) {
        throw UniqueConflictError(ConflictKind::Identifier, candidate.identifier);
    }

    const Timestamp ts = now();
    rec->identifier = candidate.identifier;
    rec->identifier_length = candidate.length;
    rec->generation_salt = candidate.salt;
    rec->identifier_assigned_at = ts;
    rec->updated_at = ts;
    identifiers_[candidate.identifier] = fingerprint;
    append_locked(rec->id, OperationKind::Assign, assign_details);
    return *rec;
}

bool MemoryBackend::mark_accessed(const std::string& fingerprint, const std::string& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    AllocationRecord* rec = find_locked(fingerprint);
    if (!rec) return false;
    rec->access_count += 1;
    rec->last_accessed_at = now();
    append_locked(rec->id, OperationKind::Access, details);
    return true;
}

bool MemoryBackend::update_upload_metadata(const std::string& fingerprint,
                                           const std::string& storage_key,
                                           const std::string& url,
                                           const std::string& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    AllocationRecord* rec = find_locked(fingerprint);
    if (!rec || rec->status != RecordStatus::Active) return false;
    rec->storage_key = storage_key;
    rec->url = url;
    rec->updated_at = now();
    append_locked(rec->id, OperationKind::Update, details);
    return true;
}

bool MemoryBackend::set_status(const std::string& fingerprint, RecordStatus status,
                               const std::string& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    AllocationRecord* rec = find_locked(fingerprint);
    if (!rec || rec->status != RecordStatus::Active || status == RecordStatus::Active) {
        return false;
    }
    rec->status = status;
    rec->updated_at = now();
    append_locked(rec->id, status == RecordStatus::Deleted ? OperationKind::Delete : OperationKind::Update,
                  details);
    return true;
}

std::vector<AllocationRecord> MemoryBackend::records_missing_identifier(int64_t after_id, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AllocationRecord> out;
    for (const auto& [fp, rec] : records_) {
        if (rec.id > after_id && !rec.has_identifier() && rec.status == RecordStatus::Active) {
            out.push_back(rec);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const AllocationRecord& a, const AllocationRecord& b) { return a.id < b.id; });
    if (out.size() > limit) out.resize(limit);
    return out;
}

RecordCounts MemoryBackend::record_counts() {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordCounts counts;
    for (const auto& [fp, rec] : records_) {
        counts.total += 1;
        if (rec.status == RecordStatus::Active) {
            counts.active += 1;
            if (rec.has_identifier()) counts.with_identifier += 1;
        }
    }
    return counts;
}

void MemoryBackend::append_operation(int64_t record_ref, OperationKind kind, const std::string& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(record_ref, kind, details);
}

std::vector<OperationLogEntry> MemoryBackend::operations_for(int64_t record_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OperationLogEntry> out;
    for (const auto& entry : operations_) {
        if (entry.record_ref == record_ref) out.push_back(entry);
    }
    return out;
}

std::vector<OperationLogEntry> MemoryBackend::all_operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

std::vector<LedgerEntry> MemoryBackend::ledger_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEntry> out;
    for (const auto& [length, entry] : ledger_) out.push_back(entry);
    return out;
}

std::optional<LedgerEntry> MemoryBackend::ledger_entry(int length) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ledger_.find(length);
    if (it == ledger_.end()) return std::nullopt;
    return it->second;
}

std::optional<LedgerEntry> MemoryBackend::first_open_length(int min_length) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = ledger_.lower_bound(min_length); it != ledger_.end(); ++it) {
        if (!it->second.exhausted) return it->second;
    }
    return std::nullopt;
}

std::optional<int> MemoryBackend::max_ledger_length() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ledger_.empty()) return std::nullopt;
    return ledger_.rbegin()->first;
}

bool MemoryBackend::create_length(int length, int64_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ledger_.count(length)) return false;
    LedgerEntry entry;
    entry.length = length;
    entry.consumed = 0;
    entry.capacity = capacity;
    entry.exhausted = capacity <= 0;
    entry.created_at = entry.updated_at = now();
    ledger_.emplace(length, entry);
    return true;
}

SlotReservation MemoryBackend::reserve_slot(int length) {
    std::lock_guard<std::mutex> lock(mutex_);
    SlotReservation slot;
    auto it = ledger_.find(length);
    if (it == ledger_.end()) {
        slot.exhausted = true;
        return slot;
    }
    LedgerEntry& entry = it->second;
    if (entry.exhausted) {
        slot.exhausted = true;
        return slot;
    }
    slot.granted = true;
    slot.sequence = entry.consumed;
    entry.consumed += 1;
    if (entry.consumed >= entry.capacity) entry.exhausted = true;
    entry.updated_at = now();
    slot.exhausted = entry.exhausted;
    return slot;
}

void MemoryBackend::saturate_length(int length) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ledger_.find(length);
    if (it == ledger_.end()) return;
    LedgerEntry& entry = it->second;
    entry.consumed = std::max(entry.consumed, entry.capacity);
    entry.exhausted = true;
    entry.updated_at = now();
}

std::vector<ReservedIdentifier> MemoryBackend::reserved_identifiers() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReservedIdentifier> out;
    for (const auto& [value, entry] : reserved_) out.push_back(entry);
    return out;
}

bool MemoryBackend::add_reserved(const std::string& value, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.emplace(value, ReservedIdentifier{value, reason}).second;
}

} // namespace shortkey
