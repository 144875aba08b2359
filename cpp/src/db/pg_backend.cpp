#include "shortkey/db/pg_backend.hpp"
#include "shortkey/db/errors.hpp"
#include "shortkey/db/helpers.hpp"
#include "shortkey/db/operations.hpp"
#include "shortkey/error.hpp"
#include "shortkey/logging.hpp"

namespace shortkey::db {

namespace {

#define EPOCH_US(col) "(EXTRACT(EPOCH FROM " col ") * 1000000)::bigint"

// Column order consumed by read_record()
const char* const RECORD_COLUMNS =
    "id, fingerprint, content_uuid::text, identifier, COALESCE(identifier_length, 0), "
    "COALESCE(generation_salt, ''), original_filename, extension, size_bytes, media_type, "
    "hash_algorithm, storage_key, url, status, access_count, metadata::text, "
    EPOCH_US("created_at") ", " EPOCH_US("identifier_assigned_at") ", "
    EPOCH_US("updated_at") ", " EPOCH_US("last_accessed_at");

const char* const LEDGER_COLUMNS =
    "key_length, consumed, capacity, exhausted, "
    EPOCH_US("created_at") ", " EPOCH_US("updated_at");

Timestamp from_micros(int64_t us) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(us)));
}

std::optional<Timestamp> opt_time(const Result& res, int row, int col) {
    if (res.is_null(row, col)) return std::nullopt;
    return from_micros(res.int64(row, col));
}

AllocationRecord read_record(const Result& res, int row) {
    AllocationRecord rec;
    rec.id = res.int64(row, 0);
    rec.fingerprint = res.str(row, 1);
    rec.content_uuid = res.str(row, 2);
    rec.identifier = res.opt_str(row, 3);
    rec.identifier_length = res.integer(row, 4);
    rec.generation_salt = res.str(row, 5);
    rec.original_filename = res.str(row, 6);
    rec.extension = res.str(row, 7);
    rec.size_bytes = res.int64(row, 8);
    rec.media_type = res.str(row, 9);
    rec.hash_algorithm = res.str(row, 10);
    rec.storage_key = res.str(row, 11);
    rec.url = res.str(row, 12);

    auto status = parse_record_status(res.str(row, 13));
    if (!status) {
        throw IntegrityViolationError("unknown record status '" + res.str(row, 13) + "'",
                                      "record " + std::to_string(rec.id));
    }
    rec.status = *status;
    rec.access_count = res.int64(row, 14);
    if (!res.is_null(row, 15)) {
        rec.metadata = Metadata::from_json(res.str(row, 15));
    }
    rec.created_at = from_micros(res.int64(row, 16));
    rec.identifier_assigned_at = opt_time(res, row, 17);
    rec.updated_at = from_micros(res.int64(row, 18));
    rec.last_accessed_at = opt_time(res, row, 19);
    return rec;
}

LedgerEntry read_ledger(const Result& res, int row) {
    LedgerEntry entry;
    entry.length = res.integer(row, 0);
    entry.consumed = res.int64(row, 1);
    entry.capacity = res.int64(row, 2);
    entry.exhausted = res.boolean(row, 3);
    entry.created_at = from_micros(res.int64(row, 4));
    entry.updated_at = from_micros(res.int64(row, 5));
    return entry;
}

std::optional<AllocationRecord> single_record(PGconn* conn, const std::string& sql,
                                              const std::string& key, const char* context) {
    Result res = exec_params(conn, sql.c_str(), {key});
    check_result(res, context);
    if (!res.has_rows()) return std::nullopt;
    return read_record(res, 0);
}

std::optional<std::string> metadata_param(const std::optional<Metadata>& metadata) {
    if (!metadata || metadata->empty()) return std::nullopt;
    return metadata->to_json();
}

void insert_log(PGconn* conn, int64_t record_ref, OperationKind kind, const std::string& details) {
    Result res = exec_params(conn,
        "INSERT INTO operation_log (record_ref, kind, details) VALUES ($1::bigint, $2, $3::jsonb)",
        {std::to_string(record_ref), std::string(operation_kind_name(kind)),
         details.empty() ? std::string("{}") : details});
    check_result(res, "append operation");
}

} // namespace

PgBackend::PgBackend(const DatabaseConfig& config) : pool_(config) {}

// =============================================================================
// Allocation records
// =============================================================================

std::optional<AllocationRecord> PgBackend::find_by_fingerprint(const std::string& fingerprint) {
    auto conn = pool_.acquire();
    static const std::string sql =
        std::string("SELECT ") + RECORD_COLUMNS + " FROM allocation_records WHERE fingerprint = $1";
    return single_record(conn, sql, fingerprint, "find by fingerprint");
}

std::optional<AllocationRecord> PgBackend::find_by_identifier(const std::string& identifier) {
    auto conn = pool_.acquire();
    static const std::string sql =
        std::string("SELECT ") + RECORD_COLUMNS + " FROM allocation_records WHERE identifier = $1";
    return single_record(conn, sql, identifier, "find by identifier");
}

bool PgBackend::identifier_exists(const std::string& identifier) {
    auto conn = pool_.acquire();
    Result res = exec_params(conn,
        "SELECT EXISTS (SELECT 1 FROM allocation_records WHERE identifier = $1)", {identifier});
    check_result(res, "identifier exists");
    return res.boolean(0, 0);
}

AllocationRecord PgBackend::insert_record(const AllocationRequest& request,
                                          const std::string& content_uuid,
                                          const std::optional<IdentifierCandidate>& candidate,
                                          const std::string& assign_details) {
    auto conn = pool_.acquire();
    Transaction tx(conn);

    static const std::string sql =
        "INSERT INTO allocation_records (fingerprint, content_uuid, identifier, identifier_length, "
        "generation_salt, identifier_assigned_at, original_filename, extension, size_bytes, "
        "media_type, hash_algorithm, metadata) "
        "VALUES ($1, $2::uuid, $3, $4::integer, $5, CASE WHEN $3::text IS NULL THEN NULL ELSE now() END, "
        "$6, $7, $8::bigint, $9, $10, $11::jsonb) RETURNING " + std::string(RECORD_COLUMNS);

    std::vector<Param> params = {
        request.fingerprint,
        content_uuid,
        candidate ? Param(candidate->identifier) : std::nullopt,
        candidate ? Param(std::to_string(candidate->length)) : std::nullopt,
        candidate ? Param(candidate->salt) : std::nullopt,
        request.original_filename,
        request.extension,
        std::to_string(request.size_bytes),
        request.media_type,
        request.hash_algorithm,
        metadata_param(request.metadata),
    };

    Result res = exec_params(conn, sql.c_str(), params);
    check_result(res, "insert record",
                 ConflictValues{request.fingerprint, candidate ? candidate->identifier : std::string()});
    AllocationRecord rec = read_record(res, 0);

    if (candidate) {
        insert_log(conn, rec.id, OperationKind::Assign, assign_details);
    }
    tx.commit();
    return rec;
}

std::optional<AllocationRecord> PgBackend::assign_identifier(const std::string& fingerprint,
                                                             const IdentifierCandidate& candidate,
                                                             const std::string& assign_details) {
    auto conn = pool_.acquire();
    Transaction tx(conn);

    static const std::string sql =
        "UPDATE allocation_records SET identifier = $2, identifier_length = $3::integer, "
        "generation_salt = $4, identifier_assigned_at = now() "
        "WHERE fingerprint = $1 AND identifier IS NULL AND status = 'active' "
        "RETURNING " + std::string(RECORD_COLUMNS);

    Result res = exec_params(conn, sql.c_str(),
        {fingerprint, candidate.identifier, std::to_string(candidate.length), candidate.salt});
    check_result(res, "assign identifier", ConflictValues{fingerprint, candidate.identifier});
    if (!res.has_rows()) {
        tx.rollback();
        return std::nullopt;
    }

    AllocationRecord rec = read_record(res, 0);
    insert_log(conn, rec.id, OperationKind::Assign, assign_details);
    tx.commit();
    return rec;
}

bool PgBackend::update_and_log(const char* sql, const std::vector<Param>& params,
                               OperationKind kind, const std::string& details, const char* context) {
    auto conn = pool_.acquire();
    Transaction tx(conn);

    Result res = exec_params(conn, sql, params);
    check_result(res, context);
    if (!res.has_rows()) {
        tx.rollback();
        return false;
    }
    insert_log(conn, res.int64(0, 0), kind, details);
    tx.commit();
    return true;
}

bool PgBackend::mark_accessed(const std::string& fingerprint, const std::string& details) {
    return update_and_log(
        "UPDATE allocation_records SET access_count = access_count + 1, last_accessed_at = now() "
        "WHERE fingerprint = $1 RETURNING id",
        {fingerprint}, OperationKind::Access, details, "mark accessed");
}

bool PgBackend::update_upload_metadata(const std::string& fingerprint,
                                       const std::string& storage_key,
                                       const std::string& url,
                                       const std::string& details) {
    return update_and_log(
        "UPDATE allocation_records SET storage_key = $2, url = $3 "
        "WHERE fingerprint = $1 AND status = 'active' RETURNING id",
        {fingerprint, storage_key, url}, OperationKind::Update, details, "update upload metadata");
}

bool PgBackend::set_status(const std::string& fingerprint, RecordStatus status,
                           const std::string& details) {
    if (status == RecordStatus::Active) {
        return false;
    }
    return update_and_log(
        "UPDATE allocation_records SET status = $2 "
        "WHERE fingerprint = $1 AND status = 'active' RETURNING id",
        {fingerprint, std::string(record_status_name(status))},
        status == RecordStatus::Deleted ? OperationKind::Delete : OperationKind::Update,
        details, "set status");
}

std::vector<AllocationRecord> PgBackend::records_missing_identifier(int64_t after_id, size_t limit) {
    auto conn = pool_.acquire();
    static const std::string sql =
        std::string("SELECT ") + RECORD_COLUMNS + " FROM allocation_records "
        "WHERE id > $1::bigint AND identifier IS NULL AND status = 'active' "
        "ORDER BY id LIMIT $2::bigint";

    Result res = exec_params(conn, sql.c_str(), {std::to_string(after_id), std::to_string(limit)});
    check_result(res, "records missing identifier");

    std::vector<AllocationRecord> out;
    out.reserve(static_cast<size_t>(res.ntuples()));
    for (int i = 0; i < res.ntuples(); ++i) {
        out.push_back(read_record(res, i));
    }
    return out;
}

RecordCounts PgBackend::record_counts() {
    auto conn = pool_.acquire();
    Result res = exec(conn,
        "SELECT count(*), "
        "count(*) FILTER (WHERE status = 'active'), "
        "count(*) FILTER (WHERE status = 'active' AND identifier IS NOT NULL) "
        "FROM allocation_records");
    check_result(res, "record counts");

    RecordCounts counts;
    counts.total = res.int64(0, 0);
    counts.active = res.int64(0, 1);
    counts.with_identifier = res.int64(0, 2);
    return counts;
}

// =============================================================================
// Operation log
// =============================================================================

void PgBackend::append_operation(int64_t record_ref, OperationKind kind, const std::string& details) {
    auto conn = pool_.acquire();
    insert_log(conn, record_ref, kind, details);
}

std::vector<OperationLogEntry> PgBackend::operations_for(int64_t record_ref) {
    auto conn = pool_.acquire();
    Result res = exec_params(conn,
        "SELECT id, record_ref, kind, details::text, " EPOCH_US("logged_at")
        " FROM operation_log WHERE record_ref = $1::bigint ORDER BY id",
        {std::to_string(record_ref)});
    check_result(res, "operations for record");

    std::vector<OperationLogEntry> out;
    for (int i = 0; i < res.ntuples(); ++i) {
        auto kind = parse_operation_kind(res.str(i, 2));
        if (!kind) {
            LOG_WARN("Skipping log entry ", res.int64(i, 0), " with unknown kind '", res.str(i, 2), "'");
            continue;
        }
        OperationLogEntry entry;
        entry.id = res.int64(i, 0);
        entry.record_ref = res.int64(i, 1);
        entry.kind = *kind;
        entry.details = res.str(i, 3);
        entry.timestamp = from_micros(res.int64(i, 4));
        out.push_back(std::move(entry));
    }
    return out;
}

// =============================================================================
// Keyspace ledger
// =============================================================================

std::vector<LedgerEntry> PgBackend::ledger_entries() {
    auto conn = pool_.acquire();
    static const std::string sql =
        std::string("SELECT ") + LEDGER_COLUMNS + " FROM keyspace_ledger ORDER BY key_length";
    Result res = exec(conn, sql);
    check_result(res, "ledger entries");

    std::vector<LedgerEntry> out;
    for (int i = 0; i < res.ntuples(); ++i) {
        out.push_back(read_ledger(res, i));
    }
    return out;
}

std::optional<LedgerEntry> PgBackend::ledger_entry(int length) {
    auto conn = pool_.acquire();
    static const std::string sql =
        std::string("SELECT ") + LEDGER_COLUMNS + " FROM keyspace_ledger WHERE key_length = $1::integer";
    Result res = exec_params(conn, sql.c_str(), {std::to_string(length)});
    check_result(res, "ledger entry");
    if (!res.has_rows()) return std::nullopt;
    return read_ledger(res, 0);
}

std::optional<LedgerEntry> PgBackend::first_open_length(int min_length) {
    auto conn = pool_.acquire();
    static const std::string sql =
        std::string("SELECT ") + LEDGER_COLUMNS + " FROM keyspace_ledger "
        "WHERE key_length >= $1::integer AND NOT exhausted ORDER BY key_length LIMIT 1";
    Result res = exec_params(conn, sql.c_str(), {std::to_string(min_length)});
    check_result(res, "first open length");
    if (!res.has_rows()) return std::nullopt;
    return read_ledger(res, 0);
}

std::optional<int> PgBackend::max_ledger_length() {
    auto conn = pool_.acquire();
    Result res = exec(conn, "SELECT MAX(key_length) FROM keyspace_ledger");
    check_result(res, "max ledger length");
    if (res.is_null(0, 0)) return std::nullopt;
    return res.integer(0, 0);
}

bool PgBackend::create_length(int length, int64_t capacity) {
    auto conn = pool_.acquire();
    Result res = exec_params(conn,
        "INSERT INTO keyspace_ledger (key_length, capacity) VALUES ($1::integer, $2::bigint) "
        "ON CONFLICT (key_length) DO NOTHING",
        {std::to_string(length), std::to_string(capacity)});
    check_result(res, "create length");
    return cmd_tuples(res) == 1;
}

SlotReservation PgBackend::reserve_slot(int length) {
    auto conn = pool_.acquire();
    // RETURNING sees the updated row, so consumed - 1 is the pre-increment value
    Result res = exec_params(conn,
        "UPDATE keyspace_ledger SET consumed = consumed + 1, exhausted = (consumed + 1 >= capacity) "
        "WHERE key_length = $1::integer AND NOT exhausted RETURNING consumed - 1, exhausted",
        {std::to_string(length)});
    check_result(res, "reserve slot");

    SlotReservation slot;
    if (!res.has_rows()) {
        slot.exhausted = true;
        return slot;
    }
    slot.granted = true;
    slot.sequence = res.int64(0, 0);
    slot.exhausted = res.boolean(0, 1);
    return slot;
}

void PgBackend::saturate_length(int length) {
    auto conn = pool_.acquire();
    Result res = exec_params(conn,
        "UPDATE keyspace_ledger SET consumed = GREATEST(consumed, capacity), exhausted = TRUE "
        "WHERE key_length = $1::integer",
        {std::to_string(length)});
    check_result(res, "saturate length");
}

// =============================================================================
// Reserved identifiers
// =============================================================================

std::vector<ReservedIdentifier> PgBackend::reserved_identifiers() {
    auto conn = pool_.acquire();
    Result res = exec(conn, "SELECT value, reason FROM reserved_identifiers ORDER BY value");
    check_result(res, "reserved identifiers");

    std::vector<ReservedIdentifier> out;
    out.reserve(static_cast<size_t>(res.ntuples()));
    for (int i = 0; i < res.ntuples(); ++i) {
        out.push_back(ReservedIdentifier{res.str(i, 0), res.str(i, 1)});
    }
    return out;
}

bool PgBackend::add_reserved(const std::string& value, const std::string& reason) {
    auto conn = pool_.acquire();
    Result res = exec_params(conn,
        "INSERT INTO reserved_identifiers (value, reason) VALUES ($1, $2) "
        "ON CONFLICT (value) DO NOTHING",
        {value, reason});
    check_result(res, "add reserved");
    return cmd_tuples(res) == 1;
}

#undef EPOCH_US

} // namespace shortkey::db
