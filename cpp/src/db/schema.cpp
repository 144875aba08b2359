#include "shortkey/db/schema.hpp"
#include "shortkey/db/operations.hpp"
#include "shortkey/error.hpp"
#include "shortkey/keyspace.hpp"
#include "shortkey/logging.hpp"
#include "shortkey/reserved_filter.hpp"

#include <iterator>

namespace shortkey::db {

namespace {

const char* const CREATE_TABLES[] = {
    R"SQL(
    CREATE TABLE IF NOT EXISTS schema_version (
        version     INTEGER NOT NULL,
        applied_at  TIMESTAMPTZ NOT NULL DEFAULT now()
    )
    )SQL",

    R"SQL(
    CREATE TABLE IF NOT EXISTS allocation_records (
        id                      BIGSERIAL PRIMARY KEY,
        fingerprint             TEXT NOT NULL,
        content_uuid            UUID NOT NULL,
        identifier              TEXT,
        identifier_length       INTEGER,
        generation_salt         TEXT,
        identifier_assigned_at  TIMESTAMPTZ,

        original_filename       TEXT NOT NULL DEFAULT '',
        extension               TEXT NOT NULL DEFAULT '',
        size_bytes              BIGINT NOT NULL DEFAULT 0 CHECK (size_bytes >= 0),
        media_type              TEXT NOT NULL DEFAULT 'application/octet-stream',
        hash_algorithm          TEXT NOT NULL DEFAULT 'sha512',

        storage_key             TEXT NOT NULL DEFAULT '',
        url                     TEXT NOT NULL DEFAULT '',

        status                  TEXT NOT NULL DEFAULT 'active'
                                CHECK (status IN ('active', 'deleted', 'archived')),
        access_count            BIGINT NOT NULL DEFAULT 0,
        last_accessed_at        TIMESTAMPTZ,
        metadata                JSONB,

        created_at              TIMESTAMPTZ NOT NULL DEFAULT now(),
        updated_at              TIMESTAMPTZ NOT NULL DEFAULT now(),

        CONSTRAINT allocation_records_fingerprint_key UNIQUE (fingerprint),
        CONSTRAINT allocation_records_identifier_key UNIQUE (identifier),
        CONSTRAINT allocation_records_identifier_length_check
            CHECK (identifier IS NULL OR identifier_length = char_length(identifier))
    )
    )SQL",

    R"SQL(
    CREATE TABLE IF NOT EXISTS keyspace_ledger (
        key_length  INTEGER PRIMARY KEY CHECK (key_length > 0),
        consumed    BIGINT NOT NULL DEFAULT 0 CHECK (consumed >= 0),
        capacity    BIGINT NOT NULL CHECK (capacity > 0),
        exhausted   BOOLEAN NOT NULL DEFAULT FALSE,
        created_at  TIMESTAMPTZ NOT NULL DEFAULT now(),
        updated_at  TIMESTAMPTZ NOT NULL DEFAULT now(),
        CHECK (exhausted OR consumed < capacity)
    )
    )SQL",

    R"SQL(
    CREATE TABLE IF NOT EXISTS reserved_identifiers (
        value       TEXT PRIMARY KEY,
        reason      TEXT NOT NULL,
        created_at  TIMESTAMPTZ NOT NULL DEFAULT now()
    )
    )SQL",

    R"SQL(
    CREATE TABLE IF NOT EXISTS operation_log (
        id          BIGSERIAL PRIMARY KEY,
        record_ref  BIGINT NOT NULL REFERENCES allocation_records(id),
        kind        TEXT NOT NULL
                    CHECK (kind IN ('assign', 'dedup_hit', 'access', 'delete', 'update')),
        details     JSONB NOT NULL DEFAULT '{}'::jsonb,
        logged_at   TIMESTAMPTZ NOT NULL DEFAULT now()
    )
    )SQL",
};

const char* const CREATE_INDEXES[] = {
    "CREATE INDEX IF NOT EXISTS idx_allocation_records_content_uuid ON allocation_records(content_uuid)",
    "CREATE INDEX IF NOT EXISTS idx_allocation_records_status ON allocation_records(status)",
    "CREATE INDEX IF NOT EXISTS idx_allocation_records_created_at ON allocation_records(created_at)",
    "CREATE INDEX IF NOT EXISTS idx_allocation_records_status_created ON allocation_records(status, created_at)",
    "CREATE INDEX IF NOT EXISTS idx_allocation_records_missing_identifier "
        "ON allocation_records(id) WHERE identifier IS NULL",
    "CREATE INDEX IF NOT EXISTS idx_operation_log_record_ref ON operation_log(record_ref)",
    "CREATE INDEX IF NOT EXISTS idx_operation_log_logged_at ON operation_log(logged_at)",
    "CREATE INDEX IF NOT EXISTS idx_operation_log_kind ON operation_log(kind)",
};

const char* const CREATE_TRIGGERS[] = {
    R"SQL(
    CREATE OR REPLACE FUNCTION shortkey_touch_updated_at() RETURNS trigger AS $$
    BEGIN
        NEW.updated_at := now();
        RETURN NEW;
    END;
    $$ LANGUAGE plpgsql
    )SQL",

    "DROP TRIGGER IF EXISTS allocation_records_touch ON allocation_records",
    R"SQL(
    CREATE TRIGGER allocation_records_touch
        BEFORE UPDATE ON allocation_records
        FOR EACH ROW EXECUTE FUNCTION shortkey_touch_updated_at()
    )SQL",

    "DROP TRIGGER IF EXISTS keyspace_ledger_touch ON keyspace_ledger",
    R"SQL(
    CREATE TRIGGER keyspace_ledger_touch
        BEFORE UPDATE ON keyspace_ledger
        FOR EACH ROW EXECUTE FUNCTION shortkey_touch_updated_at()
    )SQL",
};

void run_all(PGconn* conn, const char* const* statements, size_t count, const char* what) {
    for (size_t i = 0; i < count; ++i) {
        Result res = exec(conn, statements[i]);
        check_result(res, what);
    }
}

} // namespace

int stored_schema_version(PGconn* conn) {
    Result exists = exec(conn, "SELECT to_regclass('schema_version') IS NOT NULL");
    check_result(exists, "schema version probe");
    if (!exists.boolean(0, 0)) {
        return 0;
    }
    Result res = exec(conn, "SELECT COALESCE(MAX(version), 0) FROM schema_version");
    check_result(res, "schema version read");
    return res.integer(0, 0);
}

void initialize_schema(PGconn* conn, const Config& config) {
    Transaction tx(conn);

    // Serialise concurrent bootstraps
    Result lock = exec(conn, "SELECT pg_advisory_xact_lock(hashtext('shortkey_schema'))");
    check_result(lock, "schema lock");

    const int stored = stored_schema_version(conn);
    if (stored > SCHEMA_VERSION) {
        throw SchemaVersionError("database schema version " + std::to_string(stored)
                                 + " is newer than supported version "
                                 + std::to_string(SCHEMA_VERSION));
    }

    run_all(conn, CREATE_TABLES, std::size(CREATE_TABLES), "create tables");
    run_all(conn, CREATE_INDEXES, std::size(CREATE_INDEXES), "create indexes");
    run_all(conn, CREATE_TRIGGERS, std::size(CREATE_TRIGGERS), "create triggers");

    if (stored < SCHEMA_VERSION) {
        if (stored > 0) {
            LOG_INFO("Upgrading schema version ", stored, " -> ", SCHEMA_VERSION);
        }
        Result res = exec_params(conn, "INSERT INTO schema_version (version) VALUES ($1::integer)",
                                 {std::to_string(SCHEMA_VERSION)});
        check_result(res, "record schema version");
    }

    size_t seeded = 0;
    for (const auto& word : default_reserved_words()) {
        Result res = exec_params(conn,
            "INSERT INTO reserved_identifiers (value, reason) VALUES ($1, $2) "
            "ON CONFLICT (value) DO NOTHING",
            {word.value, word.reason});
        check_result(res, "seed reserved identifiers");
        seeded += static_cast<size_t>(cmd_tuples(res));
    }

    // First row only on an empty ledger; later lengths are opened by KeyspaceLedger,
    // which never goes below the highest existing length.
    const int min_length = config.keyspace.min_length;
    Result ledger = exec_params(conn,
        "INSERT INTO keyspace_ledger (key_length, capacity) "
        "SELECT $1::integer, $2::bigint "
        "WHERE NOT EXISTS (SELECT 1 FROM keyspace_ledger)",
        {std::to_string(min_length), std::to_string(keyspace_capacity(config.keyspace, min_length))});
    check_result(ledger, "seed keyspace ledger");

    tx.commit();
    LOG_INFO("Schema ready (version ", SCHEMA_VERSION, ", ", seeded, " reserved words seeded)");
}

} // namespace shortkey::db
