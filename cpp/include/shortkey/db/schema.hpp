#pragma once

#include <libpq-fe.h>

#include "shortkey/config.hpp"

namespace shortkey::db {

// Version of the layout created by initialize_schema().
inline constexpr int SCHEMA_VERSION = 1;

/**
 * Create tables, indexes and triggers if missing, record the schema version
 * and seed the default reserved words plus the ledger row for
 * keyspace.min_length. Idempotent; runs in one transaction.
 *
 * Throws SchemaVersionError if the database was created by a newer binary.
 */
void initialize_schema(PGconn* conn, const Config& config);

// Highest recorded schema version, 0 when the table is missing or empty.
int stored_schema_version(PGconn* conn);

} // namespace shortkey::db
