// =============================================================================
// PostgreSQL Backend Tests
// =============================================================================
//
// Run against a scratch database named by SK_DB_NAME / SK_DB_HOST / SK_DB_PORT /
// SK_DB_USER / SK_DB_PASS. Skipped when no server is reachable.

#include <gtest/gtest.h>
#include <libpq-fe.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "shortkey/allocation_service.hpp"
#include "shortkey/db/helpers.hpp"
#include "shortkey/db/pg_backend.hpp"
#include "shortkey/db/schema.hpp"
#include "shortkey/error.hpp"
#include "shortkey/identifier_generator.hpp"
#include "shortkey/keyspace_ledger.hpp"

using namespace shortkey;

class PgBackendTest : public ::testing::Test {
protected:
    Config config;
    std::unique_ptr<db::PgBackend> backend;

    void SetUp() override {
        config.retry.initial_delay_s = 0.0;
        config.retry.max_delay_s = 0.0;
        config.database.pool_size = 4;
        config.database.checkout_timeout_ms = 2000;
        apply_env_overrides(config);

        try {
            backend = std::make_unique<db::PgBackend>(config.database);
            auto conn = backend->pool().acquire();
            db::initialize_schema(conn, config);
        } catch (const ShortkeyException& e) {
            backend.reset();
            GTEST_SKIP() << "Database not available: " << e.what();
        }
    }

    // Random digest so repeated runs against the same database never collide.
    static std::string fresh_fingerprint() {
        static SecureIdentifierGenerator gen("0123456789abcdef");
        return gen.salt(64);
    }

    static AllocationRequest request_for(const std::string& fingerprint) {
        AllocationRequest req;
        req.fingerprint = fingerprint;
        req.original_filename = "scan.pdf";
        req.extension = ".pdf";
        req.size_bytes = 2048;
        req.media_type = "application/pdf";
        return req;
    }
};

TEST_F(PgBackendTest, SchemaIsVersionedAndIdempotent) {
    auto conn = backend->pool().acquire();
    EXPECT_EQ(db::stored_schema_version(conn), db::SCHEMA_VERSION);
    EXPECT_NO_THROW(db::initialize_schema(conn, config));

    db::Result tables = db::exec(conn,
        "SELECT count(*) FROM information_schema.tables WHERE table_name IN "
        "('allocation_records', 'keyspace_ledger', 'reserved_identifiers', 'operation_log', 'schema_version')");
    ASSERT_TRUE(tables.ok());
    EXPECT_EQ(tables.int64(0, 0), 5);
}

TEST_F(PgBackendTest, ReinitWithLowerMinLengthOpensNoShorterLength) {
    auto highest = backend->max_ledger_length();
    ASSERT_TRUE(highest.has_value());

    Config lowered = config;
    lowered.keyspace.min_length = 2;
    auto conn = backend->pool().acquire();
    db::initialize_schema(conn, lowered);

    EXPECT_FALSE(backend->ledger_entry(2).has_value());
    EXPECT_EQ(backend->max_ledger_length(), highest);

    KeyspaceLedger ledger(*backend, lowered.keyspace);
    EXPECT_GE(ledger.current_length(), config.keyspace.min_length);
    EXPECT_FALSE(backend->ledger_entry(2).has_value());
}

TEST_F(PgBackendTest, DefaultReservedWordsAreSeeded) {
    ReservedWordFilter filter(*backend);
    EXPECT_TRUE(filter.is_reserved("admin"));
    EXPECT_GE(filter.size(), default_reserved_words().size());
}

TEST_F(PgBackendTest, AllocateLookupResolve) {
    AllocationService service(*backend, config);
    const std::string fp = fresh_fingerprint();

    Allocation a = service.allocate(request_for(fp));
    EXPECT_EQ(a.outcome, AllocationOutcome::Assigned);
    EXPECT_GE(a.length(), config.keyspace.min_length);
    EXPECT_EQ(a.record.fingerprint, fp);
    EXPECT_EQ(a.record.extension, ".pdf");

    Allocation again = service.allocate(request_for(fp));
    EXPECT_EQ(again.outcome, AllocationOutcome::DedupHit);
    EXPECT_EQ(again.identifier(), a.identifier());

    auto resolved = service.resolve(a.identifier());
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->fingerprint, fp);
    EXPECT_EQ(resolved->access_count, 1);

    auto ops = backend->operations_for(a.record.id);
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[0].kind, OperationKind::Assign);
    EXPECT_EQ(ops[1].kind, OperationKind::DedupHit);
    EXPECT_EQ(ops[2].kind, OperationKind::Access);
}

TEST_F(PgBackendTest, UniqueConstraintsAreReportedByKey) {
    const std::string fp = fresh_fingerprint();
    const std::string identifier = "t" + fp.substr(0, 11);
    IdentifierCandidate candidate{identifier, static_cast<int>(identifier.size()), "00"};

    backend->insert_record(request_for(fp), "00000000-0000-0000-0000-000000000000", candidate, "{}");

    try {
        backend->insert_record(request_for(fresh_fingerprint()), "00000000-0000-0000-0000-000000000000",
                               candidate, "{}");
        FAIL() << "expected identifier conflict";
    } catch (const UniqueConflictError& e) {
        EXPECT_EQ(e.kind(), ConflictKind::Identifier);
    }

    try {
        IdentifierCandidate other{"u" + fp.substr(0, 11), 12, "00"};
        backend->insert_record(request_for(fp), "00000000-0000-0000-0000-000000000000", other, "{}");
        FAIL() << "expected fingerprint conflict";
    } catch (const UniqueConflictError& e) {
        EXPECT_EQ(e.kind(), ConflictKind::Fingerprint);
    }
}

TEST_F(PgBackendTest, ReserveSlotNeverPassesCapacity) {
    // a length far above anything the allocator uses; removed again so it
    // does not become the ledger's highest row
    const int length = 40;
    auto conn = backend->pool().acquire();
    db::exec(conn, "DELETE FROM keyspace_ledger WHERE key_length = 40");

    ASSERT_TRUE(backend->create_length(length, 2));
    EXPECT_TRUE(backend->reserve_slot(length).granted);
    SlotReservation last = backend->reserve_slot(length);
    EXPECT_TRUE(last.granted);
    EXPECT_TRUE(last.exhausted);
    EXPECT_FALSE(backend->reserve_slot(length).granted);

    auto entry = backend->ledger_entry(length);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->exhausted);
    EXPECT_EQ(entry->consumed, 2);

    db::Result cleanup = db::exec(conn, "DELETE FROM keyspace_ledger WHERE key_length = 40");
    EXPECT_TRUE(cleanup.ok());
}

TEST_F(PgBackendTest, ConcurrentSameFingerprintAssignsOnce) {
    AllocationService service(*backend, config);
    const std::string fp = fresh_fingerprint();

    constexpr int THREADS = 4;
    std::vector<Allocation> results(THREADS);
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] { results[t] = service.allocate(request_for(fp)); });
    }
    for (auto& th : threads) th.join();

    int assigned = 0;
    for (const auto& r : results) {
        if (r.outcome == AllocationOutcome::Assigned) ++assigned;
        EXPECT_EQ(r.identifier(), results[0].identifier());
    }
    EXPECT_EQ(assigned, 1);
}

TEST_F(PgBackendTest, StatusChangeIsLogged) {
    AllocationService service(*backend, config);
    const std::string fp = fresh_fingerprint();
    Allocation a = service.allocate(request_for(fp));

    EXPECT_TRUE(service.store().set_status(fp, RecordStatus::Archived, "retention"));
    EXPECT_FALSE(service.store().set_status(fp, RecordStatus::Deleted));
    EXPECT_EQ(backend->find_by_fingerprint(fp)->status, RecordStatus::Archived);
    EXPECT_EQ(backend->operations_for(a.record.id).back().kind, OperationKind::Update);
}
