// =============================================================================
// SQLSTATE Classification Tests
// =============================================================================

#include <gtest/gtest.h>

#include "shortkey/db/connection.hpp"
#include "shortkey/db/errors.hpp"
#include "shortkey/error.hpp"

using namespace shortkey::db;

class SqlStateTest : public ::testing::Test {};

TEST_F(SqlStateTest, UniqueViolationNamesTheKey) {
    EXPECT_EQ(classify_sqlstate("23505", FINGERPRINT_CONSTRAINT), FailureClass::FingerprintConflict);
    EXPECT_EQ(classify_sqlstate("23505", IDENTIFIER_CONSTRAINT), FailureClass::IdentifierConflict);
    EXPECT_EQ(classify_sqlstate("23505", "some_other_key"), FailureClass::Integrity);
}

TEST_F(SqlStateTest, OtherConstraintViolationsAreIntegrity) {
    EXPECT_EQ(classify_sqlstate("23514", "keyspace_ledger_check"), FailureClass::Integrity);
    EXPECT_EQ(classify_sqlstate("23502", ""), FailureClass::Integrity);
    EXPECT_EQ(classify_sqlstate("23503", ""), FailureClass::Integrity);
}

TEST_F(SqlStateTest, RetryableStates) {
    EXPECT_EQ(classify_sqlstate("", ""), FailureClass::Transient);        // connection dropped
    EXPECT_EQ(classify_sqlstate("40001", ""), FailureClass::Transient);
    EXPECT_EQ(classify_sqlstate("40P01", ""), FailureClass::Transient);
    EXPECT_EQ(classify_sqlstate("55P03", ""), FailureClass::Transient);
    EXPECT_EQ(classify_sqlstate("57014", ""), FailureClass::Transient);
    EXPECT_EQ(classify_sqlstate("08006", ""), FailureClass::Transient);
    EXPECT_EQ(classify_sqlstate("53300", ""), FailureClass::Transient);
    EXPECT_EQ(classify_sqlstate("57P01", ""), FailureClass::Transient);
}

TEST_F(SqlStateTest, EverythingElseIsFatal) {
    EXPECT_EQ(classify_sqlstate("42P01", ""), FailureClass::Fatal);   // undefined table
    EXPECT_EQ(classify_sqlstate("22P02", ""), FailureClass::Fatal);
    EXPECT_EQ(classify_sqlstate("00000", ""), FailureClass::None);
}

class ConnectionPoolTest : public ::testing::Test {};

TEST_F(ConnectionPoolTest, AcquireAfterShutdownIsConnectionFailure) {
    shortkey::DatabaseConfig config;
    config.pool_size = 1;
    config.checkout_timeout_ms = 50;
    ConnectionPool pool(config);
    pool.shutdown();

    try {
        pool.acquire();
        FAIL() << "expected shut-down pool to refuse checkout";
    } catch (const shortkey::ShortkeyException& e) {
        EXPECT_EQ(e.code(), shortkey::ErrorCode::CONNECTION_FAILED);
        EXPECT_EQ(pool.open_connections(), 0u);
    }
}
