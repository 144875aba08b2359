// =============================================================================
// Keyspace Ledger Tests
// =============================================================================

#include <gtest/gtest.h>

#include "shortkey/error.hpp"
#include "shortkey/keyspace_ledger.hpp"
#include "shortkey/storage/memory_backend.hpp"

using namespace shortkey;

class KeyspaceLedgerTest : public ::testing::Test {
protected:
    MemoryBackend backend;
    KeyspaceConfig config;
};

TEST_F(KeyspaceLedgerTest, FreshLedgerOpensMinLength) {
    KeyspaceLedger ledger(backend, config);
    EXPECT_EQ(ledger.current_length(), 4);

    auto entry = backend.ledger_entry(4);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->consumed, 0);
    EXPECT_EQ(entry->capacity, ledger.capacity_for(4));
    EXPECT_FALSE(entry->exhausted);

    // asking again does not create anything new
    EXPECT_EQ(ledger.current_length(), 4);
    EXPECT_EQ(ledger.entries().size(), 1u);
}

TEST_F(KeyspaceLedgerTest, CreateLengthIsIdempotent) {
    EXPECT_TRUE(backend.create_length(4, 10));
    EXPECT_FALSE(backend.create_length(4, 99));
    EXPECT_EQ(backend.ledger_entry(4)->capacity, 10);
}

TEST_F(KeyspaceLedgerTest, ReserveSlotConsumesUpToCapacity) {
    config.capacity_overrides[4] = 2;
    KeyspaceLedger ledger(backend, config);
    ASSERT_EQ(ledger.current_length(), 4);

    SlotReservation first = ledger.reserve_slot(4);
    EXPECT_TRUE(first.granted);
    EXPECT_EQ(first.sequence, 0);
    EXPECT_FALSE(first.exhausted);

    SlotReservation second = ledger.reserve_slot(4);
    EXPECT_TRUE(second.granted);
    EXPECT_EQ(second.sequence, 1);
    EXPECT_TRUE(second.exhausted);

    SlotReservation third = ledger.reserve_slot(4);
    EXPECT_FALSE(third.granted);
    EXPECT_EQ(backend.ledger_entry(4)->consumed, 2);
}

TEST_F(KeyspaceLedgerTest, ExhaustedLengthIsNeverReturned) {
    config.capacity_overrides[4] = 1;
    KeyspaceLedger ledger(backend, config);
    ASSERT_EQ(ledger.current_length(), 4);
    ASSERT_TRUE(ledger.reserve_slot(4).granted);

    EXPECT_EQ(ledger.current_length(), 5);
    EXPECT_TRUE(backend.ledger_entry(4)->exhausted);
    EXPECT_FALSE(backend.ledger_entry(5)->exhausted);
}

TEST_F(KeyspaceLedgerTest, SaturationRatioRetiresEarly) {
    config.capacity_overrides[4] = 10;
    config.saturation_ratio = 0.85;
    KeyspaceLedger ledger(backend, config);
    ASSERT_EQ(ledger.current_length(), 4);

    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(ledger.reserve_slot(4).granted);
    }
    EXPECT_EQ(ledger.current_length(), 4);   // 0.8 < 0.85

    ASSERT_TRUE(ledger.reserve_slot(4).granted);
    EXPECT_EQ(ledger.current_length(), 5);   // 0.9 >= 0.85

    auto retired = backend.ledger_entry(4);
    EXPECT_TRUE(retired->exhausted);
    EXPECT_EQ(retired->consumed, 10);
}

TEST_F(KeyspaceLedgerTest, SaturateRetiresImmediately) {
    KeyspaceLedger ledger(backend, config);
    ASSERT_EQ(ledger.current_length(), 4);
    ledger.saturate(4);

    auto entry = backend.ledger_entry(4);
    EXPECT_TRUE(entry->exhausted);
    EXPECT_GE(entry->consumed, entry->capacity);
    EXPECT_FALSE(ledger.reserve_slot(4).granted);
    EXPECT_EQ(ledger.current_length(), 5);
}

TEST_F(KeyspaceLedgerTest, RaisedMinLengthSkipsLowerRows) {
    {
        KeyspaceLedger ledger(backend, config);
        ASSERT_EQ(ledger.current_length(), 4);
    }
    config.min_length = 6;
    KeyspaceLedger ledger(backend, config);
    EXPECT_EQ(ledger.current_length(), 6);
    EXPECT_FALSE(backend.ledger_entry(5).has_value());
}

TEST_F(KeyspaceLedgerTest, LoweredMinLengthNeverReopensShorterLengths) {
    config.capacity_overrides[4] = 1;
    {
        KeyspaceLedger ledger(backend, config);
        ASSERT_TRUE(ledger.reserve_slot(4).granted);
        ASSERT_EQ(ledger.current_length(), 5);
    }
    config.min_length = 3;
    KeyspaceLedger ledger(backend, config);
    EXPECT_EQ(ledger.current_length(), 5);
    EXPECT_FALSE(backend.ledger_entry(3).has_value());

    ledger.saturate(5);
    EXPECT_EQ(ledger.current_length(), 6);
    EXPECT_FALSE(backend.ledger_entry(3).has_value());
}

TEST_F(KeyspaceLedgerTest, ThrowsPastMaxLength) {
    config.min_length = 4;
    config.max_length = 5;
    config.capacity_overrides[4] = 1;
    config.capacity_overrides[5] = 1;
    KeyspaceLedger ledger(backend, config);

    ASSERT_TRUE(ledger.reserve_slot(ledger.current_length()).granted);
    ASSERT_TRUE(ledger.reserve_slot(ledger.current_length()).granted);
    EXPECT_THROW(ledger.current_length(), KeyspaceExhaustedError);
    EXPECT_FALSE(backend.ledger_entry(6).has_value());
}
