// =============================================================================
// Keyspace Statistics Tests
// =============================================================================

#include <gtest/gtest.h>
#include <boost/json.hpp>

#include "shortkey/allocation_service.hpp"
#include "shortkey/statistics.hpp"
#include "test_support.hpp"

using namespace shortkey;
using namespace shortkey::test_support;

class StatisticsTest : public ::testing::Test {
protected:
    MemoryBackend backend;
    Config config = test_config();

    void SetUp() override {
        seed_reserved_words(backend);
    }
};

TEST_F(StatisticsTest, EmptyStoreCreatesNothing) {
    ReservedWordFilter reserved(backend);
    Statistics stats = collect_statistics(backend, reserved, config.keyspace);

    EXPECT_TRUE(stats.lengths.empty());
    EXPECT_FALSE(stats.current_length.has_value());
    EXPECT_EQ(stats.records_total, 0);
    EXPECT_EQ(stats.charset_size, 62u);
    EXPECT_EQ(stats.reserved_count, default_reserved_words().size());
    EXPECT_TRUE(backend.ledger_entries().empty());
}

TEST_F(StatisticsTest, ReportsPerLengthUsage) {
    config.keyspace.capacity_overrides[4] = 2;
    AllocationService service(backend, config);
    for (uint64_t n = 0; n < 3; ++n) service.allocate(make_request(n));
    service.store().register_pending(make_request(50));
    ASSERT_TRUE(service.store().set_status(make_fingerprint(0), RecordStatus::Deleted));

    Statistics stats = collect_statistics(backend, service.reserved(), config.keyspace);

    ASSERT_EQ(stats.lengths.size(), 2u);
    EXPECT_EQ(stats.lengths[0].length, 4);
    EXPECT_EQ(stats.lengths[0].consumed, 2);
    EXPECT_TRUE(stats.lengths[0].exhausted);
    EXPECT_DOUBLE_EQ(stats.lengths[0].usage_percent, 100.0);
    EXPECT_EQ(stats.lengths[1].length, 5);
    EXPECT_FALSE(stats.lengths[1].exhausted);
    ASSERT_TRUE(stats.current_length.has_value());
    EXPECT_EQ(*stats.current_length, 5);

    EXPECT_EQ(stats.records_total, 4);
    EXPECT_EQ(stats.records_active, 3);
    EXPECT_EQ(stats.identifiers_assigned, 2);
}

TEST_F(StatisticsTest, JsonSnapshot) {
    AllocationService service(backend, config);
    service.allocate(make_request(1));

    Statistics stats = collect_statistics(backend, service.reserved(), config.keyspace);
    boost::json::value doc = boost::json::parse(stats.to_json());
    const auto& obj = doc.as_object();

    EXPECT_EQ(obj.at("current_length").as_int64(), 4);
    EXPECT_EQ(obj.at("records_total").as_int64(), 1);
    ASSERT_EQ(obj.at("lengths").as_array().size(), 1u);
    EXPECT_EQ(obj.at("lengths").as_array()[0].as_object().at("consumed").as_int64(), 1);
}
