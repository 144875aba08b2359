// =============================================================================
// Reserved-Word Filter Tests
// =============================================================================

#include <gtest/gtest.h>

#include "shortkey/error.hpp"
#include "shortkey/reserved_filter.hpp"
#include "shortkey/storage/memory_backend.hpp"

using namespace shortkey;

class ReservedFilterTest : public ::testing::Test {
protected:
    MemoryBackend backend;

    void SetUp() override {
        seed_reserved_words(backend);
    }
};

TEST_F(ReservedFilterTest, SeedsDefaultWordsOnce) {
    EXPECT_EQ(backend.reserved_identifiers().size(), default_reserved_words().size());
    EXPECT_EQ(seed_reserved_words(backend), 0u);
}

TEST_F(ReservedFilterTest, MatchesIgnoringCase) {
    ReservedWordFilter filter(backend);
    EXPECT_TRUE(filter.is_reserved("admin"));
    EXPECT_TRUE(filter.is_reserved("ADMIN"));
    EXPECT_TRUE(filter.is_reserved("Admin"));
    EXPECT_TRUE(filter.is_reserved("404"));
    EXPECT_FALSE(filter.is_reserved("photo"));
    EXPECT_FALSE(filter.is_reserved("admins"));
}

TEST_F(ReservedFilterTest, AddReservedStoresLowercase) {
    ReservedWordFilter filter(backend);
    EXPECT_TRUE(filter.add_reserved("Blog", "marketing pages"));
    EXPECT_TRUE(filter.is_reserved("blog"));
    EXPECT_TRUE(filter.is_reserved("BLOG"));
    EXPECT_FALSE(filter.add_reserved("blog", "again"));
    EXPECT_EQ(filter.size(), default_reserved_words().size() + 1);

    bool stored_lower = false;
    for (const auto& entry : backend.reserved_identifiers()) {
        if (entry.value == "blog") stored_lower = true;
    }
    EXPECT_TRUE(stored_lower);
}

TEST_F(ReservedFilterTest, AddReservedRequiresValueAndReason) {
    ReservedWordFilter filter(backend);
    EXPECT_THROW(filter.add_reserved("", "reason"), InvalidArgumentError);
    EXPECT_THROW(filter.add_reserved("shop", ""), InvalidArgumentError);
}

TEST_F(ReservedFilterTest, ReloadPicksUpStoreChanges) {
    ReservedWordFilter filter(backend);
    EXPECT_FALSE(filter.is_reserved("zzzz"));

    // written by another process; the cached set does not see it yet
    backend.add_reserved("zzzz", "added elsewhere");
    EXPECT_FALSE(filter.is_reserved("zzzz"));

    EXPECT_EQ(filter.reload(), default_reserved_words().size() + 1);
    EXPECT_TRUE(filter.is_reserved("zzzz"));
}

TEST_F(ReservedFilterTest, EmptyStoreReservesNothing) {
    MemoryBackend empty;
    ReservedWordFilter filter(empty);
    EXPECT_EQ(filter.size(), 0u);
    EXPECT_FALSE(filter.is_reserved("admin"));
}
