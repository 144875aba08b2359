// =============================================================================
// Record Metadata Tests
// =============================================================================

#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "shortkey/error.hpp"
#include "shortkey/metadata.hpp"

using namespace shortkey;

class MetadataTest : public ::testing::Test {};

TEST_F(MetadataTest, SetAndGet) {
    Metadata md;
    md.set("camera", std::string("x100"));
    md.set("width", int64_t{4000});
    md.set("hdr", true);

    auto camera = md.get("camera");
    ASSERT_TRUE(camera.has_value());
    EXPECT_EQ(std::get<std::string>(*camera), "x100");
    EXPECT_EQ(std::get<int64_t>(*md.get("width")), 4000);
    EXPECT_TRUE(std::get<bool>(*md.get("hdr")));
    EXPECT_FALSE(md.get("missing").has_value());
}

TEST_F(MetadataTest, RejectsBadKeys) {
    Metadata md;
    EXPECT_THROW(md.set("", std::string("x")), InvalidArgumentError);
    EXPECT_THROW(md.set("has space", std::string("x")), InvalidArgumentError);
    EXPECT_THROW(md.set(std::string(Metadata::MAX_KEY_LENGTH + 1, 'k'), std::string("x")),
                 InvalidArgumentError);
    EXPECT_TRUE(md.empty());
}

TEST_F(MetadataTest, FieldLimit) {
    Metadata md;
    for (size_t i = 0; i < Metadata::MAX_FIELDS; ++i) {
        md.set("k" + std::to_string(i), int64_t(i));
    }
    EXPECT_THROW(md.set("one_more", int64_t{1}), InvalidArgumentError);
    // overwriting an existing key is still allowed
    EXPECT_NO_THROW(md.set("k0", int64_t{42}));
}

TEST_F(MetadataTest, TagsAreDeduplicated) {
    Metadata md;
    md.add_tag("holiday");
    md.add_tag("holiday");
    md.add_tag("beach");
    ASSERT_EQ(md.tags().size(), 2u);
    EXPECT_EQ(md.tags()[0], "holiday");
    EXPECT_THROW(md.add_tag(""), InvalidArgumentError);
}

TEST_F(MetadataTest, JsonLayout) {
    Metadata md;
    md.set("camera", std::string("x100"));
    md.add_tag("holiday");
    EXPECT_EQ(md.to_json(), R"({"fields":{"camera":"x100"},"tags":["holiday"]})");
}

TEST_F(MetadataTest, JsonRoundTrip) {
    Metadata md;
    md.set("camera", std::string("x100"));
    md.set("iso", int64_t{200});
    md.set("exposure", 0.125);
    md.set("flash", false);
    md.add_tag("night");

    EXPECT_EQ(Metadata::from_json(md.to_json()), md);
}

TEST_F(MetadataTest, FromJsonRejectsUntypedPayloads) {
    EXPECT_THROW(Metadata::from_json("not json"), InvalidArgumentError);
    EXPECT_THROW(Metadata::from_json("[1, 2]"), InvalidArgumentError);
    EXPECT_THROW(Metadata::from_json(R"({"fields": {"nested": {"a": 1}}})"), InvalidArgumentError);
    EXPECT_THROW(Metadata::from_json(R"({"extra": 1})"), InvalidArgumentError);
    EXPECT_THROW(Metadata::from_json(R"({"tags": [1]})"), InvalidArgumentError);
}

TEST_F(MetadataTest, FromJsonRejectsIntegersPastInt64) {
    EXPECT_THROW(Metadata::from_json(R"({"fields": {"frames": 9223372036854775808}})"), InvalidArgumentError);
    EXPECT_THROW(Metadata::from_json(R"({"fields": {"frames": 18446744073709551615}})"), InvalidArgumentError);

    Metadata md = Metadata::from_json(R"({"fields": {"frames": 9223372036854775807}})");
    ASSERT_TRUE(md.get("frames").has_value());
    EXPECT_EQ(std::get<int64_t>(*md.get("frames")), std::numeric_limits<int64_t>::max());
}
