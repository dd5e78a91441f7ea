#include <gtest/gtest.h>
#include "protocol/announce.hpp"
#include <string>

using namespace protocol;

// -----------------------
// ENCODING
// -----------------------
TEST(AnnounceTest, EncodesPipeDelimitedFields) {
    Announcement a{"a1b2c3d4e5f6", "laptop", 8080};
    EXPECT_EQ(encode_announcement(a), "PYDROP_ANNOUNCE|a1b2c3d4e5f6|laptop|8080");
}

TEST(AnnounceTest, PipeInNameDoesNotShiftFields) {
    Announcement a{"a1b2c3d4e5f6", "my|box", 9000};
    std::string encoded = encode_announcement(a);
    EXPECT_EQ(encoded, "PYDROP_ANNOUNCE|a1b2c3d4e5f6|my_box|9000");

    auto parsed = parse_announcement(encoded);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->http_port, 9000);
}

// -----------------------
// PARSING
// -----------------------
TEST(AnnounceTest, ParsesValidMessage) {
    auto parsed = parse_announcement("PYDROP_ANNOUNCE|device123|MyDevice|8080");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, "device123");
    EXPECT_EQ(parsed->name, "MyDevice");
    EXPECT_EQ(parsed->http_port, 8080);
}

TEST(AnnounceTest, IgnoresExtraFields) {
    auto parsed = parse_announcement("PYDROP_ANNOUNCE|device123|MyDevice|8080|v2|whatever");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, "device123");
    EXPECT_EQ(parsed->http_port, 8080);
}

TEST(AnnounceTest, TrimsTrailingNewline) {
    auto parsed = parse_announcement("PYDROP_ANNOUNCE|device123|MyDevice|8080\r\n");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->http_port, 8080);
}

TEST(AnnounceTest, AcceptsUtf8Name) {
    auto parsed = parse_announcement("PYDROP_ANNOUNCE|abc|Caf\xC3\xA9 PC|8080");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "Caf\xC3\xA9 PC");
}

TEST(AnnounceTest, RejectsMissingPort) {
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE|device123|MyDevice").has_value());
}

TEST(AnnounceTest, RejectsWrongPrefix) {
    EXPECT_FALSE(parse_announcement("OTHER|device123|MyDevice|8080").has_value());
    EXPECT_FALSE(parse_announcement("PYDROP_DISCOVER|device123|MyDevice|8080").has_value());
}

TEST(AnnounceTest, RejectsWrongDelimiter) {
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE;device123;MyDevice;8080").has_value());
}

TEST(AnnounceTest, RejectsBadPorts) {
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE|id|name|http").has_value());
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE|id|name|0").has_value());
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE|id|name|70000").has_value());
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE|id|name|-1").has_value());
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE|id|name|").has_value());
}

TEST(AnnounceTest, RejectsEmptyId) {
    EXPECT_FALSE(parse_announcement("PYDROP_ANNOUNCE||name|8080").has_value());
}

TEST(AnnounceTest, RejectsInvalidUtf8) {
    std::string payload = "PYDROP_ANNOUNCE|id|bad\xFF\xFEname|8080";
    EXPECT_FALSE(parse_announcement(payload).has_value());

    std::string truncated = "PYDROP_ANNOUNCE|id|name\xC3|8080";
    EXPECT_FALSE(parse_announcement(truncated).has_value());
}

TEST(AnnounceTest, RejectsEmbeddedControlBytes) {
    std::string payload("PYDROP_ANNOUNCE|id|na\0me|8080", 29);
    EXPECT_FALSE(parse_announcement(payload).has_value());
}

TEST(AnnounceTest, RejectsEmptyAndOversizedPayloads) {
    EXPECT_FALSE(parse_announcement("").has_value());
    std::string huge = "PYDROP_ANNOUNCE|id|" + std::string(2000, 'x') + "|8080";
    EXPECT_FALSE(parse_announcement(huge).has_value());
}
