#include <docsnap-cpp/change.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace docsnap_cpp;

TEST(Change, default_constructed) {
    const auto c = Change{};
    EXPECT_TRUE(c.document_id.empty());
    EXPECT_EQ(c.version, 0u);
    EXPECT_TRUE(c.ops.empty());
    EXPECT_EQ(c.timestamp, 0);
    EXPECT_FALSE(c.message.has_value());
}

TEST(Change, with_ops_and_message) {
    const auto c = Change{
        .document_id = "doc-1",
        .version = 3,
        .ops = {set_property("meta", "title", ScalarValue{std::string{"v3"}})},
        .timestamp = 1700000000000,
        .message = std::string{"rename"},
    };
    EXPECT_EQ(c.version, 3u);
    EXPECT_EQ(c.ops.size(), 1u);
    EXPECT_EQ(c.message, "rename");
}

TEST(Change, equality) {
    auto a = Change{.document_id = "doc-1", .version = 1, .ops = {delete_node("x")}};
    auto b = a;
    EXPECT_EQ(a, b);
    b.version = 2;
    EXPECT_NE(a, b);
}
