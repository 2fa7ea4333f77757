#include <docsnap-cpp/change_applicator.hpp>
#include <docsnap-cpp/error.hpp>

#include "note_fixture.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docsnap_cpp;

TEST(ApplyChanges, applies_in_order) {
    auto doc = test::make_note_schema()->create_document();
    auto changes = std::vector<Change>{};
    for (auto v = Version{1}; v <= 3; ++v) changes.push_back(test::make_note_change("doc", v));

    apply_changes(doc, changes);

    EXPECT_EQ(doc.get<std::int64_t>("meta", "revision"), 3);
    EXPECT_EQ(doc.get<std::string>("p2", "content"), "text 2");
    auto body = doc.get("body", "nodes");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(get_sequence(*body),
              (Sequence{ScalarValue{std::string{"p1"}}, ScalarValue{std::string{"p2"}},
                        ScalarValue{std::string{"p3"}}}));
}

TEST(ApplyChanges, empty_span_is_a_no_op) {
    auto doc = test::make_note_schema()->create_document();
    auto before = doc.nodes();
    apply_changes(doc, {});
    EXPECT_EQ(doc.nodes(), before);
}

TEST(ApplyChanges, ops_within_a_change_apply_in_recorded_order) {
    auto doc = test::make_note_schema()->create_document();
    auto change = Change{
        .document_id = "doc",
        .version = 1,
        .ops = {
            create_node(Node{.id = "p1", .type = "paragraph", .properties = {}}),
            splice_property("p1", "content", 0, 0, ScalarValue{std::string{"world"}}),
            splice_property("p1", "content", 0, 0, ScalarValue{std::string{"hello "}}),
        },
    };
    apply_changes(doc, std::vector<Change>{change});
    EXPECT_EQ(doc.get<std::string>("p1", "content"), "hello world");
}

TEST(ApplyChanges, failure_propagates_unchanged) {
    auto doc = test::make_note_schema()->create_document();
    auto changes = std::vector<Change>{
        test::make_note_change("doc", 1),
        Change{.document_id = "doc", .version = 2, .ops = {delete_node("ghost")}},
        test::make_note_change("doc", 3),
    };
    try {
        apply_changes(doc, changes);
        FAIL() << "expected SnapshotError";
    } catch (const SnapshotError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
    // The first change stays applied, the third never ran
    EXPECT_TRUE(doc.contains("p1"));
    EXPECT_FALSE(doc.contains("p3"));
}
