#include <docsnap-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace docsnap_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_arguments),       "invalid_arguments");
    EXPECT_EQ(to_string_view(ErrorKind::snapshot_store_required), "snapshot_store_required");
    EXPECT_EQ(to_string_view(ErrorKind::schema_not_found),        "schema_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::document_not_found),      "document_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_change),          "invalid_change");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation),       "invalid_operation");
    EXPECT_EQ(to_string_view(ErrorKind::decoding_error),          "decoding_error");
    EXPECT_EQ(to_string_view(ErrorKind::storage_error),           "storage_error");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::schema_not_found, "Schema note not found"};
    const auto e2 = Error{ErrorKind::schema_not_found, "Schema note not found"};
    const auto e3 = Error{ErrorKind::document_not_found, "Schema note not found"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::storage_error, "foo"};
    const auto e2 = Error{ErrorKind::storage_error, "bar"};

    EXPECT_NE(e1, e2);
}

// -- SnapshotError ------------------------------------------------------------

TEST(SnapshotError, what_prefixes_the_kind) {
    const auto e = SnapshotError{ErrorKind::invalid_arguments, "args requires a documentId"};
    EXPECT_STREQ(e.what(), "invalid_arguments: args requires a documentId");
}

TEST(SnapshotError, carries_the_structured_error) {
    const auto e = SnapshotError{Error{ErrorKind::decoding_error, "bad frame"}};
    EXPECT_EQ(e.kind(), ErrorKind::decoding_error);
    EXPECT_EQ(e.error().message, "bad frame");
}

TEST(SnapshotError, is_a_runtime_error) {
    try {
        throw SnapshotError{ErrorKind::snapshot_store_required, "no store"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "snapshot_store_required: no store");
        return;
    }
    FAIL() << "SnapshotError was not caught as std::runtime_error";
}
