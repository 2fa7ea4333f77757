#pragma once

// Shared "note" schema and change history used across the tests.

#include <docsnap-cpp/change.hpp>
#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/stores.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsnap_cpp::test {

// A note is a "body" container holding the ids of its paragraphs, plus a
// "meta" node with a title and a revision counter.
inline auto make_note_schema() -> std::shared_ptr<NodeSchema> {
    return std::make_shared<NodeSchema>("note",
        std::vector<NodeType>{
            {.name = "container",
             .properties = {{"nodes", {.type = PropertyType::sequence}}}},
            {.name = "paragraph",
             .properties = {{"content", {.type = PropertyType::string}}}},
            {.name = "meta",
             .properties = {{"title", {.type = PropertyType::string,
                                       .default_value = ScalarValue{std::string{"Untitled"}}}},
                            {"revision", {.type = PropertyType::integer}}}},
        },
        std::vector<Node>{
            {.id = "body", .type = "container", .properties = {}},
            {.id = "meta", .type = "meta", .properties = {}},
        });
}

inline auto paragraph_id(Version version) -> std::string {
    return "p" + std::to_string(version);
}

// The change committed at `version`: appends paragraph p<version> to the
// body and bumps the revision.
inline auto make_note_change(const DocumentId& document_id, Version version) -> Change {
    auto id = paragraph_id(version);
    return Change{
        .document_id = document_id,
        .version = version,
        .ops = {
            create_node(Node{.id = id, .type = "paragraph",
                             .properties = {{"content", ScalarValue{"text " + std::to_string(version)}}}}),
            splice_property("body", "nodes", static_cast<std::size_t>(version - 1), 0,
                            Sequence{ScalarValue{id}}),
            set_property("meta", "revision", ScalarValue{static_cast<std::int64_t>(version)}),
        },
        .timestamp = 1700000000000 + static_cast<std::int64_t>(version),
        .message = std::nullopt,
    };
}

// Record `document_id` with `count` changes in the stores.
inline void populate_note(MemoryDocumentStore& documents, MemoryChangeStore& changes,
                          const DocumentId& document_id, Version count) {
    documents.create_document(DocumentRecord{
        .document_id = document_id, .schema_name = "note", .version = 0});
    for (auto v = Version{1}; v <= count; ++v) {
        changes.add_change(make_note_change(document_id, v));
        documents.update_version(document_id, v);
    }
}

}  // namespace docsnap_cpp::test
