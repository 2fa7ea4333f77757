/// @file document.hpp
/// @brief The Document class -- a live, mutable document instance.

#pragma once

#include <docsnap-cpp/node.hpp>
#include <docsnap-cpp/op.hpp>
#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/types.hpp>
#include <docsnap-cpp/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsnap_cpp {

namespace detail {
struct DocState;
}  // namespace detail

/// A live, mutable document instance of a schema.
///
/// A Document is a set of typed nodes keyed by id. It is advanced by
/// applying operations in the order they were committed. Instances are
/// created by a schema (empty, version 0) and either mutated by replaying
/// changes or populated from a snapshot through import_document().
///
/// Documents are plain values with no internal synchronization: a
/// reconstruction owns its instance exclusively and discards it after
/// export.
///
/// @code
/// auto doc = registry.create_instance("note");
/// doc.apply(create_node(Node{.id = "p1", .type = "paragraph"}));
/// doc.apply(splice_property("p1", "content", 0, 0, std::string{"Hello"}));
/// auto text = doc.get<std::string>("p1", "content");
/// @endcode
class Document {
public:
    /// Construct an instance with no nodes. Prefer DocumentSchema::create_document(),
    /// which also adds the schema's seed nodes.
    /// @throws SnapshotError (invalid_arguments) if schema is null.
    explicit Document(std::shared_ptr<const DocumentSchema> schema);

    ~Document();

    Document(Document&&) noexcept;
    auto operator=(Document&&) noexcept -> Document&;

    /// Deep-copy a document. The copy is independent and shares no state.
    Document(const Document&);
    /// Deep-copy assignment.
    auto operator=(const Document&) -> Document&;

    // -- Schema ---------------------------------------------------------------

    /// The schema this instance was created from.
    auto schema() const -> const DocumentSchema&;

    /// Shorthand for schema().name().
    auto schema_name() const -> const std::string&;

    // -- Mutation -------------------------------------------------------------

    /// Apply one operation.
    ///
    /// The document is left unchanged if the operation is rejected.
    /// @throws SnapshotError (invalid_operation) if the operation does not
    ///   apply: unknown node or node type, duplicate id, undeclared
    ///   property, value of the wrong type, or splice out of range.
    void apply(const Op& op);

    /// Remove every node, including seed nodes.
    void clear();

    // -- Reading --------------------------------------------------------------

    /// Check whether a node exists.
    auto contains(std::string_view id) const -> bool;

    /// Get a copy of a node, or nullopt if it does not exist.
    auto get(std::string_view id) const -> std::optional<Node>;

    /// Get a node property, or nullopt if the node or property does not exist.
    auto get(std::string_view id, std::string_view property) const -> std::optional<Value>;

    /// Get a typed scalar property.
    /// @code
    /// auto title = doc.get<std::string>("meta", "title");
    /// @endcode
    template <typename T>
    auto get(std::string_view id, std::string_view property) const -> std::optional<T> {
        return get_scalar<T>(get(id, property));
    }

    /// All node ids, sorted.
    auto node_ids() const -> std::vector<NodeId>;

    /// All nodes, sorted by id.
    auto nodes() const -> std::vector<Node>;

    /// Number of nodes.
    auto size() const -> std::size_t;

    /// Check whether the document has no nodes.
    auto empty() const -> bool { return size() == 0; }

private:
    std::unique_ptr<detail::DocState> state_;
};

}  // namespace docsnap_cpp
