/// @file op.hpp
/// @brief Operation types recorded in changes.

#pragma once

#include <docsnap-cpp/node.hpp>
#include <docsnap-cpp/types.hpp>
#include <docsnap-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace docsnap_cpp {

/// The kind of mutation an operation represents.
enum class OpType : std::uint8_t {
    create,  ///< Insert a new node.
    del,     ///< Remove a node.
    set,     ///< Replace a property value.
    update,  ///< Splice a text or sequence property.
};

/// Convert an OpType to its string representation.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::create: return "create";
        case OpType::del:    return "delete";
        case OpType::set:    return "set";
        case OpType::update: return "update";
    }
    return "unknown";
}

/// A single atomic mutation of a document.
///
/// Operations are immutable once recorded in a Change. Which fields are
/// meaningful depends on the action:
///
/// | action | path               | node          | value            | offset/remove |
/// |--------|--------------------|---------------|------------------|---------------|
/// | create | `{id}`             | the new node  | --               | --            |
/// | del    | `{id}`             | removed node  | --               | --            |
/// | set    | `{id, property}`   | --            | new value        | --            |
/// | update | `{id, property}`   | --            | inserted content | splice range  |
///
/// For `update` on a text property the inserted content is a string; on a
/// sequence property it is a Sequence.
struct Op {
    OpType action{OpType::set};   ///< The type of mutation.
    Path path;                    ///< Target node, or node and property.
    std::optional<Node> node{};   ///< Node payload for create/del.
    Value value{};                ///< New value (set) or inserted content (update).
    std::size_t offset{0};        ///< Splice position (update).
    std::size_t remove{0};        ///< Number of elements removed at offset (update).

    auto operator==(const Op&) const -> bool = default;
};

// -- Builders -----------------------------------------------------------------

/// Build a create operation for the given node.
inline auto create_node(Node node) -> Op {
    auto path = Path{node.id};
    return Op{.action = OpType::create, .path = std::move(path), .node = std::move(node)};
}

/// Build a delete operation for the node with the given id.
inline auto delete_node(NodeId id) -> Op {
    return Op{.action = OpType::del, .path = Path{std::move(id)}};
}

/// Build a set operation replacing `property` of node `id`.
inline auto set_property(NodeId id, std::string property, Value value) -> Op {
    return Op{
        .action = OpType::set,
        .path = Path{std::move(id), std::move(property)},
        .value = std::move(value),
    };
}

/// Build an update operation splicing `property` of node `id`.
///
/// @code
/// // Insert "Hello" at the start of a text property
/// auto op = splice_property("p1", "content", 0, 0, std::string{"Hello"});
/// @endcode
inline auto splice_property(NodeId id, std::string property,
                            std::size_t offset, std::size_t remove,
                            Value insert) -> Op {
    return Op{
        .action = OpType::update,
        .path = Path{std::move(id), std::move(property)},
        .value = std::move(insert),
        .offset = offset,
        .remove = remove,
    };
}

}  // namespace docsnap_cpp
