/// @file node.hpp
/// @brief Node type: a typed record inside a document.

#pragma once

#include <docsnap-cpp/types.hpp>
#include <docsnap-cpp/value.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace docsnap_cpp {

/// A typed record stored in a Document.
///
/// The node type names one of the node types declared by the document's
/// schema. Properties are ordered by name so two equal nodes always
/// serialize identically.
struct Node {
    NodeId id;                                ///< Unique id within the document.
    std::string type;                         ///< Node type declared by the schema.
    std::map<std::string, Value> properties;  ///< Property values by name.

    /// Get a property, or nullopt if it is not set.
    auto get(std::string_view property) const -> std::optional<Value> {
        auto it = properties.find(std::string{property});
        if (it == properties.end()) return std::nullopt;
        return it->second;
    }

    auto operator==(const Node&) const -> bool = default;
};

}  // namespace docsnap_cpp
