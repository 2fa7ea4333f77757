/// @file schema.hpp
/// @brief Document schemas and the schema registry (the document factory).

#pragma once

#include <docsnap-cpp/node.hpp>
#include <docsnap-cpp/value.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docsnap_cpp {

class Document;

/// The value type a schema declares for a node property.
enum class PropertyType : std::uint8_t {
    string,     ///< A string; supports splice updates.
    integer,    ///< A 64-bit signed integer.
    number,     ///< A double (integers are accepted).
    boolean,    ///< A bool.
    timestamp,  ///< A Timestamp.
    bytes,      ///< A byte array.
    sequence,   ///< A Sequence of scalars; supports splice updates.
    any,        ///< Any value.
};

/// Convert a PropertyType to its string representation.
constexpr auto to_string_view(PropertyType type) noexcept -> std::string_view {
    switch (type) {
        case PropertyType::string:    return "string";
        case PropertyType::integer:   return "integer";
        case PropertyType::number:    return "number";
        case PropertyType::boolean:   return "boolean";
        case PropertyType::timestamp: return "timestamp";
        case PropertyType::bytes:     return "bytes";
        case PropertyType::sequence:  return "sequence";
        case PropertyType::any:       return "any";
    }
    return "unknown";
}

/// Parse a PropertyType from its string representation.
/// @throws SnapshotError (invalid_arguments) for unknown names.
auto property_type_from_string(std::string_view name) -> PropertyType;

/// Check whether a value conforms to a property type.
auto conforms(PropertyType type, const Value& value) -> bool;

/// Check whether a value can be stored in a snapshot: every number is
/// finite and every string is well-formed UTF-8.
auto is_storable(const Value& value) -> bool;

/// The zero value of a property type ("" for string, 0 for integer, ...).
auto default_value(PropertyType type) -> Value;

/// Declaration of one node property.
struct PropertyDef {
    PropertyType type{PropertyType::any};  ///< Accepted value type.
    Value default_value{};                 ///< Value used when a node omits the property.

    auto operator==(const PropertyDef&) const -> bool = default;
};

/// Declaration of one node type: its name and properties.
struct NodeType {
    std::string name;                                ///< Node type name.
    std::map<std::string, PropertyDef> properties;   ///< Declared properties.

    auto operator==(const NodeType&) const -> bool = default;
};

/// A schema: the capability to construct empty document instances.
///
/// Schemas must be owned by a std::shared_ptr; documents created from a
/// schema keep it alive.
class DocumentSchema : public std::enable_shared_from_this<DocumentSchema> {
public:
    virtual ~DocumentSchema() = default;

    /// The name documents record to identify this schema.
    virtual auto name() const -> const std::string& = 0;

    /// Look up a node type, or nullptr if the schema does not declare it.
    virtual auto find_node_type(std::string_view type) const -> const NodeType* = 0;

    /// Construct an empty document instance (version 0) of this schema.
    virtual auto create_document() const -> Document;
};

/// A schema defined by a list of node types and optional seed nodes.
///
/// Seed nodes are present in every empty instance, e.g. the body
/// container of an article.
///
/// @code
/// auto note = std::make_shared<NodeSchema>("note", std::vector<NodeType>{
///     {.name = "paragraph",
///      .properties = {{"content", {.type = PropertyType::string}}}},
/// });
/// @endcode
class NodeSchema final : public DocumentSchema {
public:
    /// @throws SnapshotError (invalid_arguments) on an empty name or a
    ///   duplicate node type.
    NodeSchema(std::string name, std::vector<NodeType> node_types,
               std::vector<Node> seed_nodes = {});

    auto name() const -> const std::string& override { return name_; }
    auto find_node_type(std::string_view type) const -> const NodeType* override;
    auto create_document() const -> Document override;

    /// All declared node types, ordered by name.
    auto node_types() const -> std::vector<NodeType>;

    /// Nodes present in every empty instance.
    auto seed_nodes() const -> const std::vector<Node>& { return seed_nodes_; }

private:
    std::string name_;
    std::map<std::string, NodeType, std::less<>> node_types_;
    std::vector<Node> seed_nodes_;
};

/// Registry of schemas keyed by name; the document factory.
///
/// Populate the registry before sharing it; lookups are safe to call
/// concurrently, add() is not.
class SchemaRegistry {
public:
    /// Register a schema under its name.
    /// @throws SnapshotError (invalid_arguments) if the schema is null or
    ///   the name is already registered.
    void add(std::shared_ptr<const DocumentSchema> schema);

    /// Look up a schema, or nullptr if none is registered under the name.
    auto find(std::string_view schema_name) const -> std::shared_ptr<const DocumentSchema>;

    /// Check whether a schema is registered under the name.
    auto contains(std::string_view schema_name) const -> bool;

    /// Registered schema names, sorted.
    auto names() const -> std::vector<std::string>;

    /// Construct an empty document instance of the named schema.
    /// @throws SnapshotError (schema_not_found) naming the requested schema.
    auto create_instance(std::string_view schema_name) const -> Document;

private:
    std::map<std::string, std::shared_ptr<const DocumentSchema>, std::less<>> schemas_;
};

}  // namespace docsnap_cpp
