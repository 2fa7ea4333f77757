#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/document.hpp>
#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/op.hpp>

#include "encoding/utf8.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <ranges>
#include <utility>

namespace docsnap_cpp {

auto property_type_from_string(std::string_view name) -> PropertyType {
    static constexpr auto all = std::array{
        PropertyType::string, PropertyType::integer, PropertyType::number,
        PropertyType::boolean, PropertyType::timestamp, PropertyType::bytes,
        PropertyType::sequence, PropertyType::any,
    };
    auto it = std::ranges::find(all, name, [](PropertyType t) { return to_string_view(t); });
    if (it == all.end()) {
        throw SnapshotError{ErrorKind::invalid_arguments,
                            "unknown property type '" + std::string{name} + "'"};
    }
    return *it;
}

auto conforms(PropertyType type, const Value& value) -> bool {
    if (type == PropertyType::any) return true;
    if (type == PropertyType::sequence) return is_sequence(value);

    const auto* sv = std::get_if<ScalarValue>(&value);
    if (!sv) return false;
    switch (type) {
        case PropertyType::string:    return std::holds_alternative<std::string>(*sv);
        case PropertyType::integer:   return std::holds_alternative<std::int64_t>(*sv);
        case PropertyType::number:
            return std::holds_alternative<double>(*sv) || std::holds_alternative<std::int64_t>(*sv);
        case PropertyType::boolean:   return std::holds_alternative<bool>(*sv);
        case PropertyType::timestamp: return std::holds_alternative<Timestamp>(*sv);
        case PropertyType::bytes:     return std::holds_alternative<Bytes>(*sv);
        case PropertyType::sequence:
        case PropertyType::any:       break;
    }
    return true;
}

auto is_storable(const Value& value) -> bool {
    auto storable = [](const ScalarValue& sv) {
        return std::visit(overload{
            [](double d) { return std::isfinite(d); },
            [](const std::string& text) { return encoding::is_valid_utf8(text); },
            [](const auto&) { return true; },
        }, sv);
    };
    return std::visit(overload{
        [&](const ScalarValue& sv) { return storable(sv); },
        [&](const Sequence& seq) { return std::ranges::all_of(seq, storable); },
    }, value);
}

auto default_value(PropertyType type) -> Value {
    switch (type) {
        case PropertyType::string:    return ScalarValue{std::string{}};
        case PropertyType::integer:   return ScalarValue{std::int64_t{0}};
        case PropertyType::number:    return ScalarValue{0.0};
        case PropertyType::boolean:   return ScalarValue{false};
        case PropertyType::timestamp: return ScalarValue{Timestamp{}};
        case PropertyType::bytes:     return ScalarValue{Bytes{}};
        case PropertyType::sequence:  return Sequence{};
        case PropertyType::any:       break;
    }
    return ScalarValue{Null{}};
}

// -- DocumentSchema -----------------------------------------------------------

auto DocumentSchema::create_document() const -> Document {
    return Document{shared_from_this()};
}

// -- NodeSchema ---------------------------------------------------------------

NodeSchema::NodeSchema(std::string name, std::vector<NodeType> node_types,
                       std::vector<Node> seed_nodes)
    : name_{std::move(name)}, seed_nodes_{std::move(seed_nodes)} {
    if (name_.empty()) {
        throw SnapshotError{ErrorKind::invalid_arguments, "schema name must not be empty"};
    }
    for (auto& type : node_types) {
        if (type.name.empty()) {
            throw SnapshotError{ErrorKind::invalid_arguments,
                                "schema '" + name_ + "' declares a node type without a name"};
        }
        for (auto& [property, def] : type.properties) {
            // An unset default takes the zero value of the declared type
            if (def.default_value == Value{} && def.type != PropertyType::any) {
                def.default_value = default_value(def.type);
            }
            if (!conforms(def.type, def.default_value)) {
                throw SnapshotError{ErrorKind::invalid_arguments,
                    "default of '" + type.name + "." + property + "' is not a "
                    + std::string{to_string_view(def.type)}};
            }
            if (!is_storable(def.default_value)) {
                throw SnapshotError{ErrorKind::invalid_arguments,
                    "default of '" + type.name + "." + property
                    + "' is not a finite number or UTF-8 text"};
            }
        }
        if (node_types_.contains(type.name)) {
            throw SnapshotError{ErrorKind::invalid_arguments,
                                "schema '" + name_ + "' declares node type '" + type.name + "' twice"};
        }
        auto key = type.name;
        node_types_.emplace(std::move(key), std::move(type));
    }
}

auto NodeSchema::find_node_type(std::string_view type) const -> const NodeType* {
    auto it = node_types_.find(type);
    return it != node_types_.end() ? &it->second : nullptr;
}

auto NodeSchema::create_document() const -> Document {
    auto doc = DocumentSchema::create_document();
    for (const auto& node : seed_nodes_) {
        doc.apply(create_node(node));
    }
    return doc;
}

auto NodeSchema::node_types() const -> std::vector<NodeType> {
    auto result = std::vector<NodeType>{};
    result.reserve(node_types_.size());
    std::ranges::transform(node_types_, std::back_inserter(result),
        [](const auto& pair) { return pair.second; });
    return result;
}

// -- SchemaRegistry -----------------------------------------------------------

void SchemaRegistry::add(std::shared_ptr<const DocumentSchema> schema) {
    if (!schema) {
        throw SnapshotError{ErrorKind::invalid_arguments, "cannot register a null schema"};
    }
    auto name = schema->name();
    if (!schemas_.emplace(name, std::move(schema)).second) {
        throw SnapshotError{ErrorKind::invalid_arguments,
                            "schema '" + name + "' is already registered"};
    }
}

auto SchemaRegistry::find(std::string_view schema_name) const
    -> std::shared_ptr<const DocumentSchema> {
    auto it = schemas_.find(schema_name);
    return it != schemas_.end() ? it->second : nullptr;
}

auto SchemaRegistry::contains(std::string_view schema_name) const -> bool {
    return schemas_.find(schema_name) != schemas_.end();
}

auto SchemaRegistry::names() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(schemas_.size());
    std::ranges::transform(schemas_, std::back_inserter(result),
        [](const auto& pair) { return pair.first; });
    return result;
}

auto SchemaRegistry::create_instance(std::string_view schema_name) const -> Document {
    auto schema = find(schema_name);
    if (!schema) {
        throw SnapshotError{ErrorKind::schema_not_found,
                            "Schema " + std::string{schema_name} + " not found"};
    }
    return schema->create_document();
}

}  // namespace docsnap_cpp
