#pragma once

// Internal header, not installed. Implementation detail of Document.

#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/node.hpp>
#include <docsnap-cpp/op.hpp>
#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/value.hpp>

#include "encoding/utf8.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace docsnap_cpp::detail {

[[noreturn]] inline void reject(std::string message) {
    throw SnapshotError{ErrorKind::invalid_operation, std::move(message)};
}

inline auto unstorable(const std::string& node_id, const std::string& property) -> std::string {
    return "value for '" + node_id + "." + property + "' is not a finite number or UTF-8 text";
}

// The complete internal state of a Document.
struct DocState {
    std::shared_ptr<const DocumentSchema> schema;
    std::map<NodeId, Node, std::less<>> nodes;

    explicit DocState(std::shared_ptr<const DocumentSchema> s) : schema{std::move(s)} {}

    auto find_node(std::string_view id) -> Node* {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }

    auto find_node(std::string_view id) const -> const Node* {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }

    // Resolve the declared definition of `property` on `node`.
    auto property_def(const Node& node, const std::string& property) const -> const PropertyDef& {
        const auto* type = schema->find_node_type(node.type);
        if (!type) reject("node type '" + node.type + "' is not declared by schema '" + schema->name() + "'");
        auto it = type->properties.find(property);
        if (it == type->properties.end()) {
            reject("node type '" + node.type + "' has no property '" + property + "'");
        }
        return it->second;
    }

    // -- Operations -----------------------------------------------------------

    void apply(const Op& op) {
        switch (op.action) {
            case OpType::create: return create(op);
            case OpType::del:    return remove(op);
            case OpType::set:    return set(op);
            case OpType::update: return update(op);
        }
        reject("unknown operation type");
    }

    void create(const Op& op) {
        if (!op.node) reject("create operation carries no node");
        const auto& input = *op.node;
        if (input.id.empty()) reject("create operation has an empty node id");
        if (!encoding::is_valid_utf8(input.id)) reject("node id is not valid UTF-8");
        if (!op.path.empty() && op.path.front() != input.id) {
            reject("create path '" + op.path.front() + "' does not match node id '" + input.id + "'");
        }
        if (nodes.contains(input.id)) reject("node '" + input.id + "' already exists");

        const auto* type = schema->find_node_type(input.type);
        if (!type) {
            reject("node type '" + input.type + "' is not declared by schema '" + schema->name() + "'");
        }

        auto node = Node{.id = input.id, .type = input.type, .properties = {}};
        for (const auto& [name, value] : input.properties) {
            auto def = type->properties.find(name);
            if (def == type->properties.end()) {
                reject("node type '" + input.type + "' has no property '" + name + "'");
            }
            if (!conforms(def->second.type, value)) {
                reject("property '" + name + "' of node '" + input.id + "' expects "
                       + std::string{to_string_view(def->second.type)});
            }
            if (!is_storable(value)) reject(unstorable(input.id, name));
            node.properties.emplace(name, value);
        }
        for (const auto& [name, def] : type->properties) {
            node.properties.try_emplace(name, def.default_value);
        }
        nodes.emplace(node.id, std::move(node));
    }

    void remove(const Op& op) {
        if (op.path.empty()) reject("delete operation has an empty path");
        auto it = nodes.find(op.path.front());
        if (it == nodes.end()) reject("cannot delete missing node '" + op.path.front() + "'");
        nodes.erase(it);
    }

    auto target(const Op& op) -> std::pair<Node*, const PropertyDef*> {
        if (op.path.size() != 2) {
            reject(std::string{to_string_view(op.action)} + " operation needs a {node, property} path");
        }
        auto* node = find_node(op.path[0]);
        if (!node) reject("node '" + op.path[0] + "' does not exist");
        return {node, &property_def(*node, op.path[1])};
    }

    void set(const Op& op) {
        auto [node, def] = target(op);
        if (!conforms(def->type, op.value)) {
            reject("property '" + op.path[1] + "' of node '" + op.path[0] + "' expects "
                   + std::string{to_string_view(def->type)});
        }
        if (!is_storable(op.value)) reject(unstorable(op.path[0], op.path[1]));
        node->properties.insert_or_assign(op.path[1], op.value);
    }

    void update(const Op& op) {
        auto [node, def] = target(op);
        auto it = node->properties.find(op.path[1]);
        if (it == node->properties.end()) reject("node '" + op.path[0] + "' has no value for '" + op.path[1] + "'");
        auto& current = it->second;

        auto splice = [&](auto& target_seq, const auto& insert) {
            if (op.offset > target_seq.size() || op.remove > target_seq.size() - op.offset) {
                reject("splice [" + std::to_string(op.offset) + ", +" + std::to_string(op.remove)
                       + ") is out of range for '" + op.path[0] + "." + op.path[1]
                       + "' of length " + std::to_string(target_seq.size()));
            }
            auto first = target_seq.begin() + static_cast<std::ptrdiff_t>(op.offset);
            first = target_seq.erase(first, first + static_cast<std::ptrdiff_t>(op.remove));
            target_seq.insert(first, insert.begin(), insert.end());
        };

        if (auto* text = std::get_if<std::string>(std::get_if<ScalarValue>(&current))) {
            auto insert = get_scalar<std::string>(op.value);
            if (!insert) reject("text splice of '" + op.path[0] + "." + op.path[1] + "' needs a string");
            auto updated = *text;
            splice(updated, *insert);
            if (!encoding::is_valid_utf8(updated)) {
                reject("splice of '" + op.path[0] + "." + op.path[1] + "' splits a UTF-8 character");
            }
            *text = std::move(updated);
            return;
        }
        if (auto* seq = std::get_if<Sequence>(&current)) {
            auto insert = get_sequence(op.value);
            if (!insert) reject("sequence splice of '" + op.path[0] + "." + op.path[1] + "' needs a sequence");
            if (!is_storable(*insert)) reject(unstorable(op.path[0], op.path[1]));
            auto updated = *seq;
            splice(updated, *insert);
            *seq = std::move(updated);
            return;
        }
        reject("property '" + op.path[1] + "' of node '" + op.path[0] + "' of type "
               + std::string{to_string_view(def->type)} + " cannot be spliced");
    }
};

}  // namespace docsnap_cpp::detail
