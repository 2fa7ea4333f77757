/// @file json.hpp
/// @brief nlohmann/json serialization and the document codec.
///
/// Provides ADL serialization (to_json/from_json) for the library's value
/// types and the codec that converts between a live Document and its
/// persisted representation (snapshot data).

#pragma once

#include <docsnap-cpp/change.hpp>
#include <docsnap-cpp/document.hpp>
#include <docsnap-cpp/node.hpp>
#include <docsnap-cpp/op.hpp>
#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/snapshot.hpp>
#include <docsnap-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <memory>

namespace docsnap_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Scalars and values -------------------------------------------------------
//
// Null, bool, integers, doubles and strings map to their JSON counterparts.
// Timestamps and bytes use a tagged object:
//   {"__type": "timestamp", "value": 1708000000000}
//   {"__type": "bytes", "value": "<base64>"}
// A Sequence is a JSON array of scalars.

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Timestamp& t);

void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

// -- Document model -----------------------------------------------------------

/// `{"id": ..., "type": ..., "properties": {...}}`
void to_json(nlohmann::json& j, const Node& n);
void from_json(const nlohmann::json& j, Node& n);

/// `{"type": "set", "path": [...], "value": ...}` and friends; see Op.
void to_json(nlohmann::json& j, const Op& op);
void from_json(const nlohmann::json& j, Op& op);

void to_json(nlohmann::json& j, const Change& c);
void from_json(const nlohmann::json& j, Change& c);

void to_json(nlohmann::json& j, const Snapshot& s);
void from_json(const nlohmann::json& j, Snapshot& s);

void to_json(nlohmann::json& j, const DocumentRecord& r);
void from_json(const nlohmann::json& j, DocumentRecord& r);

// -- Schemas ------------------------------------------------------------------

void to_json(nlohmann::json& j, const PropertyDef& d);
void from_json(const nlohmann::json& j, PropertyDef& d);

void to_json(nlohmann::json& j, const NodeSchema& s);

/// Build a NodeSchema from its JSON definition.
///
/// @code
/// {
///   "name": "note",
///   "node_types": {
///     "paragraph": {"content": {"type": "string"}},
///     "container": {"nodes": {"type": "sequence"}}
///   },
///   "seed_nodes": [{"id": "body", "type": "container", "properties": {}}]
/// }
/// @endcode
/// @throws SnapshotError (invalid_arguments) on a malformed definition.
auto schema_from_json(const nlohmann::json& j) -> std::shared_ptr<NodeSchema>;

// =============================================================================
// Document codec
// =============================================================================

/// Export a document as `{"schema": name, "nodes": [node...]}`.
///
/// Nodes are emitted in id order and properties in name order, so two
/// documents with equal state export to equal JSON.
auto export_document(const Document& doc) -> nlohmann::json;

/// Replace the contents of `doc` with the exported state in `data`.
///
/// Existing nodes (including seed nodes) are discarded first. Nodes are
/// recreated through the document's schema, so undeclared node types or
/// mistyped properties are rejected.
/// @return `doc`, for chaining.
/// @throws SnapshotError (decoding_error) if `data` is malformed, names a
///   different schema, or does not fit the schema.
auto import_document(Document& doc, const nlohmann::json& data) -> Document&;

}  // namespace docsnap_cpp
