/// @file types.hpp
/// @brief Core identity types: DocumentId, Version, NodeId, Path.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace docsnap_cpp {

/// Opaque identifier of a document, stable for the document's lifetime.
///
/// The empty string is never a valid id and is treated as "missing".
using DocumentId = std::string;

/// Position in a document's change history.
///
/// Strictly increasing per document. Version 0 is the empty document
/// before any change has been applied; the change committed first
/// occupies version 1.
using Version = std::uint64_t;

/// Identifier of a node inside a document.
using NodeId = std::string;

/// Address of a node or one of its properties: `{node_id}` or
/// `{node_id, property}`.
using Path = std::vector<std::string>;

}  // namespace docsnap_cpp
