/// @file snapshot.hpp
/// @brief Snapshot and DocumentRecord types.

#pragma once

#include <docsnap-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace docsnap_cpp {

/// A fully materialized document export at one version.
///
/// Snapshots are a cache: they can always be rebuilt from the change log
/// and are never edited once stored. `data` is the output of
/// export_document().
struct Snapshot {
    DocumentId document_id;  ///< The document this snapshot belongs to.
    Version version{0};      ///< The version the data reflects.
    nlohmann::json data;     ///< Exported document state.

    auto operator==(const Snapshot&) const -> bool = default;
};

/// Metadata pointer to a document's current state.
struct DocumentRecord {
    DocumentId document_id;  ///< The document id.
    std::string schema_name; ///< Schema used to construct instances.
    Version version{0};      ///< Latest committed version.

    auto operator==(const DocumentRecord&) const -> bool = default;
};

}  // namespace docsnap_cpp
