/// @file change.hpp
/// @brief Change type: the operations committed at one document version.

#pragma once

#include <docsnap-cpp/op.hpp>
#include <docsnap-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docsnap_cpp {

/// An immutable record of one committed mutation.
///
/// Each change belongs to exactly one document and occupies exactly one
/// version slot. The change log is append-only: changes are never edited
/// or removed once recorded, and replaying them in version order is the
/// only source of truth for a document's state.
struct Change {
    DocumentId document_id;              ///< The document this change belongs to.
    Version version{0};                  ///< Version slot (1-based).
    std::vector<Op> ops;                 ///< Operations, in the order they were recorded.
    std::int64_t timestamp{0};           ///< Unix timestamp in milliseconds.
    std::optional<std::string> message;  ///< Optional human-readable commit message.

    auto operator==(const Change&) const -> bool = default;
};

}  // namespace docsnap_cpp
