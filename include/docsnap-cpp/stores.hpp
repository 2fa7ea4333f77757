/// @file stores.hpp
/// @brief Collaborator interfaces consumed by the snapshot engine, plus
///        in-memory implementations.

#pragma once

#include <docsnap-cpp/change.hpp>
#include <docsnap-cpp/snapshot.hpp>
#include <docsnap-cpp/types.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace docsnap_cpp {

// =============================================================================
// Interfaces
// =============================================================================

/// Per-document metadata: schema and current version.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /// Get the record of a document.
    /// @throws SnapshotError (document_not_found) if the id is unknown.
    virtual auto get_document(const DocumentId& document_id) const -> DocumentRecord = 0;
};

/// Append-only, version-ordered log of changes per document.
class ChangeStore {
public:
    virtual ~ChangeStore() = default;

    /// Get the changes with versions in `(since_version, to_version]`, in
    /// ascending version order. An omitted `to_version` means "through
    /// the latest change". The result must be gap-free.
    virtual auto get_changes(const DocumentId& document_id, Version since_version,
                             std::optional<Version> to_version) const -> std::vector<Change> = 0;
};

/// Persistent cache of materialized snapshots keyed by (document, version).
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /// Get the snapshot at `version`. With `find_closest`, return the
    /// snapshot with the highest version at or before `version` instead.
    /// @return nullopt if no matching snapshot exists (not an error).
    virtual auto get_snapshot(const DocumentId& document_id, Version version,
                              bool find_closest) const -> std::optional<Snapshot> = 0;

    /// Store a snapshot, replacing any snapshot at the same (document, version).
    virtual void save_snapshot(const Snapshot& snapshot) = 0;
};

// =============================================================================
// In-memory implementations
// =============================================================================

/// Thread-safe in-memory DocumentStore.
class MemoryDocumentStore final : public DocumentStore {
public:
    auto get_document(const DocumentId& document_id) const -> DocumentRecord override;

    /// Add a new document record.
    /// @throws SnapshotError (invalid_arguments) on an empty id or schema
    ///   name, or if the document already exists.
    void create_document(DocumentRecord record);

    /// Advance the current version of a document.
    /// @throws SnapshotError (document_not_found) for unknown ids and
    ///   (invalid_arguments) if `version` would move the document backwards.
    void update_version(const DocumentId& document_id, Version version);

    /// Remove a document record. Returns false if it did not exist.
    auto delete_document(const DocumentId& document_id) -> bool;

private:
    mutable std::shared_mutex mutex_;
    std::map<DocumentId, DocumentRecord> documents_;
};

/// Thread-safe in-memory ChangeStore.
class MemoryChangeStore final : public ChangeStore {
public:
    auto get_changes(const DocumentId& document_id, Version since_version,
                     std::optional<Version> to_version) const -> std::vector<Change> override;

    /// Append a change. Its version must directly follow the latest one.
    /// @return The new latest version.
    /// @throws SnapshotError (invalid_change) on an empty document id or a
    ///   version that is not latest + 1.
    auto add_change(Change change) -> Version;

    /// Latest version recorded for a document (0 if none).
    auto latest_version(const DocumentId& document_id) const -> Version;

    /// Remove every change of a document. Returns the number removed.
    auto delete_changes(const DocumentId& document_id) -> std::size_t;

private:
    mutable std::shared_mutex mutex_;
    std::map<DocumentId, std::vector<Change>> changes_;  // index i holds version i + 1
};

/// Thread-safe in-memory SnapshotStore.
class MemorySnapshotStore final : public SnapshotStore {
public:
    auto get_snapshot(const DocumentId& document_id, Version version,
                      bool find_closest) const -> std::optional<Snapshot> override;

    void save_snapshot(const Snapshot& snapshot) override;

    /// Remove a snapshot. Returns false if it did not exist.
    auto delete_snapshot(const DocumentId& document_id, Version version) -> bool;

    /// Versions with a stored snapshot, ascending.
    auto snapshot_versions(const DocumentId& document_id) const -> std::vector<Version>;

private:
    mutable std::shared_mutex mutex_;
    std::map<DocumentId, std::map<Version, Snapshot>> snapshots_;
};

}  // namespace docsnap_cpp
