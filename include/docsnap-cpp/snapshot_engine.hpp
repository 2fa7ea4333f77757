/// @file snapshot_engine.hpp
/// @brief SnapshotEngine -- reconstructs documents at any version.

#pragma once

#include <docsnap-cpp/change.hpp>
#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/snapshot.hpp>
#include <docsnap-cpp/stores.hpp>
#include <docsnap-cpp/types.hpp>

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace docsnap_cpp {

/// Collaborators and policy of a SnapshotEngine.
struct SnapshotEngineConfig {
    std::shared_ptr<const SchemaRegistry> schemas;    ///< Document factory.
    std::shared_ptr<const DocumentStore> document_store;
    std::shared_ptr<const ChangeStore> change_store;
    std::shared_ptr<SnapshotStore> snapshot_store;    ///< Optional snapshot cache.
    std::uint64_t frequency{1};                       ///< Snapshot every n-th version.
};

/// Identifies the snapshot to compute.
struct GetSnapshotArgs {
    DocumentId document_id;          ///< Required.
    std::optional<Version> version;  ///< Defaults to the document's latest version.
};

/// Produces the materialized state of a document at a version.
///
/// A snapshot is computed by replaying the document's change log onto an
/// empty instance of its schema. With a snapshot store configured, the
/// replay starts from the closest stored snapshot at or before the target
/// version instead, so its cost is proportional to the number of changes
/// since that snapshot rather than to the whole history.
///
/// The engine holds nothing but its configuration. All methods are const
/// and may run concurrently; each call owns the document instance it
/// builds. Collaborator errors are never retried or suppressed.
///
/// @code
/// auto engine = SnapshotEngine{{
///     .schemas = registry,
///     .document_store = documents,
///     .change_store = changes,
///     .snapshot_store = snapshots,
///     .frequency = 10,
/// }};
/// auto snapshot = engine.get_snapshot({.document_id = "doc-1", .version = 20});
/// @endcode
class SnapshotEngine {
public:
    /// @throws SnapshotError (invalid_arguments) if a required collaborator
    ///   is missing or frequency is 0.
    explicit SnapshotEngine(SnapshotEngineConfig config);

    /// Compute the snapshot of a document at a version without persisting it.
    ///
    /// If a snapshot is stored at exactly the requested version it is
    /// returned as is.
    /// @throws SnapshotError (invalid_arguments) if the document id is empty
    ///   or the version is beyond the document's latest version. Errors of
    ///   the collaborators, the factory and the document propagate.
    auto get_snapshot(const GetSnapshotArgs& args) const -> Snapshot;

    /// Persist a snapshot of the document's current version if `version`
    /// is due under the configured frequency.
    ///
    /// Called by the commit workflow once per committed change with the
    /// newly committed version. Does nothing unless a snapshot store is
    /// configured and `version % frequency == 0`.
    /// @return true if a snapshot was created.
    auto request_snapshot(const DocumentId& document_id, Version version) const -> bool;

    /// Compute a snapshot and persist it in the snapshot store.
    /// @throws SnapshotError (snapshot_store_required) before doing anything
    ///   else if no snapshot store is configured. Otherwise as get_snapshot(),
    ///   plus errors of SnapshotStore::save_snapshot().
    auto create_snapshot(const GetSnapshotArgs& args) const -> Snapshot;

    // -- Async ----------------------------------------------------------------
    //
    // Run the same pipeline on the process-global executor. Errors raised
    // during the pipeline are delivered through the future. The engine must
    // outlive the returned futures.

    auto get_snapshot_async(GetSnapshotArgs args) const -> std::future<Snapshot>;

    auto request_snapshot_async(DocumentId document_id, Version version) const -> std::future<bool>;

    /// @throws SnapshotError (snapshot_store_required) directly, not through
    ///   the future, if no snapshot store is configured.
    auto create_snapshot_async(GetSnapshotArgs args) const -> std::future<Snapshot>;

    // -- Configuration --------------------------------------------------------

    /// Check whether a snapshot store is configured.
    auto has_snapshot_store() const noexcept -> bool { return config_.snapshot_store != nullptr; }

    /// The snapshot frequency.
    auto frequency() const noexcept -> std::uint64_t { return config_.frequency; }

private:
    void require_snapshot_store() const;

    auto compute_snapshot(const GetSnapshotArgs& args) const -> Snapshot;
    auto compute_incremental(const DocumentRecord& record, Version version) const -> Snapshot;
    auto compute_full_replay(const DocumentRecord& record, Version version) const -> Snapshot;
    auto fetch_changes(const DocumentRecord& record, Version since, Version to) const
        -> std::vector<Change>;

    SnapshotEngineConfig config_;
};

}  // namespace docsnap_cpp
