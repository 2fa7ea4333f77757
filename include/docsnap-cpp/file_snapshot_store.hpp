/// @file file_snapshot_store.hpp
/// @brief SnapshotStore persisting snapshots as compressed files on disk.

#pragma once

#include <docsnap-cpp/snapshot.hpp>
#include <docsnap-cpp/stores.hpp>
#include <docsnap-cpp/types.hpp>

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace docsnap_cpp {

/// SnapshotStore backed by a directory tree.
///
/// Layout: `<root>/<hex(document_id)>/<version>.snap`, where the version
/// is zero-padded to 20 digits so lexical and numeric order agree. Each
/// file holds the snapshot's JSON serialization in a zlib frame. Files
/// are written to a temporary name and renamed into place, so readers
/// never observe a partially written snapshot.
class FileSnapshotStore final : public SnapshotStore {
public:
    /// Open (and create if needed) the store rooted at `root`.
    /// @throws SnapshotError (storage_error) if the directory cannot be created.
    explicit FileSnapshotStore(std::filesystem::path root);

    /// @throws SnapshotError (decoding_error) if the matching file is corrupt,
    ///   (storage_error) if it cannot be read.
    auto get_snapshot(const DocumentId& document_id, Version version,
                      bool find_closest) const -> std::optional<Snapshot> override;

    /// @throws SnapshotError (storage_error) if the snapshot cannot be
    ///   serialized or the file cannot be written.
    void save_snapshot(const Snapshot& snapshot) override;

    /// Remove a snapshot file. Returns false if it did not exist.
    auto delete_snapshot(const DocumentId& document_id, Version version) -> bool;

    /// Versions with a stored snapshot, ascending.
    auto snapshot_versions(const DocumentId& document_id) const -> std::vector<Version>;

    /// The root directory.
    auto root() const -> const std::filesystem::path& { return root_; }

private:
    auto document_dir(const DocumentId& document_id) const -> std::filesystem::path;
    auto snapshot_path(const DocumentId& document_id, Version version) const -> std::filesystem::path;
    auto read_snapshot(const std::filesystem::path& path) const -> Snapshot;
    // Unordered; callers hold the lock.
    auto list_versions(const DocumentId& document_id) const -> std::vector<Version>;

    std::filesystem::path root_;
    mutable std::shared_mutex mutex_;
};

}  // namespace docsnap_cpp
