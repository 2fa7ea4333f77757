#include <docsnap-cpp/stores.hpp>
#include <docsnap-cpp/error.hpp>

#include <cstddef>
#include <iterator>
#include <mutex>
#include <string>
#include <utility>

namespace docsnap_cpp {

// -- MemoryDocumentStore ------------------------------------------------------

auto MemoryDocumentStore::get_document(const DocumentId& document_id) const -> DocumentRecord {
    auto lock = std::shared_lock{mutex_};
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        throw SnapshotError{ErrorKind::document_not_found,
                            "document '" + document_id + "' does not exist"};
    }
    return it->second;
}

void MemoryDocumentStore::create_document(DocumentRecord record) {
    if (record.document_id.empty() || record.schema_name.empty()) {
        throw SnapshotError{ErrorKind::invalid_arguments,
                            "a document record needs a document id and a schema name"};
    }
    auto lock = std::unique_lock{mutex_};
    auto id = record.document_id;
    if (!documents_.emplace(id, std::move(record)).second) {
        throw SnapshotError{ErrorKind::invalid_arguments, "document '" + id + "' already exists"};
    }
}

void MemoryDocumentStore::update_version(const DocumentId& document_id, Version version) {
    auto lock = std::unique_lock{mutex_};
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
        throw SnapshotError{ErrorKind::document_not_found,
                            "document '" + document_id + "' does not exist"};
    }
    if (version < it->second.version) {
        throw SnapshotError{ErrorKind::invalid_arguments,
            "document '" + document_id + "' cannot move from version "
            + std::to_string(it->second.version) + " back to " + std::to_string(version)};
    }
    it->second.version = version;
}

auto MemoryDocumentStore::delete_document(const DocumentId& document_id) -> bool {
    auto lock = std::unique_lock{mutex_};
    return documents_.erase(document_id) > 0;
}

// -- MemoryChangeStore --------------------------------------------------------

auto MemoryChangeStore::get_changes(const DocumentId& document_id, Version since_version,
                                    std::optional<Version> to_version) const -> std::vector<Change> {
    auto lock = std::shared_lock{mutex_};
    auto it = changes_.find(document_id);
    if (it == changes_.end()) return {};

    const auto& log = it->second;
    auto last = static_cast<Version>(log.size());
    if (to_version && *to_version < last) last = *to_version;
    if (since_version >= last) return {};

    // Version v is stored at index v - 1
    return std::vector<Change>(log.begin() + static_cast<std::ptrdiff_t>(since_version),
                               log.begin() + static_cast<std::ptrdiff_t>(last));
}

auto MemoryChangeStore::add_change(Change change) -> Version {
    if (change.document_id.empty()) {
        throw SnapshotError{ErrorKind::invalid_change, "a change needs a document id"};
    }
    auto lock = std::unique_lock{mutex_};
    auto& log = changes_[change.document_id];
    auto expected = static_cast<Version>(log.size()) + 1;
    if (change.version != expected) {
        throw SnapshotError{ErrorKind::invalid_change,
            "change for '" + change.document_id + "' has version " + std::to_string(change.version)
            + ", expected " + std::to_string(expected)};
    }
    log.push_back(std::move(change));
    return expected;
}

auto MemoryChangeStore::latest_version(const DocumentId& document_id) const -> Version {
    auto lock = std::shared_lock{mutex_};
    auto it = changes_.find(document_id);
    return it != changes_.end() ? static_cast<Version>(it->second.size()) : 0;
}

auto MemoryChangeStore::delete_changes(const DocumentId& document_id) -> std::size_t {
    auto lock = std::unique_lock{mutex_};
    auto it = changes_.find(document_id);
    if (it == changes_.end()) return 0;
    auto count = it->second.size();
    changes_.erase(it);
    return count;
}

// -- MemorySnapshotStore ------------------------------------------------------

auto MemorySnapshotStore::get_snapshot(const DocumentId& document_id, Version version,
                                       bool find_closest) const -> std::optional<Snapshot> {
    auto lock = std::shared_lock{mutex_};
    auto doc = snapshots_.find(document_id);
    if (doc == snapshots_.end()) return std::nullopt;

    const auto& versions = doc->second;
    if (!find_closest) {
        auto it = versions.find(version);
        if (it == versions.end()) return std::nullopt;
        return it->second;
    }
    auto it = versions.upper_bound(version);
    if (it == versions.begin()) return std::nullopt;
    return std::prev(it)->second;
}

void MemorySnapshotStore::save_snapshot(const Snapshot& snapshot) {
    if (snapshot.document_id.empty()) {
        throw SnapshotError{ErrorKind::invalid_arguments, "a snapshot needs a document id"};
    }
    auto lock = std::unique_lock{mutex_};
    snapshots_[snapshot.document_id].insert_or_assign(snapshot.version, snapshot);
}

auto MemorySnapshotStore::delete_snapshot(const DocumentId& document_id, Version version) -> bool {
    auto lock = std::unique_lock{mutex_};
    auto doc = snapshots_.find(document_id);
    if (doc == snapshots_.end()) return false;
    auto erased = doc->second.erase(version) > 0;
    if (doc->second.empty()) snapshots_.erase(doc);
    return erased;
}

auto MemorySnapshotStore::snapshot_versions(const DocumentId& document_id) const -> std::vector<Version> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<Version>{};
    auto doc = snapshots_.find(document_id);
    if (doc == snapshots_.end()) return result;
    result.reserve(doc->second.size());
    for (const auto& [version, snapshot] : doc->second) result.push_back(version);
    return result;
}

}  // namespace docsnap_cpp
