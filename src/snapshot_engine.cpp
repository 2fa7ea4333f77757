#include <docsnap-cpp/snapshot_engine.hpp>
#include <docsnap-cpp/change_applicator.hpp>
#include <docsnap-cpp/document.hpp>
#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/json.hpp>
#include <docsnap-cpp/log.hpp>

#include "executor.hpp"

#include <exception>
#include <string>
#include <utility>

namespace docsnap_cpp {

SnapshotEngine::SnapshotEngine(SnapshotEngineConfig config)
    : config_{std::move(config)} {
    if (!config_.schemas || !config_.document_store || !config_.change_store) {
        throw SnapshotError{ErrorKind::invalid_arguments,
            "a snapshot engine needs a schema registry, a document store and a change store"};
    }
    if (config_.frequency == 0) {
        throw SnapshotError{ErrorKind::invalid_arguments, "snapshot frequency must be positive"};
    }
}

// -- Public API ---------------------------------------------------------------

auto SnapshotEngine::get_snapshot(const GetSnapshotArgs& args) const -> Snapshot {
    try {
        return compute_snapshot(args);
    } catch (const std::exception& e) {
        logger()->warn("cannot compute snapshot of '{}': {}", args.document_id, e.what());
        throw;
    }
}

auto SnapshotEngine::request_snapshot(const DocumentId& document_id, Version version) const -> bool {
    if (!config_.snapshot_store || version % config_.frequency != 0) {
        return false;
    }
    create_snapshot(GetSnapshotArgs{.document_id = document_id, .version = std::nullopt});
    return true;
}

auto SnapshotEngine::create_snapshot(const GetSnapshotArgs& args) const -> Snapshot {
    require_snapshot_store();
    try {
        auto snapshot = compute_snapshot(args);
        config_.snapshot_store->save_snapshot(snapshot);
        logger()->info("stored snapshot of '{}' at version {}", snapshot.document_id, snapshot.version);
        return snapshot;
    } catch (const std::exception& e) {
        logger()->warn("cannot create snapshot of '{}': {}", args.document_id, e.what());
        throw;
    }
}

auto SnapshotEngine::get_snapshot_async(GetSnapshotArgs args) const -> std::future<Snapshot> {
    return detail::global_executor().async([this, args = std::move(args)] {
        return get_snapshot(args);
    });
}

auto SnapshotEngine::request_snapshot_async(DocumentId document_id, Version version) const
    -> std::future<bool> {
    return detail::global_executor().async([this, document_id = std::move(document_id), version] {
        return request_snapshot(document_id, version);
    });
}

auto SnapshotEngine::create_snapshot_async(GetSnapshotArgs args) const -> std::future<Snapshot> {
    require_snapshot_store();
    return detail::global_executor().async([this, args = std::move(args)] {
        return create_snapshot(args);
    });
}

// -- Reconstruction -----------------------------------------------------------

void SnapshotEngine::require_snapshot_store() const {
    if (!config_.snapshot_store) {
        throw SnapshotError{ErrorKind::snapshot_store_required,
            "You must provide a snapshot store to be able to create snapshots"};
    }
}

auto SnapshotEngine::compute_snapshot(const GetSnapshotArgs& args) const -> Snapshot {
    if (args.document_id.empty()) {
        throw SnapshotError{ErrorKind::invalid_arguments, "args requires a documentId"};
    }

    auto record = config_.document_store->get_document(args.document_id);
    auto version = args.version.value_or(record.version);
    if (version > record.version) {
        throw SnapshotError{ErrorKind::invalid_arguments,
            "document '" + record.document_id + "' has no version " + std::to_string(version)
            + " (latest is " + std::to_string(record.version) + ")"};
    }

    if (config_.snapshot_store && version != 0) {
        return compute_incremental(record, version);
    }
    return compute_full_replay(record, version);
}

auto SnapshotEngine::compute_incremental(const DocumentRecord& record, Version version) const
    -> Snapshot {
    auto cached = config_.snapshot_store->get_snapshot(record.document_id, version, true);
    if (cached && cached->version == version) {
        logger()->debug("snapshot cache hit for '{}' at version {}", record.document_id, version);
        return std::move(*cached);
    }

    auto known_version = cached ? cached->version : Version{0};
    logger()->debug("replaying '{}' from version {} to {}", record.document_id, known_version, version);

    auto doc = config_.schemas->create_instance(record.schema_name);
    if (cached) {
        import_document(doc, cached->data);
    }
    auto changes = fetch_changes(record, known_version, version);
    apply_changes(doc, changes);

    return Snapshot{.document_id = record.document_id, .version = version, .data = export_document(doc)};
}

auto SnapshotEngine::compute_full_replay(const DocumentRecord& record, Version version) const
    -> Snapshot {
    logger()->debug("replaying full history of '{}' to version {}", record.document_id, version);

    auto doc = config_.schemas->create_instance(record.schema_name);
    auto changes = fetch_changes(record, 0, version);
    apply_changes(doc, changes);

    return Snapshot{.document_id = record.document_id, .version = version, .data = export_document(doc)};
}

auto SnapshotEngine::fetch_changes(const DocumentRecord& record, Version since, Version to) const
    -> std::vector<Change> {
    auto changes = config_.change_store->get_changes(record.document_id, since, to);

    // The replay is only correct if the log returned exactly (since, to]
    auto expected = since;
    for (const auto& change : changes) {
        if (change.version != ++expected) {
            throw SnapshotError{ErrorKind::invalid_change,
                "change log of '" + record.document_id + "' returned version "
                + std::to_string(change.version) + " where " + std::to_string(expected)
                + " was expected"};
        }
    }
    if (expected != to) {
        throw SnapshotError{ErrorKind::invalid_change,
            "change log of '" + record.document_id + "' ends at version " + std::to_string(expected)
            + ", expected " + std::to_string(to)};
    }
    return changes;
}

}  // namespace docsnap_cpp
