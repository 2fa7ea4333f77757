// note_history: walks a note's history through the snapshot engine
//
// Commits twenty changes to a "note" document, asking the engine for a
// snapshot after every commit (it persists one every five versions), then
// reconstructs a few historical versions. Pass a directory to persist the
// snapshots on disk instead of in memory.
//
// Build: cmake --build build
// Run:   ./build/note_history [snapshot-dir]

#include <docsnap-cpp/docsnap.hpp>

#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ds = docsnap_cpp;

namespace {

auto note_schema() -> std::shared_ptr<ds::NodeSchema> {
    return ds::schema_from_json(nlohmann::json::parse(R"({
        "name": "note",
        "node_types": {
            "container": {"nodes": {"type": "sequence"}},
            "paragraph": {"content": {"type": "string"}},
            "meta": {"title": {"type": "string", "default": "Untitled"},
                     "edited": {"type": "timestamp"}}
        },
        "seed_nodes": [
            {"id": "body", "type": "container", "properties": {}},
            {"id": "meta", "type": "meta", "properties": {}}
        ]
    })"));
}

auto make_change(ds::Version version) -> ds::Change {
    auto id = "p" + std::to_string(version);
    auto now = std::int64_t{1700000000000} + static_cast<std::int64_t>(version) * 60000;
    return ds::Change{
        .document_id = "doc-1",
        .version = version,
        .ops = {
            ds::create_node(ds::Node{.id = id, .type = "paragraph", .properties = {}}),
            ds::splice_property(id, "content", 0, 0, ds::ScalarValue{"Paragraph " + std::to_string(version)}),
            ds::splice_property("body", "nodes", static_cast<std::size_t>(version - 1), 0,
                                ds::Sequence{ds::ScalarValue{id}}),
            ds::set_property("meta", "edited", ds::ScalarValue{ds::Timestamp{now}}),
        },
        .timestamp = now,
        .message = "add " + id,
    };
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto options = ds::EngineOptions{.frequency = 5, .log_level = "info", .snapshot_directory = std::nullopt};
        if (argc > 1) options.snapshot_directory = argv[1];
        ds::configure_logging(options);

        auto registry = std::make_shared<ds::SchemaRegistry>();
        registry->add(note_schema());
        auto documents = std::make_shared<ds::MemoryDocumentStore>();
        auto changes = std::make_shared<ds::MemoryChangeStore>();

        auto config = ds::make_engine_config(options, registry, documents, changes);
        if (!config.snapshot_store) config.snapshot_store = std::make_shared<ds::MemorySnapshotStore>();
        auto engine = ds::SnapshotEngine{std::move(config)};

        // -- Commit workflow --------------------------------------------------
        documents->create_document({.document_id = "doc-1", .schema_name = "note", .version = 0});
        for (auto v = ds::Version{1}; v <= 20; ++v) {
            changes->add_change(make_change(v));
            documents->update_version("doc-1", v);
            if (engine.request_snapshot("doc-1", v)) {
                std::printf("snapshot stored at version %llu\n", static_cast<unsigned long long>(v));
            }
        }

        // -- Time travel ------------------------------------------------------
        for (auto v : {ds::Version{0}, ds::Version{3}, ds::Version{17}}) {
            auto snapshot = engine.get_snapshot({.document_id = "doc-1", .version = v});
            auto doc = registry->create_instance("note");
            ds::import_document(doc, snapshot.data);

            auto body = doc.get("body", "nodes");
            auto count = body ? ds::get_sequence(*body).value_or(ds::Sequence{}).size() : 0;
            std::printf("version %2llu: %zu paragraphs", static_cast<unsigned long long>(v), count);
            if (auto last = doc.get<std::string>("p" + std::to_string(v), "content")) {
                std::printf(", last reads \"%s\"", last->c_str());
            }
            std::printf("\n");
        }

        // -- Latest version, asynchronously ------------------------------------
        auto latest = engine.get_snapshot_async({.document_id = "doc-1", .version = std::nullopt}).get();
        std::printf("latest (version %llu):\n%s\n",
                    static_cast<unsigned long long>(latest.version), latest.data.dump(2).c_str());
    } catch (const ds::SnapshotError& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "unexpected error: %s\n", e.what());
        return 1;
    }
    return 0;
}
