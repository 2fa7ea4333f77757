// docsnap-cpp benchmarks: incremental reconstruction against full replay.

#include <docsnap-cpp/docsnap.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace docsnap_cpp;

namespace {

auto make_schema() -> std::shared_ptr<NodeSchema> {
    return std::make_shared<NodeSchema>("note",
        std::vector<NodeType>{
            {.name = "container", .properties = {{"nodes", {.type = PropertyType::sequence}}}},
            {.name = "paragraph", .properties = {{"content", {.type = PropertyType::string}}}},
        },
        std::vector<Node>{{.id = "body", .type = "container", .properties = {}}});
}

auto make_change(Version version) -> Change {
    auto id = "p" + std::to_string(version);
    return Change{
        .document_id = "doc",
        .version = version,
        .ops = {
            create_node(Node{.id = id, .type = "paragraph",
                             .properties = {{"content", ScalarValue{std::string(64, 'x')}}}}),
            splice_property("body", "nodes", static_cast<std::size_t>(version - 1), 0,
                            Sequence{ScalarValue{id}}),
        },
    };
}

// A document with `history` changes and, optionally, snapshots every
// `interval` versions.
struct History {
    std::shared_ptr<SchemaRegistry> schemas = std::make_shared<SchemaRegistry>();
    std::shared_ptr<MemoryDocumentStore> documents = std::make_shared<MemoryDocumentStore>();
    std::shared_ptr<MemoryChangeStore> changes = std::make_shared<MemoryChangeStore>();
    std::shared_ptr<MemorySnapshotStore> snapshots = std::make_shared<MemorySnapshotStore>();

    History(Version history, Version interval) {
        schemas->add(make_schema());
        documents->create_document({.document_id = "doc", .schema_name = "note", .version = 0});
        auto doc = schemas->create_instance("note");
        for (auto v = Version{1}; v <= history; ++v) {
            auto change = make_change(v);
            apply_changes(doc, std::span<const Change>{&change, 1});
            changes->add_change(std::move(change));
            documents->update_version("doc", v);
            if (interval != 0 && v % interval == 0) {
                snapshots->save_snapshot({.document_id = "doc", .version = v, .data = export_document(doc)});
            }
        }
    }

    auto engine(bool incremental) const -> SnapshotEngine {
        return SnapshotEngine{SnapshotEngineConfig{
            .schemas = schemas,
            .document_store = documents,
            .change_store = changes,
            .snapshot_store = incremental ? snapshots : nullptr,
            .frequency = 1,
        }};
    }
};

}  // anonymous namespace

// =============================================================================
// Reconstruction of the latest version
// =============================================================================

static void bm_full_replay(benchmark::State& state) {
    const auto history = static_cast<Version>(state.range(0));
    auto fixture = History{history, 0};
    auto engine = fixture.engine(false);
    for (auto _ : state) {
        auto snapshot = engine.get_snapshot({.document_id = "doc", .version = history});
        benchmark::DoNotOptimize(snapshot);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_full_replay)->RangeMultiplier(4)->Range(16, 1024);

// The closest stored snapshot is 15 changes behind the requested version.
static void bm_incremental(benchmark::State& state) {
    const auto history = static_cast<Version>(state.range(0));
    auto fixture = History{history, 16};
    auto engine = fixture.engine(true);
    for (auto _ : state) {
        auto snapshot = engine.get_snapshot({.document_id = "doc", .version = history - 1});
        benchmark::DoNotOptimize(snapshot);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_incremental)->RangeMultiplier(4)->Range(16, 1024);

static void bm_exact_hit(benchmark::State& state) {
    const auto history = static_cast<Version>(state.range(0));
    auto fixture = History{history, 16};
    auto engine = fixture.engine(true);
    for (auto _ : state) {
        auto snapshot = engine.get_snapshot({.document_id = "doc", .version = history});
        benchmark::DoNotOptimize(snapshot);
    }
}
BENCHMARK(bm_exact_hit)->RangeMultiplier(4)->Range(16, 1024);

// =============================================================================
// Codec
// =============================================================================

static void bm_export_import(benchmark::State& state) {
    const auto history = static_cast<Version>(state.range(0));
    auto fixture = History{history, 0};
    auto doc = fixture.schemas->create_instance("note");
    auto changes = fixture.changes->get_changes("doc", 0, std::nullopt);
    apply_changes(doc, changes);
    for (auto _ : state) {
        auto data = export_document(doc);
        auto restored = fixture.schemas->create_instance("note");
        import_document(restored, data);
        benchmark::DoNotOptimize(restored);
    }
}
BENCHMARK(bm_export_import)->RangeMultiplier(4)->Range(16, 1024);
