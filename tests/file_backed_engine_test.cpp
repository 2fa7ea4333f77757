#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/file_snapshot_store.hpp>
#include <docsnap-cpp/json.hpp>
#include <docsnap-cpp/snapshot_engine.hpp>

#include "note_fixture.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace docsnap_cpp;
namespace fs = std::filesystem;

namespace {

// Records how many changes each query returned.
struct RecordingChangeStore final : ChangeStore {
    explicit RecordingChangeStore(std::shared_ptr<MemoryChangeStore> inner)
        : inner{std::move(inner)} {}

    auto get_changes(const DocumentId& id, Version since, std::optional<Version> to) const
        -> std::vector<Change> override {
        auto result = inner->get_changes(id, since, to);
        auto lock = std::lock_guard{mutex};
        queries.emplace_back(since, result.size());
        return result;
    }

    std::shared_ptr<MemoryChangeStore> inner;
    mutable std::mutex mutex;
    mutable std::vector<std::pair<Version, std::size_t>> queries;
};

// A "sample" holds free text and numbers of every storable shape.
auto make_sample_schema() -> std::shared_ptr<NodeSchema> {
    return std::make_shared<NodeSchema>("sample",
        std::vector<NodeType>{
            {.name = "sample",
             .properties = {{"label", {.type = PropertyType::string}},
                            {"weight", {.type = PropertyType::number}},
                            {"extra", {.type = PropertyType::any}}}},
        },
        std::vector<Node>{});
}

auto text(std::string s) -> Value { return ScalarValue{std::move(s)}; }
auto number(double d) -> Value { return ScalarValue{d}; }

class FileBackedEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string{"docsnap-engine-"} + info->name());
        fs::remove_all(root_);

        auto registry = std::make_shared<SchemaRegistry>();
        registry->add(test::make_note_schema());
        registry->add(make_sample_schema());
        schemas_ = registry;

        documents_ = std::make_shared<MemoryDocumentStore>();
        memory_changes_ = std::make_shared<MemoryChangeStore>();
        test::populate_note(*documents_, *memory_changes_, "doc-1", 20);
        changes_ = std::make_shared<RecordingChangeStore>(memory_changes_);
        files_ = std::make_shared<FileSnapshotStore>(root_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        fs::remove_all(root_, ec);
    }

    auto file_engine(std::shared_ptr<SnapshotStore> store = nullptr) const -> SnapshotEngine {
        return SnapshotEngine{SnapshotEngineConfig{
            .schemas = schemas_,
            .document_store = documents_,
            .change_store = changes_,
            .snapshot_store = store ? std::move(store) : files_,
            .frequency = 1,
        }};
    }

    auto full_engine() const -> SnapshotEngine {
        return SnapshotEngine{SnapshotEngineConfig{
            .schemas = schemas_, .document_store = documents_, .change_store = changes_}};
    }

    // Commit `ops` as the next change of `document_id`, creating the
    // document on first use.
    void commit(const DocumentId& document_id, std::vector<Op> ops) {
        auto version = memory_changes_->latest_version(document_id) + 1;
        if (version == 1) {
            documents_->create_document({.document_id = document_id, .schema_name = "sample", .version = 0});
        }
        memory_changes_->add_change(Change{.document_id = document_id, .version = version, .ops = std::move(ops)});
        documents_->update_version(document_id, version);
    }

    void expect_same_history(const DocumentId& document_id, Version latest) {
        auto incremental = file_engine();
        auto full = full_engine();
        for (auto v = Version{1}; v <= latest; ++v) {
            auto a = incremental.get_snapshot({.document_id = document_id, .version = v});
            auto b = full.get_snapshot({.document_id = document_id, .version = v});
            EXPECT_EQ(a, b) << document_id << " version " << v;
        }
    }

    fs::path root_;
    std::shared_ptr<const SchemaRegistry> schemas_;
    std::shared_ptr<MemoryDocumentStore> documents_;
    std::shared_ptr<MemoryChangeStore> memory_changes_;
    std::shared_ptr<RecordingChangeStore> changes_;
    std::shared_ptr<FileSnapshotStore> files_;
};

template <typename F>
void expect_error(ErrorKind kind, F&& f) {
    try {
        f();
        FAIL() << "expected " << to_string_view(kind);
    } catch (const SnapshotError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

}  // anonymous namespace

// -- Note history -------------------------------------------------------------

TEST_F(FileBackedEngineTest, incremental_and_full_replay_agree) {
    auto engine = file_engine();
    for (auto v : {4u, 11u, 16u}) engine.create_snapshot({.document_id = "doc-1", .version = v});
    EXPECT_EQ(files_->snapshot_versions("doc-1"), (std::vector<Version>{4, 11, 16}));

    expect_same_history("doc-1", 20);
}

TEST_F(FileBackedEngineTest, exact_hit_reads_the_file_only) {
    auto engine = file_engine();
    auto created = engine.create_snapshot({.document_id = "doc-1", .version = 10});
    changes_->queries.clear();

    EXPECT_EQ(engine.get_snapshot({.document_id = "doc-1", .version = 10}), created);
    EXPECT_TRUE(changes_->queries.empty());
}

TEST_F(FileBackedEngineTest, delta_cost_matches_distance_to_snapshot) {
    auto engine = file_engine();
    engine.create_snapshot({.document_id = "doc-1", .version = 15});
    changes_->queries.clear();

    auto snapshot = engine.get_snapshot({.document_id = "doc-1", .version = 20});
    EXPECT_EQ(snapshot, full_engine().get_snapshot({.document_id = "doc-1", .version = 20}));
    ASSERT_EQ(changes_->queries.size(), 1u);
    EXPECT_EQ(changes_->queries[0].first, 15u);
    EXPECT_EQ(changes_->queries[0].second, 5u);
}

TEST_F(FileBackedEngineTest, snapshots_survive_reopening_the_store) {
    file_engine().create_snapshot({.document_id = "doc-1", .version = 12});
    changes_->queries.clear();

    auto reopened = file_engine(std::make_shared<FileSnapshotStore>(root_));
    auto snapshot = reopened.get_snapshot({.document_id = "doc-1", .version = 12});
    EXPECT_EQ(snapshot, full_engine().get_snapshot({.document_id = "doc-1", .version = 12}));
    EXPECT_TRUE(changes_->queries.empty());
}

// -- Value fidelity -----------------------------------------------------------

TEST_F(FileBackedEngineTest, non_ascii_text_and_numeric_extremes_survive) {
    commit("doc-s", {create_node(Node{.id = "s1", .type = "sample", .properties = {
        {"label", text("h\xc3\xa9llo")},
        {"weight", number(std::numeric_limits<double>::max())}}})});
    commit("doc-s", {splice_property("s1", "label", 6, 0, text(" w\xc3\xb6rld \xe2\x9c\x93"))});
    commit("doc-s", {set_property("s1", "extra", Sequence{
        ScalarValue{std::string{"\xe6\x97\xa5\xe6\x9c\xac"}},
        ScalarValue{-0.5},
        ScalarValue{std::numeric_limits<double>::denorm_min()},
        ScalarValue{std::numeric_limits<std::int64_t>::min()},
        ScalarValue{std::numeric_limits<std::int64_t>::max()}})});
    commit("doc-s", {set_property("s1", "weight", number(-1e-300))});
    commit("doc-s", {set_property("s1", "extra", number(0.1))});

    auto engine = file_engine();
    engine.create_snapshot({.document_id = "doc-s", .version = 3});
    EXPECT_TRUE(engine.request_snapshot("doc-s", 5));
    EXPECT_EQ(files_->snapshot_versions("doc-s"), (std::vector<Version>{3, 5}));

    expect_same_history("doc-s", 5);

    auto doc = schemas_->create_instance("sample");
    import_document(doc, engine.get_snapshot({.document_id = "doc-s", .version = 3}).data);
    EXPECT_EQ(doc.get<std::string>("s1", "label"), "h\xc3\xa9llo w\xc3\xb6rld \xe2\x9c\x93");
    EXPECT_EQ(doc.get<double>("s1", "weight"), std::numeric_limits<double>::max());
}

TEST_F(FileBackedEngineTest, non_finite_numbers_never_reach_the_store) {
    commit("doc-n", {create_node(Node{.id = "a", .type = "sample", .properties = {
        {"weight", number(std::numeric_limits<double>::quiet_NaN())}}})});
    commit("doc-n", {set_property("a", "label", text("x"))});
    commit("doc-i", {create_node(Node{.id = "b", .type = "sample", .properties = {}})});
    commit("doc-i", {set_property("b", "extra", number(-std::numeric_limits<double>::infinity()))});

    auto engine = file_engine();
    expect_error(ErrorKind::invalid_operation, [&] { engine.request_snapshot("doc-n", 2); });
    expect_error(ErrorKind::invalid_operation, [&] {
        engine.create_snapshot({.document_id = "doc-i", .version = 2});
    });
    expect_error(ErrorKind::invalid_operation, [&] {
        full_engine().get_snapshot({.document_id = "doc-n", .version = 1});
    });
    EXPECT_TRUE(files_->snapshot_versions("doc-n").empty());
    EXPECT_TRUE(files_->snapshot_versions("doc-i").empty());

    // History before the bad change stays readable
    engine.create_snapshot({.document_id = "doc-i", .version = 1});
    EXPECT_EQ(files_->snapshot_versions("doc-i"), (std::vector<Version>{1}));
}

TEST_F(FileBackedEngineTest, splice_splitting_a_character_never_reaches_the_store) {
    commit("doc-u", {create_node(Node{.id = "a", .type = "sample", .properties = {
        {"label", text("\xc3\xa9")}}})});
    commit("doc-u", {splice_property("a", "label", 1, 0, text("x"))});

    auto engine = file_engine();
    expect_error(ErrorKind::invalid_operation, [&] { engine.request_snapshot("doc-u", 2); });
    EXPECT_TRUE(files_->snapshot_versions("doc-u").empty());

    engine.create_snapshot({.document_id = "doc-u", .version = 1});
    expect_same_history("doc-u", 1);
}
