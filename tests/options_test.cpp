#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/file_snapshot_store.hpp>
#include <docsnap-cpp/log.hpp>
#include <docsnap-cpp/options.hpp>

#include "note_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace docsnap_cpp;
namespace fs = std::filesystem;
using json = nlohmann::json;

TEST(EngineOptions, defaults) {
    const auto options = json::object().get<EngineOptions>();
    EXPECT_EQ(options.frequency, 1u);
    EXPECT_EQ(options.log_level, "warn");
    EXPECT_FALSE(options.snapshot_directory.has_value());
}

TEST(EngineOptions, parses_all_keys) {
    auto options = json::parse(R"({
        "frequency": 10,
        "log_level": "debug",
        "snapshot_directory": "/var/lib/docsnap"
    })").get<EngineOptions>();
    EXPECT_EQ(options.frequency, 10u);
    EXPECT_EQ(options.log_level, "debug");
    EXPECT_EQ(options.snapshot_directory, fs::path{"/var/lib/docsnap"});
}

TEST(EngineOptions, to_json_round_trip) {
    auto options = EngineOptions{.frequency = 5, .log_level = "info", .snapshot_directory = fs::path{"snaps"}};
    EXPECT_EQ(json(options).get<EngineOptions>(), options);
}

TEST(EngineOptions, invalid_values_throw_invalid_arguments) {
    for (const auto* text : {R"({"frequency": 0})",
                             R"({"frequency": -2})",
                             R"({"frequency": "often"})",
                             R"({"log_level": "chatty"})",
                             R"({"log_level": 3})",
                             R"({"snapshot_directory": 7})",
                             R"([1, 2])"}) {
        try {
            (void)json::parse(text).get<EngineOptions>();
            FAIL() << text;
        } catch (const SnapshotError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::invalid_arguments) << text;
        }
    }
}

TEST(EngineOptions, off_is_a_valid_level) {
    auto options = json::parse(R"({"log_level": "off"})").get<EngineOptions>();
    EXPECT_EQ(options.log_level, "off");
}

TEST(EngineOptions, load_options_from_file) {
    auto path = fs::temp_directory_path() / "docsnap-options-test.json";
    {
        auto out = std::ofstream{path};
        out << R"({"frequency": 3})";
    }
    auto options = load_options(path);
    EXPECT_EQ(options.frequency, 3u);
    fs::remove(path);
}

TEST(EngineOptions, load_options_failures) {
    EXPECT_THROW(load_options("/nonexistent/docsnap/options.json"), SnapshotError);

    auto path = fs::temp_directory_path() / "docsnap-options-broken.json";
    {
        auto out = std::ofstream{path};
        out << "{ not json";
    }
    EXPECT_THROW(load_options(path), SnapshotError);
    fs::remove(path);
}

TEST(EngineOptions, configure_logging_sets_level) {
    configure_logging(EngineOptions{.frequency = 1, .log_level = "error", .snapshot_directory = std::nullopt});
    EXPECT_EQ(logger()->level(), spdlog::level::err);
    set_log_level(spdlog::level::warn);
}

// -- make_engine_config -------------------------------------------------------

TEST(MakeEngineConfig, without_directory_has_no_snapshot_store) {
    auto registry = std::make_shared<SchemaRegistry>();
    auto config = make_engine_config(EngineOptions{.frequency = 4}, registry,
                                     std::make_shared<MemoryDocumentStore>(),
                                     std::make_shared<MemoryChangeStore>());
    EXPECT_EQ(config.frequency, 4u);
    EXPECT_EQ(config.schemas, registry);
    EXPECT_FALSE(config.snapshot_store);
}

TEST(MakeEngineConfig, directory_creates_file_store) {
    auto dir = fs::temp_directory_path() / "docsnap-config-test";
    fs::remove_all(dir);
    auto options = EngineOptions{.frequency = 2, .log_level = "warn", .snapshot_directory = dir};
    auto config = make_engine_config(options, std::make_shared<SchemaRegistry>(),
                                     std::make_shared<MemoryDocumentStore>(),
                                     std::make_shared<MemoryChangeStore>());

    auto* store = dynamic_cast<FileSnapshotStore*>(config.snapshot_store.get());
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->root(), dir);
    EXPECT_TRUE(fs::is_directory(dir));
    fs::remove_all(dir);
}
