#include <docsnap-cpp/options.hpp>
#include <docsnap-cpp/error.hpp>
#include <docsnap-cpp/file_snapshot_store.hpp>
#include <docsnap-cpp/log.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace docsnap_cpp {

namespace {

auto parse_level(const std::string& name) -> spdlog::level::level_enum {
    // from_str maps unknown names to "off"
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw SnapshotError{ErrorKind::invalid_arguments, "unknown log level '" + name + "'"};
    }
    return level;
}

}  // anonymous namespace

void from_json(const nlohmann::json& j, EngineOptions& options) {
    try {
        options = EngineOptions{};
        if (!j.is_object()) {
            throw SnapshotError{ErrorKind::invalid_arguments, "engine options must be a JSON object"};
        }
        if (auto it = j.find("frequency"); it != j.end()) {
            if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
                throw SnapshotError{ErrorKind::invalid_arguments,
                                    "frequency must be a positive integer"};
            }
            options.frequency = it->get<std::uint64_t>();
        }
        if (auto it = j.find("log_level"); it != j.end()) {
            options.log_level = it->get<std::string>();
            parse_level(options.log_level);
        }
        if (auto it = j.find("snapshot_directory"); it != j.end() && !it->is_null()) {
            options.snapshot_directory = std::filesystem::path{it->get<std::string>()};
        }
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError{ErrorKind::invalid_arguments, std::string{"invalid engine options: "} + e.what()};
    }
}

void to_json(nlohmann::json& j, const EngineOptions& options) {
    j = nlohmann::json{{"frequency", options.frequency}, {"log_level", options.log_level}};
    if (options.snapshot_directory) {
        j["snapshot_directory"] = options.snapshot_directory->string();
    }
}

auto load_options(const std::filesystem::path& path) -> EngineOptions {
    auto in = std::ifstream{path};
    if (!in) {
        throw SnapshotError{ErrorKind::invalid_arguments,
                            "cannot open options file '" + path.string() + "'"};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw SnapshotError{ErrorKind::invalid_arguments,
                            "options file '" + path.string() + "' is not valid JSON"};
    }
    return j.get<EngineOptions>();
}

void configure_logging(const EngineOptions& options) {
    set_log_level(parse_level(options.log_level));
}

auto make_engine_config(const EngineOptions& options,
                        std::shared_ptr<const SchemaRegistry> schemas,
                        std::shared_ptr<const DocumentStore> document_store,
                        std::shared_ptr<const ChangeStore> change_store) -> SnapshotEngineConfig {
    auto snapshot_store = std::shared_ptr<SnapshotStore>{};
    if (options.snapshot_directory) {
        snapshot_store = std::make_shared<FileSnapshotStore>(*options.snapshot_directory);
    }
    return SnapshotEngineConfig{
        .schemas = std::move(schemas),
        .document_store = std::move(document_store),
        .change_store = std::move(change_store),
        .snapshot_store = std::move(snapshot_store),
        .frequency = options.frequency,
    };
}

}  // namespace docsnap_cpp
