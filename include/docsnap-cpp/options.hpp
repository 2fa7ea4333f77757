/// @file options.hpp
/// @brief Engine configuration loaded from JSON.

#pragma once

#include <docsnap-cpp/schema.hpp>
#include <docsnap-cpp/snapshot_engine.hpp>
#include <docsnap-cpp/stores.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace docsnap_cpp {

/// Deployment settings of a snapshot engine.
///
/// @code
/// {
///   "frequency": 10,
///   "log_level": "info",
///   "snapshot_directory": "/var/lib/docsnap"
/// }
/// @endcode
/// Every key is optional.
struct EngineOptions {
    std::uint64_t frequency{1};                               ///< Snapshot every n-th version.
    std::string log_level{"warn"};                            ///< spdlog level name.
    std::optional<std::filesystem::path> snapshot_directory;  ///< Enables a FileSnapshotStore.

    auto operator==(const EngineOptions&) const -> bool = default;
};

/// @throws SnapshotError (invalid_arguments) on a non-positive frequency,
///   an unknown log level or a value of the wrong JSON type.
void from_json(const nlohmann::json& j, EngineOptions& options);
void to_json(nlohmann::json& j, const EngineOptions& options);

/// Read options from a JSON file.
/// @throws SnapshotError (invalid_arguments) if the file cannot be read or
///   holds invalid options.
auto load_options(const std::filesystem::path& path) -> EngineOptions;

/// Apply the logging settings to the library logger.
void configure_logging(const EngineOptions& options);

/// Assemble an engine configuration from options and collaborators.
///
/// A FileSnapshotStore is created when `snapshot_directory` is set;
/// otherwise the engine has no snapshot store.
auto make_engine_config(const EngineOptions& options,
                        std::shared_ptr<const SchemaRegistry> schemas,
                        std::shared_ptr<const DocumentStore> document_store,
                        std::shared_ptr<const ChangeStore> change_store) -> SnapshotEngineConfig;

}  // namespace docsnap_cpp
