/// @file log.hpp
/// @brief Library logging through spdlog.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace docsnap_cpp {

/// The logger used by the library.
///
/// Defaults to a stderr logger named "docsnap" at level `warn`. It is not
/// registered in spdlog's global registry.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Replace the library logger, e.g. to route messages into an
/// application's sinks. A null logger restores the default.
void set_logger(std::shared_ptr<spdlog::logger> logger);

/// Set the level of the current library logger.
void set_log_level(spdlog::level::level_enum level);

}  // namespace docsnap_cpp
