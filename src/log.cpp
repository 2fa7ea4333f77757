#include <docsnap-cpp/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <utility>

namespace docsnap_cpp {

namespace {

auto make_default_logger() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto result = std::make_shared<spdlog::logger>("docsnap", std::move(sink));
    result->set_level(spdlog::level::warn);
    return result;
}

// Swapped atomically so concurrent reconstructions can log while a host
// installs its own logger.
auto current() -> std::atomic<std::shared_ptr<spdlog::logger>>& {
    static auto instance = std::atomic<std::shared_ptr<spdlog::logger>>{make_default_logger()};
    return instance;
}

}  // anonymous namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    return current().load();
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    current().store(logger ? std::move(logger) : make_default_logger());
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace docsnap_cpp
