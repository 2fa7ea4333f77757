#include <docsnap-cpp/log.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <gtest/gtest.h>

#include <memory>
#include <sstream>

using namespace docsnap_cpp;

TEST(Logger, default_is_named_docsnap_at_warn) {
    set_logger(nullptr);
    EXPECT_EQ(logger()->name(), "docsnap");
    EXPECT_EQ(logger()->level(), spdlog::level::warn);
}

TEST(Logger, set_logger_routes_messages) {
    auto out = std::ostringstream{};
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("%l %v");
    set_logger(std::make_shared<spdlog::logger>("custom", sink));
    set_log_level(spdlog::level::info);

    logger()->info("stored snapshot");
    logger()->debug("filtered out");
    logger()->flush();

    EXPECT_EQ(out.str(), "info stored snapshot\n");
    set_logger(nullptr);
}

TEST(Logger, null_logger_restores_default) {
    set_logger(std::make_shared<spdlog::logger>("other"));
    set_logger(nullptr);
    EXPECT_EQ(logger()->name(), "docsnap");
}
