#pragma once

// Process-global Taskflow executor running the engine's async entry points.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace docsnap_cpp::detail {

// Created on first use, destroyed at exit. Worker count defaults to
// std::thread::hardware_concurrency().
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace docsnap_cpp::detail
