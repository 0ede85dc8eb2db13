#pragma once

// Global work-stealing executor via Taskflow.
//
// A process-global tf::Executor sized to std::thread::hardware_concurrency().
// compare_many() submits its independent comparisons here; a single
// comparison never runs in parallel.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace jsondiff_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace jsondiff_cpp::detail
