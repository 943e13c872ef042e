#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). Version-chain folds that can run
// independently (compare_versions) are submitted through it.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

namespace docdiff_cpp::detail {

// Process-global executor. Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace docdiff_cpp::detail
