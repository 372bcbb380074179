#pragma once

// Taskflow executors for analysis runs.
//
// Every run gets an executor sized from Config::worker_count (0 means
// std::thread::hardware_concurrency()). Pairwise comparisons, per-proposal
// checks and collaborator fetches are all submitted as tasks to it.
//
// Internal header: not installed.

#include <taskflow/taskflow.hpp>

#include <cstddef>
#include <thread>

namespace mergeguard::detail {

inline auto resolve_worker_count(unsigned int requested) -> std::size_t {
    if (requested > 0) return requested;
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

}  // namespace mergeguard::detail
