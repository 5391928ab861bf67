#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace shardkeep {

// ============================================================================
// Bounded Parallel Execution
// ============================================================================

// Runs fn(i) for every i in [0, count) on min(count, max_workers) threads.
// Workers pull indices from a shared cursor, so a slow index never holds
// back the others. Returns once every index has run.
//
// fn is expected to record its own failures; an exception escaping fn is
// logged and the remaining indices still run.
void parallel_for(std::size_t count,
                  std::size_t max_workers,
                  const std::function<void(std::size_t)>& fn);

// Starts one worker thread running the given loop
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

// As above, with worker threads started through spawn. When spawn throws
// std::system_error the threads already running and the caller finish the
// remaining indices.
void parallel_for(std::size_t count,
                  std::size_t max_workers,
                  const std::function<void(std::size_t)>& fn,
                  const ThreadSpawner& spawn);

// Number of threads parallel_for would start for this workload
[[nodiscard]] std::size_t worker_count(std::size_t count, std::size_t max_workers);

}  // namespace shardkeep
