#include "core/worker_pool.hh"
#include "core/logging.hh"
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace shardkeep {

std::size_t worker_count(std::size_t count, std::size_t max_workers) {
    return std::min(count, std::max<std::size_t>(max_workers, 1));
}

void parallel_for(std::size_t count,
                  std::size_t max_workers,
                  const std::function<void(std::size_t)>& fn) {
    parallel_for(count, max_workers, fn, [](std::function<void()> loop) {
        return std::thread(std::move(loop));
    });
}

void parallel_for(std::size_t count,
                  std::size_t max_workers,
                  const std::function<void(std::size_t)>& fn,
                  const ThreadSpawner& spawn) {
    if (count == 0) {
        return;
    }

    std::atomic<std::size_t> cursor{0};

    auto run = [&]() {
        while (true) {
            std::size_t i = cursor.fetch_add(1);
            if (i >= count) {
                break;
            }
            try {
                fn(i);
            } catch (const std::exception& e) {
                SHARDKEEP_LOG_WARN(log::core) << "Exception in worker for index " << i
                                              << ": " << e.what();
            }
        }
    };

    std::size_t threads = worker_count(count, max_workers);
    if (threads == 1) {
        run();
        return;
    }

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (std::size_t t = 1; t < threads; ++t) {
        try {
            workers.push_back(spawn(run));
        } catch (const std::system_error& e) {
            // Workers already started plus the caller drain the cursor
            SHARDKEEP_LOG_WARN(log::core) << "Started " << workers.size() + 1 << " of "
                                          << threads << " workers: " << e.what();
            break;
        }
    }
    run();  // The calling thread takes a share too

    for (auto& worker : workers) {
        worker.join();
    }
}

}  // namespace shardkeep
