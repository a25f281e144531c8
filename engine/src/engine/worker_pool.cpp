// engine/src/engine/worker_pool.cpp
#include <tessel/engine/WorkerPool.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>


namespace tessel::engine {

    uint32_t resolve_worker_count(uint32_t max_threads) {
        const unsigned hw = std::thread::hardware_concurrency();
        const uint32_t avail = (hw == 0) ? 1u : static_cast<uint32_t>(hw);
        return std::max(1u, std::min(avail, max_threads));
    }

    WorkerPool::WorkerPool(uint32_t thread_count)
        : thread_count_(thread_count == 0 ? 1 : thread_count) {}

    std::vector<WorkerFailure> WorkerPool::run(const std::vector<std::function<void()>>& tasks) const {
        // one slot per task; each slot is written by exactly one thread
        std::vector<std::string> errors(tasks.size());
        std::vector<uint8_t> failed(tasks.size(), 0);
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            while (true) {
                const size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= tasks.size()) return;
                try {
                    tasks[i]();
                } catch (const std::exception& e) {
                    failed[i] = 1;
                    errors[i] = e.what();
                } catch (...) {
                    failed[i] = 1;
                    errors[i] = "non-standard exception";
                }
            }
        };

        const size_t spawn = std::min<size_t>(thread_count_, tasks.size());
        std::vector<std::thread> threads;
        threads.reserve(spawn);
        for (size_t t = 0; t < spawn; ++t) {
            try {
                threads.emplace_back(worker);
            } catch (const std::system_error&) {
                // out of threads: whatever is left runs on the calling thread below
                break;
            }
        }

        if (threads.empty() || threads.size() < spawn) worker();

        for (auto& th : threads) {
            if (th.joinable()) th.join();
        }

        std::vector<WorkerFailure> out;
        for (size_t i = 0; i < tasks.size(); ++i) {
            if (failed[i] == 0) continue;
            out.push_back(WorkerFailure{static_cast<uint32_t>(i), std::move(errors[i])});
        }
        return out;
    }

} // namespace tessel::engine
