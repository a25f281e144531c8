// engine/include/tessel/engine/WorkerPool.hpp
#pragma once
#include <tessel/engine/Section.hpp>

#include <cstdint>
#include <functional>
#include <vector>


namespace tessel::engine {

    /// @brief min(hardware parallelism, max_threads); an unknown hardware count counts as 1.
    uint32_t resolve_worker_count(uint32_t max_threads);

    /// @brief 한 번의 tokenize 호출 안에서만 사는 고정 크기 워커 풀.
    /// Threads claim task indices from an atomic counter; run() joins every thread before it returns.
    class WorkerPool {
    public:
        explicit WorkerPool(uint32_t thread_count);

        uint32_t thread_count() const { return thread_count_; }

        // failures are reported by task index, in index order
        std::vector<WorkerFailure> run(const std::vector<std::function<void()>>& tasks) const;

    private:
        uint32_t thread_count_ = 1;
    };

} // namespace tessel::engine
