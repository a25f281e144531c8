// engine/include/tessel/engine/Section.hpp
#pragma once
#include <tessel/lex/Token.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>


namespace tessel::engine {

    inline constexpr uint32_t k_default_parallel_line_threshold = 4000;
    inline constexpr uint32_t k_default_max_threads = 4;

    struct LineRange {
        uint32_t first_line = 0;
        uint32_t line_count = 0;
    };

    /// @brief 워커 한 개가 맡는 line-aligned 구간.
    template <class State>
    struct Section {
        uint32_t begin = 0;         // byte offset (line start)
        uint32_t end = 0;           // byte offset (next section's begin, or text size)
        uint32_t start_line = 0;
        State initial_state{};
    };

    enum class ExecPath : uint8_t {
        kSequential,
        kParallel,
    };

    struct WorkerFailure {
        uint32_t section_index = 0;
        std::string message{};
    };

    struct TokenizeOptions {
        uint32_t worker_count = 1;
        uint32_t parallel_line_threshold = k_default_parallel_line_threshold;

        // called on the worker thread before a section is scanned
        std::function<void(uint32_t section_index)> section_observer{};
    };

    struct TokenizeStats {
        ExecPath path = ExecPath::kSequential;
        uint32_t line_count = 0;
        uint32_t section_count = 1;
        std::vector<WorkerFailure> failures{};
    };

    struct TokenizeResult {
        TokenList tokens;
        TokenizeStats stats{};
    };

    const char* exec_path_name(ExecPath p);

} // namespace tessel::engine
