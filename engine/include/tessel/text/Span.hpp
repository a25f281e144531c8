// engine/include/tessel/text/Span.hpp
#pragma once
#include <cstdint>


namespace tessel {

    /// @brief 한 줄 안의 바이트 컬럼 구간 [lo, hi)
    struct Span {
        uint32_t line = 0;  // 0-based
        uint32_t lo = 0;    // byte column inclusive
        uint32_t hi = 0;    // byte column exclusive
    };

} // namespace tessel
