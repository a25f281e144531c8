// engine/include/tessel/engine/Partition.hpp
#pragma once
#include <tessel/engine/Section.hpp>

#include <cstdint>
#include <vector>


namespace tessel::engine {

    /// @brief line_count 줄을 parts 개의 연속 구간으로 나눈다.
    /// Every range gets line_count / parts lines and the last one absorbs the remainder.
    /// parts is clamped to [1, line_count] so no range is empty (an empty document yields one range).
    std::vector<LineRange> partition_lines(uint32_t line_count, uint32_t parts);

} // namespace tessel::engine
