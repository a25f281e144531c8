// engine/src/engine/partition.cpp
#include <tessel/engine/Partition.hpp>


namespace tessel::engine {

    std::vector<LineRange> partition_lines(uint32_t line_count, uint32_t parts) {
        if (line_count == 0) line_count = 1;
        if (parts == 0) parts = 1;
        if (parts > line_count) parts = line_count;

        const uint32_t per = line_count / parts;

        std::vector<LineRange> out;
        out.reserve(parts);
        for (uint32_t i = 0; i < parts; ++i) {
            LineRange r{};
            r.first_line = i * per;
            r.line_count = (i + 1 == parts) ? (line_count - r.first_line) : per;
            out.push_back(r);
        }
        return out;
    }

} // namespace tessel::engine
