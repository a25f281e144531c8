// engine/src/engine/range.cpp
#include <tessel/engine/Range.hpp>


namespace tessel::engine {

    TokenList filter_lines(std::span<const Token> tokens, uint32_t start_line, uint32_t end_line) {
        TokenList out;
        if (start_line > end_line) return out;
        for (const auto& t : tokens) {
            if (t.line < start_line) continue;
            if (t.line > end_line) break;
            out.push_back(t);
        }
        return out;
    }

} // namespace tessel::engine
