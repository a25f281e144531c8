// engine/include/tessel/engine/Range.hpp
#pragma once
#include <tessel/lex/Token.hpp>

#include <cstdint>
#include <span>


namespace tessel::engine {

    // tokens on lines [start_line, end_line], order preserved
    TokenList filter_lines(std::span<const Token> tokens, uint32_t start_line, uint32_t end_line);

} // namespace tessel::engine
