// engine/include/tessel/engine/Encoder.hpp
#pragma once
#include <tessel/lex/Token.hpp>

#include <cstdint>
#include <span>
#include <vector>


namespace tessel::engine {

    /// @brief LSP semanticTokens 델타 인코딩 (5 ints / token).
    /// Input must be ordered by (line, col). Zero-length tokens are skipped.
    /// The modifier field is always 0.
    std::vector<uint32_t> encode(std::span<const Token> tokens);

    /// @brief Rebuilds absolute tokens from encoded data with a cursor starting at (0, 0).
    /// A trailing partial group is ignored.
    TokenList decode(std::span<const uint32_t> data);

} // namespace tessel::engine
