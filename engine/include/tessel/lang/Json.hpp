// engine/include/tessel/lang/Json.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <span>
#include <string_view>


namespace tessel::json {

    enum class TokenKind : uint32_t {
        kProperty = 0,
        kString,
        kNumber,
        kKeyword,
    };

    std::span<const std::string_view> legend();

    /// @brief 컨텍스트 스택 기반 전체 토크나이저 (순차 전용).
    /// Object keys are recognised from the container stack, not from lookahead.
    TokenList tokenize_full(std::string_view text, diag::Bag* diags);

    /// @brief Range tokenizer using local lookahead only:
    /// a string is a property iff the next non-whitespace byte after it is ':'.
    /// Scanning starts at start_line; nothing before it is read.
    TokenList tokenize_range_local(std::string_view text, uint32_t start_line, uint32_t end_line);

} // namespace tessel::json
