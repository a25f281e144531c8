// engine/include/tessel/lex/Token.hpp
#pragma once
#include <cstdint>
#include <vector>


namespace tessel {

    /// @brief 하이라이트 구간 하나. kind는 언어별 legend 인덱스.
    /// A token never spans lines; multi-line constructs are emitted one token per physical line.
    struct Token {
        uint32_t kind = 0;
        uint32_t line = 0;    // 0-based
        uint32_t col = 0;     // 0-based byte column
        uint32_t length = 0;  // bytes

        bool operator==(const Token&) const = default;
    };

    using TokenList = std::vector<Token>;

    /// @brief 한 슬라이스를 스캔한 결과: 토큰 + 슬라이스 끝에서의 lex state
    template <class State>
    struct ScanResult {
        TokenList tokens;
        State end_state{};
    };

} // namespace tessel
