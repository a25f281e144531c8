// engine/include/tessel/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace tessel::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        // string/comment/heredoc closed by end of input
        kUnterminatedLiteral,   // args: {0}=construct name

        // byte that no rule of the language accepts; skipped without a token
        kUnexpectedCharacter,   // args: {0}=character

        // bracket / container shape (unmatched close, unclosed open, extra root)
        kStructuralMismatch,    // args: {0}=detail
    };

} // namespace tessel::diag
