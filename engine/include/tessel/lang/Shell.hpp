// engine/include/tessel/lang/Shell.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>


namespace tessel::shell {

    enum class TokenKind : uint32_t {
        kKeyword = 0,
        kString,
        kNumber,
        kComment,
        kFunction,
        kParameter,
        kOperator,
        kMacro,
        kNamespace,
        kLabel,     // heredoc delimiters (opening word and closing line)
    };

    enum class QuoteStyle : uint8_t {
        kSingle,    // '...'
        kDouble,    // "..."
        kAnsiC,     // $'...'
    };

    struct Normal {
        bool operator==(const Normal&) const = default;
    };

    /// @brief heredoc 본문 안. 다음 줄부터 delimiter 줄이 나올 때까지.
    struct InHeredoc {
        std::string delimiter;
        bool strip_tabs = false;    // `<<-`
        bool operator==(const InHeredoc&) const = default;
    };

    struct InQuote {
        QuoteStyle style = QuoteStyle::kDouble;
        bool operator==(const InQuote&) const = default;
    };

    using LexState = std::variant<Normal, InHeredoc, InQuote>;

    std::span<const std::string_view> legend();

    struct Strategy {
        using State = LexState;

        static ScanResult<LexState> scan(std::string_view slice, uint32_t start_line,
                                         const LexState& initial, diag::Bag* diags);

        static LexState scan_state(std::string_view slice, const LexState& initial);
    };

} // namespace tessel::shell
