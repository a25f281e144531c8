// engine/include/tessel/lang/Css.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>


namespace tessel::css {

    enum class TokenKind : uint32_t {
        kKeyword = 0,   // @rules, !important, media query words
        kString,
        kNumber,        // lengths, percentages, hex colors
        kComment,
        kType,          // tag selectors and *
        kProperty,
        kFunction,
        kOperator,
        kParameter,     // --custom-property
        kClass,         // .class, #id, :pseudo, ::pseudo-element
    };

    struct Normal {
        bool operator==(const Normal&) const = default;
    };

    /// @brief /* ... */ still open at the end of a line
    struct InBlockComment {
        bool operator==(const InBlockComment&) const = default;
    };

    /// @brief quoted string whose line ended in an escaping backslash
    struct InString {
        char quote = '"';
        bool operator==(const InString&) const = default;
    };

    using Construct = std::variant<Normal, InBlockComment, InString>;

    /// @brief 줄 경계를 넘는 CSS 문맥.
    /// blocks holds one entry per open `{`: true when the block holds rules (@media, @supports, ...),
    /// false when it holds declarations. Selectors are recognised at the top level and inside rule blocks.
    struct LexState {
        Construct construct{};
        std::vector<bool> blocks{};
        bool in_value = false;        // after a declaration's ':'
        bool after_at_rule = false;   // the next '{' opens a rule block
        bool operator==(const LexState&) const = default;
    };

    std::span<const std::string_view> legend();

    struct Strategy {
        using State = LexState;

        static ScanResult<LexState> scan(std::string_view slice, uint32_t start_line,
                                         const LexState& initial, diag::Bag* diags);

        static LexState scan_state(std::string_view slice, const LexState& initial);
    };

} // namespace tessel::css
