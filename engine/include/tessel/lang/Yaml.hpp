// engine/include/tessel/lang/Yaml.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>


namespace tessel::yaml {

    enum class TokenKind : uint32_t {
        kKeyword = 0,
        kString,
        kNumber,
        kComment,
        kProperty,
        kOperator,
        kType,      // tags, document markers
        kMacro,     // anchors and aliases
        kNamespace, // directives
    };

    struct Normal {
        bool operator==(const Normal&) const = default;
    };

    /// @brief `key: |` / `key: >` 이후의 block scalar 본문.
    /// Content lines are those indented deeper than the line that opened the scalar;
    /// blank lines never end it.
    struct InBlockScalar {
        int32_t parent_indent = 0;
        char style = '|';   // '|' literal, '>' folded
        bool operator==(const InBlockScalar&) const = default;
    };

    /// @brief flow scalar ("..." or '...') continued onto following lines
    struct InQuotedScalar {
        char quote = '"';
        bool operator==(const InQuotedScalar&) const = default;
    };

    using Construct = std::variant<Normal, InBlockScalar, InQuotedScalar>;

    /// @brief flow_depth: `{` / `[` nesting still open at the end of a line
    struct LexState {
        Construct construct{};
        uint32_t flow_depth = 0;
        bool operator==(const LexState&) const = default;
    };

    std::span<const std::string_view> legend();

    struct Strategy {
        using State = LexState;

        static ScanResult<LexState> scan(std::string_view slice, uint32_t start_line,
                                         const LexState& initial, diag::Bag* diags);

        static LexState scan_state(std::string_view slice, const LexState& initial);
    };

} // namespace tessel::yaml
