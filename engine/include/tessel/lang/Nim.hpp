// engine/include/tessel/lang/Nim.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>


namespace tessel::nim {

    enum class TokenKind : uint32_t {
        kKeyword = 0,
        kString,
        kNumber,
        kComment,
        kFunction,
        kMethod,
        kType,
        kMacro,             // template / macro names
        kBuiltinFunction,
        kOperator,
        kParameter,
        kProperty,
        kNamespace,
        kBuiltinConstant,   // true / false / nil
        kDecorator,         // {. pragmas .}
        kEnumMember,
    };

    struct Normal {
        bool operator==(const Normal&) const = default;
    };

    /// @brief `#[ ... ]#` (nestable) or `##[ ... ]##` doc comment
    struct InBlockComment {
        uint32_t depth = 1;
        bool doc = false;
        bool operator==(const InBlockComment&) const = default;
    };

    struct InTripleString {
        bool operator==(const InTripleString&) const = default;
    };

    using LexState = std::variant<Normal, InBlockComment, InTripleString>;

    std::span<const std::string_view> legend();

    struct Strategy {
        using State = LexState;

        static ScanResult<LexState> scan(std::string_view slice, uint32_t start_line,
                                         const LexState& initial, diag::Bag* diags);

        static LexState scan_state(std::string_view slice, const LexState& initial);
    };

} // namespace tessel::nim
