// engine/include/tessel/lang/Python.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>


namespace tessel::python {

    enum class TokenKind : uint32_t {
        kKeyword = 0,
        kString,
        kNumber,
        kComment,
        kFunction,
        kMethod,
        kClass,
        kDecorator,         // published as "macro"
        kBuiltinFunction,
        kOperator,
        kType,
        kParameter,
        kSelfParameter,
        kClsParameter,
        kProperty,
        kNamespace,
        kBuiltinConstant,   // True / False / None / ...
    };

    struct Normal {
        bool operator==(const Normal&) const = default;
    };

    /// @brief """ or ''' string still open at the end of a line
    struct InTripleString {
        char quote = '"';
        bool operator==(const InTripleString&) const = default;
    };

    /// @brief ' or " string whose line ended in an escaping backslash
    struct InString {
        char quote = '"';
        bool operator==(const InString&) const = default;
    };

    using Construct = std::variant<Normal, InTripleString, InString>;

    /// @brief 열린 class / def 블록. indent는 헤더 줄의 들여쓰기(탭 = 4).
    struct Scope {
        uint32_t indent = 0;
        bool is_class = false;
        bool operator==(const Scope&) const = default;
    };

    /// @brief def 뒤의 매개변수 목록. 여러 줄에 걸칠 수 있다.
    struct ParamList {
        uint32_t depth = 1;
        bool first = true;  // no parameter name seen yet
        bool slot = true;   // the next word names a parameter
        bool operator==(const ParamList&) const = default;
    };

    struct LexState {
        Construct construct{};
        std::vector<Scope> scopes{};
        std::optional<ParamList> params{};
        bool operator==(const LexState&) const = default;
    };

    std::span<const std::string_view> legend();

    struct Strategy {
        using State = LexState;

        static ScanResult<LexState> scan(std::string_view slice, uint32_t start_line,
                                         const LexState& initial, diag::Bag* diags);

        static LexState scan_state(std::string_view slice, const LexState& initial);
    };

} // namespace tessel::python
