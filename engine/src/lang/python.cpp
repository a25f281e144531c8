// engine/src/lang/python.cpp
#include <tessel/lang/Python.hpp>
#include <tessel/lex/Cursor.hpp>
#include <tessel/lex/TokenSink.hpp>

#include <array>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>


namespace tessel::python {

    namespace {

        constexpr std::array<std::string_view, 17> k_legend = {
            "keyword",
            "string",
            "number",
            "comment",
            "function",
            "method",
            "class",
            "macro",
            "builtinFunction",
            "operator",
            "type",
            "parameter",
            "selfParameter",
            "clsParameter",
            "property",
            "namespace",
            "builtinConstant",
        };

        constexpr uint32_t kind_(TokenKind k) { return static_cast<uint32_t>(k); }

        bool is_keyword_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "def", "class", "return", "if", "elif", "else", "for", "while",
                "break", "continue", "pass", "import", "from", "as", "try",
                "except", "finally", "raise", "with", "yield", "lambda",
                "global", "nonlocal", "del", "assert", "async", "await",
                "match", "case",
            };
            return k.contains(w);
        }

        // keywords highlighted as operators
        bool is_word_operator_(std::string_view w) {
            return w == "and" || w == "or" || w == "not" || w == "in" || w == "is";
        }

        bool is_constant_(std::string_view w) {
            return w == "True" || w == "False" || w == "None";
        }

        bool is_builtin_type_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "int", "float", "complex", "str", "bytes", "bytearray", "bool",
                "list", "dict", "set", "frozenset", "tuple", "object", "type",
                "range", "memoryview",
                "Exception", "BaseException", "ValueError", "TypeError", "KeyError",
                "IndexError", "RuntimeError", "StopIteration", "OSError",
            };
            return k.contains(w);
        }

        bool is_builtin_function_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "print", "len", "open", "input", "isinstance", "issubclass",
                "getattr", "setattr", "hasattr", "delattr", "super", "iter",
                "next", "enumerate", "zip", "map", "filter", "sorted", "reversed",
                "min", "max", "sum", "abs", "round", "any", "all", "repr", "hash",
                "id", "vars", "dir", "callable", "format", "ord", "chr",
            };
            return k.contains(w);
        }

        bool is_ident_start_(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || static_cast<unsigned char>(c) >= 0x80;
        }

        bool is_ident_char_(char c) {
            return is_ident_start_(c) || (c >= '0' && c <= '9');
        }

        bool is_digit_(char c) { return c >= '0' && c <= '9'; }

        bool is_operator_char_(char c) {
            switch (c) {
                case '+': case '-': case '*': case '/': case '%': case '<': case '>':
                case '=': case '!': case '&': case '|': case '^': case '~':
                    return true;
                default:
                    return false;
            }
        }

        bool is_string_prefix_char_(char c) {
            switch (c) {
                case 'r': case 'R': case 'b': case 'B': case 'u': case 'U': case 'f': case 'F':
                    return true;
                default:
                    return false;
            }
        }

        char closer_of_(char open) {
            switch (open) {
                case '(': return ')';
                case '[': return ']';
                default:  return '}';
            }
        }

        enum class QuoteEnd : uint8_t {
            kClosed,
            kContinued,     // an escaping backslash ends the line
            kCut,
        };

        // indent in columns, a tab counts as four
        uint32_t indent_width_(std::string_view src, size_t lo, size_t hi, size_t* first) {
            uint32_t w = 0;
            size_t i = lo;
            for (; i < hi && (src[i] == ' ' || src[i] == '\t'); ++i) {
                w += (src[i] == '\t') ? 4 : 1;
            }
            *first = i;
            return w;
        }

        template <bool kEmit>
        class Scanner {
        public:
            Scanner(std::string_view src, uint32_t start_line, LexState st, diag::Bag* diags)
                : cur_(src, start_line), sink_(diags), state_(std::move(st)) {}

            LexState run() {
                while (!cur_.eof()) {
                    scan_line_();
                }
                finish_();
                return state_;
            }

            TokenList take_tokens() { return sink_.take(); }

        private:
            void scan_line_() {
                reset_line_context_();

                if (!resume_()) {
                    cur_.next_line();
                    return;
                }

                while (!cur_.at_line_break()) {
                    scan_one_();
                }
                cur_.next_line();
            }

            void reset_line_context_() {
                size_t first = 0;
                indent_ = indent_width_(cur_.source(), cur_.pos(), cur_.content_end(), &first);

                // a line of code closes every block opened at its indent or deeper
                const bool code = first < cur_.content_end() && cur_.source()[first] != '#';
                if (code && std::holds_alternative<Normal>(state_.construct) && !state_.params.has_value()) {
                    while (!state_.scopes.empty() && state_.scopes.back().indent >= indent_) {
                        state_.scopes.pop_back();
                    }
                }

                words_ = 0;
                import_line_ = false;
                after_def_ = false;
                after_class_ = false;
                after_dot_ = false;
                expect_params_ = false;
            }

            bool resume_() {
                const size_t lo = cur_.pos();
                const size_t end = cur_.content_end();

                if (const auto* ts = std::get_if<InTripleString>(&state_.construct)) {
                    const auto close = find_triple_close_(ts->quote, lo);
                    if (!close.has_value()) {
                        emit_to_(TokenKind::kString, lo, end);
                        return false;
                    }
                    emit_to_(TokenKind::kString, lo, *close);
                    cur_.skip_to(*close);
                    state_.construct = Normal{};
                    return true;
                }

                if (const auto* s = std::get_if<InString>(&state_.construct)) {
                    size_t close = end;
                    switch (find_quote_close_(s->quote, lo, &close)) {
                        case QuoteEnd::kClosed:
                            emit_to_(TokenKind::kString, lo, close);
                            cur_.skip_to(close);
                            state_.construct = Normal{};
                            return true;
                        case QuoteEnd::kContinued:
                            emit_to_(TokenKind::kString, lo, end);
                            return false;
                        case QuoteEnd::kCut:
                            emit_to_(TokenKind::kString, lo, end);
                            if (sink_.reporting()) {
                                sink_.report(diag::Code::kUnterminatedLiteral, span_of_(lo, end), "string literal");
                            }
                            state_.construct = Normal{};
                            open_.reset();
                            return false;
                    }
                }
                return true;
            }

            std::optional<size_t> find_triple_close_(char q, size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = from;
                while (i < end) {
                    if (src[i] == '\\') {
                        i += 2;
                        continue;
                    }
                    if (i + 2 < end && src[i] == q && src[i + 1] == q && src[i + 2] == q) {
                        return i + 3;
                    }
                    ++i;
                }
                return std::nullopt;
            }

            QuoteEnd find_quote_close_(char q, size_t from, size_t* close) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = from;
                while (i < end) {
                    if (src[i] == '\\') {
                        if (i + 1 >= end) return QuoteEnd::kContinued;
                        i += 2;
                        continue;
                    }
                    if (src[i] == q) {
                        *close = i + 1;
                        return QuoteEnd::kClosed;
                    }
                    ++i;
                }
                return QuoteEnd::kCut;
            }

            void emit_to_(TokenKind k, size_t lo, size_t hi) {
                sink_.emit(kind_(k), cur_.line(), cur_.col_of(lo), static_cast<uint32_t>(hi - lo));
            }

            Span span_of_(size_t lo, size_t hi) const {
                return Span{cur_.line(), cur_.col_of(lo), cur_.col_of(hi)};
            }

            bool only_ws_before_(size_t off) const {
                const auto src = cur_.source();
                for (size_t i = cur_.line_start(); i < off; ++i) {
                    if (src[i] != ' ' && src[i] != '\t') return false;
                }
                return true;
            }

            // length of a string prefix (r, b, f, rb, ...) at the cursor that is followed by a quote
            size_t string_prefix_len_() const {
                size_t n = 0;
                while (n < 2 && is_string_prefix_char_(cur_.peek(n))) ++n;
                if (n == 0) return 0;
                const char q = cur_.peek(n);
                return (q == '"' || q == '\'') ? n : 0;
            }

            // depth-1 position inside a def's parameter list
            bool in_param_list_() const {
                return state_.params.has_value() && state_.params->depth == 1;
            }

            void scan_one_() {
                const char c = cur_.peek();
                const size_t lo = cur_.pos();

                if (c == ' ' || c == '\t' || c == '\r') {
                    cur_.bump();
                    return;
                }

                const bool dot = after_dot_;
                after_dot_ = false;
                const bool opens_params = expect_params_;
                expect_params_ = false;

                if (c == '#') {
                    const size_t hi = cur_.content_end();
                    emit_to_(TokenKind::kComment, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (c == '"' || c == '\'') {
                    scan_string_(lo, lo);
                    return;
                }

                if (const size_t pre = string_prefix_len_(); pre != 0) {
                    scan_string_(lo, lo + pre);
                    return;
                }

                if (is_digit_(c) || (c == '.' && is_digit_(cur_.peek(1)))) {
                    scan_number_();
                    return;
                }

                if (is_ident_start_(c)) {
                    while (!cur_.at_line_break() && is_ident_char_(cur_.peek())) cur_.bump();
                    on_word_(lo, cur_.pos(), dot);
                    return;
                }

                if (c == '@' && only_ws_before_(lo) && is_ident_start_(cur_.peek(1))) {
                    cur_.bump();
                    while (!cur_.at_line_break() && (is_ident_char_(cur_.peek()) || cur_.peek() == '.')) cur_.bump();
                    emit_to_(TokenKind::kDecorator, lo, cur_.pos());
                    return;
                }

                if (c == '.') {
                    cur_.bump();
                    after_dot_ = true;
                    return;
                }

                if (c == '(' || c == '[' || c == '{') {
                    open_bracket_(c, lo, opens_params);
                    return;
                }

                if (c == ')' || c == ']' || c == '}') {
                    close_bracket_(c, lo);
                    return;
                }

                if (c == ',') {
                    if (in_param_list_()) state_.params->slot = true;
                    cur_.bump();
                    return;
                }

                if (c == ':') {
                    // annotation
                    if (in_param_list_()) state_.params->slot = false;
                    cur_.bump();
                    return;
                }

                if (in_param_list_()) {
                    // default value follows
                    if (c == '=' && cur_.peek(1) != '=') {
                        state_.params->slot = false;
                        cur_.bump();
                        return;
                    }
                    // *args / **kwargs / bare *
                    if (c == '*') {
                        cur_.bump();
                        if (cur_.peek() == '*') cur_.bump();
                        return;
                    }
                }

                if (is_operator_char_(c) || c == '@') {
                    while (!cur_.at_line_break() && (is_operator_char_(cur_.peek()) || cur_.peek() == '@')) cur_.bump();
                    emit_to_(TokenKind::kOperator, lo, cur_.pos());
                    return;
                }

                if (c == '$' || c == '?' || c == '`') {
                    if (sink_.reporting()) {
                        sink_.report(diag::Code::kUnexpectedCharacter, span_of_(lo, lo + 1), std::string_view(&c, 1));
                    }
                    cur_.bump();
                    return;
                }

                // ';' '\\' and the rest: no token
                cur_.bump();
            }

            // lo: first byte of the literal (prefix included), q_at: the opening quote
            void scan_string_(size_t lo, size_t q_at) {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                const char q = src[q_at];

                if (q_at + 2 < end && src[q_at + 1] == q && src[q_at + 2] == q) {
                    if (const auto close = find_triple_close_(q, q_at + 3); close.has_value()) {
                        emit_to_(TokenKind::kString, lo, *close);
                        cur_.skip_to(*close);
                        return;
                    }
                    emit_to_(TokenKind::kString, lo, end);
                    state_.construct = InTripleString{q};
                    open_ = span_of_(lo, q_at + 3);
                    cur_.skip_to(end);
                    return;
                }

                size_t close = end;
                switch (find_quote_close_(q, q_at + 1, &close)) {
                    case QuoteEnd::kClosed:
                        emit_to_(TokenKind::kString, lo, close);
                        cur_.skip_to(close);
                        return;
                    case QuoteEnd::kContinued:
                        emit_to_(TokenKind::kString, lo, end);
                        state_.construct = InString{q};
                        open_ = span_of_(lo, q_at + 1);
                        cur_.skip_to(end);
                        return;
                    case QuoteEnd::kCut:
                        emit_to_(TokenKind::kString, lo, end);
                        if (sink_.reporting()) {
                            sink_.report(diag::Code::kUnterminatedLiteral, span_of_(lo, end), "string literal");
                        }
                        cur_.skip_to(end);
                        return;
                }
            }

            void scan_number_() {
                const size_t lo = cur_.pos();
                const char c0 = cur_.peek();
                const char c1 = cur_.peek(1);

                if (c0 == '0' && (c1 == 'x' || c1 == 'X' || c1 == 'o' || c1 == 'O' || c1 == 'b' || c1 == 'B')) {
                    cur_.bump();
                    cur_.bump();
                    while (!cur_.at_line_break() && is_ident_char_(cur_.peek())) cur_.bump();
                    emit_to_(TokenKind::kNumber, lo, cur_.pos());
                    return;
                }

                while (is_digit_(cur_.peek()) || cur_.peek() == '_') cur_.bump();
                if (cur_.peek() == '.') {
                    cur_.bump();
                    while (is_digit_(cur_.peek()) || cur_.peek() == '_') cur_.bump();
                }
                if (cur_.peek() == 'e' || cur_.peek() == 'E') {
                    const char n = cur_.peek(1);
                    const char nn = cur_.peek(2);
                    if (is_digit_(n) || ((n == '+' || n == '-') && is_digit_(nn))) {
                        cur_.bump();
                        cur_.bump();
                        while (is_digit_(cur_.peek()) || cur_.peek() == '_') cur_.bump();
                    }
                }
                if (cur_.peek() == 'j' || cur_.peek() == 'J') cur_.bump();
                emit_to_(TokenKind::kNumber, lo, cur_.pos());
            }

            bool next_is_call_(size_t hi) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t p = hi;
                while (p < end && (src[p] == ' ' || src[p] == '\t')) ++p;
                return p < end && src[p] == '(';
            }

            // the innermost class or def decides: a def nested in a def is a plain function
            bool in_class_scope_() const {
                return !state_.scopes.empty() && state_.scopes.back().is_class;
            }

            void on_word_(size_t lo, size_t hi, bool after_dot) {
                const auto word = cur_.text(lo, hi);
                const bool first = (words_++ == 0);

                if (first && (word == "import" || word == "from")) import_line_ = true;

                if (after_def_) {
                    after_def_ = false;
                    emit_to_(in_class_scope_() ? TokenKind::kMethod : TokenKind::kFunction, lo, hi);
                    state_.scopes.push_back(Scope{indent_, false});
                    state_.params.reset();
                    expect_params_ = true;
                    return;
                }
                if (after_class_) {
                    after_class_ = false;
                    emit_to_(TokenKind::kClass, lo, hi);
                    state_.scopes.push_back(Scope{indent_, true});
                    return;
                }

                if (in_param_list_() && state_.params->slot) {
                    auto& p = *state_.params;
                    if (p.first && word == "self") {
                        emit_to_(TokenKind::kSelfParameter, lo, hi);
                    } else if (p.first && word == "cls") {
                        emit_to_(TokenKind::kClsParameter, lo, hi);
                    } else {
                        emit_to_(TokenKind::kParameter, lo, hi);
                    }
                    p.first = false;
                    p.slot = false;
                    return;
                }

                if constexpr (kEmit) {
                    classify_word_(word, lo, hi, after_dot);
                }

                after_def_ = (word == "def");
                after_class_ = (word == "class");
            }

            void classify_word_(std::string_view word, size_t lo, size_t hi, bool after_dot) {
                if (import_line_) {
                    const bool kw = word == "import" || word == "from" || word == "as";
                    emit_to_(kw ? TokenKind::kKeyword : TokenKind::kNamespace, lo, hi);
                    return;
                }
                if (after_dot) {
                    emit_to_(next_is_call_(hi) ? TokenKind::kMethod : TokenKind::kProperty, lo, hi);
                    return;
                }
                if (is_constant_(word)) {
                    emit_to_(TokenKind::kBuiltinConstant, lo, hi);
                    return;
                }
                if (is_word_operator_(word)) {
                    emit_to_(TokenKind::kOperator, lo, hi);
                    return;
                }
                if (is_keyword_(word)) {
                    emit_to_(TokenKind::kKeyword, lo, hi);
                    return;
                }
                if (is_builtin_type_(word)) {
                    emit_to_(TokenKind::kType, lo, hi);
                    return;
                }
                if (is_builtin_function_(word)) {
                    emit_to_(TokenKind::kBuiltinFunction, lo, hi);
                    return;
                }
                if (next_is_call_(hi)) {
                    emit_to_(TokenKind::kFunction, lo, hi);
                    return;
                }
                // plain names, self and cls included, carry no token
            }

            void open_bracket_(char c, size_t lo, bool opens_params) {
                if (state_.params.has_value()) {
                    ++state_.params->depth;
                } else if (c == '(' && opens_params) {
                    state_.params = ParamList{};
                }
                if (sink_.reporting()) {
                    brackets_.emplace_back(c, span_of_(lo, lo + 1));
                }
                cur_.bump();
            }

            void close_bracket_(char c, size_t lo) {
                if (state_.params.has_value() && --state_.params->depth == 0) {
                    state_.params.reset();
                }
                if (sink_.reporting()) {
                    if (!brackets_.empty() && closer_of_(brackets_.back().first) == c) {
                        brackets_.pop_back();
                    } else {
                        const std::string detail = std::string("unmatched '") + c + "'";
                        sink_.report(diag::Code::kStructuralMismatch, span_of_(lo, lo + 1), detail);
                    }
                }
                cur_.bump();
            }

            void finish_() {
                if (!sink_.reporting()) return;

                for (const auto& [open, span] : brackets_) {
                    const std::string detail = std::string("unclosed '") + open + "'";
                    sink_.report(diag::Code::kStructuralMismatch, span, detail);
                }
                if (!open_.has_value()) return;
                if (std::holds_alternative<InTripleString>(state_.construct)) {
                    sink_.report(diag::Code::kUnterminatedLiteral, *open_, "triple-quoted string");
                } else if (std::holds_alternative<InString>(state_.construct)) {
                    sink_.report(diag::Code::kUnterminatedLiteral, *open_, "string literal");
                }
            }

            lex::Cursor cur_;
            lex::TokenSink<kEmit> sink_;
            LexState state_;

            // line-local context
            uint32_t indent_ = 0;
            uint32_t words_ = 0;
            bool import_line_ = false;
            bool after_def_ = false;
            bool after_class_ = false;
            bool after_dot_ = false;
            bool expect_params_ = false;

            // diagnostics only
            std::vector<std::pair<char, Span>> brackets_;
            std::optional<Span> open_{};
        };

    } // namespace

    std::span<const std::string_view> legend() {
        return k_legend;
    }

    ScanResult<LexState> Strategy::scan(std::string_view slice, uint32_t start_line,
                                        const LexState& initial, diag::Bag* diags) {
        Scanner<true> sc(slice, start_line, initial, diags);
        ScanResult<LexState> out;
        out.end_state = sc.run();
        out.tokens = sc.take_tokens();
        return out;
    }

    LexState Strategy::scan_state(std::string_view slice, const LexState& initial) {
        Scanner<false> sc(slice, 0, initial, nullptr);
        return sc.run();
    }

} // namespace tessel::python
