// engine/src/lang/nim.cpp
#include <tessel/lang/Nim.hpp>
#include <tessel/lex/Cursor.hpp>
#include <tessel/lex/TokenSink.hpp>

#include <array>
#include <optional>
#include <string>
#include <unordered_set>


namespace tessel::nim {

    namespace {

        constexpr std::array<std::string_view, 16> k_legend = {
            "keyword",
            "string",
            "number",
            "comment",
            "function",
            "method",
            "type",
            "macro",
            "builtinFunction",
            "operator",
            "parameter",
            "property",
            "namespace",
            "builtinConstant",
            "decorator",
            "enumMember",
        };

        constexpr uint32_t kind_(TokenKind k) { return static_cast<uint32_t>(k); }

        bool is_keyword_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "addr", "asm", "bind", "block", "break", "case", "cast", "concept",
                "const", "continue", "converter", "defer", "discard", "distinct",
                "do", "elif", "else", "end", "enum", "except", "export", "finally",
                "for", "from", "func", "if", "import", "include", "interface",
                "iterator", "let", "macro", "method", "mixin", "object", "out",
                "proc", "ptr", "raise", "ref", "return", "static", "template",
                "try", "tuple", "type", "using", "var", "when", "while", "yield",
                "as",
            };
            return k.contains(w);
        }

        // keywords highlighted as operators
        bool is_word_operator_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "and", "or", "not", "xor", "shl", "shr", "div", "mod",
                "in", "notin", "is", "isnot", "of",
            };
            return k.contains(w);
        }

        bool is_constant_(std::string_view w) {
            return w == "true" || w == "false" || w == "nil";
        }

        bool is_builtin_type_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "int", "int8", "int16", "int32", "int64",
                "uint", "uint8", "uint16", "uint32", "uint64",
                "float", "float32", "float64", "bool", "char", "byte",
                "string", "cstring", "pointer", "seq", "array", "openArray",
                "varargs", "set", "range", "Natural", "Positive", "void",
                "auto", "typed", "untyped", "typedesc", "sink", "lent",
            };
            return k.contains(w);
        }

        bool is_builtin_function_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "GC_ref", "GC_unref", "abs", "add", "alloc", "allocShared", "assert",
                "chr", "clamp", "close", "compiles", "contains", "debugEcho", "dec",
                "declared", "deepCopy", "default", "defined", "del", "dealloc",
                "doAssert", "echo", "find", "gorge", "high", "inc", "insert", "items",
                "len", "low", "max", "min", "mitems", "move", "mpairs", "new",
                "newSeq", "newString", "open", "ord", "pairs", "pred", "quit",
                "readAll", "readFile", "readLine", "realloc", "repr", "reset",
                "sizeof", "staticExec", "staticRead", "succ", "swap", "typeof",
                "wasMoved", "write", "writeFile", "writeLine", "setLen", "toSeq",
            };
            return k.contains(w);
        }

        // declaration keyword -> kind of the name that follows it
        std::optional<TokenKind> decl_kind_(std::string_view w) {
            if (w == "proc" || w == "func" || w == "iterator" || w == "converter") return TokenKind::kFunction;
            if (w == "method") return TokenKind::kMethod;
            if (w == "template" || w == "macro") return TokenKind::kMacro;
            return std::nullopt;
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
                case '=': case '+': case '-': case '*': case '/': case '<': case '>':
                case '@': case '$': case '~': case '&': case '%': case '|': case '!':
                case '?': case '^': case '.': case ':': case '\\':
                    return true;
                default:
                    return false;
            }
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
                words_ = 0;
                import_line_ = false;
                decl_line_ = false;
                enum_line_ = false;
                after_decl_.reset();
                after_dot_ = false;
                param_depth_ = 0;
                param_slot_ = false;

                if (!resume_()) {
                    cur_.next_line();
                    return;
                }

                while (!cur_.at_line_break()) {
                    scan_one_();
                }
                cur_.next_line();
            }

            bool resume_() {
                const size_t lo = cur_.pos();
                const size_t hi = cur_.content_end();

                if (auto* bc = std::get_if<InBlockComment>(&state_)) {
                    const auto close = find_block_close_(*bc, lo);
                    if (!close.has_value()) {
                        emit_to_(TokenKind::kComment, lo, hi);
                        return false;
                    }
                    emit_to_(TokenKind::kComment, lo, *close);
                    cur_.skip_to(*close);
                    state_ = Normal{};
                    return true;
                }

                if (std::holds_alternative<InTripleString>(state_)) {
                    const auto close = find_triple_close_(lo);
                    if (!close.has_value()) {
                        emit_to_(TokenKind::kString, lo, hi);
                        return false;
                    }
                    emit_to_(TokenKind::kString, lo, *close);
                    cur_.skip_to(*close);
                    state_ = Normal{};
                }
                return true;
            }

            // walks nested #[ ]# (or ##[ ]## for doc comments) on the current line.
            // bc.depth is updated in place; returns the offset past the final closer.
            std::optional<size_t> find_block_close_(InBlockComment& bc, size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                const std::string_view open = bc.doc ? "##[" : "#[";
                const std::string_view close = bc.doc ? "]##" : "]#";

                size_t i = from;
                while (i < end) {
                    const auto rest = src.substr(i, end - i);
                    if (rest.starts_with(open)) {
                        ++bc.depth;
                        i += open.size();
                        continue;
                    }
                    if (rest.starts_with(close)) {
                        i += close.size();
                        if (--bc.depth == 0) return i;
                        continue;
                    }
                    ++i;
                }
                return std::nullopt;
            }

            // a closing """ absorbs any further quotes in the run
            std::optional<size_t> find_triple_close_(size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                for (size_t i = from; i + 2 < end; ++i) {
                    if (src[i] == '"' && src[i + 1] == '"' && src[i + 2] == '"') {
                        size_t j = i + 3;
                        while (j < end && src[j] == '"') ++j;
                        return j;
                    }
                }
                return std::nullopt;
            }

            std::optional<size_t> find_quote_close_(size_t from, bool raw) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = from;
                while (i < end) {
                    if (!raw && src[i] == '\\') {
                        i += 2;
                        continue;
                    }
                    if (src[i] == '"') {
                        if (raw && i + 1 < end && src[i + 1] == '"') {
                            i += 2;
                            continue;
                        }
                        return i + 1;
                    }
                    ++i;
                }
                return std::nullopt;
            }

            void emit_to_(TokenKind k, size_t lo, size_t hi) {
                sink_.emit(kind_(k), cur_.line(), cur_.col_of(lo), static_cast<uint32_t>(hi - lo));
            }

            Span span_of_(size_t lo, size_t hi) const {
                return Span{cur_.line(), cur_.col_of(lo), cur_.col_of(hi)};
            }

            void scan_one_() {
                const char c = cur_.peek();
                const size_t lo = cur_.pos();
                const size_t end = cur_.content_end();

                if (c == ' ' || c == '\t' || c == '\r') {
                    cur_.bump();
                    return;
                }

                const bool dot = after_dot_;
                after_dot_ = false;

                if (c == '#') {
                    scan_comment_();
                    return;
                }

                if (c == '"') {
                    scan_string_(lo, lo, false);
                    return;
                }

                if ((c == 'r' || c == 'R') && cur_.peek(1) == '"') {
                    scan_string_(lo, lo + 1, true);
                    return;
                }

                if (c == '\'') {
                    scan_char_();
                    return;
                }

                if (is_digit_(c)) {
                    scan_number_();
                    return;
                }

                if (is_ident_start_(c)) {
                    while (!cur_.at_line_break() && is_ident_char_(cur_.peek())) cur_.bump();
                    on_word_(lo, cur_.pos(), dot);
                    return;
                }

                if (c == '`') {
                    // `op` style identifiers
                    size_t i = lo + 1;
                    const auto src = cur_.source();
                    while (i < end && src[i] != '`') ++i;
                    const size_t hi = (i < end) ? i + 1 : lo + 1;
                    if (after_decl_.has_value()) {
                        emit_to_(*after_decl_, lo, hi);
                        after_decl_.reset();
                    }
                    cur_.skip_to(hi);
                    return;
                }

                if (c == '{' && cur_.peek(1) == '.') {
                    const auto rest = cur_.rest_of_line();
                    const size_t close = rest.find(".}", 2);
                    const size_t hi = (close == std::string_view::npos) ? lo + 2 : lo + close + 2;
                    emit_to_(TokenKind::kDecorator, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (c == '(' || c == '[' || c == '{') {
                    if (decl_line_) {
                        ++param_depth_;
                        if (param_depth_ == 1 && c == '(') param_slot_ = true;
                    }
                    cur_.bump();
                    return;
                }

                if (c == ')' || c == ']' || c == '}') {
                    if (decl_line_ && param_depth_ > 0) --param_depth_;
                    cur_.bump();
                    return;
                }

                if (c == ',' || c == ';') {
                    if (param_depth_ == 1) param_slot_ = true;
                    cur_.bump();
                    return;
                }

                if (c == '.' && !is_operator_char_(cur_.peek(1))) {
                    cur_.bump();
                    after_dot_ = true;
                    return;
                }

                if (c == ':' && !is_operator_char_(cur_.peek(1))) {
                    cur_.bump();
                    return;
                }

                if (is_operator_char_(c)) {
                    while (!cur_.at_line_break() && is_operator_char_(cur_.peek())) cur_.bump();
                    emit_to_(TokenKind::kOperator, lo, cur_.pos());
                    return;
                }

                cur_.bump();
            }

            void scan_comment_() {
                const size_t lo = cur_.pos();
                const size_t end = cur_.content_end();
                const bool doc = (cur_.peek(1) == '#');
                const size_t open_len = doc ? 3 : 2;

                if (cur_.peek(open_len - 1) == '[') {
                    InBlockComment bc{1, doc};
                    const auto close = find_block_close_(bc, lo + open_len);
                    if (close.has_value()) {
                        emit_to_(TokenKind::kComment, lo, *close);
                        cur_.skip_to(*close);
                        return;
                    }
                    emit_to_(TokenKind::kComment, lo, end);
                    state_ = bc;
                    open_ = span_of_(lo, lo + open_len);
                    open_what_ = doc ? "documentation comment" : "block comment";
                    cur_.skip_to(end);
                    return;
                }

                emit_to_(TokenKind::kComment, lo, end);
                cur_.skip_to(end);
            }

            // lo: first byte of the literal, q_at: its opening quote
            void scan_string_(size_t lo, size_t q_at, bool raw) {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();

                if (q_at + 2 < end && src[q_at + 1] == '"' && src[q_at + 2] == '"') {
                    if (const auto close = find_triple_close_(q_at + 3); close.has_value()) {
                        emit_to_(TokenKind::kString, lo, *close);
                        cur_.skip_to(*close);
                        return;
                    }
                    emit_to_(TokenKind::kString, lo, end);
                    state_ = InTripleString{};
                    open_ = span_of_(lo, q_at + 3);
                    open_what_ = "triple-quoted string";
                    cur_.skip_to(end);
                    return;
                }

                if (const auto close = find_quote_close_(q_at + 1, raw); close.has_value()) {
                    emit_to_(TokenKind::kString, lo, *close);
                    cur_.skip_to(*close);
                    return;
                }

                emit_to_(TokenKind::kString, lo, end);
                if (sink_.reporting()) {
                    sink_.report(diag::Code::kUnterminatedLiteral, span_of_(lo, end), "string literal");
                }
                cur_.skip_to(end);
            }

            void scan_char_() {
                const size_t lo = cur_.pos();
                const auto rest = cur_.rest_of_line();

                size_t len = 0;
                if (rest.size() >= 3 && rest[1] != '\\' && rest[2] == '\'') {
                    len = 3;
                } else if (rest.size() >= 4 && rest[1] == '\\') {
                    const size_t close = rest.find('\'', 3);
                    if (close != std::string_view::npos && close <= 6) len = close + 1;
                }

                if (len == 0) {
                    cur_.bump();
                    return;
                }
                emit_to_(TokenKind::kString, lo, lo + len);
                cur_.skip_to(lo + len);
            }

            void scan_number_() {
                const size_t lo = cur_.pos();
                const char c1 = cur_.peek(1);

                if (cur_.peek() == '0' && (c1 == 'x' || c1 == 'X' || c1 == 'b' || c1 == 'B' || c1 == 'o' || c1 == 'c')) {
                    cur_.bump();
                    cur_.bump();
                    while (!cur_.at_line_break() && (is_ident_char_(cur_.peek()))) cur_.bump();
                } else {
                    while (is_digit_(cur_.peek()) || cur_.peek() == '_') cur_.bump();
                    if (cur_.peek() == '.' && is_digit_(cur_.peek(1))) {
                        cur_.bump();
                        while (is_digit_(cur_.peek()) || cur_.peek() == '_') cur_.bump();
                    }
                    if (cur_.peek() == 'e' || cur_.peek() == 'E') {
                        const char n = cur_.peek(1);
                        if (is_digit_(n) || ((n == '+' || n == '-') && is_digit_(cur_.peek(2)))) {
                            cur_.bump();
                            cur_.bump();
                            while (is_digit_(cur_.peek())) cur_.bump();
                        }
                    }
                }

                // type suffix: 1'i32, 0xff'u8, 2.0'f32
                if (cur_.peek() == '\'' && is_ident_start_(cur_.peek(1))) {
                    cur_.bump();
                    while (!cur_.at_line_break() && is_ident_char_(cur_.peek())) cur_.bump();
                }
                emit_to_(TokenKind::kNumber, lo, cur_.pos());
            }

            bool next_is_call_(size_t hi) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t p = hi;
                // an export marker may sit between a name and its parameters
                if (p < end && src[p] == '*') ++p;
                return p < end && src[p] == '(';
            }

            void on_word_(size_t lo, size_t hi, bool after_dot) {
                const auto word = cur_.text(lo, hi);
                const bool first = (words_++ == 0);

                if (first && (word == "import" || word == "include" || word == "from")) import_line_ = true;

                if constexpr (kEmit) {
                    classify_word_(word, lo, hi, after_dot);
                }

                after_decl_ = decl_kind_(word);
                if (after_decl_.has_value()) decl_line_ = true;
                if (word == "enum") enum_line_ = true;
                if (param_depth_ == 1) param_slot_ = false;
            }

            void classify_word_(std::string_view word, size_t lo, size_t hi, bool after_dot) {
                if (after_decl_.has_value()) {
                    emit_to_(*after_decl_, lo, hi);
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
                if (is_constant_(word)) {
                    emit_to_(TokenKind::kBuiltinConstant, lo, hi);
                    return;
                }
                if (import_line_) {
                    emit_to_(TokenKind::kNamespace, lo, hi);
                    return;
                }
                if (after_dot) {
                    emit_to_(next_is_call_(hi) ? TokenKind::kMethod : TokenKind::kProperty, lo, hi);
                    return;
                }
                if (param_depth_ == 1 && param_slot_) {
                    emit_to_(TokenKind::kParameter, lo, hi);
                    return;
                }
                // `= enum a, b, c` on one line
                if (enum_line_) {
                    emit_to_(TokenKind::kEnumMember, lo, hi);
                    return;
                }
                if (is_builtin_type_(word) || (word[0] >= 'A' && word[0] <= 'Z')) {
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
            }

            void finish_() {
                if (!sink_.reporting() || !open_.has_value()) return;
                if (std::holds_alternative<Normal>(state_)) return;
                sink_.report(diag::Code::kUnterminatedLiteral, *open_, open_what_);
            }

            lex::Cursor cur_;
            lex::TokenSink<kEmit> sink_;
            LexState state_;

            // line-local context
            uint32_t words_ = 0;
            bool import_line_ = false;
            bool decl_line_ = false;
            bool enum_line_ = false;
            std::optional<TokenKind> after_decl_{};
            bool after_dot_ = false;
            uint32_t param_depth_ = 0;
            bool param_slot_ = false;

            // diagnostics only
            std::optional<Span> open_{};
            std::string_view open_what_{};
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

} // namespace tessel::nim
