// engine/src/lang/shell.cpp
#include <tessel/lang/Shell.hpp>
#include <tessel/lex/Cursor.hpp>
#include <tessel/lex/TokenSink.hpp>

#include <array>
#include <optional>
#include <string>
#include <unordered_set>


namespace tessel::shell {

    namespace {

        constexpr std::array<std::string_view, 10> k_legend = {
            "keyword",
            "string",
            "number",
            "comment",
            "function",
            "parameter",
            "operator",
            "macro",
            "namespace",
            "label",
        };

        constexpr uint32_t kind_(TokenKind k) { return static_cast<uint32_t>(k); }

        bool is_keyword_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "if", "then", "else", "elif", "fi",
                "for", "do", "done", "while", "until",
                "case", "esac", "in", "select",
                "function", "return", "exit",
                "local", "export", "readonly", "declare", "typeset",
                "unset", "unsetenv",
                "source", "eval", "exec",
                "set", "shift", "trap",
                "break", "continue",
                "true", "false",
            };
            return k.contains(w);
        }

        bool is_word_char_(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        }

        // bytes that continue a plain shell word (command names, paths, flags)
        bool is_arg_char_(char c) {
            if (is_word_char_(c)) return true;
            if (static_cast<unsigned char>(c) >= 0x80) return true;
            switch (c) {
                case '/': case '.': case '-': case ':': case '+':
                case '@': case '%': case ',': case '~':
                    return true;
                default:
                    return false;
            }
        }

        bool is_delim_char_(char c) {
            switch (c) {
                case ' ': case '\t': case '\r': case '\n':
                case ';': case '|': case '&': case '<': case '>': case '(': case ')':
                    return false;
                default:
                    return true;
            }
        }

        bool is_all_digits_(std::string_view w) {
            if (w.empty()) return false;
            for (const char c : w) {
                if (c < '0' || c > '9') return false;
            }
            return true;
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
                pending_.reset();
                after_function_kw_ = false;

                if (!resume_()) {
                    cur_.next_line();
                    return;
                }

                while (!cur_.at_line_break()) {
                    scan_one_();
                }

                // only the first heredoc opened on a line owns the following lines
                if (pending_.has_value()) {
                    state_ = std::move(*pending_);
                }
                cur_.next_line();
            }

            // continues a construct left open by an earlier line.
            // returns false when that construct owns the whole line.
            bool resume_() {
                if (const auto* hd = std::get_if<InHeredoc>(&state_)) {
                    const size_t lo = cur_.pos();
                    const size_t hi = cur_.content_end();

                    size_t b = lo;
                    if (hd->strip_tabs) {
                        while (b < hi && cur_.source()[b] == '\t') ++b;
                    }
                    size_t e = hi;
                    while (e > b && (cur_.source()[e - 1] == ' ' || cur_.source()[e - 1] == '\t')) --e;

                    if (cur_.text(b, e) == hd->delimiter) {
                        sink_.emit(kind_(TokenKind::kLabel), cur_.line(), cur_.col_of(b), static_cast<uint32_t>(e - b));
                        state_ = Normal{};
                    } else {
                        sink_.emit(kind_(TokenKind::kString), cur_.line(), 0, static_cast<uint32_t>(hi - lo));
                    }
                    return false;
                }

                if (const auto* q = std::get_if<InQuote>(&state_)) {
                    const size_t lo = cur_.pos();
                    const auto close = find_quote_close_(q->style, lo);
                    if (!close.has_value()) {
                        sink_.emit(kind_(TokenKind::kString), cur_.line(), 0, static_cast<uint32_t>(cur_.content_end() - lo));
                        return false;
                    }
                    sink_.emit(kind_(TokenKind::kString), cur_.line(), 0, static_cast<uint32_t>(*close - lo));
                    cur_.skip_to(*close);
                    state_ = Normal{};
                }
                return true;
            }

            // offset just past the closing quote on the current line
            std::optional<size_t> find_quote_close_(QuoteStyle style, size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = from;
                while (i < end) {
                    const char c = src[i];
                    if (style == QuoteStyle::kSingle) {
                        if (c == '\'') return i + 1;
                        ++i;
                        continue;
                    }
                    if (c == '\\') {
                        i += 2;
                        continue;
                    }
                    if ((style == QuoteStyle::kDouble && c == '"') || (style == QuoteStyle::kAnsiC && c == '\'')) {
                        return i + 1;
                    }
                    ++i;
                }
                return std::nullopt;
            }

            bool at_word_start_() const {
                if (cur_.col() == 0) return true;
                const char p = cur_.source()[cur_.pos() - 1];
                return p == ' ' || p == '\t' || p == ';' || p == '|' || p == '&' || p == '(' || p == ')';
            }

            void emit_to_(TokenKind k, size_t lo, size_t hi) {
                sink_.emit(kind_(k), cur_.line(), cur_.col_of(lo), static_cast<uint32_t>(hi - lo));
            }

            void scan_one_() {
                const char c = cur_.peek();
                const size_t lo = cur_.pos();

                if (c == ' ' || c == '\t' || c == '\r') {
                    cur_.bump();
                    return;
                }

                if (c == '#') {
                    const size_t hi = cur_.content_end();
                    if (cur_.line() == 0 && cur_.col() == 0 && cur_.peek(1) == '!') {
                        emit_to_(TokenKind::kNamespace, lo, hi);
                        cur_.skip_to(hi);
                        return;
                    }
                    if (at_word_start_()) {
                        emit_to_(TokenKind::kComment, lo, hi);
                        cur_.skip_to(hi);
                        return;
                    }
                    cur_.bump();
                    return;
                }

                if (c == '<' && cur_.peek(1) == '<') {
                    if (cur_.peek(2) == '<') {
                        // here-string, no body
                        emit_to_(TokenKind::kOperator, lo, lo + 3);
                        cur_.skip_to(lo + 3);
                        return;
                    }
                    const bool strip = (cur_.peek(2) == '-');
                    const size_t op_end = lo + (strip ? 3 : 2);
                    emit_to_(TokenKind::kOperator, lo, op_end);
                    cur_.skip_to(op_end);
                    cur_.skip_ws();
                    read_heredoc_word_(strip);
                    return;
                }

                if (c == '"' || c == '\'' || (c == '$' && cur_.peek(1) == '\'')) {
                    const QuoteStyle style =
                        (c == '"')  ? QuoteStyle::kDouble :
                        (c == '\'') ? QuoteStyle::kSingle : QuoteStyle::kAnsiC;
                    const size_t body = lo + ((style == QuoteStyle::kAnsiC) ? 2 : 1);

                    if (const auto close = find_quote_close_(style, body); close.has_value()) {
                        emit_to_(TokenKind::kString, lo, *close);
                        cur_.skip_to(*close);
                        return;
                    }

                    const size_t hi = cur_.content_end();
                    emit_to_(TokenKind::kString, lo, hi);
                    // a heredoc opened earlier on this line takes the next line instead
                    if (!pending_.has_value()) {
                        state_ = InQuote{style};
                        open_ = Span{cur_.line(), cur_.col_of(lo), cur_.col_of(hi)};
                        open_what_ = "quoted string";
                    }
                    cur_.skip_to(hi);
                    return;
                }

                if (c == '$') {
                    scan_dollar_();
                    return;
                }

                if (c == '`') {
                    size_t i = lo + 1;
                    const size_t end = cur_.content_end();
                    const auto src = cur_.source();
                    while (i < end && src[i] != '`') {
                        i += (src[i] == '\\') ? 2 : 1;
                    }
                    const size_t hi = (i < end) ? i + 1 : end;
                    emit_to_(TokenKind::kMacro, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (c == '|' || c == '&' || c == ';' || c == '>' || c == '<') {
                    const char n = cur_.peek(1);
                    const bool two =
                        (c == '|' && n == '|') || (c == '&' && n == '&') ||
                        (c == ';' && n == ';') || (c == '>' && n == '>') ||
                        (c == '>' && n == '&') || (c == '&' && n == '>');
                    const size_t hi = lo + (two ? 2 : 1);
                    emit_to_(TokenKind::kOperator, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (c == '=') {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    cur_.bump();
                    return;
                }

                if (is_arg_char_(c)) {
                    while (!cur_.at_line_break() && is_arg_char_(cur_.peek())) cur_.bump();
                    if constexpr (kEmit) {
                        classify_word_(lo, cur_.pos());
                    }
                    return;
                }

                // brackets, braces and anything unknown: no token
                cur_.bump();
            }

            void read_heredoc_word_(bool strip) {
                const size_t lo = cur_.pos();
                std::string delim;

                const char q = cur_.peek();
                if (q == '\'' || q == '"') {
                    cur_.bump();
                    while (!cur_.at_line_break() && cur_.peek() != q) delim.push_back(cur_.bump());
                    if (cur_.peek() == q) cur_.bump();
                } else {
                    while (!cur_.at_line_break() && is_delim_char_(cur_.peek())) {
                        const char ch = cur_.bump();
                        if (ch == '\\') continue; // <<\EOF
                        delim.push_back(ch);
                    }
                }

                if (delim.empty()) return;
                emit_to_(TokenKind::kLabel, lo, cur_.pos());

                if (!pending_.has_value()) {
                    pending_ = InHeredoc{std::move(delim), strip};
                    open_ = Span{cur_.line(), cur_.col_of(lo), cur_.col()};
                    open_what_ = "heredoc";
                }
            }

            void scan_dollar_() {
                const size_t lo = cur_.pos();
                const size_t end = cur_.content_end();
                const auto src = cur_.source();
                const char n = cur_.peek(1);

                if (n == '(') {
                    // $( ... ) on one line is a single macro token; otherwise only `$(` is
                    int depth = 0;
                    size_t i = lo + 1;
                    for (; i < end; ++i) {
                        if (src[i] == '(') ++depth;
                        else if (src[i] == ')' && --depth == 0) break;
                    }
                    const size_t hi = (i < end) ? i + 1 : lo + 2;
                    emit_to_(TokenKind::kMacro, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (n == '{') {
                    size_t i = lo + 2;
                    while (i < end && src[i] != '}') ++i;
                    const size_t hi = (i < end) ? i + 1 : end;
                    emit_to_(TokenKind::kParameter, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (n == '@' || n == '*' || n == '#' || n == '?' || n == '-' || n == '$' || n == '!' || (n >= '0' && n <= '9')) {
                    emit_to_(TokenKind::kParameter, lo, lo + 2);
                    cur_.skip_to(lo + 2);
                    return;
                }

                if (is_word_char_(n)) {
                    size_t i = lo + 1;
                    while (i < end && is_word_char_(src[i])) ++i;
                    emit_to_(TokenKind::kParameter, lo, i);
                    cur_.skip_to(i);
                    return;
                }

                cur_.bump();
            }

            void classify_word_(size_t lo, size_t hi) {
                const auto word = cur_.text(lo, hi);

                if (after_function_kw_) {
                    after_function_kw_ = false;
                    emit_to_(TokenKind::kFunction, lo, hi);
                    return;
                }

                if (is_keyword_(word)) {
                    emit_to_(TokenKind::kKeyword, lo, hi);
                    if (word == "function") after_function_kw_ = true;
                    return;
                }

                if (is_all_digits_(word)) {
                    emit_to_(TokenKind::kNumber, lo, hi);
                    return;
                }

                // name() / name ()
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t p = hi;
                while (p < end && (src[p] == ' ' || src[p] == '\t')) ++p;
                if (p + 1 < end && src[p] == '(' && src[p + 1] == ')') {
                    emit_to_(TokenKind::kFunction, lo, hi);
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

            std::optional<InHeredoc> pending_{};
            bool after_function_kw_ = false;

            // where the construct that is still open was opened (diagnostics only)
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

} // namespace tessel::shell
