// engine/src/lang/css.cpp
#include <tessel/lang/Css.hpp>
#include <tessel/lex/Cursor.hpp>
#include <tessel/lex/TokenSink.hpp>

#include <array>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>


namespace tessel::css {

    namespace {

        constexpr std::array<std::string_view, 10> k_legend = {
            "keyword",
            "string",
            "number",
            "comment",
            "type",
            "property",
            "function",
            "operator",
            "parameter",
            "class",
        };

        constexpr uint32_t kind_(TokenKind k) { return static_cast<uint32_t>(k); }

        bool is_tag_name_(std::string_view w) {
            static const std::unordered_set<std::string_view> k{
                "a", "abbr", "address", "area", "article", "aside", "audio",
                "b", "base", "bdi", "bdo", "blockquote", "body", "br", "button",
                "canvas", "caption", "cite", "code", "col", "colgroup",
                "data", "datalist", "dd", "del", "details", "dfn", "dialog", "div", "dl", "dt",
                "em", "embed", "fieldset", "figcaption", "figure", "footer", "form",
                "h1", "h2", "h3", "h4", "h5", "h6", "head", "header", "hgroup", "hr", "html",
                "i", "iframe", "img", "input", "ins", "kbd",
                "label", "legend", "li", "link",
                "main", "map", "mark", "math", "menu", "menuitem", "meta", "meter",
                "nav", "noscript", "object", "ol", "optgroup", "option", "output",
                "p", "param", "picture", "pre", "progress", "q",
                "rb", "rp", "rt", "rtc", "ruby",
                "s", "samp", "script", "section", "select", "slot", "small", "source",
                "span", "strong", "style", "sub", "summary", "sup", "svg",
                "table", "tbody", "td", "template", "textarea", "tfoot", "th", "thead",
                "time", "title", "tr", "track", "u", "ul", "var", "video", "wbr",
            };
            return k.contains(w);
        }

        // at-rules whose block holds rules rather than declarations
        bool opens_rule_block_(std::string_view w) {
            return w == "media" || w == "supports" || w == "layer" || w == "container"
                || w == "scope" || w == "starting-style" || w == "keyframes";
        }

        bool is_media_word_(std::string_view w) {
            return w == "and" || w == "or" || w == "not" || w == "only";
        }

        bool is_ident_start_(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        bool is_word_char_(char c) {
            return is_ident_start_(c) || (c >= '0' && c <= '9') || c == '-';
        }

        bool is_alpha_(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
        bool is_digit_(char c) { return c >= '0' && c <= '9'; }

        bool is_hex_(char c) {
            return is_digit_(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        enum class QuoteEnd : uint8_t {
            kClosed,
            kContinued,     // an escaping backslash ends the line
            kCut,
        };

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
                const size_t end = cur_.content_end();

                if (std::holds_alternative<InBlockComment>(state_.construct)) {
                    const auto close = find_comment_close_(lo);
                    if (!close.has_value()) {
                        emit_to_(TokenKind::kComment, lo, end);
                        return false;
                    }
                    emit_to_(TokenKind::kComment, lo, *close);
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

            std::optional<size_t> find_comment_close_(size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                for (size_t i = from; i + 1 < end; ++i) {
                    if (src[i] == '*' && src[i + 1] == '/') return i + 2;
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

            bool selector_context_() const {
                return state_.blocks.empty() || state_.blocks.back();
            }

            size_t skip_word_(size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = from;
                while (i < end && is_word_char_(src[i])) ++i;
                return i;
            }

            void scan_one_() {
                const char c = cur_.peek();
                const char n = cur_.peek(1);
                const size_t lo = cur_.pos();

                if (c == ' ' || c == '\t' || c == '\r') {
                    cur_.bump();
                    return;
                }

                if (c == '/' && n == '*') {
                    scan_comment_(lo);
                    return;
                }

                if (c == '"' || c == '\'') {
                    scan_string_(lo);
                    return;
                }

                if (c == '@') {
                    const size_t hi = skip_word_(lo + 1);
                    emit_to_(TokenKind::kKeyword, lo, hi);
                    if (opens_rule_block_(cur_.text(lo + 1, hi))) state_.after_at_rule = true;
                    cur_.skip_to(hi);
                    return;
                }

                const bool sel = selector_context_();

                if (c == '#' && !sel && state_.in_value) {
                    const auto src = cur_.source();
                    size_t i = lo + 1;
                    while (i < cur_.content_end() && is_hex_(src[i])) ++i;
                    emit_to_(TokenKind::kNumber, lo, i);
                    cur_.skip_to(i);
                    return;
                }

                if ((c == '.' || c == '#') && sel) {
                    const size_t hi = skip_word_(lo + 1);
                    if (hi - lo > 1) emit_to_(TokenKind::kClass, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                if (c == ':') {
                    scan_colon_(lo, sel);
                    return;
                }

                switch (c) {
                    case ';':
                        emit_to_(TokenKind::kOperator, lo, lo + 1);
                        state_.in_value = false;
                        cur_.bump();
                        return;
                    case '{':
                        emit_to_(TokenKind::kOperator, lo, lo + 1);
                        state_.blocks.push_back(state_.after_at_rule);
                        state_.after_at_rule = false;
                        state_.in_value = false;
                        if (sink_.reporting()) braces_.push_back(span_of_(lo, lo + 1));
                        cur_.bump();
                        return;
                    case '}':
                        emit_to_(TokenKind::kOperator, lo, lo + 1);
                        close_block_(lo);
                        cur_.bump();
                        return;
                    case ',':
                        emit_to_(TokenKind::kOperator, lo, lo + 1);
                        cur_.bump();
                        return;
                    case '(':
                    case ')':
                        cur_.bump();
                        return;
                    case '[':
                        skip_attribute_selector_();
                        return;
                    default:
                        break;
                }

                if ((c == '>' || c == '+' || c == '~') && sel) {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    cur_.bump();
                    return;
                }

                if (c == '*' && sel) {
                    emit_to_(TokenKind::kType, lo, lo + 1);
                    cur_.bump();
                    return;
                }

                if (c == '!' && !state_.blocks.empty()) {
                    scan_important_(lo);
                    return;
                }

                const bool signed_number = c == '-' && state_.in_value
                    && (is_digit_(n) || (n == '.' && is_digit_(cur_.peek(2))));
                if (is_digit_(c) || (c == '.' && is_digit_(n)) || signed_number) {
                    scan_number_(lo);
                    return;
                }

                if (is_ident_start_(c) || c == '-') {
                    scan_word_(lo, sel);
                    return;
                }

                cur_.bump();
            }

            void scan_comment_(size_t lo) {
                const size_t end = cur_.content_end();
                if (const auto close = find_comment_close_(lo + 2); close.has_value()) {
                    emit_to_(TokenKind::kComment, lo, *close);
                    cur_.skip_to(*close);
                    return;
                }
                emit_to_(TokenKind::kComment, lo, end);
                state_.construct = InBlockComment{};
                open_ = span_of_(lo, lo + 2);
                open_what_ = "block comment";
                cur_.skip_to(end);
            }

            void scan_string_(size_t lo) {
                const size_t end = cur_.content_end();
                const char q = cur_.peek();

                size_t close = end;
                switch (find_quote_close_(q, lo + 1, &close)) {
                    case QuoteEnd::kClosed:
                        emit_to_(TokenKind::kString, lo, close);
                        cur_.skip_to(close);
                        return;
                    case QuoteEnd::kContinued:
                        emit_to_(TokenKind::kString, lo, end);
                        state_.construct = InString{q};
                        open_ = span_of_(lo, lo + 1);
                        open_what_ = "string literal";
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

            // selector context: :pseudo-class / ::pseudo-element. declarations: the value separator.
            void scan_colon_(size_t lo, bool sel) {
                if (!sel) {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    state_.in_value = true;
                    cur_.bump();
                    return;
                }

                size_t i = lo + 1;
                if (cur_.peek(1) == ':') ++i;
                if (i < cur_.content_end() && is_ident_start_(cur_.source()[i])) {
                    const size_t hi = skip_word_(i);
                    emit_to_(TokenKind::kClass, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }
                emit_to_(TokenKind::kOperator, lo, lo + 1);
                cur_.skip_to(i);
            }

            void close_block_(size_t lo) {
                if (!state_.blocks.empty()) state_.blocks.pop_back();
                state_.in_value = false;

                if (!sink_.reporting()) return;
                if (!braces_.empty()) {
                    braces_.pop_back();
                } else {
                    sink_.report(diag::Code::kStructuralMismatch, span_of_(lo, lo + 1), "unmatched '}'");
                }
            }

            // [attr="v"] carries no tokens; it ends at ']' or at the line end
            void skip_attribute_selector_() {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = cur_.pos() + 1;
                while (i < end && src[i] != ']') {
                    if (src[i] == '"' || src[i] == '\'') {
                        const char q = src[i++];
                        while (i < end && src[i] != q) i += (src[i] == '\\') ? 2 : 1;
                        if (i < end) ++i;
                        continue;
                    }
                    ++i;
                }
                cur_.skip_to(i < end ? i + 1 : end);
            }

            void scan_important_(size_t lo) {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = lo + 1;
                while (i < end && (src[i] == ' ' || src[i] == '\t')) ++i;
                const size_t w = i;
                while (i < end && is_alpha_(src[i])) ++i;
                if (cur_.text(w, i) == "important") emit_to_(TokenKind::kKeyword, lo, i);
                cur_.skip_to(i);
            }

            void scan_number_(size_t lo) {
                if (cur_.peek() == '-') cur_.bump();
                while (is_digit_(cur_.peek())) cur_.bump();
                if (cur_.peek() == '.' && is_digit_(cur_.peek(1))) {
                    cur_.bump();
                    while (is_digit_(cur_.peek())) cur_.bump();
                }
                // unit: px, em, rem, vh, ... or %
                if (cur_.peek() == '%') {
                    cur_.bump();
                } else {
                    while (is_alpha_(cur_.peek())) cur_.bump();
                }
                emit_to_(TokenKind::kNumber, lo, cur_.pos());
            }

            void scan_word_(size_t lo, bool sel) {
                if (cur_.peek() == '-' && cur_.peek(1) == '-') {
                    const size_t hi = skip_word_(lo + 2);
                    emit_to_(TokenKind::kParameter, lo, hi);
                    cur_.skip_to(hi);
                    return;
                }

                const size_t hi = skip_word_(lo);
                cur_.skip_to(hi);
                const auto word = cur_.text(lo, hi);
                if (word == "-") return;

                if (cur_.peek() == '(') {
                    emit_to_(TokenKind::kFunction, lo, hi);
                    return;
                }
                if (is_media_word_(word)) {
                    emit_to_(TokenKind::kKeyword, lo, hi);
                    return;
                }
                if (sel) {
                    // unknown selector words (custom elements) carry no token
                    if (is_tag_name_(word)) emit_to_(TokenKind::kType, lo, hi);
                    return;
                }
                // value words (auto, none, block) carry no token
                if (!state_.in_value) emit_to_(TokenKind::kProperty, lo, hi);
            }

            void finish_() {
                if (!sink_.reporting()) return;

                for (const auto& span : braces_) {
                    sink_.report(diag::Code::kStructuralMismatch, span, "unclosed '{'");
                }
                if (open_.has_value() && !std::holds_alternative<Normal>(state_.construct)) {
                    sink_.report(diag::Code::kUnterminatedLiteral, *open_, open_what_);
                }
            }

            lex::Cursor cur_;
            lex::TokenSink<kEmit> sink_;
            LexState state_;

            // diagnostics only
            std::vector<Span> braces_;
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

} // namespace tessel::css
