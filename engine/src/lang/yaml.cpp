// engine/src/lang/yaml.cpp
#include <tessel/lang/Yaml.hpp>
#include <tessel/lex/Cursor.hpp>
#include <tessel/lex/TokenSink.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_set>


namespace tessel::yaml {

    namespace {

        constexpr std::array<std::string_view, 9> k_legend = {
            "keyword",
            "string",
            "number",
            "comment",
            "property",
            "operator",
            "type",
            "macro",
            "namespace",
        };

        constexpr uint32_t kind_(TokenKind k) { return static_cast<uint32_t>(k); }

        bool is_blank_(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\0'; }

        bool is_flow_indicator_(char c) {
            return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
        }

        std::string lower_ascii_(std::string_view s) {
            std::string out(s);
            for (auto& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            return out;
        }

        bool is_keyword_(std::string_view w) {
            static const std::unordered_set<std::string> k{
                "true", "false", "null", "~", "yes", "no", "on", "off",
            };
            return k.contains(lower_ascii_(w));
        }

        bool all_of_(std::string_view s, bool (*pred)(char)) {
            if (s.empty()) return false;
            for (const char c : s) {
                if (!pred(c)) return false;
            }
            return true;
        }

        bool is_dec_(char c) { return (c >= '0' && c <= '9') || c == '_'; }
        bool is_hex_(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0 || c == '_'; }
        bool is_oct_(char c) { return (c >= '0' && c <= '7') || c == '_'; }
        bool is_bin_(char c) { return c == '0' || c == '1' || c == '_'; }

        bool is_number_(std::string_view w) {
            if (w.empty()) return false;
            std::string_view s = w;
            if (s.front() == '+' || s.front() == '-') s.remove_prefix(1);
            if (s.empty()) return false;

            const std::string low = lower_ascii_(s);
            if (low == ".inf" || low == ".nan") return true;
            if (low.size() > 2 && low[0] == '0' && low[1] == 'x') return all_of_(s.substr(2), is_hex_);
            if (low.size() > 2 && low[0] == '0' && low[1] == 'o') return all_of_(s.substr(2), is_oct_);
            if (low.size() > 2 && low[0] == '0' && low[1] == 'b') return all_of_(s.substr(2), is_bin_);

            size_t i = 0;
            size_t digits = 0;
            while (i < s.size() && is_dec_(s[i])) { ++i; ++digits; }
            if (i < s.size() && s[i] == '.') {
                ++i;
                while (i < s.size() && is_dec_(s[i])) { ++i; ++digits; }
            }
            if (digits == 0) return false;
            if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
                ++i;
                if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
                size_t exp = 0;
                while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++exp; }
                if (exp == 0) return false;
            }
            return i == s.size();
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
                value_pos_ = true;

                const auto src = cur_.source();
                size_t i = cur_.pos();
                while (i < cur_.content_end() && src[i] == ' ') ++i;
                node_col_ = static_cast<int32_t>(cur_.col_of(i));

                if (!resume_()) {
                    cur_.next_line();
                    return;
                }

                while (!cur_.at_line_break()) {
                    scan_one_();
                }

                if (pending_.has_value()) {
                    state_.construct = *pending_;
                }
                cur_.next_line();
            }

            bool resume_() {
                const auto src = cur_.source();
                const size_t lo = cur_.pos();
                const size_t hi = cur_.content_end();

                if (const auto* bs = std::get_if<InBlockScalar>(&state_.construct)) {
                    size_t i = lo;
                    while (i < hi && src[i] == ' ') ++i;
                    if (i == hi) return false; // blank lines belong to the scalar

                    const auto indent = static_cast<int32_t>(i - lo);
                    const auto head = cur_.text(lo, std::min(lo + 3, hi));
                    const bool marker = (head == "---" || head == "...") && (lo + 3 >= hi || is_blank_(src[lo + 3]));
                    if (indent > bs->parent_indent && !marker) {
                        emit_to_(TokenKind::kString, i, hi);
                        return false;
                    }
                    state_.construct = Normal{};
                    return true;
                }

                if (const auto* qs = std::get_if<InQuotedScalar>(&state_.construct)) {
                    size_t b = lo;
                    while (b < hi && (src[b] == ' ' || src[b] == '\t')) ++b;
                    const auto close = find_quote_close_(qs->quote, b);
                    if (!close.has_value()) {
                        emit_to_(TokenKind::kString, b, hi);
                        return false;
                    }
                    emit_to_(TokenKind::kString, b, *close);
                    cur_.skip_to(*close);
                    state_.construct = Normal{};
                    value_pos_ = false;
                }
                return true;
            }

            std::optional<size_t> find_quote_close_(char quote, size_t from) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t i = from;
                while (i < end) {
                    if (quote == '"' && src[i] == '\\') {
                        i += 2;
                        continue;
                    }
                    if (src[i] == quote) {
                        // '' is an escaped quote inside single-quoted scalars
                        if (quote == '\'' && i + 1 < end && src[i + 1] == '\'') {
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

            // `key:` lookahead from hi, within this line
            bool followed_by_key_colon_(size_t hi) const {
                const auto src = cur_.source();
                const size_t end = cur_.content_end();
                size_t p = hi;
                while (p < end && (src[p] == ' ' || src[p] == '\t')) ++p;
                if (p >= end || src[p] != ':') return false;
                return p + 1 >= end || is_blank_(src[p + 1]) || (state_.flow_depth > 0 && is_flow_indicator_(src[p + 1]));
            }

            void scan_one_() {
                const auto src = cur_.source();
                const size_t lo = cur_.pos();
                const size_t end = cur_.content_end();
                const char c = cur_.peek();
                const char n = cur_.peek(1);

                if (c == ' ' || c == '\t' || c == '\r') {
                    cur_.bump();
                    return;
                }

                if (c == '#') {
                    if (cur_.col() == 0 || src[lo - 1] == ' ' || src[lo - 1] == '\t') {
                        emit_to_(TokenKind::kComment, lo, end);
                        cur_.skip_to(end);
                        return;
                    }
                    cur_.bump();
                    return;
                }

                if (cur_.col() == 0) {
                    const auto head = cur_.text(lo, std::min(lo + 3, end));
                    if ((head == "---" || head == "...") && (lo + 3 >= end || is_blank_(src[lo + 3]))) {
                        emit_to_(TokenKind::kType, lo, lo + 3);
                        cur_.skip_to(lo + 3);
                        state_.flow_depth = 0;
                        value_pos_ = true;
                        node_col_ = -1; // a root block scalar may start at column 0
                        return;
                    }
                    if (c == '%') {
                        emit_to_(TokenKind::kNamespace, lo, end);
                        cur_.skip_to(end);
                        return;
                    }
                }

                if ((c == '-' || c == '?') && value_pos_ && state_.flow_depth == 0 && is_blank_(n)) {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    cur_.bump();
                    node_col_ = static_cast<int32_t>(cur_.col_of(lo));
                    value_pos_ = true;
                    return;
                }

                if (c == ':' && (is_blank_(n) || state_.flow_depth > 0)) {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    cur_.bump();
                    value_pos_ = true;
                    return;
                }

                if ((c == '&' || c == '*') && !is_blank_(n)) {
                    size_t i = lo + 1;
                    while (i < end && !is_blank_(src[i]) && !is_flow_indicator_(src[i])) ++i;
                    emit_to_(TokenKind::kMacro, lo, i);
                    cur_.skip_to(i);
                    return;
                }

                if (c == '!') {
                    size_t i = lo + 1;
                    while (i < end && !is_blank_(src[i])) ++i;
                    emit_to_(TokenKind::kType, lo, i);
                    cur_.skip_to(i);
                    return;
                }

                if ((c == '|' || c == '>') && value_pos_ && state_.flow_depth == 0) {
                    size_t i = lo + 1;
                    while (i < end && (src[i] == '+' || src[i] == '-' || (src[i] >= '0' && src[i] <= '9'))) ++i;
                    if (i >= end || src[i] == ' ' || src[i] == '\t') {
                        emit_to_(TokenKind::kOperator, lo, i);
                        cur_.skip_to(i);
                        pending_ = InBlockScalar{node_col_, c};
                        value_pos_ = false;
                        return;
                    }
                }

                if (c == '{' || c == '[') {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    cur_.bump();
                    ++state_.flow_depth;
                    value_pos_ = true;
                    return;
                }

                if (c == '}' || c == ']' || c == ',') {
                    emit_to_(TokenKind::kOperator, lo, lo + 1);
                    cur_.bump();
                    if (c != ',' && state_.flow_depth > 0) --state_.flow_depth;
                    value_pos_ = (c == ',');
                    return;
                }

                if (c == '"' || c == '\'') {
                    const auto close = find_quote_close_(c, lo + 1);
                    if (!close.has_value()) {
                        emit_to_(TokenKind::kString, lo, end);
                        cur_.skip_to(end);
                        state_.construct = InQuotedScalar{c};
                        open_ = Span{cur_.line(), cur_.col_of(lo), cur_.col_of(end)};
                        return;
                    }
                    const bool key = followed_by_key_colon_(*close);
                    emit_to_(key ? TokenKind::kProperty : TokenKind::kString, lo, *close);
                    if (key) node_col_ = static_cast<int32_t>(cur_.col_of(lo));
                    cur_.skip_to(*close);
                    value_pos_ = false;
                    return;
                }

                scan_plain_();
            }

            void scan_plain_() {
                const auto src = cur_.source();
                const size_t lo = cur_.pos();
                const size_t end = cur_.content_end();

                size_t i = lo;
                while (i < end) {
                    const char ch = src[i];
                    if (ch == ':' && (i + 1 >= end || is_blank_(src[i + 1]) || (state_.flow_depth > 0 && is_flow_indicator_(src[i + 1])))) break;
                    if (ch == '#' && i > lo && (src[i - 1] == ' ' || src[i - 1] == '\t')) break;
                    if (state_.flow_depth > 0 && is_flow_indicator_(ch)) break;
                    ++i;
                }

                size_t hi = i;
                while (hi > lo && (src[hi - 1] == ' ' || src[hi - 1] == '\t')) --hi;
                if (hi == lo) {
                    cur_.bump();
                    return;
                }

                const bool key = followed_by_key_colon_(hi);
                if (key) node_col_ = static_cast<int32_t>(cur_.col_of(lo));

                if constexpr (kEmit) {
                    const auto word = cur_.text(lo, hi);
                    TokenKind k = TokenKind::kString;
                    if (key) k = TokenKind::kProperty;
                    else if (is_keyword_(word)) k = TokenKind::kKeyword;
                    else if (is_number_(word)) k = TokenKind::kNumber;
                    emit_to_(k, lo, hi);
                }

                cur_.skip_to(hi);
                value_pos_ = false;
            }

            // a block scalar may legally run to the end of input, a quoted scalar may not
            void finish_() {
                if (!sink_.reporting() || !open_.has_value()) return;
                if (!std::holds_alternative<InQuotedScalar>(state_.construct)) return;
                sink_.report(diag::Code::kUnterminatedLiteral, *open_, "quoted scalar");
            }

            lex::Cursor cur_;
            lex::TokenSink<kEmit> sink_;
            LexState state_;

            std::optional<InBlockScalar> pending_{};
            std::optional<Span> open_{};

            // line-local context
            int32_t node_col_ = 0;
            bool value_pos_ = true;
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

} // namespace tessel::yaml
