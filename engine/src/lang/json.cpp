// engine/src/lang/json.cpp
#include <tessel/lang/Json.hpp>

#include <array>
#include <string>
#include <vector>


namespace tessel::json {

    namespace {

        constexpr std::array<std::string_view, 4> k_legend = {
            "property",
            "string",
            "number",
            "keyword",
        };

        constexpr uint32_t kind_(TokenKind k) { return static_cast<uint32_t>(k); }

        bool is_ws_(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
        bool is_digit_(char c) { return c >= '0' && c <= '9'; }
        bool is_alpha_(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

        /// @brief 줄/컬럼을 추적하는 바이트 워커 (JSON 전용)
        class Walker {
        public:
            explicit Walker(std::string_view text) : text_(text) {}

            bool eof() const { return pos_ >= text_.size(); }
            char peek(size_t k = 0) const {
                const size_t i = pos_ + k;
                return (i < text_.size()) ? text_[i] : '\0';
            }

            void bump() {
                if (eof()) return;
                if (text_[pos_] == '\n') {
                    ++line_;
                    col_ = 0;
                } else {
                    ++col_;
                }
                ++pos_;
            }

            void skip_ws() {
                while (!eof() && is_ws_(text_[pos_])) bump();
            }

            // skips whole lines until `line` is reached
            void seek_line(uint32_t line) {
                while (!eof() && line_ < line) bump();
            }

            size_t pos() const { return pos_; }
            uint32_t line() const { return line_; }
            uint32_t col() const { return col_; }
            std::string_view text() const { return text_; }

        private:
            std::string_view text_;
            size_t pos_ = 0;
            uint32_t line_ = 0;
            uint32_t col_ = 0;
        };

        struct StringLit {
            uint32_t line = 0;
            uint32_t col = 0;
            uint32_t length = 0;
            bool closed = false;
        };

        // reads "..." starting at the opening quote; a string never crosses a line break.
        // bad escapes are passed to on_bad_escape(line, col, escaped_char).
        template <class OnBadEscape>
        StringLit read_string_(Walker& w, OnBadEscape&& on_bad_escape) {
            StringLit s{w.line(), w.col(), 0, false};
            const size_t lo = w.pos();
            w.bump();

            while (!w.eof()) {
                const char c = w.peek();
                if (c == '\n' || (c == '\r' && (w.peek(1) == '\n' || w.peek(1) == '\0'))) break;
                if (c == '\\') {
                    w.bump();
                    const char e = w.peek();
                    if (e == '\n' || e == '\0') break;
                    switch (e) {
                        case '"': case '\\': case '/': case 'b': case 'f':
                        case 'n': case 'r': case 't': case 'u':
                            break;
                        default:
                            on_bad_escape(w.line(), w.col(), e);
                            break;
                    }
                    w.bump();
                    continue;
                }
                w.bump();
                if (c == '"') {
                    s.closed = true;
                    break;
                }
            }
            s.length = static_cast<uint32_t>(w.pos() - lo);
            return s;
        }

        void read_number_(Walker& w) {
            if (w.peek() == '-') w.bump();
            while (is_digit_(w.peek())) w.bump();
            if (w.peek() == '.') {
                w.bump();
                while (is_digit_(w.peek())) w.bump();
            }
            if (w.peek() == 'e' || w.peek() == 'E') {
                w.bump();
                if (w.peek() == '+' || w.peek() == '-') w.bump();
                while (is_digit_(w.peek())) w.bump();
            }
        }

        std::string_view read_word_(Walker& w) {
            const size_t lo = w.pos();
            while (is_alpha_(w.peek())) w.bump();
            return w.text().substr(lo, w.pos() - lo);
        }

        bool is_literal_name_(std::string_view word) {
            return word == "true" || word == "false" || word == "null";
        }

        enum class Frame : uint8_t {
            kObject,
            kArray,
        };

        class FullTokenizer {
        public:
            FullTokenizer(std::string_view text, diag::Bag* diags) : w_(text), diags_(diags) {}

            TokenList run() {
                while (true) {
                    w_.skip_ws();
                    if (w_.eof()) break;
                    step_();
                }

                if (!stack_.empty()) {
                    report_(diag::Code::kStructuralMismatch, w_.line(), w_.col(), 1, "unexpected end of input");
                }
                return std::move(tokens_);
            }

        private:
            void step_() {
                const char c = w_.peek();
                const uint32_t line = w_.line();
                const uint32_t col = w_.col();

                switch (c) {
                    case '{':
                    case '[':
                        count_root_value_(line, col);
                        stack_.push_back(c == '{' ? Frame::kObject : Frame::kArray);
                        expect_key_ = (c == '{');
                        w_.bump();
                        return;

                    case '}':
                    case ']': {
                        const Frame want = (c == '}') ? Frame::kObject : Frame::kArray;
                        if (!stack_.empty() && stack_.back() == want) {
                            stack_.pop_back();
                        } else {
                            report_(diag::Code::kStructuralMismatch, line, col, 1, std::string("unmatched '") + c + "'");
                        }
                        expect_key_ = false;
                        w_.bump();
                        return;
                    }

                    case ':':
                        expect_key_ = false;
                        w_.bump();
                        return;

                    case ',':
                        expect_key_ = (!stack_.empty() && stack_.back() == Frame::kObject);
                        w_.bump();
                        return;

                    case '"': {
                        const bool key = expect_key_ && !stack_.empty() && stack_.back() == Frame::kObject;
                        count_root_value_(line, col);
                        const auto s = read_string_(w_, [this](uint32_t l, uint32_t cc, char e) {
                            report_(diag::Code::kUnexpectedCharacter, l, cc, 1, std::string("\\") + e);
                        });
                        tokens_.push_back(Token{kind_(key ? TokenKind::kProperty : TokenKind::kString), s.line, s.col, s.length});
                        if (!s.closed) {
                            report_(diag::Code::kUnterminatedLiteral, s.line, s.col, s.length, "string");
                        }
                        if (key) expect_key_ = false;
                        return;
                    }

                    default:
                        break;
                }

                if (c == '-' || is_digit_(c)) {
                    count_root_value_(line, col);
                    const size_t lo = w_.pos();
                    read_number_(w_);
                    tokens_.push_back(Token{kind_(TokenKind::kNumber), line, col, static_cast<uint32_t>(w_.pos() - lo)});
                    return;
                }

                if (is_alpha_(c)) {
                    count_root_value_(line, col);
                    const auto word = read_word_(w_);
                    if (is_literal_name_(word)) {
                        tokens_.push_back(Token{kind_(TokenKind::kKeyword), line, col, static_cast<uint32_t>(word.size())});
                    } else {
                        report_(diag::Code::kUnexpectedCharacter, line, col, 1, std::string(1, c));
                    }
                    return;
                }

                report_(diag::Code::kUnexpectedCharacter, line, col, 1, std::string(1, c));
                w_.bump();
            }

            void count_root_value_(uint32_t line, uint32_t col) {
                if (!stack_.empty()) return;
                if (++root_values_ == 2) {
                    report_(diag::Code::kStructuralMismatch, line, col, 1, "multiple root values");
                }
            }

            void report_(diag::Code code, uint32_t line, uint32_t col, uint32_t len, std::string_view arg) {
                if (diags_ == nullptr) return;
                diags_->report(code, Span{line, col, col + len}, arg);
            }

            Walker w_;
            diag::Bag* diags_ = nullptr;
            TokenList tokens_;
            std::vector<Frame> stack_;
            bool expect_key_ = false;
            uint32_t root_values_ = 0;
        };

    } // namespace

    std::span<const std::string_view> legend() {
        return k_legend;
    }

    TokenList tokenize_full(std::string_view text, diag::Bag* diags) {
        FullTokenizer t(text, diags);
        return t.run();
    }

    TokenList tokenize_range_local(std::string_view text, uint32_t start_line, uint32_t end_line) {
        TokenList out;
        if (start_line > end_line) return out;

        Walker w(text);
        w.seek_line(start_line);

        const auto in_range = [&](uint32_t line) { return line >= start_line && line <= end_line; };

        while (true) {
            w.skip_ws();
            if (w.eof() || w.line() > end_line) break;

            const char c = w.peek();
            const uint32_t line = w.line();
            const uint32_t col = w.col();

            if (c == '"') {
                const auto s = read_string_(w, [](uint32_t, uint32_t, char) {});
                // local lookahead: the next non-whitespace byte decides key vs value
                Walker look = w;
                look.skip_ws();
                const bool key = (look.peek() == ':');
                if (in_range(s.line)) {
                    out.push_back(Token{kind_(key ? TokenKind::kProperty : TokenKind::kString), s.line, s.col, s.length});
                }
                continue;
            }

            if (c == '-' || is_digit_(c)) {
                const size_t lo = w.pos();
                read_number_(w);
                if (in_range(line)) {
                    out.push_back(Token{kind_(TokenKind::kNumber), line, col, static_cast<uint32_t>(w.pos() - lo)});
                }
                continue;
            }

            if (is_alpha_(c)) {
                const auto word = read_word_(w);
                if (is_literal_name_(word) && in_range(line)) {
                    out.push_back(Token{kind_(TokenKind::kKeyword), line, col, static_cast<uint32_t>(word.size())});
                }
                continue;
            }

            w.bump();
        }
        return out;
    }

} // namespace tessel::json
