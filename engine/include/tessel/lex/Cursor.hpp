// engine/include/tessel/lex/Cursor.hpp
#pragma once
#include <cstdint>
#include <string_view>


namespace tessel::lex {

    /// @brief Byte cursor over one scan slice.
    /// The slice always starts at a line start; columns are relative to the current line,
    /// so the same bytes give the same columns wherever the slice sits in the document.
    class Cursor {
    public:
        Cursor(std::string_view src, uint32_t start_line)
            : src_(src), line_(start_line) {}

        char peek(size_t k = 0) const {
            const size_t i = pos_ + k;
            return (i < src_.size()) ? src_[i] : '\0';
        }

        bool eof() const { return pos_ >= src_.size(); }

        // '\n', '\r\n' or end of slice
        bool at_line_break() const {
            return eof() || src_[pos_] == '\n' || (src_[pos_] == '\r' && (pos_ + 1 >= src_.size() || src_[pos_ + 1] == '\n'));
        }

        char bump() {
            if (eof()) return '\0';
            const char c = src_[pos_++];
            if (c == '\n') {
                ++line_;
                line_start_ = pos_;
            }
            return c;
        }

        // moves forward inside the current line only
        void skip_to(size_t off) {
            const size_t end = line_end();
            pos_ = (off < end) ? off : end;
        }

        void skip_ws() {
            while (!eof() && (src_[pos_] == ' ' || src_[pos_] == '\t')) ++pos_;
        }

        // consumes the rest of the line including its '\n'
        void next_line() {
            skip_to(line_end());
            bump();
        }

        size_t pos() const { return pos_; }
        uint32_t line() const { return line_; }
        uint32_t col() const { return static_cast<uint32_t>(pos_ - line_start_); }
        uint32_t col_of(size_t off) const { return static_cast<uint32_t>(off - line_start_); }
        size_t line_start() const { return line_start_; }

        // offset of the current line's '\n' (or end of slice)
        size_t line_end() const {
            const size_t nl = src_.find('\n', pos_);
            return (nl == std::string_view::npos) ? src_.size() : nl;
        }

        // line_end() minus a trailing '\r'
        size_t content_end() const {
            size_t e = line_end();
            if (e > line_start_ && src_[e - 1] == '\r') --e;
            return (e < pos_) ? pos_ : e;
        }

        std::string_view text(size_t lo, size_t hi) const { return src_.substr(lo, hi - lo); }
        std::string_view rest_of_line() const { return text(pos_, content_end()); }
        std::string_view source() const { return src_; }

    private:
        std::string_view src_{};
        size_t pos_ = 0;
        size_t line_start_ = 0;
        uint32_t line_ = 0;
    };

} // namespace tessel::lex
