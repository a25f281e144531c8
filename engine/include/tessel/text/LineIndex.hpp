// engine/include/tessel/text/LineIndex.hpp
#pragma once
#include <tessel/text/Span.hpp>

#include <cstdint>
#include <string_view>
#include <vector>


namespace tessel {

    struct LineCol {
        uint32_t line = 0; // 0-based
        uint32_t col = 0;  // 0-based, byte column
    };

    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 1;           // 1-based
        uint32_t caret_cols_before = 0; // number of spaces before '^'
        uint32_t caret_cols_len = 1;    // number of '^'
    };

    /// @brief 문서 한 개의 줄 시작 오프셋 테이블. 텍스트는 빌려서 본다.
    class LineIndex {
    public:
        explicit LineIndex(std::string_view text);

        std::string_view text() const { return text_; }

        // count('\n') + 1; an empty document has one (empty) line
        uint32_t line_count() const { return static_cast<uint32_t>(starts_.size()); }

        uint32_t line_start(uint32_t line) const;

        // offset of the line's '\n' (or end of text)
        uint32_t line_end(uint32_t line) const;

        // line contents without '\n' and without a trailing '\r'
        std::string_view line_text(uint32_t line) const;

        LineCol line_col(uint32_t byte_off) const;

        // (line, col) -> byte offset, clamped into the line
        uint32_t offset_of(uint32_t line, uint32_t col) const;

        // single-line snippet for a diagnostic span (display columns are bytes)
        Snippet snippet_for_span(const Span& sp) const;

    private:
        static std::vector<uint32_t> build_line_starts(std::string_view s);

        std::string_view text_{};
        std::vector<uint32_t> starts_; // byte offsets, includes 0
    };

} // namespace tessel
