// engine/src/text/line_index.cpp
#include <tessel/text/LineIndex.hpp>

#include <algorithm>


namespace tessel {

    std::vector<uint32_t> LineIndex::build_line_starts(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);

        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    LineIndex::LineIndex(std::string_view text)
        : text_(text), starts_(build_line_starts(text)) {}

    uint32_t LineIndex::line_start(uint32_t line) const {
        if (line >= starts_.size()) return static_cast<uint32_t>(text_.size());
        return starts_[line];
    }

    uint32_t LineIndex::line_end(uint32_t line) const {
        if (line + 1 < starts_.size()) return starts_[line + 1] - 1;
        return static_cast<uint32_t>(text_.size());
    }

    std::string_view LineIndex::line_text(uint32_t line) const {
        if (line >= starts_.size()) return {};
        const uint32_t lo = starts_[line];
        uint32_t hi = line_end(line);
        if (hi > lo && text_[hi - 1] == '\r') --hi;
        return text_.substr(lo, hi - lo);
    }

    LineCol LineIndex::line_col(uint32_t byte_off) const {
        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(text_.size()));

        auto it = std::upper_bound(starts_.begin(), starts_.end(), off);
        const uint32_t idx = (it == starts_.begin()) ? 0 : static_cast<uint32_t>((it - starts_.begin()) - 1);

        LineCol lc;
        lc.line = idx;
        lc.col = off - starts_[idx];
        return lc;
    }

    uint32_t LineIndex::offset_of(uint32_t line, uint32_t col) const {
        if (line >= starts_.size()) return static_cast<uint32_t>(text_.size());
        const uint32_t lo = starts_[line];
        const uint32_t hi = line_end(line);
        return std::min(lo + col, hi);
    }

    Snippet LineIndex::snippet_for_span(const Span& sp) const {
        Snippet sn;
        sn.line_text = line_text(sp.line);
        sn.line_no = sp.line + 1;

        const uint32_t len = static_cast<uint32_t>(sn.line_text.size());
        const uint32_t lo = std::min(sp.lo, len);
        const uint32_t hi = std::min(std::max(sp.hi, lo), len);

        sn.caret_cols_before = lo;
        sn.caret_cols_len = (hi > lo) ? (hi - lo) : 1;
        return sn;
    }

} // namespace tessel
