// engine/src/engine/encoder.cpp
#include <tessel/engine/Encoder.hpp>


namespace tessel::engine {

    std::vector<uint32_t> encode(std::span<const Token> tokens) {
        std::vector<uint32_t> data;
        data.reserve(tokens.size() * 5);

        uint32_t prev_line = 0;
        uint32_t prev_col = 0;

        for (const auto& tok : tokens) {
            if (tok.length == 0) continue;

            const uint32_t delta_line = tok.line - prev_line;
            const uint32_t delta_col = (delta_line == 0) ? (tok.col - prev_col) : tok.col;

            data.push_back(delta_line);
            data.push_back(delta_col);
            data.push_back(tok.length);
            data.push_back(tok.kind);
            data.push_back(0); // modifiers

            prev_line = tok.line;
            prev_col = tok.col;
        }

        return data;
    }

    TokenList decode(std::span<const uint32_t> data) {
        TokenList out;
        out.reserve(data.size() / 5);

        uint32_t line = 0;
        uint32_t col = 0;
        for (size_t i = 0; i + 5 <= data.size(); i += 5) {
            const uint32_t dl = data[i];
            const uint32_t dc = data[i + 1];
            if (dl != 0) {
                line += dl;
                col = dc;
            } else {
                col += dc;
            }
            out.push_back(Token{data[i + 3], line, col, data[i + 2]});
        }
        return out;
    }

} // namespace tessel::engine
