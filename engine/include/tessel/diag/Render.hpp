// engine/include/tessel/diag/Render.hpp
#pragma once
#include <tessel/diag/Diagnostic.hpp>
#include <tessel/text/LineIndex.hpp>

#include <string>
#include <string_view>


namespace tessel::diag {

    std::string_view code_name(Code c);

    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief 진단 한 개를 `error[Code]: msg` + 스니펫 형태로 렌더링한다.
    std::string render_one(const Diagnostic& d, Language lang, std::string_view file_name, const LineIndex& lines);

} // namespace tessel::diag
