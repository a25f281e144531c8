// engine/src/diag/render.cpp
#include <tessel/diag/Render.hpp>

#include <sstream>


namespace tessel::diag {

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kUnterminatedLiteral: return "UnterminatedLiteral";
            case Code::kUnexpectedCharacter: return "UnexpectedCharacter";
            case Code::kStructuralMismatch: return "StructuralMismatch";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            // args: {0}=construct name
            case Code::kUnterminatedLiteral: return "unterminated {0}";
            // args: {0}=character
            case Code::kUnexpectedCharacter: return "unexpected character '{0}'";
            // args: {0}=detail
            case Code::kStructuralMismatch: return "structural mismatch: {0}";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kUnterminatedLiteral: return "{0}이(가) 닫히지 않았습니다";
            case Code::kUnexpectedCharacter: return "예상하지 못한 문자 '{0}'";
            case Code::kStructuralMismatch: return "구조 불일치: {0}";
        }
        return "알 수 없는 진단";
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_one(const Diagnostic& d, Language lang, std::string_view file_name, const LineIndex& lines) {
        const std::string msg = render_message(d, lang);
        const auto sp = d.span();
        const auto sn = lines.snippet_for_span(sp);

        std::ostringstream oss;
        auto sev = d.severity();
        const char* sev_name =
            (sev == Severity::kWarning) ? "warning" :
            (sev == Severity::kFatal)   ? "fatal"   : "error";

        oss << sev_name << "[" << code_name(d.code()) << "]: " << msg << "\n";
        oss << " --> " << file_name << ":" << (sp.line + 1) << ":" << (sp.lo + 1) << "\n";
        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | ";

        // spaces to caret
        for (uint32_t i = 0; i < sn.caret_cols_before; ++i) oss << ' ';

        // underline
        for (uint32_t i = 0; i < sn.caret_cols_len; ++i) oss << '^';

        return oss.str();
    }

} // namespace tessel::diag
