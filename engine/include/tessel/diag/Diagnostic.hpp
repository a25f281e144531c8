// engine/include/tessel/diag/Diagnostic.hpp
#pragma once
#include <tessel/text/Span.hpp>
#include <tessel/diag/DiagCode.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>


namespace tessel::diag {

    /// @brief 토크나이저가 보고하는 진단 하나. 위치는 한 줄 안의 [lo, hi) 컬럼 구간.
    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span, std::string_view arg)
            : severity_(severity), code_(code), span_(span), args_{std::string(arg)} {}

        Severity severity() const { return severity_; }
        Code code() const { return code_; }
        Span span() const { return span_; }
        const std::vector<std::string>& args() const { return args_; }

    private:
        Severity severity_ = Severity::kError;
        Code code_ = Code::kUnexpectedCharacter;
        Span span_{};
        std::vector<std::string> args_;
    };

    /// @brief 순차 스캔 한 번의 진단 모음. 병렬 경로에는 넘기지 않는다.
    class Bag {
    public:
        // lexers only produce errors; warnings come from configuration, not from here
        void report(Code code, Span span, std::string_view arg) {
            diags_.emplace_back(Severity::kError, code, span, arg);
        }

        bool has_error() const {
            return std::any_of(diags_.begin(), diags_.end(), [](const Diagnostic& d) {
                return d.severity() != Severity::kWarning;
            });
        }

        bool has_code(Code c) const {
            return std::any_of(diags_.begin(), diags_.end(), [c](const Diagnostic& d) { return d.code() == c; });
        }

        bool empty() const { return diags_.empty(); }
        size_t size() const { return diags_.size(); }

        const std::vector<Diagnostic>& diags() const { return diags_; }

    private:
        std::vector<Diagnostic> diags_;
    };

} // namespace tessel::diag
