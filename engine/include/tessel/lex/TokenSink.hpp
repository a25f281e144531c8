// engine/include/tessel/lex/TokenSink.hpp
#pragma once
#include <tessel/lex/Token.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <string_view>


namespace tessel::lex {

    /// @brief 스캐너 출력 대상.
    /// kEmit == false is the state-only (prescan) instantiation: every emit is compiled out,
    /// so the scanner shares its recognition rules with the full scan but produces nothing.
    template <bool kEmit>
    class TokenSink {
    public:
        explicit TokenSink(diag::Bag* diags) : diags_(kEmit ? diags : nullptr) {}

        static constexpr bool emits() { return kEmit; }

        void emit(uint32_t kind, uint32_t line, uint32_t col, uint32_t length) {
            if constexpr (kEmit) {
                if (length == 0) return;
                tokens_.push_back(Token{kind, line, col, length});
            }
        }

        // diagnostics only flow on the sequential path (a bag was supplied)
        bool reporting() const { return diags_ != nullptr; }

        void report(diag::Code code, Span span, std::string_view arg) {
            if (diags_ == nullptr) return;
            diags_->report(code, span, arg);
        }

        TokenList take() { return std::move(tokens_); }

    private:
        TokenList tokens_;
        diag::Bag* diags_ = nullptr;
    };

} // namespace tessel::lex
