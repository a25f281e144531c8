// engine/include/tessel/engine/Tokenizer.hpp
#pragma once
#include <tessel/engine/Section.hpp>
#include <tessel/lang/Language.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>


namespace tessel::engine {

    /// @brief 언어 하나의 토크나이저. 서버/CLI는 이 인터페이스만 본다.
    class Tokenizer {
    public:
        virtual ~Tokenizer() = default;

        virtual LanguageId language() const = 0;
        virtual RangeStrategy range_strategy() const = 0;
        virtual bool supports_parallel() const = 0;

        std::span<const std::string_view> legend() const { return token_legend(language()); }

        // diags is filled only when the sequential path runs
        virtual TokenizeResult tokenize_full(std::string_view text, const TokenizeOptions& opt, diag::Bag* diags) const = 0;

        // inclusive line range
        virtual TokenList tokenize_range(std::string_view text, uint32_t start_line, uint32_t end_line,
                                         const TokenizeOptions& opt) const = 0;
    };

    std::unique_ptr<Tokenizer> make_tokenizer(LanguageId id);

} // namespace tessel::engine
