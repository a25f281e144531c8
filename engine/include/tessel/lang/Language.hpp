// engine/include/tessel/lang/Language.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>


namespace tessel {

    enum class LanguageId : uint8_t {
        kShell,
        kYaml,
        kPython,
        kNim,
        kJson,
        kCss,
    };

    /// @brief How a language answers viewport (line range) requests.
    enum class RangeStrategy : uint8_t {
        kFilterFull,        // full tokenization filtered by line; identical to full output
        kLocalLookahead,    // bounded per-line reclassification; may diverge on malformed input
    };

    std::string_view language_name(LanguageId id);
    std::string_view range_strategy_name(RangeStrategy s);

    // "shell" / "bash" / "sh", "yaml" / "yml", "python" / "py", "nim", "json", "css"
    std::optional<LanguageId> language_from_name(std::string_view name);

    // by file extension; query and fragment of a uri are ignored
    std::optional<LanguageId> language_from_path(std::string_view path_or_uri);

    /// @brief semanticTokens legend (tokenTypes). Index == Token::kind.
    std::span<const std::string_view> token_legend(LanguageId id);

} // namespace tessel
