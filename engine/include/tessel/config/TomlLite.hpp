// engine/include/tessel/config/TomlLite.hpp
#pragma once
#include <tessel/config/EngineConfig.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>


namespace tessel::config::toml_lite {

    /// @brief `[section]` + `key = value` 만 지원하는 TOML 부분집합.
    /// Values are strings, integers or booleans. Keys are flattened to "section.key".
    /// A missing file is not an error and yields no values.
    bool parse_file(const std::filesystem::path& path,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err);

    // same grammar over an in-memory document; source_name prefixes messages
    bool parse_text(std::string_view text,
                    std::string_view source_name,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err);

} // namespace tessel::config::toml_lite
