// tools/tesselc/src/cli/Options.hpp
#pragma once

#include <tessel/diag/DiagCode.hpp>
#include <tessel/lang/Language.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


namespace tesselc::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kTokens,    // one token per line: line:col len kind
        kEncoded,   // LSP delta-encoded integers
        kLegend,
    };

    struct LineSpan {
        uint32_t start_line = 0;
        uint32_t end_line = 0;     // inclusive
    };

    struct Options {
        Mode mode = Mode::kUsage;

        std::string file{};
        std::optional<tessel::LanguageId> language{};
        std::optional<LineSpan> range{};

        // override tessel.toml / environment when set
        std::optional<int64_t> max_threads{};
        std::optional<int64_t> threshold{};
        std::optional<std::string> config_path{};

        tessel::diag::Language lang = tessel::diag::Language::kEn;
        bool stats = false;

        bool ok = true;
        std::string error{};
    };

    /// @brief `tesselc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

} // namespace tesselc::cli
