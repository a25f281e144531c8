#include "../../tools/tesselc/src/cli/Options.hpp"

#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static tesselc::cli::Options parse_(std::initializer_list<std::string_view> args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("tesselc");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return tesselc::cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool test_language_inferred_from_extension_() {
        const auto opt = parse_({"--file", "deploy/values.yml"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.mode == tesselc::cli::Mode::kTokens, "default dump must be tokens");
        ok &= require_(opt.language == tessel::LanguageId::kYaml, ".yml must infer yaml");
        ok &= require_(!opt.range.has_value(), "range must be absent");

        const auto css = parse_({"--file", "site/theme.css"});
        ok &= require_(css.ok && css.language == tessel::LanguageId::kCss, ".css must infer css");
        return ok;
    }

    static bool test_explicit_language_overrides_extension_() {
        const auto opt = parse_({"--file", "build.txt", "--language", "Nim", "--dump", "encoded"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.language == tessel::LanguageId::kNim, "language name must be case-insensitive");
        ok &= require_(opt.mode == tesselc::cli::Mode::kEncoded, "dump encoded must parse");
        return ok;
    }

    static bool test_unknown_extension_fails_() {
        const auto opt = parse_({"--file", "notes.txt"});

        bool ok = true;
        ok &= require_(!opt.ok, "uninferable language must fail");
        ok &= require_(opt.error.find("use --language") != std::string::npos, "error must suggest --language");
        return ok;
    }

    static bool test_unknown_language_fails_() {
        const auto opt = parse_({"--file", "a.py", "--language", "cobol"});

        bool ok = true;
        ok &= require_(!opt.ok, "unknown language must fail");
        ok &= require_(opt.error == "unknown language: cobol", "error must name the language");
        return ok;
    }

    static bool test_range_and_overrides_parse_() {
        const auto opt = parse_({
            "--file", "run.sh",
            "--range", "10", "20",
            "--threads", "8",
            "--threshold", "100",
            "--config", "ci/tessel.toml",
            "--lang", "ko",
            "--stats",
        });

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.language == tessel::LanguageId::kShell, ".sh must infer shell");
        ok &= require_(opt.range.has_value() && opt.range->start_line == 10 && opt.range->end_line == 20,
                       "range must parse");
        ok &= require_(opt.max_threads == 8, "threads must parse");
        ok &= require_(opt.threshold == 100, "threshold must parse");
        ok &= require_(opt.config_path == std::string("ci/tessel.toml"), "config path must parse");
        ok &= require_(opt.lang == tessel::diag::Language::kKo, "diag language must parse");
        ok &= require_(opt.stats, "stats flag must be set");
        return ok;
    }

    static bool test_range_rejects_reversed_and_negative_() {
        const auto reversed = parse_({"--file", "a.json", "--range", "5", "2"});
        const auto negative = parse_({"--file", "a.json", "--range", "-1", "2"});
        const auto missing = parse_({"--file", "a.json", "--range", "5"});

        bool ok = true;
        ok &= require_(!reversed.ok, "reversed range must fail");
        ok &= require_(!negative.ok, "negative range must fail");
        ok &= require_(!missing.ok, "range with one bound must fail");
        return ok;
    }

    static bool test_bad_number_fails_() {
        const auto opt = parse_({"--file", "a.py", "--threads", "four"});

        bool ok = true;
        ok &= require_(!opt.ok, "non-numeric threads must fail");
        ok &= require_(opt.error.find("--threads") != std::string::npos, "error must name the flag");
        return ok;
    }

    static bool test_bad_dump_kind_fails_() {
        const auto opt = parse_({"--file", "a.py", "--dump", "xml"});
        return require_(!opt.ok, "unknown dump kind must fail");
    }

    static bool test_version_and_usage_modes_() {
        const auto ver = parse_({"--file", "a.py", "--version"});
        const auto help = parse_({"-h"});
        const auto no_file = parse_({"--language", "json"});

        bool ok = true;
        ok &= require_(ver.ok && ver.mode == tesselc::cli::Mode::kVersion, "--version must win");
        ok &= require_(help.ok && help.mode == tesselc::cli::Mode::kUsage, "-h must print usage");
        ok &= require_(no_file.ok && no_file.mode == tesselc::cli::Mode::kUsage, "missing --file must print usage");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"language_inferred_from_extension", test_language_inferred_from_extension_},
        {"explicit_language_overrides_extension", test_explicit_language_overrides_extension_},
        {"unknown_extension_fails", test_unknown_extension_fails_},
        {"unknown_language_fails", test_unknown_language_fails_},
        {"range_and_overrides_parse", test_range_and_overrides_parse_},
        {"range_rejects_reversed_and_negative", test_range_rejects_reversed_and_negative_},
        {"bad_number_fails", test_bad_number_fails_},
        {"bad_dump_kind_fails", test_bad_dump_kind_fails_},
        {"version_and_usage_modes", test_version_and_usage_modes_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
