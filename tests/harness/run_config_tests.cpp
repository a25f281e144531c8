#include <tessel/config/EngineConfig.hpp>
#include <tessel/config/TomlLite.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool contains_(const std::vector<std::string>& lines, const std::string& needle) {
        for (const auto& l : lines) {
            if (l.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    static bool write_text_(const std::filesystem::path& path, const std::string& text) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs) return false;
        ofs << text;
        return ofs.good();
    }

    static void clear_env_() {
        unsetenv("TESSEL_PARALLEL_THRESHOLD");
        unsetenv("TESSEL_MAX_THREADS");
        unsetenv("TESSEL_TRACE");
    }

    static bool test_toml_sections_and_types_() {
        using namespace tessel::config;
        FlatMap out;
        std::vector<std::string> warnings;
        std::string err;

        const bool parsed = toml_lite::parse_text(
            "# engine tuning\n"
            "[engine]\n"
            "parallel_line_threshold = 2500\n"
            "max_threads = +8   # inline comment\n"
            "\n"
            "[server]\n"
            "trace = true\n"
            "diag_lang = \"ko\"\n",
            "tessel.toml", out, warnings, err);

        bool ok = true;
        ok &= require_(parsed && err.empty(), "document must parse");
        ok &= require_(warnings.empty(), "clean document must not warn");
        ok &= require_(out.size() == 4, "four keys expected");

        const auto cfg = materialize(out);
        ok &= require_(cfg.parallel_line_threshold == 2500, "threshold must be read");
        ok &= require_(cfg.max_threads == 8, "max_threads must be read");
        ok &= require_(cfg.trace, "trace must be read");
        ok &= require_(cfg.diag_lang == tessel::diag::Language::kKo, "diag_lang must be read");
        return ok;
    }

    static bool test_toml_errors_have_locations_() {
        using namespace tessel::config;
        FlatMap out;
        std::vector<std::string> warnings;
        std::string err;

        const bool parsed = toml_lite::parse_text("[engine]\nmax_threads 4\n", "cfg.toml", out, warnings, err);

        bool ok = true;
        ok &= require_(!parsed, "missing '=' must fail");
        ok &= require_(err == "cfg.toml:2: expected '='", "error must carry source and line");

        err.clear();
        ok &= require_(!toml_lite::parse_text("[engine\n", "cfg.toml", out, warnings, err), "broken header must fail");
        err.clear();
        ok &= require_(!toml_lite::parse_text("a = [1]\n", "cfg.toml", out, warnings, err), "arrays are not supported");
        return ok;
    }

    static bool test_toml_duplicate_key_warns_() {
        using namespace tessel::config;
        FlatMap out;
        std::vector<std::string> warnings;
        std::string err;

        const bool parsed = toml_lite::parse_text("[engine]\nmax_threads = 2\nmax_threads = 3\n", "t", out, warnings, err);

        bool ok = true;
        ok &= require_(parsed, "duplicates are not fatal");
        ok &= require_(contains_(warnings, "duplicate key 'engine.max_threads'"), "duplicate must warn");
        ok &= require_(materialize(out).max_threads == 3, "last value wins");
        return ok;
    }

    static bool test_materialize_wrong_types_() {
        using namespace tessel::config;
        FlatMap values;
        values["engine.max_threads"] = std::string("many");
        values["server.trace"] = int64_t{1};
        values["server.diag_lang"] = std::string("fr");

        std::vector<std::string> warnings;
        const auto cfg = materialize(values, &warnings);

        bool ok = true;
        ok &= require_(cfg.max_threads == 4, "wrong-typed value must keep the default");
        ok &= require_(!cfg.trace, "wrong-typed trace must keep the default");
        ok &= require_(cfg.diag_lang == tessel::diag::Language::kEn, "unknown language must keep the default");
        ok &= require_(warnings.size() == 3, "each bad value must warn");
        return ok;
    }

    static bool test_clamp_() {
        using namespace tessel::config;
        EngineConfig low{};
        low.max_threads = 0;
        low.parallel_line_threshold = -5;

        EngineConfig high{};
        high.max_threads = 1000;

        std::vector<std::string> wl;
        std::vector<std::string> wh;
        clamp(low, &wl);
        clamp(high, &wh);

        bool ok = true;
        ok &= require_(low.max_threads == 1 && low.parallel_line_threshold == 1, "low values clamp to 1");
        ok &= require_(high.max_threads == k_max_threads_limit, "max_threads clamps to the limit");
        ok &= require_(wl.size() == 2 && wh.size() == 1, "every clamp must warn");
        ok &= require_(contains_(wl, "max_threads 0 clamped to 1"), "clamp warning must name the value");
        return ok;
    }

    static bool test_env_overrides_() {
        using namespace tessel::config;
        clear_env_();
        setenv("TESSEL_PARALLEL_THRESHOLD", "123", 1);
        setenv("TESSEL_MAX_THREADS", "two", 1);
        setenv("TESSEL_TRACE", "On", 1);

        EngineConfig cfg{};
        std::vector<std::string> warnings;
        apply_env(cfg, &warnings);
        clear_env_();

        bool ok = true;
        ok &= require_(cfg.parallel_line_threshold == 123, "numeric env must override");
        ok &= require_(cfg.max_threads == 4, "invalid env must be ignored");
        ok &= require_(cfg.trace, "boolean env is case-insensitive");
        ok &= require_(contains_(warnings, "TESSEL_MAX_THREADS"), "invalid env must warn");
        return ok;
    }

    static bool test_load_layers_file_then_env_() {
        using namespace tessel::config;
        clear_env_();

        std::error_code ec{};
        const auto dir = std::filesystem::temp_directory_path(ec) / "tessel-config-load";
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir, ec);
        const auto path = dir / "tessel.toml";
        if (ec || !write_text_(path, "[engine]\nmax_threads = 99\nparallel_line_threshold = 50\n[extra]\nx = 1\n")) {
            return require_(false, "temp config must be writable");
        }

        setenv("TESSEL_PARALLEL_THRESHOLD", "75", 1);
        EngineConfig cfg{};
        std::vector<std::string> warnings;
        std::string err;
        const bool loaded = load(path, cfg, warnings, err);
        clear_env_();
        std::filesystem::remove_all(dir, ec);

        bool ok = true;
        ok &= require_(loaded && err.empty(), "config must load");
        ok &= require_(cfg.parallel_line_threshold == 75, "environment must win over the file");
        ok &= require_(cfg.max_threads == k_max_threads_limit, "file value must be clamped");
        ok &= require_(contains_(warnings, "unknown key 'extra.x' ignored"), "unknown key must warn");
        ok &= require_(contains_(warnings, "max_threads 99 clamped"), "clamp must warn");
        return ok;
    }

    static bool test_load_missing_explicit_path_fails_() {
        using namespace tessel::config;
        EngineConfig cfg{};
        cfg.max_threads = 9;
        std::vector<std::string> warnings;
        std::string err;
        const bool loaded = load(std::filesystem::path("/nonexistent/tessel/none.toml"), cfg, warnings, err);

        bool ok = true;
        ok &= require_(!loaded, "missing explicit file must fail");
        ok &= require_(err.find("config file not found") != std::string::npos, "error must say what is missing");
        ok &= require_(cfg.max_threads == 4, "output must be reset to defaults");
        return ok;
    }

    static bool test_parse_diag_lang_() {
        using tessel::config::parse_diag_lang;
        bool ok = true;
        ok &= require_(parse_diag_lang("EN") == tessel::diag::Language::kEn, "EN must parse");
        ok &= require_(parse_diag_lang("ko") == tessel::diag::Language::kKo, "ko must parse");
        ok &= require_(!parse_diag_lang("de").has_value(), "de is unknown");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"toml_sections_and_types", test_toml_sections_and_types_},
        {"toml_errors_have_locations", test_toml_errors_have_locations_},
        {"toml_duplicate_key_warns", test_toml_duplicate_key_warns_},
        {"materialize_wrong_types", test_materialize_wrong_types_},
        {"clamp", test_clamp_},
        {"env_overrides", test_env_overrides_},
        {"load_layers_file_then_env", test_load_layers_file_then_env_},
        {"load_missing_explicit_path_fails", test_load_missing_explicit_path_fails_},
        {"parse_diag_lang", test_parse_diag_lang_},
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
