#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <cstdlib>

namespace {

std::pair<int, std::string> run_capture(const std::string& command) {
    const auto tmp = std::filesystem::temp_directory_path() / "tesselc_cli_capture.txt";
    const std::string full = command + " > \"" + tmp.string() + "\" 2>&1";
    const int rc = std::system(full.c_str());

    std::ifstream ifs(tmp, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    std::error_code ec{};
    std::filesystem::remove(tmp, ec);
    return {rc, out};
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) return false;
    ofs << text;
    return ofs.good();
}

std::filesystem::path fixture_dir() {
    const auto dir = std::filesystem::temp_directory_path() / "tesselc-cli-cases";
    std::error_code ec{};
    std::filesystem::create_directories(dir, ec);
    return dir;
}

bool test_help_and_version() {
    const std::string bin = TESSELC_BUILD_BIN;

    auto [rc_help, out_help] = run_capture("\"" + bin + "\" --help");
    if (rc_help != 0 || !contains(out_help, "--dump tokens|encoded|legend")) {
        std::cerr << "help failed\n" << out_help;
        return false;
    }

    auto [rc_ver, out_ver] = run_capture("\"" + bin + "\" --version");
    if (rc_ver != 0 || !contains(out_ver, "tessel v")) {
        std::cerr << "version failed\n" << out_ver;
        return false;
    }

    auto [rc_bad, out_bad] = run_capture("\"" + bin + "\" --file x.unknown");
    if (rc_bad == 0 || !contains(out_bad, "cannot infer language")) {
        std::cerr << "unknown extension must fail\n" << out_bad;
        return false;
    }
    return true;
}

bool test_dump_tokens_and_encoded() {
    const std::string bin = TESSELC_BUILD_BIN;
    const auto path = fixture_dir() / "ok.sh";
    if (!write_text(path, "echo $HOME # hi\n")) return false;

    auto [rc_tok, out_tok] = run_capture("\"" + bin + "\" --file \"" + path.string() + "\"");
    if (rc_tok != 0 || !contains(out_tok, "1:6 len=5 parameter") || !contains(out_tok, "1:12 len=4 comment")) {
        std::cerr << "token dump failed\n" << out_tok;
        return false;
    }

    auto [rc_enc, out_enc] = run_capture("\"" + bin + "\" --file \"" + path.string() + "\" --dump encoded");
    if (rc_enc != 0 || !contains(out_enc, "0 5 5 5 0\n0 6 4 3 0\n")) {
        std::cerr << "encoded dump failed\n" << out_enc;
        return false;
    }

    auto [rc_leg, out_leg] = run_capture("\"" + bin + "\" --file \"" + path.string() + "\" --dump legend");
    if (rc_leg != 0 || !contains(out_leg, "9 label")) {
        std::cerr << "legend dump failed\n" << out_leg;
        return false;
    }
    return true;
}

bool test_diagnostics_render_and_fail() {
    const std::string bin = TESSELC_BUILD_BIN;
    const auto path = fixture_dir() / "bad.py";
    if (!write_text(path, "x = \"abc\n")) return false;

    auto [rc_en, out_en] = run_capture("\"" + bin + "\" --file \"" + path.string() + "\"");
    if (rc_en == 0 || !contains(out_en, "error[UnterminatedLiteral]: unterminated string literal")
        || !contains(out_en, "bad.py:1:5")) {
        std::cerr << "english diagnostic failed\n" << out_en;
        return false;
    }

    auto [rc_ko, out_ko] = run_capture("\"" + bin + "\" --file \"" + path.string() + "\" --lang ko");
    if (rc_ko == 0 || !contains(out_ko, "닫히지 않았습니다")) {
        std::cerr << "korean diagnostic failed\n" << out_ko;
        return false;
    }
    return true;
}

bool test_stats_and_range() {
    const std::string bin = TESSELC_BUILD_BIN;
    const auto path = fixture_dir() / "big.sh";

    std::string text;
    for (int i = 0; i < 20; ++i) text += "cat <<EOF\nbody " + std::to_string(i) + "\nEOF\n";
    if (!write_text(path, text)) return false;

    auto [rc_par, out_par] = run_capture(
        "\"" + bin + "\" --file \"" + path.string() + "\" --threads 3 --threshold 1 --stats");
    // the worker count is capped by the machine
    const unsigned hw = std::thread::hardware_concurrency();
    const unsigned workers = std::min(3u, hw == 0 ? 1u : hw);
    const std::string want = (workers >= 2)
        ? "path: parallel, lines: 61, sections: " + std::to_string(workers)
        : std::string("path: sequential, lines: 61, sections: 1");
    if (rc_par != 0 || !contains(out_par, want)) {
        std::cerr << "parallel stats failed\n" << out_par;
        return false;
    }

    auto [rc_seq, out_seq] = run_capture("\"" + bin + "\" --file \"" + path.string() + "\" --stats");
    if (rc_seq != 0 || !contains(out_seq, "path: sequential")) {
        std::cerr << "sequential stats failed\n" << out_seq;
        return false;
    }

    auto [rc_rng, out_rng] = run_capture(
        "\"" + bin + "\" --file \"" + path.string() + "\" --range 1 1 --stats");
    if (rc_rng != 0 || !contains(out_rng, "range strategy: filter-full") || !contains(out_rng, "2:1 len=6 string")
        || contains(out_rng, "1:5")) {
        std::cerr << "range dump failed\n" << out_rng;
        return false;
    }
    return true;
}

bool test_config_file_and_clamp_warning() {
    const std::string bin = TESSELC_BUILD_BIN;
    const auto dir = fixture_dir();
    const auto cfg = dir / "tessel.toml";
    const auto src = dir / "cfg.json";
    if (!write_text(cfg, "[engine]\nmax_threads = 0\n")) return false;
    if (!write_text(src, "{\"a\": 1}\n")) return false;

    auto [rc, out] = run_capture(
        "\"" + bin + "\" --file \"" + src.string() + "\" --config \"" + cfg.string() + "\"");
    if (rc != 0 || !contains(out, "warning: max_threads 0 clamped to 1") || !contains(out, "1:2 len=3 property")) {
        std::cerr << "config run failed\n" << out;
        return false;
    }

    auto [rc_missing, out_missing] = run_capture(
        "\"" + bin + "\" --file \"" + src.string() + "\" --config \"" + (dir / "none.toml").string() + "\"");
    if (rc_missing == 0 || !contains(out_missing, "config file not found")) {
        std::cerr << "missing config must fail\n" << out_missing;
        return false;
    }
    return true;
}

} // namespace

int main() {
    const bool ok1 = test_help_and_version();
    const bool ok2 = test_dump_tokens_and_encoded();
    const bool ok3 = test_diagnostics_render_and_fail();
    const bool ok4 = test_stats_and_range();
    const bool ok5 = test_config_file_and_clamp_warning();

    std::error_code ec{};
    std::filesystem::remove_all(fixture_dir(), ec);

    if (!ok1 || !ok2 || !ok3 || !ok4 || !ok5) return 1;
    std::cout << "tesselc cli tests passed\n";
    return 0;
}
