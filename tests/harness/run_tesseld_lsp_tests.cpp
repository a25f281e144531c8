#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <cstdlib>

namespace {

std::string make_frame(std::string_view payload) {
    return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + std::string(payload);
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) return false;
    ofs << text;
    return ofs.good();
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return {};
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

std::string run_lsp_session(std::string_view language, const std::vector<std::string>& payloads, int& exit_code,
                            std::string_view raw_tail = {}) {
    const auto stamp = std::to_string(
        static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count()));
    const auto in_path = std::filesystem::temp_directory_path() / ("tesseld-lsp-in-" + stamp + ".txt");
    const auto out_path = std::filesystem::temp_directory_path() / ("tesseld-lsp-out-" + stamp + ".txt");

    std::string framed;
    for (const auto& p : payloads) {
        framed += make_frame(p);
    }
    framed += raw_tail;
    if (!write_text(in_path, framed)) {
        exit_code = 1;
        return "failed to write input stream";
    }

    const std::string cmd =
        "\"" + std::string(TESSELD_BUILD_BIN) + "\" --stdio --language " + std::string(language)
        + " < \"" + in_path.string() + "\" > \"" + out_path.string() + "\" 2>&1";
    exit_code = std::system(cmd.c_str());
    const std::string out = read_text(out_path);

    std::error_code ec{};
    std::filesystem::remove(in_path, ec);
    std::filesystem::remove(out_path, ec);
    return out;
}

const std::string k_initialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"processId":null,"rootUri":null,"capabilities":{}}})";
const std::string k_initialized = R"({"jsonrpc":"2.0","method":"initialized","params":{}})";
const std::string k_shutdown = R"({"jsonrpc":"2.0","id":99,"method":"shutdown","params":{}})";
const std::string k_exit = R"({"jsonrpc":"2.0","method":"exit","params":{}})";

std::string did_open(std::string_view uri, std::string_view lang_id, int version, std::string_view escaped_text) {
    return "{\"jsonrpc\":\"2.0\",\"method\":\"textDocument/didOpen\",\"params\":{\"textDocument\":{\"uri\":\""
         + std::string(uri) + "\",\"languageId\":\"" + std::string(lang_id) + "\",\"version\":"
         + std::to_string(version) + ",\"text\":\"" + std::string(escaped_text) + "\"}}}";
}

std::string full_request(int id, std::string_view uri) {
    return "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id)
         + ",\"method\":\"textDocument/semanticTokens/full\",\"params\":{\"textDocument\":{\"uri\":\""
         + std::string(uri) + "\"}}}";
}

bool test_initialize_declares_legend_and_strategy() {
    std::vector<std::string> payloads{k_initialize, k_initialized, k_shutdown, k_exit};

    int rc = 0;
    const std::string out = run_lsp_session("shell", payloads, rc);
    if (rc != 0) {
        std::cerr << "initialize session failed, rc=" << rc << "\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"tokenTypes\":[\"keyword\",\"string\",\"number\",\"comment\",\"function\","
                       "\"parameter\",\"operator\",\"macro\",\"namespace\",\"label\"]")) {
        std::cerr << "expected the shell legend in initialize\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"tesselRangeStrategy\":\"filter-full\"") || !contains(out, "\"tesselParallel\":true")) {
        std::cerr << "expected range strategy and parallel flag\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":99,\"result\":null")) {
        std::cerr << "expected shutdown result\n" << out << "\n";
        return false;
    }
    return true;
}

bool test_python_literal_diagnostic_and_tokens() {
    const std::string uri = "file:///tmp/tesseld_literal.py";
    std::vector<std::string> payloads{
        k_initialize,
        k_initialized,
        did_open(uri, "python", 1, "x = \\\"abc"),
        full_request(2, uri),
        k_shutdown,
        k_exit,
    };

    int rc = 0;
    const std::string out = run_lsp_session("python", payloads, rc);
    if (rc != 0) {
        std::cerr << "python session failed, rc=" << rc << "\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"range\":{\"start\":{\"line\":0,\"character\":4},\"end\":{\"line\":0,\"character\":8}}")
        || !contains(out, "\"code\":\"UnterminatedLiteral\"")) {
        std::cerr << "expected an UnterminatedLiteral diagnostic over [4, 8)\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":2,\"result\":{\"data\":[0,2,1,9,0,0,2,4,1,0]}")) {
        std::cerr << "expected operator + truncated string tokens\n" << out << "\n";
        return false;
    }
    return true;
}

bool test_incremental_change_and_stale_version() {
    const std::string uri = "file:///tmp/tesseld_change.sh";
    std::vector<std::string> payloads{
        k_initialize,
        k_initialized,
        did_open(uri, "shellscript", 1, "echo hi\\n"),
        "{\"jsonrpc\":\"2.0\",\"method\":\"textDocument/didChange\",\"params\":{\"textDocument\":{\"uri\":\"" + uri
            + "\",\"version\":2},\"contentChanges\":[{\"range\":{\"start\":{\"line\":0,\"character\":5},"
              "\"end\":{\"line\":0,\"character\":7}},\"text\":\"$HOME\"}]}}",
        // same version again: ignored
        "{\"jsonrpc\":\"2.0\",\"method\":\"textDocument/didChange\",\"params\":{\"textDocument\":{\"uri\":\"" + uri
            + "\",\"version\":2},\"contentChanges\":[{\"text\":\"# gone\\n\"}]}}",
        full_request(3, uri),
        k_shutdown,
        k_exit,
    };

    int rc = 0;
    const std::string out = run_lsp_session("shell", payloads, rc);
    if (rc != 0) {
        std::cerr << "change session failed, rc=" << rc << "\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":3,\"result\":{\"data\":[0,5,5,5,0]}")) {
        std::cerr << "expected a single parameter token after the edit\n" << out << "\n";
        return false;
    }
    return true;
}

bool test_json_range_uses_lookahead() {
    const std::string uri = "file:///tmp/tesseld_range.json";
    std::vector<std::string> payloads{
        k_initialize,
        k_initialized,
        did_open(uri, "json", 1, "[\\\"a\\\": 1]"),
        full_request(2, uri),
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"textDocument/semanticTokens/range\",\"params\":{\"textDocument\":{\"uri\":\""
            + uri + "\"},\"range\":{\"start\":{\"line\":0,\"character\":0},\"end\":{\"line\":1,\"character\":0}}}}",
        k_shutdown,
        k_exit,
    };

    int rc = 0;
    const std::string out = run_lsp_session("json", payloads, rc);
    if (rc != 0) {
        std::cerr << "json session failed, rc=" << rc << "\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"tesselRangeStrategy\":\"local-lookahead\"") || !contains(out, "\"tesselParallel\":false")) {
        std::cerr << "expected json to declare the lookahead strategy\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":2,\"result\":{\"data\":[0,1,3,1,0,0,5,1,2,0]}")) {
        std::cerr << "expected full tokenization to see a string\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":3,\"result\":{\"data\":[0,1,3,0,0,0,5,1,2,0]}")) {
        std::cerr << "expected range tokenization to see a property\n" << out << "\n";
        return false;
    }
    return true;
}

bool test_errors_and_init_option_warnings() {
    std::vector<std::string> payloads{
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"capabilities":{},"initializationOptions":{"tessel":{"maxThreads":0}}}})",
        R"({"jsonrpc":"2.0","id":2,"method":"textDocument/hover","params":{}})",
        R"({"jsonrpc":"2.0","id":3,"method":"textDocument/semanticTokens/range","params":{"textDocument":{"uri":"file:///none.yaml"}}})",
        R"({"jsonrpc":"2.0","id":4,"method":"textDocument/semanticTokens/full","params":{"textDocument":{"uri":"file:///none.yaml"}}})",
        k_shutdown,
        k_exit,
    };

    int rc = 0;
    const std::string out = run_lsp_session("yaml", payloads, rc);
    if (rc != 0) {
        std::cerr << "error session failed, rc=" << rc << "\n" << out << "\n";
        return false;
    }
    if (!contains(out, "window/logMessage") || !contains(out, "max_threads 0 clamped to 1")) {
        std::cerr << "expected a clamp warning via logMessage\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":2,\"error\":{\"code\":-32601")) {
        std::cerr << "expected method not found\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":3,\"error\":{\"code\":-32602")) {
        std::cerr << "expected invalid params for a range request without range\n" << out << "\n";
        return false;
    }
    if (!contains(out, "\"id\":4,\"result\":{\"data\":[]}")) {
        std::cerr << "expected empty data for an unknown document\n" << out << "\n";
        return false;
    }
    return true;
}

bool test_oversized_frame_is_refused() {
    std::vector<std::string> payloads{k_initialize, k_initialized, k_shutdown};

    int rc = 0;
    const std::string out = run_lsp_session("shell", payloads, rc,
                                            "Content-Length: 99999999999999999\r\n\r\n{\"jsonrpc\":\"2.0\"}");
    if (rc != 0) {
        std::cerr << "oversized frame must not bring the server down, rc=" << rc << "\n" << out << "\n";
        return false;
    }
    if (!contains(out, "exceeds the 67108864 byte limit") || !contains(out, "\"id\":99,\"result\":null")) {
        std::cerr << "expected the frame to be refused after a normal session\n" << out << "\n";
        return false;
    }
    return true;
}

bool test_exit_without_shutdown_fails() {
    std::vector<std::string> payloads{k_initialize, k_exit};

    int rc = 0;
    const std::string out = run_lsp_session("nim", payloads, rc);
    if (rc == 0) {
        std::cerr << "exit without shutdown must not return 0\n" << out << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    const bool ok1 = test_initialize_declares_legend_and_strategy();
    const bool ok2 = test_python_literal_diagnostic_and_tokens();
    const bool ok3 = test_incremental_change_and_stale_version();
    const bool ok4 = test_json_range_uses_lookahead();
    const bool ok5 = test_errors_and_init_option_warnings();
    const bool ok6 = test_exit_without_shutdown_fails();
    const bool ok7 = test_oversized_frame_is_refused();

    if (!ok1 || !ok2 || !ok3 || !ok4 || !ok5 || !ok6 || !ok7) return 1;
    std::cout << "tesseld lsp tests passed\n";
    return 0;
}
