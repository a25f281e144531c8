#include <tessel/engine/Encoder.hpp>
#include <tessel/engine/Engine.hpp>
#include <tessel/lang/Python.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_delta_encoding_() {
        const tessel::TokenList toks = {
            {1, 0, 5, 3},
            {2, 0, 10, 2},
            {0, 2, 4, 1},
            {3, 2, 7, 6},
        };
        const auto data = tessel::engine::encode(toks);
        const std::vector<uint32_t> want = {
            0, 5, 3, 1, 0,
            0, 5, 2, 2, 0,
            2, 4, 1, 0, 0,
            0, 3, 6, 3, 0,
        };
        return require_(data == want, "line delta, same-line col delta, absolute col after a line change");
    }

    static bool test_zero_length_skipped_() {
        const tessel::TokenList toks = {
            {1, 0, 2, 3},
            {1, 0, 6, 0},
            {1, 0, 9, 1},
        };
        const auto data = tessel::engine::encode(toks);
        const std::vector<uint32_t> want = {
            0, 2, 3, 1, 0,
            0, 7, 1, 1, 0,
        };
        return require_(data == want, "zero-length token must not move the cursor");
    }

    static bool test_empty_input_() {
        const tessel::TokenList none;
        bool ok = true;
        ok &= require_(tessel::engine::encode(none).empty(), "no tokens encode to nothing");
        ok &= require_(tessel::engine::decode(std::vector<uint32_t>{}).empty(), "nothing decodes to no tokens");
        return ok;
    }

    static bool test_decode_reconstructs_scan_output_() {
        using E = tessel::engine::Engine<tessel::python::Strategy>;
        const std::string text =
            "import sys\n"
            "\n"
            "class A:\n"
            "    def f(self, x):\n"
            "        return x.y + 1  # c\n";
        const auto toks = E::tokenize_sequential(text, nullptr);
        const auto back = tessel::engine::decode(tessel::engine::encode(toks));

        bool ok = true;
        ok &= require_(!toks.empty(), "fixture must produce tokens");
        ok &= require_(back == toks, "decode(encode(t)) must equal t");
        return ok;
    }

    static bool test_decode_ignores_partial_group_() {
        const std::vector<uint32_t> data = {0, 1, 2, 3, 0, 1, 4};
        const auto toks = tessel::engine::decode(data);

        bool ok = true;
        ok &= require_(toks.size() == 1, "trailing partial group must be ignored");
        if (!toks.empty()) {
            ok &= require_(toks[0].line == 0 && toks[0].col == 1 && toks[0].length == 2 && toks[0].kind == 3,
                           "first group must decode");
        }
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"delta_encoding", test_delta_encoding_},
        {"zero_length_skipped", test_zero_length_skipped_},
        {"empty_input", test_empty_input_},
        {"decode_reconstructs_scan_output", test_decode_reconstructs_scan_output_},
        {"decode_ignores_partial_group", test_decode_ignores_partial_group_},
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
