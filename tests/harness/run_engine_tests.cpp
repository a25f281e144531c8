#include <tessel/engine/Engine.hpp>
#include <tessel/engine/Partition.hpp>
#include <tessel/engine/Tokenizer.hpp>
#include <tessel/engine/WorkerPool.hpp>
#include <tessel/lang/Css.hpp>
#include <tessel/lang/Nim.hpp>
#include <tessel/lang/Python.hpp>
#include <tessel/lang/Shell.hpp>
#include <tessel/lang/Yaml.hpp>

#include <atomic>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static std::string repeat_(std::string_view block, uint32_t n) {
        std::string out;
        out.reserve(block.size() * n);
        for (uint32_t i = 0; i < n; ++i) out.append(block);
        return out;
    }

    static tessel::engine::TokenizeOptions opts_(uint32_t workers, uint32_t threshold) {
        tessel::engine::TokenizeOptions o{};
        o.worker_count = workers;
        o.parallel_line_threshold = threshold;
        return o;
    }

    static constexpr std::string_view k_heredoc_block = "run <<EOF\nline one\nline two\nEOF\n";

    /// @brief 문서를 W=1..4로 돌려 순차 결과와 비교한다.
    template <class S>
    static bool check_transparency_(std::string_view text, const char* name) {
        using E = tessel::engine::Engine<S>;
        const auto seq = E::tokenize_sequential(text, nullptr);

        bool ok = true;
        for (uint32_t w = 1; w <= 4; ++w) {
            const auto res = E::tokenize(text, opts_(w, 1), nullptr);
            if (res.tokens != seq) {
                std::cerr << "  - " << name << ": W=" << w << " differs from the sequential scan\n";
                ok = false;
            }
            const auto want = (w == 1) ? tessel::engine::ExecPath::kSequential : tessel::engine::ExecPath::kParallel;
            if (res.stats.path != want) {
                std::cerr << "  - " << name << ": W=" << w << " took the wrong path\n";
                ok = false;
            }
        }
        return ok;
    }

    static bool test_partition_lines_() {
        using tessel::engine::partition_lines;
        const auto a = partition_lines(10, 3);
        const auto b = partition_lines(2, 4);
        const auto c = partition_lines(0, 4);
        const auto d = partition_lines(7, 0);

        bool ok = true;
        ok &= require_(a.size() == 3, "10 lines / 3 parts must give 3 ranges");
        if (a.size() == 3) {
            ok &= require_(a[0].first_line == 0 && a[0].line_count == 3, "first range must be [0, 3)");
            ok &= require_(a[1].first_line == 3 && a[1].line_count == 3, "second range must be [3, 6)");
            ok &= require_(a[2].first_line == 6 && a[2].line_count == 4, "last range must absorb the remainder");
        }
        ok &= require_(b.size() == 2, "parts must be clamped to the line count");
        ok &= require_(c.size() == 1 && c[0].line_count == 1, "empty document must yield one range");
        ok &= require_(d.size() == 1 && d[0].line_count == 7, "zero parts must mean one range");
        return ok;
    }

    static bool test_worker_pool_runs_every_task_() {
        const tessel::engine::WorkerPool pool(3);
        std::vector<int> out(17, 0);
        std::vector<std::function<void()>> tasks;
        for (size_t i = 0; i < out.size(); ++i) {
            tasks.push_back([&out, i] { out[i] = static_cast<int>(i) * 2; });
        }
        const auto failures = pool.run(tasks);

        bool ok = true;
        ok &= require_(failures.empty(), "no task may fail");
        for (size_t i = 0; i < out.size(); ++i) {
            ok &= require_(out[i] == static_cast<int>(i) * 2, "every task must run exactly once");
        }
        return ok;
    }

    static bool test_worker_pool_reports_failures_in_order_() {
        const tessel::engine::WorkerPool pool(4);
        std::atomic<int> ran{0};
        std::vector<std::function<void()>> tasks;
        for (int i = 0; i < 6; ++i) {
            tasks.push_back([&ran, i] {
                ++ran;
                if (i == 1 || i == 4) throw std::runtime_error("boom " + std::to_string(i));
            });
        }
        const auto failures = pool.run(tasks);

        bool ok = true;
        ok &= require_(ran.load() == 6, "failing tasks must not stop the others");
        ok &= require_(failures.size() == 2, "two failures expected");
        if (failures.size() == 2) {
            ok &= require_(failures[0].section_index == 1 && failures[1].section_index == 4, "failures must be in index order");
            ok &= require_(failures[0].message == "boom 1", "failure message must be kept");
        }
        return ok;
    }

    static bool test_resolve_worker_count_() {
        bool ok = true;
        ok &= require_(tessel::engine::resolve_worker_count(1) == 1, "max_threads 1 must give one worker");
        ok &= require_(tessel::engine::resolve_worker_count(0) == 1, "max_threads 0 must still give one worker");
        ok &= require_(tessel::engine::resolve_worker_count(4) <= 4, "worker count must not exceed max_threads");
        return ok;
    }

    static bool test_heredoc_boundary_scenario_() {
        using E = tessel::engine::Engine<tessel::shell::Strategy>;
        using K = tessel::shell::TokenKind;

        // 1001 blocks: 4004 lines plus the empty last line; W=3 cuts at lines 1335 and 2670,
        // both inside heredoc bodies
        const std::string text = repeat_(k_heredoc_block, 1001);
        const tessel::LineIndex lines(text);

        const auto seq = E::tokenize_sequential(text, nullptr);
        const auto par = E::tokenize(text, opts_(3, tessel::engine::k_default_parallel_line_threshold), nullptr);

        bool ok = true;
        ok &= require_(lines.line_count() == 4005, "fixture must have 4005 lines");
        ok &= require_(par.stats.path == tessel::engine::ExecPath::kParallel, "document above the threshold must go parallel");
        ok &= require_(par.stats.section_count == 3, "three sections expected");
        ok &= require_(par.tokens == seq, "parallel output must equal sequential output");

        const auto sections = E::plan_sections(text, lines, 3);
        ok &= require_(sections.size() == 3, "three planned sections expected");
        if (sections.size() == 3) {
            ok &= require_(sections[1].start_line == 1335 && sections[2].start_line == 2670, "section starts must be line-aligned");
            const auto* s1 = std::get_if<tessel::shell::InHeredoc>(&sections[1].initial_state);
            const auto* s2 = std::get_if<tessel::shell::InHeredoc>(&sections[2].initial_state);
            ok &= require_(s1 != nullptr && s1->delimiter == "EOF", "section 1 must start inside the heredoc");
            ok &= require_(s2 != nullptr && s2->delimiter == "EOF", "section 2 must start inside the heredoc");

            const auto at = E::state_at(text, lines.line_start(1335));
            ok &= require_(at == sections[1].initial_state, "state_at must agree with the planned boundary state");
            ok &= require_(std::holds_alternative<tessel::shell::Normal>(E::state_at(text, lines.line_start(1336))),
                           "the closing delimiter must return to Normal");
        }

        // per block: `<<`, opening label, two body strings, closing label
        for (uint32_t b : {333u, 667u}) {
            std::vector<tessel::Token> block;
            for (const auto& t : par.tokens) {
                if (t.line >= b * 4 && t.line < b * 4 + 4) block.push_back(t);
            }
            ok &= require_(block.size() == 5, "boundary block must have five tokens");
            if (block.size() == 5) {
                ok &= require_(block[0].kind == static_cast<uint32_t>(K::kOperator) && block[0].col == 4 && block[0].length == 2,
                               "`<<` must be an operator");
                ok &= require_(block[2].kind == static_cast<uint32_t>(K::kString) && block[2].col == 0 && block[2].length == 8,
                               "\"line one\" must be one string token");
                ok &= require_(block[3].kind == static_cast<uint32_t>(K::kString) && block[3].col == 0 && block[3].length == 8,
                               "\"line two\" must be one string token");
                ok &= require_(block[4].kind == static_cast<uint32_t>(K::kLabel) && block[4].length == 3,
                               "closing EOF must not be a string");
            }
        }
        return ok;
    }

    static bool test_threshold_boundary_() {
        using E = tessel::engine::Engine<tessel::python::Strategy>;
        constexpr std::string_view line = "value = compute(1, 'x')  # note\n";

        // count('\n') + 1 lines
        const std::string small = repeat_(line, 3998) + "tail = 1";
        const std::string large = repeat_(line, 4000) + "tail = 1";

        const auto o = opts_(4, tessel::engine::k_default_parallel_line_threshold);
        const auto rs = E::tokenize(small, o, nullptr);
        const auto rl = E::tokenize(large, o, nullptr);

        bool ok = true;
        ok &= require_(rs.stats.line_count == 3999, "small fixture must have 3999 lines");
        ok &= require_(rl.stats.line_count == 4001, "large fixture must have 4001 lines");
        ok &= require_(rs.stats.path == tessel::engine::ExecPath::kSequential, "3999 lines must be sequential");
        ok &= require_(rl.stats.path == tessel::engine::ExecPath::kParallel, "4001 lines must be parallel");

        tessel::TokenList shared_s;
        tessel::TokenList shared_l;
        for (const auto& t : rs.tokens) if (t.line < 3998) shared_s.push_back(t);
        for (const auto& t : rl.tokens) if (t.line < 3998) shared_l.push_back(t);
        ok &= require_(!shared_s.empty() && shared_s == shared_l, "shared content must tokenize identically");
        return ok;
    }

    static bool test_parallel_transparency_all_languages_() {
        const std::string sh = repeat_(
            "deploy() {\n  cat <<'END'\n  body $x\nEND\n  echo \"a\n  b\" && exit 1\n}\n", 9);
        const std::string yml = repeat_(
            "job:\n  run: |\n    make\n\n    make test\n  env: {A: 1}\n  msg: 'two\n    lines'\n", 9);
        const std::string py = repeat_(
            "class C:\n    def f(self,\n          *b):\n        '''doc\n        more'''\n"
            "        s = 'x\\\ny'\n        return b.c(1) + 0x1f\n", 9);
        const std::string nim = repeat_(
            "#[ a\n#[ b ]#\n]#\nproc p*(x: int): int =\n  \"\"\"s\n  t\"\"\" & $x\n", 9);
        const std::string css = repeat_(
            "/* a\n b */\n@media print {\n  nav > a:hover {\n    content: \"x\\\ny\";\n    margin: -1px 2em;\n  }\n}\n", 9);

        bool ok = true;
        ok &= check_transparency_<tessel::shell::Strategy>(sh, "shell");
        ok &= check_transparency_<tessel::yaml::Strategy>(yml, "yaml");
        ok &= check_transparency_<tessel::python::Strategy>(py, "python");
        ok &= check_transparency_<tessel::nim::Strategy>(nim, "nim");
        ok &= check_transparency_<tessel::css::Strategy>(css, "css");
        return ok;
    }

    static bool test_idempotence_() {
        using E = tessel::engine::Engine<tessel::shell::Strategy>;
        const std::string text = repeat_(k_heredoc_block, 50);
        const auto o = opts_(3, 1);

        const auto a = E::tokenize(text, o, nullptr);
        const auto b = E::tokenize(text, o, nullptr);
        const auto c = E::tokenize_sequential(text, nullptr);
        const auto d = E::tokenize_sequential(text, nullptr);

        bool ok = true;
        ok &= require_(a.tokens == b.tokens, "parallel runs must be identical");
        ok &= require_(c == d, "sequential runs must be identical");
        return ok;
    }

    static bool test_worker_failure_isolation_() {
        using E = tessel::engine::Engine<tessel::shell::Strategy>;
        const std::string text = repeat_(k_heredoc_block, 30);
        const tessel::LineIndex lines(text);

        auto o = opts_(3, 1);
        o.section_observer = [](uint32_t idx) {
            if (idx == 1) throw std::runtime_error("section lost");
        };
        const auto res = E::tokenize(text, o, nullptr);
        const auto seq = E::tokenize_sequential(text, nullptr);
        const auto sections = E::plan_sections(text, lines, 3);

        bool ok = true;
        ok &= require_(res.stats.failures.size() == 1, "one failure expected");
        if (res.stats.failures.size() == 1) {
            ok &= require_(res.stats.failures[0].section_index == 1, "section 1 must be the failed one");
            ok &= require_(res.stats.failures[0].message == "section lost", "failure message must be kept");
        }

        if (sections.size() == 3) {
            tessel::TokenList want;
            for (const auto& t : seq) {
                if (t.line >= sections[1].start_line && t.line < sections[2].start_line) continue;
                want.push_back(t);
            }
            ok &= require_(res.tokens == want, "failed section must contribute zero tokens, others stay intact");
        } else {
            ok &= require_(false, "three sections expected");
        }
        return ok;
    }

    static bool test_parallel_path_has_no_diagnostics_() {
        using E = tessel::engine::Engine<tessel::python::Strategy>;
        const std::string text = repeat_("x = 'open\n", 20);

        tessel::diag::Bag seq_bag;
        tessel::diag::Bag par_bag;
        (void)E::tokenize(text, opts_(1, 1), &seq_bag);
        (void)E::tokenize(text, opts_(4, 1), &par_bag);

        bool ok = true;
        ok &= require_(seq_bag.diags().size() == 20, "sequential path must report every unterminated literal");
        ok &= require_(par_bag.diags().empty(), "parallel path must not report");
        return ok;
    }

    static bool test_tokenizer_registry_() {
        bool ok = true;
        for (const auto id : {tessel::LanguageId::kShell, tessel::LanguageId::kYaml,
                              tessel::LanguageId::kPython, tessel::LanguageId::kNim,
                              tessel::LanguageId::kCss}) {
            const auto tk = tessel::engine::make_tokenizer(id);
            ok &= require_(tk != nullptr, "tokenizer must exist");
            if (tk == nullptr) continue;
            ok &= require_(tk->language() == id, "tokenizer must report its language");
            ok &= require_(tk->supports_parallel(), "stateful languages must support parallel scans");
            ok &= require_(tk->range_strategy() == tessel::RangeStrategy::kFilterFull, "stateful languages filter full output");
            ok &= require_(!tk->legend().empty(), "legend must not be empty");
        }

        const auto json = tessel::engine::make_tokenizer(tessel::LanguageId::kJson);
        ok &= require_(json != nullptr && !json->supports_parallel(), "json must be sequential only");
        ok &= require_(json != nullptr && json->range_strategy() == tessel::RangeStrategy::kLocalLookahead,
                       "json ranges must use local lookahead");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"partition_lines", test_partition_lines_},
        {"worker_pool_runs_every_task", test_worker_pool_runs_every_task_},
        {"worker_pool_reports_failures_in_order", test_worker_pool_reports_failures_in_order_},
        {"resolve_worker_count", test_resolve_worker_count_},
        {"heredoc_boundary_scenario", test_heredoc_boundary_scenario_},
        {"threshold_boundary", test_threshold_boundary_},
        {"parallel_transparency_all_languages", test_parallel_transparency_all_languages_},
        {"idempotence", test_idempotence_},
        {"worker_failure_isolation", test_worker_failure_isolation_},
        {"parallel_path_has_no_diagnostics", test_parallel_path_has_no_diagnostics_},
        {"tokenizer_registry", test_tokenizer_registry_},
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
