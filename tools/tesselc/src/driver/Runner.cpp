// tools/tesselc/src/driver/Runner.cpp
#include "Runner.hpp"

#include <tessel/config/EngineConfig.hpp>
#include <tessel/diag/Render.hpp>
#include <tessel/engine/Encoder.hpp>
#include <tessel/engine/Tokenizer.hpp>
#include <tessel/engine/WorkerPool.hpp>
#include <tessel/text/LineIndex.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>


namespace tesselc::driver {

    namespace {

        bool read_file(const std::string& path, std::string& out, std::string& err) {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs) {
                err = "failed to open file: " + path;
                return false;
            }
            std::ostringstream ss;
            ss << ifs.rdbuf();
            out = ss.str();
            return true;
        }

        /// @brief 설정 파일/환경변수 위에 CLI 값을 덮어쓴다.
        bool resolve_config(const cli::Options& opt, tessel::config::EngineConfig& cfg) {
            std::vector<std::string> warnings;
            std::string err;

            std::optional<std::filesystem::path> path{};
            if (opt.config_path.has_value()) path = std::filesystem::path(*opt.config_path);

            if (!tessel::config::load(path, cfg, warnings, err)) {
                std::cerr << "error: " << err << "\n";
                return false;
            }
            if (opt.max_threads.has_value()) cfg.max_threads = *opt.max_threads;
            if (opt.threshold.has_value()) cfg.parallel_line_threshold = *opt.threshold;
            tessel::config::clamp(cfg, &warnings);

            for (const auto& w : warnings) {
                std::cerr << "warning: " << w << "\n";
            }
            return true;
        }

        void dump_tokens(const tessel::TokenList& tokens, std::span<const std::string_view> legend) {
            for (const auto& t : tokens) {
                const std::string_view kind = (t.kind < legend.size()) ? legend[t.kind] : std::string_view("?");
                std::cout << (t.line + 1) << ":" << (t.col + 1) << " len=" << t.length << " " << kind << "\n";
            }
        }

        void dump_encoded(const tessel::TokenList& tokens) {
            const auto data = tessel::engine::encode(tokens);
            for (size_t i = 0; i < data.size(); i += 5) {
                for (size_t k = 0; k < 5 && i + k < data.size(); ++k) {
                    if (k != 0) std::cout << ' ';
                    std::cout << data[i + k];
                }
                std::cout << "\n";
            }
        }

        int flush_diags(const tessel::diag::Bag& bag, tessel::diag::Language lang,
                        const std::string& file, const tessel::LineIndex& lines) {
            for (const auto& d : bag.diags()) {
                std::cerr << tessel::diag::render_one(d, lang, file, lines) << "\n";
            }
            return bag.has_error() ? 1 : 0;
        }

    } // namespace

    int run(const cli::Options& opt) {
        const auto tk = tessel::engine::make_tokenizer(*opt.language);
        if (tk == nullptr) {
            std::cerr << "error: no tokenizer for language\n";
            return 1;
        }

        if (opt.mode == cli::Mode::kLegend) {
            const auto legend = tk->legend();
            for (size_t i = 0; i < legend.size(); ++i) {
                std::cout << i << " " << legend[i] << "\n";
            }
            return 0;
        }

        tessel::config::EngineConfig cfg{};
        if (!resolve_config(opt, cfg)) return 1;

        std::string text;
        std::string err;
        if (!read_file(opt.file, text, err)) {
            std::cerr << "error: " << err << "\n";
            return 1;
        }

        tessel::engine::TokenizeOptions topt{};
        topt.worker_count = tessel::engine::resolve_worker_count(static_cast<uint32_t>(cfg.max_threads));
        topt.parallel_line_threshold = static_cast<uint32_t>(cfg.parallel_line_threshold);

        tessel::diag::Bag bag;
        tessel::TokenList tokens;
        if (opt.range.has_value()) {
            tokens = tk->tokenize_range(text, opt.range->start_line, opt.range->end_line, topt);
            if (opt.stats) {
                std::cerr << "range strategy: " << tessel::range_strategy_name(tk->range_strategy()) << "\n";
            }
        } else {
            auto res = tk->tokenize_full(text, topt, &bag);
            tokens = std::move(res.tokens);
            if (opt.stats) {
                std::cerr << "path: " << tessel::engine::exec_path_name(res.stats.path)
                          << ", lines: " << res.stats.line_count
                          << ", sections: " << res.stats.section_count
                          << ", workers: " << topt.worker_count << "\n";
            }
            for (const auto& f : res.stats.failures) {
                std::cerr << "warning: section " << f.section_index << " failed, its tokens are omitted: " << f.message << "\n";
            }
        }

        if (opt.mode == cli::Mode::kEncoded) {
            dump_encoded(tokens);
        } else {
            dump_tokens(tokens, tk->legend());
        }

        const tessel::LineIndex lines(text);
        return flush_diags(bag, opt.lang, opt.file, lines);
    }

} // namespace tesselc::driver
