// engine/include/tessel/engine/Engine.hpp
#pragma once
#include <tessel/engine/Partition.hpp>
#include <tessel/engine/Range.hpp>
#include <tessel/engine/Section.hpp>
#include <tessel/engine/WorkerPool.hpp>
#include <tessel/text/LineIndex.hpp>
#include <tessel/diag/Diagnostic.hpp>

#include <functional>
#include <string_view>
#include <vector>


namespace tessel::engine {

    /// @brief 언어 하나에 대한 병렬 토크나이즈 엔진.
    ///
    /// Strategy supplies the language:
    ///   using State = ...;                                   // closed std::variant of lex states
    ///   static ScanResult<State> scan(slice, start_line, initial, diags);
    ///   static State scan_state(slice, initial);             // same rules, no tokens
    ///
    /// Large documents are split into line-aligned sections. Boundary states come from a
    /// sequential scan_state chain that finishes before any worker starts; sections are then
    /// scanned concurrently and merged by section index.
    template <class Strategy>
    class Engine {
    public:
        using State = typename Strategy::State;

        static TokenList tokenize_sequential(std::string_view text, diag::Bag* diags) {
            return Strategy::scan(text, 0, State{}, diags).tokens;
        }

        /// @brief LexState reached after scanning text[0, offset) from the initial state.
        static State state_at(std::string_view text, uint32_t offset) {
            return Strategy::scan_state(text.substr(0, offset), State{});
        }

        static std::vector<Section<State>> plan_sections(std::string_view text, const LineIndex& lines, uint32_t parts) {
            const auto ranges = partition_lines(lines.line_count(), parts);

            std::vector<Section<State>> out;
            out.reserve(ranges.size());

            State st{};
            for (size_t i = 0; i < ranges.size(); ++i) {
                Section<State> s{};
                s.begin = lines.line_start(ranges[i].first_line);
                s.end = (i + 1 < ranges.size())
                    ? lines.line_start(ranges[i + 1].first_line)
                    : static_cast<uint32_t>(text.size());
                s.start_line = ranges[i].first_line;
                s.initial_state = st;

                // the last section's end state is never needed
                if (i + 1 < ranges.size()) {
                    st = Strategy::scan_state(text.substr(s.begin, s.end - s.begin), st);
                }
                out.push_back(std::move(s));
            }
            return out;
        }

        /// @brief Full document. Falls back to one sequential scan (which also fills diags) when the
        /// document is below the threshold or fewer than two workers are available.
        static TokenizeResult tokenize(std::string_view text, const TokenizeOptions& opt, diag::Bag* diags) {
            TokenizeResult out{};
            const LineIndex lines(text);
            out.stats.line_count = lines.line_count();

            if (lines.line_count() < opt.parallel_line_threshold || opt.worker_count <= 1) {
                out.tokens = tokenize_sequential(text, diags);
                out.stats.path = ExecPath::kSequential;
                out.stats.section_count = 1;
                return out;
            }

            const auto sections = plan_sections(text, lines, opt.worker_count);
            std::vector<TokenList> parts(sections.size());

            std::vector<std::function<void()>> tasks;
            tasks.reserve(sections.size());
            for (uint32_t i = 0; i < sections.size(); ++i) {
                tasks.push_back([&, i] {
                    if (opt.section_observer) opt.section_observer(i);
                    const auto& s = sections[i];
                    parts[i] = Strategy::scan(text.substr(s.begin, s.end - s.begin), s.start_line, s.initial_state, nullptr).tokens;
                });
            }

            const WorkerPool pool(opt.worker_count);
            out.stats.failures = pool.run(tasks);
            for (const auto& f : out.stats.failures) {
                parts[f.section_index].clear();
            }

            size_t total = 0;
            for (const auto& p : parts) total += p.size();
            out.tokens.reserve(total);
            for (auto& p : parts) {
                out.tokens.insert(out.tokens.end(), p.begin(), p.end());
            }

            out.stats.path = ExecPath::kParallel;
            out.stats.section_count = static_cast<uint32_t>(sections.size());
            return out;
        }

        /// @brief Range request, filter-full strategy: identical to tokenize() restricted to the lines.
        static TokenList tokenize_range(std::string_view text, uint32_t start_line, uint32_t end_line, const TokenizeOptions& opt) {
            const auto full = tokenize(text, opt, nullptr);
            return filter_lines(full.tokens, start_line, end_line);
        }
    };

} // namespace tessel::engine
