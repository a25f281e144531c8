// tools/tesselc/src/cli/Options.cpp
#include "Options.hpp"

#include <charconv>
#include <string_view>


namespace tesselc::cli {

    namespace {

        /// @brief 특정 키 플래그 위치를 탐색한다.
        std::optional<size_t> find_flag(const std::vector<std::string_view>& args, std::string_view key) {
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] == key) return i;
            }
            return std::nullopt;
        }

        std::optional<int64_t> parse_int(std::string_view s) {
            int64_t v = 0;
            const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
            return v;
        }

        bool fail(Options& opt, std::string msg) {
            opt.ok = false;
            opt.error = std::move(msg);
            return false;
        }

        /// @brief `--flag <int>` 형태 옵션을 파싱한다. 없으면 true, 잘못되면 false.
        bool parse_int_flag(const std::vector<std::string_view>& args, std::string_view key,
                            std::optional<int64_t>& out, Options& opt) {
            const auto i = find_flag(args, key);
            if (!i.has_value()) return true;
            if (*i + 1 >= args.size()) return fail(opt, std::string(key) + " requires a number");
            const auto v = parse_int(args[*i + 1]);
            if (!v.has_value()) return fail(opt, std::string(key) + ": not a number: " + std::string(args[*i + 1]));
            out = *v;
            return true;
        }

        bool parse_range(const std::vector<std::string_view>& args, Options& opt) {
            const auto i = find_flag(args, "--range");
            if (!i.has_value()) return true;
            if (*i + 2 >= args.size()) return fail(opt, "--range requires <start-line> <end-line>");

            const auto a = parse_int(args[*i + 1]);
            const auto b = parse_int(args[*i + 2]);
            if (!a.has_value() || !b.has_value() || *a < 0 || *b < 0) {
                return fail(opt, "--range lines must be non-negative numbers");
            }
            if (*a > *b) return fail(opt, "--range start must not exceed end");
            if (*b > UINT32_MAX) return fail(opt, "--range line out of range");
            opt.range = LineSpan{static_cast<uint32_t>(*a), static_cast<uint32_t>(*b)};
            return true;
        }

        bool parse_dump(const std::vector<std::string_view>& args, Options& opt) {
            opt.mode = Mode::kTokens;
            const auto i = find_flag(args, "--dump");
            if (!i.has_value()) return true;
            if (*i + 1 >= args.size()) return fail(opt, "--dump requires tokens|encoded|legend");

            const auto what = args[*i + 1];
            if (what == "tokens") opt.mode = Mode::kTokens;
            else if (what == "encoded") opt.mode = Mode::kEncoded;
            else if (what == "legend") opt.mode = Mode::kLegend;
            else return fail(opt, "unknown --dump kind: " + std::string(what));
            return true;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "tesselc\n"
            << "  --version\n"
            << "  --file <path> [--language shell|yaml|python|nim|json|css]\n"
            << "                [--dump tokens|encoded|legend] [--range A B]\n"
            << "                [--threads N] [--threshold N] [--config <path>]\n"
            << "                [--lang en|ko] [--stats]\n"
            << "\n"
            << "Options:\n"
            << "  --language L      (default: from the file extension)\n"
            << "  --range A B       (0-based inclusive line range)\n"
            << "  --threads N       (max worker threads, overrides config)\n"
            << "  --threshold N     (parallel line threshold, overrides config)\n"
            << "  --stats           (print execution path and section count)\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        if (find_flag(args, "--version")) {
            opt.mode = Mode::kVersion;
            return opt;
        }
        if (find_flag(args, "--help") || find_flag(args, "-h")) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        if (const auto i = find_flag(args, "--lang"); i && *i + 1 < args.size()) {
            opt.lang = (args[*i + 1] == "ko") ? tessel::diag::Language::kKo : tessel::diag::Language::kEn;
        }
        opt.stats = find_flag(args, "--stats").has_value();

        if (const auto i = find_flag(args, "--language")) {
            if (*i + 1 >= args.size()) {
                fail(opt, "--language requires a name");
                return opt;
            }
            opt.language = tessel::language_from_name(args[*i + 1]);
            if (!opt.language.has_value()) {
                fail(opt, "unknown language: " + std::string(args[*i + 1]));
                return opt;
            }
        }

        if (const auto i = find_flag(args, "--config")) {
            if (*i + 1 >= args.size()) {
                fail(opt, "--config requires a path");
                return opt;
            }
            opt.config_path = std::string(args[*i + 1]);
        }

        if (!parse_int_flag(args, "--threads", opt.max_threads, opt)) return opt;
        if (!parse_int_flag(args, "--threshold", opt.threshold, opt)) return opt;
        if (!parse_range(args, opt)) return opt;

        const auto f = find_flag(args, "--file");
        if (!f.has_value()) {
            opt.mode = Mode::kUsage;
            return opt;
        }
        if (*f + 1 >= args.size()) {
            fail(opt, "--file requires a path");
            return opt;
        }
        opt.file = std::string(args[*f + 1]);

        if (!parse_dump(args, opt)) return opt;

        if (!opt.language.has_value()) {
            opt.language = tessel::language_from_path(opt.file);
            if (!opt.language.has_value()) {
                fail(opt, "cannot infer language from '" + opt.file + "', use --language");
                return opt;
            }
        }
        return opt;
    }

} // namespace tesselc::cli
