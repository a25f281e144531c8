// engine/src/config/engine_config.cpp
#include <tessel/config/EngineConfig.hpp>
#include <tessel/config/TomlLite.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <unordered_set>


namespace tessel::config {

    namespace {

        const std::unordered_set<std::string>& known_keys_() {
            static const std::unordered_set<std::string> k{
                "engine.parallel_line_threshold",
                "engine.max_threads",

                "server.trace",
                "server.diag_lang",
            };
            return k;
        }

        std::string getenv_string(const char* key) {
            const char* p = std::getenv(key);
            if (p == nullptr) return {};
            return std::string(p);
        }

        std::string lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name) {
            std::vector<std::string> to_erase{};
            for (const auto& [k, _] : values) {
                if (!is_known_key(k)) {
                    warnings.push_back(std::string(source_name) + ": unknown key '" + k + "' ignored");
                    to_erase.push_back(k);
                }
            }
            for (const auto& k : to_erase) {
                values.erase(k);
            }
        }

        void apply_env_int(int64_t& dst, const char* key, std::vector<std::string>* warnings) {
            const auto v = getenv_string(key);
            if (v.empty()) return;

            int64_t parsed = 0;
            const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
            if (ec != std::errc{} || ptr != v.data() + v.size()) {
                if (warnings != nullptr) warnings->push_back(std::string(key) + ": not an integer ('" + v + "'), ignored");
                return;
            }
            dst = parsed;
        }

        void apply_env_bool(bool& dst, const char* key, std::vector<std::string>* warnings) {
            const auto v = lower(getenv_string(key));
            if (v.empty()) return;
            if (v == "1" || v == "true" || v == "on" || v == "yes") {
                dst = true;
            } else if (v == "0" || v == "false" || v == "off" || v == "no") {
                dst = false;
            } else if (warnings != nullptr) {
                warnings->push_back(std::string(key) + ": not a boolean ('" + v + "'), ignored");
            }
        }

    } // namespace

    bool is_known_key(std::string_view key) {
        return known_keys_().contains(std::string(key));
    }

    std::optional<diag::Language> parse_diag_lang(std::string_view text) {
        const std::string v = lower(std::string(text));
        if (v == "en") return diag::Language::kEn;
        if (v == "ko") return diag::Language::kKo;
        return std::nullopt;
    }

    EngineConfig materialize(const FlatMap& values, std::vector<std::string>* warnings) {
        EngineConfig c{};

        const auto find_ = [&](std::string_view key) -> const Value* {
            const auto it = values.find(std::string(key));
            return (it == values.end()) ? nullptr : &it->second;
        };
        const auto wrong_type_ = [&](std::string_view key, std::string_view expected) {
            if (warnings != nullptr) {
                warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected " + std::string(expected) + ")");
            }
        };

        auto get_int = [&](std::string_view key, int64_t& dst) {
            const Value* v = find_(key);
            if (v == nullptr) return;
            if (const auto* p = std::get_if<int64_t>(v)) {
                dst = *p;
                return;
            }
            wrong_type_(key, "int");
        };
        auto get_bool = [&](std::string_view key, bool& dst) {
            const Value* v = find_(key);
            if (v == nullptr) return;
            if (const auto* p = std::get_if<bool>(v)) {
                dst = *p;
                return;
            }
            wrong_type_(key, "bool");
        };
        auto get_lang = [&](std::string_view key, diag::Language& dst) {
            const Value* v = find_(key);
            if (v == nullptr) return;
            const auto* p = std::get_if<std::string>(v);
            if (p == nullptr) {
                wrong_type_(key, "string");
                return;
            }
            if (const auto lang = parse_diag_lang(*p); lang.has_value()) {
                dst = *lang;
            } else if (warnings != nullptr) {
                warnings->push_back("config key '" + std::string(key) + "': unknown language '" + *p + "' (en|ko), ignored");
            }
        };

        get_int("engine.parallel_line_threshold", c.parallel_line_threshold);
        get_int("engine.max_threads", c.max_threads);
        get_bool("server.trace", c.trace);
        get_lang("server.diag_lang", c.diag_lang);
        return c;
    }

    void apply_env(EngineConfig& cfg, std::vector<std::string>* warnings) {
        apply_env_int(cfg.parallel_line_threshold, "TESSEL_PARALLEL_THRESHOLD", warnings);
        apply_env_int(cfg.max_threads, "TESSEL_MAX_THREADS", warnings);
        apply_env_bool(cfg.trace, "TESSEL_TRACE", warnings);
    }

    void clamp(EngineConfig& cfg, std::vector<std::string>* warnings) {
        const auto note = [&](std::string msg) {
            if (warnings != nullptr) warnings->push_back(std::move(msg));
        };

        if (cfg.max_threads < 1) {
            note("max_threads " + std::to_string(cfg.max_threads) + " clamped to 1");
            cfg.max_threads = 1;
        } else if (cfg.max_threads > k_max_threads_limit) {
            note("max_threads " + std::to_string(cfg.max_threads) + " clamped to " + std::to_string(k_max_threads_limit));
            cfg.max_threads = k_max_threads_limit;
        }

        if (cfg.parallel_line_threshold < 1) {
            note("parallel_line_threshold " + std::to_string(cfg.parallel_line_threshold) + " clamped to 1");
            cfg.parallel_line_threshold = 1;
        } else if (cfg.parallel_line_threshold > UINT32_MAX) {
            note("parallel_line_threshold " + std::to_string(cfg.parallel_line_threshold) + " clamped to " + std::to_string(UINT32_MAX));
            cfg.parallel_line_threshold = UINT32_MAX;
        }
    }

    bool load(const std::optional<std::filesystem::path>& explicit_path,
              EngineConfig& out,
              std::vector<std::string>& warnings,
              std::string& err) {
        out = EngineConfig{};
        err.clear();

        std::filesystem::path path{};
        if (explicit_path.has_value()) {
            std::error_code ec{};
            if (!std::filesystem::exists(*explicit_path, ec)) {
                err = "config file not found: " + explicit_path->string();
                return false;
            }
            path = *explicit_path;
        } else {
            path = std::filesystem::path(k_default_file_name);
        }

        FlatMap values{};
        if (!toml_lite::parse_file(path, values, warnings, err)) return false;
        filter_unknown_keys(values, warnings, path.string());

        out = materialize(values, &warnings);
        apply_env(out, &warnings);
        clamp(out, &warnings);
        return true;
    }

} // namespace tessel::config
