// engine/include/tessel/config/EngineConfig.hpp
#pragma once
#include <tessel/diag/DiagCode.hpp>
#include <tessel/engine/Section.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>


namespace tessel::config {

    using Value = std::variant<std::string, int64_t, bool>;
    using FlatMap = std::map<std::string, Value>;

    inline constexpr int64_t k_max_threads_limit = 64;
    inline constexpr std::string_view k_default_file_name = "tessel.toml";

    /// @brief 엔진/서버 설정. 레이어 순서: 기본값 -> tessel.toml -> 환경변수 -> initializationOptions
    struct EngineConfig {
        int64_t parallel_line_threshold = engine::k_default_parallel_line_threshold;
        int64_t max_threads = engine::k_default_max_threads;
        bool trace = false;
        diag::Language diag_lang = diag::Language::kEn;
    };

    bool is_known_key(std::string_view key);

    // "en" / "ko" (case-insensitive)
    std::optional<diag::Language> parse_diag_lang(std::string_view text);

    // typed view of file values; unknown keys are dropped with a warning before this
    EngineConfig materialize(const FlatMap& values, std::vector<std::string>* warnings = nullptr);

    // TESSEL_PARALLEL_THRESHOLD, TESSEL_MAX_THREADS, TESSEL_TRACE
    void apply_env(EngineConfig& cfg, std::vector<std::string>* warnings = nullptr);

    // max_threads into [1, k_max_threads_limit], threshold >= 1
    void clamp(EngineConfig& cfg, std::vector<std::string>* warnings = nullptr);

    /// @brief defaults + file + env, clamped.
    /// explicit_path must exist when given; otherwise ./tessel.toml is read if present.
    /// Returns false only when the file exists but cannot be parsed (err is set).
    bool load(const std::optional<std::filesystem::path>& explicit_path,
              EngineConfig& out,
              std::vector<std::string>& warnings,
              std::string& err);

} // namespace tessel::config
