// engine/src/lang/language.cpp
#include <tessel/lang/Language.hpp>
#include <tessel/lang/Css.hpp>
#include <tessel/lang/Json.hpp>
#include <tessel/lang/Nim.hpp>
#include <tessel/lang/Python.hpp>
#include <tessel/lang/Shell.hpp>
#include <tessel/lang/Yaml.hpp>

#include <string>


namespace tessel {

    namespace {

        std::string lower_(std::string_view s) {
            std::string out(s);
            for (auto& c : out) {
                if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            }
            return out;
        }

    } // namespace

    std::string_view language_name(LanguageId id) {
        switch (id) {
            case LanguageId::kShell:  return "shell";
            case LanguageId::kYaml:   return "yaml";
            case LanguageId::kPython: return "python";
            case LanguageId::kNim:    return "nim";
            case LanguageId::kJson:   return "json";
            case LanguageId::kCss:    return "css";
        }
        return "unknown";
    }

    std::string_view range_strategy_name(RangeStrategy s) {
        switch (s) {
            case RangeStrategy::kFilterFull:     return "filter-full";
            case RangeStrategy::kLocalLookahead: return "local-lookahead";
        }
        return "unknown";
    }

    std::optional<LanguageId> language_from_name(std::string_view name) {
        const std::string n = lower_(name);
        if (n == "shell" || n == "bash" || n == "sh") return LanguageId::kShell;
        if (n == "yaml" || n == "yml") return LanguageId::kYaml;
        if (n == "python" || n == "py") return LanguageId::kPython;
        if (n == "nim") return LanguageId::kNim;
        if (n == "json") return LanguageId::kJson;
        if (n == "css") return LanguageId::kCss;
        return std::nullopt;
    }

    std::optional<LanguageId> language_from_path(std::string_view path_or_uri) {
        std::string_view p = path_or_uri;
        if (const size_t q = p.find_first_of("?#"); q != std::string_view::npos) {
            p = p.substr(0, q);
        }

        const size_t slash = p.find_last_of('/');
        const std::string_view base = (slash == std::string_view::npos) ? p : p.substr(slash + 1);
        const size_t dot = base.find_last_of('.');
        if (dot == std::string_view::npos || dot + 1 >= base.size()) return std::nullopt;

        const std::string ext = lower_(base.substr(dot + 1));
        if (ext == "sh" || ext == "bash") return LanguageId::kShell;
        if (ext == "yaml" || ext == "yml") return LanguageId::kYaml;
        if (ext == "py" || ext == "pyi") return LanguageId::kPython;
        if (ext == "nim" || ext == "nims" || ext == "nimble") return LanguageId::kNim;
        if (ext == "json") return LanguageId::kJson;
        if (ext == "css") return LanguageId::kCss;
        return std::nullopt;
    }

    std::span<const std::string_view> token_legend(LanguageId id) {
        switch (id) {
            case LanguageId::kShell:  return shell::legend();
            case LanguageId::kYaml:   return yaml::legend();
            case LanguageId::kPython: return python::legend();
            case LanguageId::kNim:    return nim::legend();
            case LanguageId::kJson:   return json::legend();
            case LanguageId::kCss:    return css::legend();
        }
        return {};
    }

} // namespace tessel
