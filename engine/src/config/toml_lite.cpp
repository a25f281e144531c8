// engine/src/config/toml_lite.cpp
#include <tessel/config/TomlLite.hpp>

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>


namespace tessel::config::toml_lite {

    namespace {

        std::string trim(std::string_view s) {
            const auto is_space = [](char c) {
                return c == ' ' || c == '\t' || c == '\n' || c == '\r';
            };
            size_t b = 0;
            size_t e = s.size();
            while (b < e && is_space(s[b])) ++b;
            while (e > b && is_space(s[e - 1])) --e;
            return std::string(s.substr(b, e - b));
        }

        // '#' outside a "..." string starts a comment
        std::string strip_comment(std::string_view line) {
            std::string out{};
            bool in_string = false;
            bool escaped = false;
            for (const char c : line) {
                if (!in_string && c == '#') break;
                out.push_back(c);
                if (!in_string) {
                    if (c == '"') in_string = true;
                    continue;
                }
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
            }
            return out;
        }

        bool parse_string_literal(std::string_view text, std::string& out, std::string& err) {
            if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
                err = "invalid string literal";
                return false;
            }
            out.clear();
            bool escaped = false;
            for (size_t i = 1; i + 1 < text.size(); ++i) {
                const char c = text[i];
                if (escaped) {
                    switch (c) {
                        case 'n': out.push_back('\n'); break;
                        case 't': out.push_back('\t'); break;
                        case 'r': out.push_back('\r'); break;
                        default:  out.push_back(c); break;
                    }
                    escaped = false;
                    continue;
                }
                if (c == '\\') {
                    escaped = true;
                    continue;
                }
                out.push_back(c);
            }
            if (escaped) {
                err = "unterminated escape in string literal";
                return false;
            }
            return true;
        }

        bool parse_int_literal(std::string_view text, int64_t& out) {
            if (!text.empty() && text.front() == '+') text.remove_prefix(1);
            if (text.empty()) return false;
            const auto* first = text.data();
            const auto* last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

        bool parse_value(std::string_view text, Value& out, std::string& err) {
            const std::string v = trim(text);
            if (v.empty()) {
                err = "empty value";
                return false;
            }
            if (v == "true" || v == "false") {
                out = (v == "true");
                return true;
            }

            int64_t iv = 0;
            if (parse_int_literal(v, iv)) {
                out = iv;
                return true;
            }

            if (v.front() == '"') {
                std::string sv{};
                if (!parse_string_literal(v, sv, err)) return false;
                out = std::move(sv);
                return true;
            }

            err = "unsupported value '" + v + "'";
            return false;
        }

        bool valid_key(std::string_view key) {
            if (key.empty()) return false;
            for (const char c : key) {
                const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
                if (!ok) return false;
            }
            return true;
        }

        std::string at_(std::string_view source_name, size_t line_no) {
            return std::string(source_name) + ":" + std::to_string(line_no) + ": ";
        }

    } // namespace

    bool parse_text(std::string_view text,
                    std::string_view source_name,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err) {
        out.clear();
        err.clear();

        std::string section{};
        size_t line_no = 0;
        size_t pos = 0;
        while (pos <= text.size()) {
            const size_t nl = text.find('\n', pos);
            const size_t end = (nl == std::string_view::npos) ? text.size() : nl;
            const std::string_view raw = text.substr(pos, end - pos);
            pos = end + 1;
            ++line_no;

            const std::string content = trim(strip_comment(raw));
            if (content.empty()) {
                if (nl == std::string_view::npos) break;
                continue;
            }

            if (content.front() == '[') {
                if (content.back() != ']') {
                    err = at_(source_name, line_no) + "invalid section header";
                    return false;
                }
                const std::string sec = trim(std::string_view(content).substr(1, content.size() - 2));
                if (!valid_key(sec)) {
                    err = at_(source_name, line_no) + "invalid section name";
                    return false;
                }
                section = sec;
            } else {
                const auto eq = content.find('=');
                if (eq == std::string::npos) {
                    err = at_(source_name, line_no) + "expected '='";
                    return false;
                }
                const std::string key = trim(std::string_view(content).substr(0, eq));
                if (!valid_key(key)) {
                    err = at_(source_name, line_no) + "invalid key";
                    return false;
                }

                Value parsed{};
                std::string parse_err{};
                if (!parse_value(std::string_view(content).substr(eq + 1), parsed, parse_err)) {
                    err = at_(source_name, line_no) + parse_err;
                    return false;
                }

                const std::string fq = section.empty() ? key : section + "." + key;
                if (out.contains(fq)) {
                    warnings.push_back(at_(source_name, line_no) + "duplicate key '" + fq + "', overriding");
                }
                out[fq] = std::move(parsed);
            }

            if (nl == std::string_view::npos) break;
        }
        return true;
    }

    bool parse_file(const std::filesystem::path& path,
                    FlatMap& out,
                    std::vector<std::string>& warnings,
                    std::string& err) {
        out.clear();
        err.clear();

        if (path.empty()) return true;
        std::error_code ec{};
        if (!std::filesystem::exists(path, ec)) return true;
        if (!std::filesystem::is_regular_file(path, ec)) {
            err = "not a regular file: " + path.string();
            return false;
        }

        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            err = "failed to open file: " + path.string();
            return false;
        }
        std::ostringstream ss;
        ss << ifs.rdbuf();
        return parse_text(ss.str(), path.string(), out, warnings, err);
    }

} // namespace tessel::config::toml_lite
