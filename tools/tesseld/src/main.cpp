// tools/tesseld/src/main.cpp
#include <tessel/Version.hpp>
#include <tessel/config/EngineConfig.hpp>
#include <tessel/diag/Render.hpp>
#include <tessel/engine/Encoder.hpp>
#include <tessel/engine/Tokenizer.hpp>
#include <tessel/engine/WorkerPool.hpp>
#include <tessel/lang/Language.hpp>
#include <tessel/text/LineIndex.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>


namespace {

    // ------------------------------------------------------------------
    // JSON (only what the protocol needs)
    // ------------------------------------------------------------------

    struct JsonValue {
        enum class Kind : uint8_t {
            kNull,
            kBool,
            kNumber,
            kString,
            kArray,
            kObject,
        };

        Kind kind = Kind::kNull;
        bool bool_v = false;
        double number_v = 0.0;
        std::optional<int64_t> int_v{};     // set when the literal is an integer
        std::string string_v{};
        std::vector<JsonValue> array_v{};
        std::map<std::string, JsonValue, std::less<>> object_v{};
    };

    /// @brief 재귀 하강 JSON 파서. 실패 시 parse()가 false.
    class JsonParser {
    public:
        explicit JsonParser(std::string_view src) : src_(src) {}

        bool parse(JsonValue& out) {
            if (!value_(out, 0)) return false;
            ws_();
            return pos_ == src_.size();
        }

    private:
        static constexpr uint32_t k_max_depth = 256;

        bool value_(JsonValue& out, uint32_t depth) {
            if (depth > k_max_depth) return false;
            ws_();
            out = JsonValue{};
            switch (peek_()) {
                case '{': return object_(out, depth);
                case '[': return array_(out, depth);
                case '"':
                    out.kind = JsonValue::Kind::kString;
                    return string_(out.string_v);
                case 't':
                    out.kind = JsonValue::Kind::kBool;
                    out.bool_v = true;
                    return word_("true");
                case 'f':
                    out.kind = JsonValue::Kind::kBool;
                    return word_("false");
                case 'n':
                    return word_("null");
                default:
                    return number_(out);
            }
        }

        bool object_(JsonValue& out, uint32_t depth) {
            out.kind = JsonValue::Kind::kObject;
            ++pos_;
            ws_();
            if (eat_('}')) return true;

            while (true) {
                ws_();
                std::string key;
                if (!string_(key)) return false;
                ws_();
                if (!eat_(':')) return false;

                JsonValue v{};
                if (!value_(v, depth + 1)) return false;
                out.object_v.insert_or_assign(std::move(key), std::move(v));

                ws_();
                if (eat_(',')) continue;
                return eat_('}');
            }
        }

        bool array_(JsonValue& out, uint32_t depth) {
            out.kind = JsonValue::Kind::kArray;
            ++pos_;
            ws_();
            if (eat_(']')) return true;

            while (true) {
                JsonValue v{};
                if (!value_(v, depth + 1)) return false;
                out.array_v.push_back(std::move(v));

                ws_();
                if (eat_(',')) continue;
                return eat_(']');
            }
        }

        bool number_(JsonValue& out) {
            const size_t lo = pos_;
            bool integral = true;
            if (peek_() == '-') ++pos_;
            if (!digits_()) return false;
            if (peek_() == '.') {
                integral = false;
                ++pos_;
                if (!digits_()) return false;
            }
            if (peek_() == 'e' || peek_() == 'E') {
                integral = false;
                ++pos_;
                if (peek_() == '+' || peek_() == '-') ++pos_;
                if (!digits_()) return false;
            }

            const std::string text(src_.substr(lo, pos_ - lo));
            out.kind = JsonValue::Kind::kNumber;
            out.number_v = std::strtod(text.c_str(), nullptr);
            if (integral) {
                int64_t iv = 0;
                const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), iv);
                if (ec == std::errc{} && p == text.data() + text.size()) out.int_v = iv;
            }
            return true;
        }

        bool string_(std::string& out) {
            if (!eat_('"')) return false;
            out.clear();
            while (pos_ < src_.size()) {
                const char c = src_[pos_++];
                if (c == '"') return true;
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                if (pos_ >= src_.size()) return false;
                const char e = src_[pos_++];
                switch (e) {
                    case '"':  out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/':  out.push_back('/'); break;
                    case 'b':  out.push_back('\b'); break;
                    case 'f':  out.push_back('\f'); break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    case 't':  out.push_back('\t'); break;
                    case 'u':
                        if (!unicode_escape_(out)) return false;
                        break;
                    default:
                        return false;
                }
            }
            return false;
        }

        bool hex4_(uint32_t& cp) {
            if (pos_ + 4 > src_.size()) return false;
            cp = 0;
            for (size_t i = 0; i < 4; ++i) {
                const char h = src_[pos_ + i];
                uint32_t v = 0;
                if (h >= '0' && h <= '9') v = static_cast<uint32_t>(h - '0');
                else if (h >= 'a' && h <= 'f') v = static_cast<uint32_t>(h - 'a' + 10);
                else if (h >= 'A' && h <= 'F') v = static_cast<uint32_t>(h - 'A' + 10);
                else return false;
                cp = (cp << 4) | v;
            }
            pos_ += 4;
            return true;
        }

        // \uXXXX, including surrogate pairs, appended as UTF-8
        bool unicode_escape_(std::string& out) {
            uint32_t cp = 0;
            if (!hex4_(cp)) return false;
            if (cp >= 0xD800 && cp <= 0xDBFF && src_.substr(pos_, 2) == "\\u") {
                pos_ += 2;
                uint32_t lo = 0;
                if (!hex4_(lo)) return false;
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            }

            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            return true;
        }

        bool digits_() {
            const size_t lo = pos_;
            while (pos_ < src_.size() && src_[pos_] >= '0' && src_[pos_] <= '9') ++pos_;
            return pos_ > lo;
        }

        bool word_(std::string_view w) {
            if (src_.substr(pos_, w.size()) != w) return false;
            pos_ += w.size();
            return true;
        }

        bool eat_(char c) {
            if (peek_() != c) return false;
            ++pos_;
            return true;
        }

        char peek_() const { return (pos_ < src_.size()) ? src_[pos_] : '\0'; }

        void ws_() {
            while (pos_ < src_.size()) {
                const char c = src_[pos_];
                if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
                ++pos_;
            }
        }

        std::string_view src_{};
        size_t pos_ = 0;
    };

    const JsonValue* obj_get_(const JsonValue* obj, std::string_view key) {
        if (obj == nullptr || obj->kind != JsonValue::Kind::kObject) return nullptr;
        const auto it = obj->object_v.find(key);
        return (it == obj->object_v.end()) ? nullptr : &it->second;
    }

    std::optional<std::string_view> as_string_(const JsonValue* v) {
        if (v == nullptr || v->kind != JsonValue::Kind::kString) return std::nullopt;
        return v->string_v;
    }

    std::optional<int64_t> as_i64_(const JsonValue* v) {
        if (v == nullptr || v->kind != JsonValue::Kind::kNumber || !v->int_v.has_value()) return std::nullopt;
        return v->int_v;
    }

    std::optional<bool> as_bool_(const JsonValue* v) {
        if (v == nullptr || v->kind != JsonValue::Kind::kBool) return std::nullopt;
        return v->bool_v;
    }

    std::string json_escape_(std::string_view s) {
        std::string out;
        out.reserve(s.size() + 8);
        for (const char c : s) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8]{};
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        out += buf;
                    } else {
                        out.push_back(c);
                    }
                    break;
            }
        }
        return out;
    }

    // request ids are echoed back verbatim (number or string)
    std::string id_to_text_(const JsonValue& id) {
        if (id.kind == JsonValue::Kind::kString) return "\"" + json_escape_(id.string_v) + "\"";
        if (id.kind == JsonValue::Kind::kNumber) {
            if (id.int_v.has_value()) return std::to_string(*id.int_v);
            return std::to_string(id.number_v);
        }
        return "null";
    }

    // ------------------------------------------------------------------
    // framing
    // ------------------------------------------------------------------

    /// @brief `Content-Length: N\r\n\r\n<payload>` 한 개를 읽는다. EOF/손상 시 false.
    // larger frames are refused without allocating their body
    constexpr size_t k_max_content_length = size_t{64} * 1024 * 1024;

    enum class ReadStatus : uint8_t {
        kOk,
        kEof,
        kOversized,
    };

    ReadStatus read_lsp_message_(std::istream& in, std::string& out_payload) {
        out_payload.clear();
        std::optional<size_t> content_length{};
        std::optional<std::streamsize> oversized{};

        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) {
                if (content_length.has_value() || oversized.has_value()) break;
                continue;
            }

            const size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string key = line.substr(0, colon);
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (key != "content-length") continue;

            std::string_view value = std::string_view(line).substr(colon + 1);
            while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            size_t n = 0;
            const auto [p, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec == std::errc::result_out_of_range || (ec == std::errc{} && n > k_max_content_length)) {
                std::cerr << "[tesseld] frame of " << value << " bytes exceeds the "
                          << k_max_content_length << " byte limit, skipped\n";
                constexpr auto k_all = std::numeric_limits<std::streamsize>::max();
                oversized = (ec == std::errc{} && n < static_cast<size_t>(k_all)) ? static_cast<std::streamsize>(n) : k_all;
                continue;
            }
            if (ec != std::errc{}) return ReadStatus::kEof;
            content_length = n;
        }

        if (oversized.has_value()) {
            // the body is discarded up to the declared length or the end of input
            in.ignore(*oversized);
            return ReadStatus::kOversized;
        }
        if (!content_length.has_value()) return ReadStatus::kEof;

        out_payload.resize(*content_length);
        in.read(out_payload.data(), static_cast<std::streamsize>(*content_length));
        return static_cast<size_t>(in.gcount()) == *content_length ? ReadStatus::kOk : ReadStatus::kEof;
    }

    void write_lsp_message_(std::ostream& out, std::string_view payload) {
        out << "Content-Length: " << payload.size() << "\r\n\r\n";
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
    }

    // ------------------------------------------------------------------
    // protocol payloads
    // ------------------------------------------------------------------

    struct Position {
        uint32_t line = 0;
        uint32_t character = 0;    // utf-8 byte column
    };

    struct Range {
        Position start{};
        Position end{};
    };

    struct TextChange {
        std::optional<Range> range{};
        std::string text{};
    };

    struct DocumentState {
        std::string text{};
        int64_t version = 0;
    };

    struct LspDiag {
        Range range{};
        int severity = 1;
        std::string code{};
        std::string message{};
    };

    bool parse_position_(const JsonValue* node, Position& out) {
        const auto line = as_i64_(obj_get_(node, "line"));
        const auto ch = as_i64_(obj_get_(node, "character"));
        if (!line.has_value() || !ch.has_value() || *line < 0 || *ch < 0) return false;
        out.line = static_cast<uint32_t>(std::min<int64_t>(*line, UINT32_MAX));
        out.character = static_cast<uint32_t>(std::min<int64_t>(*ch, UINT32_MAX));
        return true;
    }

    bool parse_range_(const JsonValue* node, Range& out) {
        return parse_position_(obj_get_(node, "start"), out.start)
            && parse_position_(obj_get_(node, "end"), out.end);
    }

    bool parse_text_change_(const JsonValue& node, TextChange& out) {
        const auto text = as_string_(obj_get_(&node, "text"));
        if (!text.has_value()) return false;
        out.text = std::string(*text);

        Range r{};
        if (parse_range_(obj_get_(&node, "range"), r)) out.range = r;
        return true;
    }

    // returns true when the text actually changed
    bool apply_text_change_(DocumentState& doc, const TextChange& ch) {
        if (!ch.range.has_value()) {
            if (doc.text == ch.text) return false;
            doc.text = ch.text;
            return true;
        }

        const tessel::LineIndex lines(doc.text);
        const auto clamp_pos = [&](const Position& p) -> size_t {
            if (p.line >= lines.line_count()) return doc.text.size();
            return lines.offset_of(p.line, p.character);
        };
        const size_t a = clamp_pos(ch.range->start);
        const size_t b = clamp_pos(ch.range->end);
        const size_t lo = std::min(a, b);
        const size_t hi = std::max(a, b);

        if (doc.text.compare(lo, hi - lo, ch.text) == 0) return false;
        doc.text.replace(lo, hi - lo, ch.text);
        return true;
    }

    int to_lsp_severity_(tessel::diag::Severity sev) {
        switch (sev) {
            case tessel::diag::Severity::kWarning: return 2;
            case tessel::diag::Severity::kFatal:
            case tessel::diag::Severity::kError:
            default:
                return 1;
        }
    }

    std::string build_initialize_result_(const tessel::engine::Tokenizer& tk) {
        std::string json = "{\"capabilities\":{";
        json += "\"textDocumentSync\":{\"openClose\":true,\"change\":2},";
        json += "\"positionEncoding\":\"utf-8\",";
        json += "\"semanticTokensProvider\":{\"legend\":{\"tokenTypes\":[";
        const auto legend = tk.legend();
        for (size_t i = 0; i < legend.size(); ++i) {
            if (i != 0) json += ",";
            json += "\"" + json_escape_(legend[i]) + "\"";
        }
        json += "],\"tokenModifiers\":[]},\"full\":true,\"range\":true},";
        json += "\"experimental\":{";
        json += "\"tesselRangeStrategy\":\"" + std::string(tessel::range_strategy_name(tk.range_strategy())) + "\",";
        json += std::string("\"tesselParallel\":") + (tk.supports_parallel() ? "true" : "false");
        json += "}},";
        json += "\"serverInfo\":{\"name\":\"tesseld\",\"version\":\""
              + std::to_string(tessel::k_version_major) + "."
              + std::to_string(tessel::k_version_minor) + "."
              + std::to_string(tessel::k_version_patch) + "\"}}";
        return json;
    }

    std::string build_semantic_tokens_result_(const tessel::TokenList& tokens) {
        const auto data = tessel::engine::encode(tokens);
        std::string json = "{\"data\":[";
        for (size_t i = 0; i < data.size(); ++i) {
            if (i != 0) json += ",";
            json += std::to_string(data[i]);
        }
        json += "]}";
        return json;
    }

    std::string build_publish_diagnostics_(std::string_view uri, int64_t version, const std::vector<LspDiag>& diags) {
        std::string json = "{\"jsonrpc\":\"2.0\",\"method\":\"textDocument/publishDiagnostics\",\"params\":{";
        json += "\"uri\":\"" + json_escape_(uri) + "\",";
        json += "\"version\":" + std::to_string(version) + ",";
        json += "\"diagnostics\":[";
        for (size_t i = 0; i < diags.size(); ++i) {
            const auto& d = diags[i];
            if (i != 0) json += ",";
            json += "{\"range\":{";
            json += "\"start\":{\"line\":" + std::to_string(d.range.start.line)
                  + ",\"character\":" + std::to_string(d.range.start.character) + "},";
            json += "\"end\":{\"line\":" + std::to_string(d.range.end.line)
                  + ",\"character\":" + std::to_string(d.range.end.character) + "}},";
            json += "\"severity\":" + std::to_string(d.severity) + ",";
            json += "\"code\":\"" + json_escape_(d.code) + "\",";
            json += "\"source\":\"tesseld\",";
            json += "\"message\":\"" + json_escape_(d.message) + "\"}";
        }
        json += "]}}";
        return json;
    }

    std::string build_window_log_message_(int type, std::string_view message) {
        std::string json = "{\"jsonrpc\":\"2.0\",\"method\":\"window/logMessage\",\"params\":{";
        json += "\"type\":" + std::to_string(type) + ",";
        json += "\"message\":\"" + json_escape_(message) + "\"}}";
        return json;
    }

    std::string build_response_result_(const JsonValue* id, std::string_view result_json) {
        if (id == nullptr) return {};
        return "{\"jsonrpc\":\"2.0\",\"id\":" + id_to_text_(*id) + ",\"result\":" + std::string(result_json) + "}";
    }

    std::string build_response_error_(const JsonValue* id, int code, std::string_view message) {
        if (id == nullptr) return {};
        return "{\"jsonrpc\":\"2.0\",\"id\":" + id_to_text_(*id)
             + ",\"error\":{\"code\":" + std::to_string(code)
             + ",\"message\":\"" + json_escape_(message) + "\"}}";
    }

    /// @brief initializationOptions.tessel (또는 최상위) 값을 설정 위에 덮어쓴다.
    void apply_initialization_options_(const JsonValue* params, tessel::config::EngineConfig& cfg,
                                       std::vector<std::string>& warnings) {
        const JsonValue* opts = obj_get_(params, "initializationOptions");
        if (opts == nullptr || opts->kind != JsonValue::Kind::kObject) return;
        if (const auto* nested = obj_get_(opts, "tessel"); nested != nullptr && nested->kind == JsonValue::Kind::kObject) {
            opts = nested;
        }

        if (const auto v = as_i64_(obj_get_(opts, "parallelLineThreshold")); v.has_value()) {
            cfg.parallel_line_threshold = *v;
        }
        if (const auto v = as_i64_(obj_get_(opts, "maxThreads")); v.has_value()) {
            cfg.max_threads = *v;
        }
        if (const auto v = as_bool_(obj_get_(opts, "trace")); v.has_value()) {
            cfg.trace = *v;
        }
        if (const auto v = as_string_(obj_get_(opts, "diagnosticLanguage")); v.has_value()) {
            if (const auto lang = tessel::config::parse_diag_lang(*v); lang.has_value()) {
                cfg.diag_lang = *lang;
            } else {
                warnings.push_back("initializationOptions: unknown diagnosticLanguage '" + std::string(*v) + "' (en|ko), ignored");
            }
        }

        tessel::config::clamp(cfg, &warnings);
    }

    // ------------------------------------------------------------------
    // server
    // ------------------------------------------------------------------

    class LspServer {
    public:
        LspServer(tessel::LanguageId lang, tessel::config::EngineConfig cfg, std::vector<std::string> startup_warnings)
            : tokenizer_(tessel::engine::make_tokenizer(lang)),
              cfg_(cfg),
              pending_warnings_(std::move(startup_warnings)) {}

        int run() {
            while (true) {
                std::string payload;
                const auto status = read_lsp_message_(std::cin, payload);
                if (status == ReadStatus::kEof) return shutdown_requested_ ? 0 : 1;
                if (status == ReadStatus::kOversized) continue;

                JsonValue msg{};
                JsonParser parser(payload);
                if (!parser.parse(msg) || msg.kind != JsonValue::Kind::kObject) {
                    trace_("dropped malformed message (" + std::to_string(payload.size()) + " bytes)");
                    continue;
                }

                const JsonValue* id = obj_get_(&msg, "id");
                const auto method = as_string_(obj_get_(&msg, "method"));
                if (!method.has_value()) continue;
                const JsonValue* params = obj_get_(&msg, "params");

                // a failing handler answers the request and the server keeps serving
                try {
                    if (*method == "initialize") {
                        handle_initialize_(id, params);
                    } else if (*method == "initialized") {
                        // nothing to do
                    } else if (*method == "shutdown") {
                        shutdown_requested_ = true;
                        send_(build_response_result_(id, "null"));
                    } else if (*method == "exit") {
                        return shutdown_requested_ ? 0 : 1;
                    } else if (*method == "textDocument/didOpen") {
                        handle_did_open_(params);
                    } else if (*method == "textDocument/didChange") {
                        handle_did_change_(params);
                    } else if (*method == "textDocument/didClose") {
                        handle_did_close_(params);
                    } else if (*method == "textDocument/semanticTokens/full") {
                        handle_semantic_tokens_full_(id, params);
                    } else if (*method == "textDocument/semanticTokens/range") {
                        handle_semantic_tokens_range_(id, params);
                    } else if (id != nullptr) {
                        send_(build_response_error_(id, -32601, "method not found: " + std::string(*method)));
                    }
                } catch (const std::exception& e) {
                    const std::string text = "internal error in " + std::string(*method) + ": " + e.what();
                    std::cerr << "[tesseld] " << text << "\n";
                    if (id != nullptr) send_(build_response_error_(id, -32603, text));
                }
            }
        }

    private:
        void send_(const std::string& payload) {
            if (!payload.empty()) write_lsp_message_(std::cout, payload);
        }

        void notify_log_message_(int type, std::string_view text) {
            send_(build_window_log_message_(type, text));
        }

        void trace_(std::string_view line) const {
            if (cfg_.trace) std::cerr << "[tesseld] " << line << "\n";
        }

        tessel::engine::TokenizeOptions options_() const {
            tessel::engine::TokenizeOptions opt{};
            opt.worker_count = tessel::engine::resolve_worker_count(static_cast<uint32_t>(cfg_.max_threads));
            opt.parallel_line_threshold = static_cast<uint32_t>(cfg_.parallel_line_threshold);
            return opt;
        }

        void report_failures_(std::string_view uri, const std::vector<tessel::engine::WorkerFailure>& failures) {
            for (const auto& f : failures) {
                const std::string text = "section " + std::to_string(f.section_index) + " of " + std::string(uri)
                                       + " failed, its tokens are omitted: " + f.message;
                std::cerr << "[tesseld] " << text << "\n";
                notify_log_message_(/*warning=*/2, text);
            }
        }

        /// @brief 전체 토크나이즈 + 트레이스. diags가 있으면 순차 경로에서 채워진다.
        tessel::engine::TokenizeResult tokenize_(std::string_view uri, std::string_view text, tessel::diag::Bag* diags) {
            const auto t0 = std::chrono::steady_clock::now();
            auto res = tokenizer_->tokenize_full(text, options_(), diags);
            const auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0).count();

            trace_(std::string("uri=") + std::string(uri)
                   + " lang=" + std::string(tessel::language_name(tokenizer_->language()))
                   + " lines=" + std::to_string(res.stats.line_count)
                   + " path=" + tessel::engine::exec_path_name(res.stats.path)
                   + " sections=" + std::to_string(res.stats.section_count)
                   + " tokens=" + std::to_string(res.tokens.size())
                   + " elapsed_us=" + std::to_string(us));

            report_failures_(uri, res.stats.failures);
            return res;
        }

        void publish_for_(std::string_view uri, const DocumentState& doc) {
            tessel::diag::Bag bag;
            (void)tokenize_(uri, doc.text, &bag);

            std::vector<LspDiag> out;
            out.reserve(bag.diags().size());
            for (const auto& d : bag.diags()) {
                const auto sp = d.span();
                LspDiag ld{};
                ld.range = Range{Position{sp.line, sp.lo}, Position{sp.line, std::max(sp.hi, sp.lo + 1)}};
                ld.severity = to_lsp_severity_(d.severity());
                ld.code = std::string(tessel::diag::code_name(d.code()));
                ld.message = tessel::diag::render_message(d, cfg_.diag_lang);
                out.push_back(std::move(ld));
            }
            send_(build_publish_diagnostics_(uri, doc.version, out));
        }

        void handle_initialize_(const JsonValue* id, const JsonValue* params) {
            apply_initialization_options_(params, cfg_, pending_warnings_);
            send_(build_response_result_(id, build_initialize_result_(*tokenizer_)));

            for (const auto& w : pending_warnings_) {
                notify_log_message_(/*warning=*/2, w);
            }
            pending_warnings_.clear();

            trace_("initialized lang=" + std::string(tessel::language_name(tokenizer_->language()))
                   + " threshold=" + std::to_string(cfg_.parallel_line_threshold)
                   + " max_threads=" + std::to_string(cfg_.max_threads));
        }

        void handle_did_open_(const JsonValue* params) {
            const auto* td = obj_get_(params, "textDocument");
            const auto uri = as_string_(obj_get_(td, "uri"));
            const auto text = as_string_(obj_get_(td, "text"));
            if (!uri.has_value() || !text.has_value()) return;

            DocumentState st{};
            st.text = std::string(*text);
            st.version = as_i64_(obj_get_(td, "version")).value_or(0);

            const auto it = documents_.insert_or_assign(std::string(*uri), std::move(st)).first;
            publish_for_(*uri, it->second);
        }

        void handle_did_change_(const JsonValue* params) {
            const auto* td = obj_get_(params, "textDocument");
            const auto* changes = obj_get_(params, "contentChanges");
            const auto uri = as_string_(obj_get_(td, "uri"));
            if (!uri.has_value() || changes == nullptr || changes->kind != JsonValue::Kind::kArray) return;

            const auto it = documents_.find(std::string(*uri));
            if (it == documents_.end()) return;

            const auto version = as_i64_(obj_get_(td, "version"));
            if (version.has_value() && *version <= it->second.version) {
                trace_("stale didChange ignored for " + std::string(*uri));
                return;
            }

            bool any_valid = false;
            for (const auto& node : changes->array_v) {
                TextChange ch{};
                if (!parse_text_change_(node, ch)) continue;
                any_valid = true;
                (void)apply_text_change_(it->second, ch);
            }
            if (!any_valid) return;

            it->second.version = version.value_or(it->second.version + 1);
            publish_for_(*uri, it->second);
        }

        void handle_did_close_(const JsonValue* params) {
            const auto uri = as_string_(obj_get_(obj_get_(params, "textDocument"), "uri"));
            if (!uri.has_value()) return;
            documents_.erase(std::string(*uri));
            send_(build_publish_diagnostics_(*uri, 0, {}));
        }

        // returns the open document for a request, or answers the request itself
        const DocumentState* find_document_(const JsonValue* id, const JsonValue* params, std::string& uri_out) {
            const auto uri = as_string_(obj_get_(obj_get_(params, "textDocument"), "uri"));
            if (!uri.has_value()) {
                send_(build_response_error_(id, -32602, "textDocument.uri is required"));
                return nullptr;
            }
            uri_out = std::string(*uri);
            const auto it = documents_.find(uri_out);
            if (it == documents_.end()) {
                send_(build_response_result_(id, build_semantic_tokens_result_({})));
                return nullptr;
            }
            return &it->second;
        }

        void handle_semantic_tokens_full_(const JsonValue* id, const JsonValue* params) {
            if (id == nullptr) return;
            std::string uri;
            const auto* doc = find_document_(id, params, uri);
            if (doc == nullptr) return;

            const auto res = tokenize_(uri, doc->text, nullptr);
            send_(build_response_result_(id, build_semantic_tokens_result_(res.tokens)));
        }

        void handle_semantic_tokens_range_(const JsonValue* id, const JsonValue* params) {
            if (id == nullptr) return;
            Range r{};
            if (!parse_range_(obj_get_(params, "range"), r)) {
                send_(build_response_error_(id, -32602, "range is required"));
                return;
            }

            std::string uri;
            const auto* doc = find_document_(id, params, uri);
            if (doc == nullptr) return;

            // an end position at character 0 does not include that line
            uint32_t last = r.end.line;
            if (r.end.character == 0 && r.end.line > r.start.line) --last;

            const auto t0 = std::chrono::steady_clock::now();
            const auto tokens = tokenizer_->tokenize_range(doc->text, r.start.line, last, options_());
            const auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0).count();
            trace_("range uri=" + uri
                   + " lines=" + std::to_string(r.start.line) + ".." + std::to_string(last)
                   + " strategy=" + std::string(tessel::range_strategy_name(tokenizer_->range_strategy()))
                   + " tokens=" + std::to_string(tokens.size())
                   + " elapsed_us=" + std::to_string(us));

            send_(build_response_result_(id, build_semantic_tokens_result_(tokens)));
        }

        std::unique_ptr<tessel::engine::Tokenizer> tokenizer_;
        tessel::config::EngineConfig cfg_{};
        std::vector<std::string> pending_warnings_{};
        std::unordered_map<std::string, DocumentState> documents_{};
        bool shutdown_requested_ = false;
    };

    void print_usage_() {
        std::cerr
            << "tesseld --stdio --language <shell|yaml|python|nim|json|css> [--config <path>]\n"
            << "  semantic token server (LSP over stdio), one language per process.\n"
            << "  env: TESSEL_PARALLEL_THRESHOLD, TESSEL_MAX_THREADS, TESSEL_TRACE\n";
    }

} // namespace

int main(int argc, char** argv) {
    if (argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
        print_usage_();
        return 0;
    }
    if (argc == 2 && std::strcmp(argv[1], "--version") == 0) {
        std::cout << "tesseld " << tessel::k_version_string << "\n";
        return 0;
    }

    bool stdio = false;
    std::optional<tessel::LanguageId> lang{};
    std::optional<std::filesystem::path> config_path{};

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--stdio") {
            stdio = true;
            continue;
        }
        if ((arg == "--language" || arg == "--config") && i + 1 < argc) {
            const std::string_view value = argv[++i];
            if (arg == "--config") {
                config_path = std::filesystem::path(value);
                continue;
            }
            lang = tessel::language_from_name(value);
            if (!lang.has_value()) {
                std::cerr << "error: unknown language: " << value << "\n";
                print_usage_();
                return 1;
            }
            continue;
        }

        std::cerr << "error: unknown option: " << arg << "\n";
        print_usage_();
        return 1;
    }

    if (!stdio) {
        std::cerr << "error: tesseld requires --stdio\n";
        print_usage_();
        return 1;
    }
    if (!lang.has_value()) {
        std::cerr << "error: tesseld requires --language\n";
        print_usage_();
        return 1;
    }

    tessel::config::EngineConfig cfg{};
    std::vector<std::string> warnings{};
    std::string err{};
    if (!tessel::config::load(config_path, cfg, warnings, err)) {
        // the server still starts; the client sees the problem after initialize
        std::cerr << "[tesseld] config: " << err << "\n";
        warnings.push_back("config: " + err + " (defaults in use)");
        cfg = tessel::config::EngineConfig{};
    }

    LspServer server(*lang, cfg, std::move(warnings));
    return server.run();
}
