// engine/src/engine/registry.cpp
#include <tessel/engine/Tokenizer.hpp>
#include <tessel/engine/Engine.hpp>
#include <tessel/lang/Css.hpp>
#include <tessel/lang/Json.hpp>
#include <tessel/lang/Nim.hpp>
#include <tessel/lang/Python.hpp>
#include <tessel/lang/Shell.hpp>
#include <tessel/lang/Yaml.hpp>


namespace tessel::engine {

    namespace {

        /// @brief Stateful languages: generic section engine + filter-full ranges.
        template <class Strategy>
        class EngineTokenizer final : public Tokenizer {
        public:
            explicit EngineTokenizer(LanguageId id) : id_(id) {}

            LanguageId language() const override { return id_; }
            RangeStrategy range_strategy() const override { return RangeStrategy::kFilterFull; }
            bool supports_parallel() const override { return true; }

            TokenizeResult tokenize_full(std::string_view text, const TokenizeOptions& opt, diag::Bag* diags) const override {
                return Engine<Strategy>::tokenize(text, opt, diags);
            }

            TokenList tokenize_range(std::string_view text, uint32_t start_line, uint32_t end_line,
                                     const TokenizeOptions& opt) const override {
                return Engine<Strategy>::tokenize_range(text, start_line, end_line, opt);
            }

        private:
            LanguageId id_;
        };

        /// @brief JSON: context-stack tokenizer, always sequential; ranges use local lookahead.
        class JsonTokenizer final : public Tokenizer {
        public:
            LanguageId language() const override { return LanguageId::kJson; }
            RangeStrategy range_strategy() const override { return RangeStrategy::kLocalLookahead; }
            bool supports_parallel() const override { return false; }

            TokenizeResult tokenize_full(std::string_view text, const TokenizeOptions&, diag::Bag* diags) const override {
                TokenizeResult out{};
                out.tokens = json::tokenize_full(text, diags);
                out.stats.path = ExecPath::kSequential;
                out.stats.line_count = LineIndex(text).line_count();
                return out;
            }

            TokenList tokenize_range(std::string_view text, uint32_t start_line, uint32_t end_line,
                                     const TokenizeOptions&) const override {
                return json::tokenize_range_local(text, start_line, end_line);
            }
        };

    } // namespace

    std::unique_ptr<Tokenizer> make_tokenizer(LanguageId id) {
        switch (id) {
            case LanguageId::kShell:  return std::make_unique<EngineTokenizer<shell::Strategy>>(id);
            case LanguageId::kYaml:   return std::make_unique<EngineTokenizer<yaml::Strategy>>(id);
            case LanguageId::kPython: return std::make_unique<EngineTokenizer<python::Strategy>>(id);
            case LanguageId::kNim:    return std::make_unique<EngineTokenizer<nim::Strategy>>(id);
            case LanguageId::kJson:   return std::make_unique<JsonTokenizer>();
            case LanguageId::kCss:    return std::make_unique<EngineTokenizer<css::Strategy>>(id);
        }
        return nullptr;
    }

} // namespace tessel::engine
