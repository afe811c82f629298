#include "app/cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <system_error>
#include <vector>

namespace toolgate::app::cli {

    using namespace toolgate::core::errors;
    using toolgate::core::config::AgentConfig;
    using toolgate::protocol::RunRequest;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> question;
            std::optional<std::string> max_iterations;
            std::optional<std::string> model;
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> model_timeout_ms;
            std::optional<std::string> tool_timeout_ms;
            std::optional<std::string> retries;
            std::optional<std::string> docs_dir;
            std::optional<std::string> config_file;
            std::optional<std::string> trace_file;
            bool parallel_calls = false;
            bool no_loop_detection = false;
            bool quiet = false;
            bool verbose = false;
        };

        // Exception-free integer parsing; the whole token must be consumed.
        Result<std::uint32_t> parse_uint(const std::string& flag, const std::string& text,
                                         std::uint32_t min_value, std::uint32_t max_value) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min_value || value > max_value) {
                return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
            }
            return value;
        }

    } // namespace

    std::string usage() {
        return "Usage: toolgate \"<question>\" [--max-iterations N] [--model NAME] [--host HOST] [--port PORT]\n"
               "                [--model-timeout-ms MS] [--tool-timeout-ms MS] [--retries N] [--docs-dir DIR]\n"
               "                [--config FILE] [--trace-file FILE] [--parallel-calls] [--no-loop-detection]\n"
               "                [--quiet | --verbose]";
    }

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No question provided.", "missing_question", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued_flags = {
            {"--max-iterations", &raw.max_iterations},
            {"--model", &raw.model},
            {"--host", &raw.host},
            {"--port", &raw.port},
            {"--model-timeout-ms", &raw.model_timeout_ms},
            {"--tool-timeout-ms", &raw.tool_timeout_ms},
            {"--retries", &raw.retries},
            {"--docs-dir", &raw.docs_dir},
            {"--config", &raw.config_file},
            {"--trace-file", &raw.trace_file}};

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--help" || arg == "-h") {
                return AgentError{ErrorCategory::Input, "Help requested.", "help_requested", usage()};
            }
            if (arg == "--parallel-calls") {
                raw.parallel_calls = true;
                continue;
            }
            if (arg == "--no-loop-detection") {
                raw.no_loop_detection = true;
                continue;
            }
            if (arg == "--quiet") {
                raw.quiet = true;
                continue;
            }
            if (arg == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : valued_flags) {
                if (arg != flag) continue;
                if (i + 1 >= args.size()) {
                    return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (matched) continue;

            if (arg.rfind("--", 0) == 0) {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument", usage()};
            }
            if (raw.question.has_value()) {
                return AgentError{ErrorCategory::Input, "Unexpected extra argument: " + arg, "unexpected_argument",
                                  "Quote the question so it is a single argument."};
            }
            raw.question = arg;
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (!raw.question.has_value() || raw.question->empty()) {
            return AgentError{ErrorCategory::Input, "No question provided.", "missing_question", usage()};
        }
        if (raw.quiet && raw.verbose) {
            return AgentError{ErrorCategory::Input, "Cannot provide both --quiet and --verbose", "conflicting_flags"};
        }

        RunRequest req;
        req.question = raw.question.value();
        req.quiet = raw.quiet;
        req.verbose = raw.verbose;

        auto with_env = core::config::apply_environment(AgentConfig{});
        if (is_error(with_env)) {
            return get_error(with_env);
        }
        AgentConfig config = get_value(with_env);

        if (raw.config_file) {
            auto loaded = core::config::load_config_file(raw.config_file.value(), config);
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            config = get_value(loaded);
        }

        if (raw.max_iterations) {
            auto parsed = parse_uint("--max-iterations", *raw.max_iterations,
                                     core::config::kMinIterations, core::config::kMaxIterationsCeiling);
            if (is_error(parsed)) return get_error(parsed);
            config.max_iterations = get_value(parsed);
        }
        if (raw.port) {
            auto parsed = parse_uint("--port", *raw.port, 1, std::numeric_limits<std::uint16_t>::max());
            if (is_error(parsed)) return get_error(parsed);
            config.model_port = static_cast<std::uint16_t>(get_value(parsed));
        }
        if (raw.model_timeout_ms) {
            auto parsed = parse_uint("--model-timeout-ms", *raw.model_timeout_ms, 1,
                                     std::numeric_limits<std::uint32_t>::max());
            if (is_error(parsed)) return get_error(parsed);
            config.model_timeout_ms = get_value(parsed);
        }
        if (raw.tool_timeout_ms) {
            auto parsed = parse_uint("--tool-timeout-ms", *raw.tool_timeout_ms, 0,
                                     std::numeric_limits<std::uint32_t>::max());
            if (is_error(parsed)) return get_error(parsed);
            config.tool_timeout_ms = get_value(parsed);
        }
        if (raw.retries) {
            auto parsed = parse_uint("--retries", *raw.retries, 1, 10);
            if (is_error(parsed)) return get_error(parsed);
            config.model_max_retries = get_value(parsed);
        }
        if (raw.model) config.model_name = raw.model.value();
        if (raw.host) config.model_host = raw.host.value();
        if (raw.docs_dir) config.docs_dir = raw.docs_dir.value();
        if (raw.trace_file) config.trace_file = std::filesystem::path(raw.trace_file.value());
        if (raw.parallel_calls) config.allow_parallel_calls = true;
        if (raw.no_loop_detection) config.detect_repeated_calls = false;

        auto valid = core::config::validate_config(config);
        if (is_error(valid)) {
            return get_error(valid);
        }

        req.config = std::move(config);
        return req;
    }

} // namespace toolgate::app::cli
