#include "core/config/agent_config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolgate::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

errors::Result<std::uint16_t> parse_port(const std::string& text) {
    std::uint32_t port = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, port);
    if (ec != std::errc() || ptr != end || port == 0 ||
        port > std::numeric_limits<std::uint16_t>::max()) {
        return AgentError{ErrorCategory::Config, "Invalid port: " + text,
                          "invalid_port", "Use a number between 1 and 65535."};
    }
    return static_cast<std::uint16_t>(port);
}

AgentError bad_value(const std::string& key, const std::string& expected) {
    return AgentError{ErrorCategory::Config,
                      "Config key '" + key + "' must be " + expected,
                      "invalid_config_value"};
}

// Reads a non-negative integer that fits in T.
template <typename T>
errors::Result<T> read_unsigned(const json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        return bad_value(key, "a non-negative integer");
    }
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > std::numeric_limits<T>::max()) {
            return bad_value(key, "within range");
        }
        return static_cast<T>(raw);
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < 0 || static_cast<std::uint64_t>(raw) > std::numeric_limits<T>::max()) {
        return bad_value(key, "a non-negative integer");
    }
    return static_cast<T>(raw);
}

errors::Result<std::string> read_string(const json& value, const std::string& key) {
    if (!value.is_string()) {
        return bad_value(key, "a string");
    }
    return value.get<std::string>();
}

errors::Result<bool> read_bool(const json& value, const std::string& key) {
    if (!value.is_boolean()) {
        return bad_value(key, "a boolean");
    }
    return value.get<bool>();
}

errors::Result<errors::Ok> apply_key(AgentConfig& config, const std::string& key,
                                     const json& value) {
    if (key == "max_iterations") {
        auto parsed = read_unsigned<std::uint32_t>(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.max_iterations = errors::get_value(parsed);
    } else if (key == "model_host") {
        auto parsed = read_string(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.model_host = errors::get_value(parsed);
    } else if (key == "model_port") {
        auto parsed = read_unsigned<std::uint16_t>(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.model_port = errors::get_value(parsed);
    } else if (key == "model_name") {
        auto parsed = read_string(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.model_name = errors::get_value(parsed);
    } else if (key == "temperature") {
        if (!value.is_number()) {
            return bad_value(key, "a number");
        }
        config.temperature = value.get<double>();
    } else if (key == "model_timeout_ms") {
        auto parsed = read_unsigned<std::uint32_t>(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.model_timeout_ms = errors::get_value(parsed);
    } else if (key == "model_max_retries") {
        auto parsed = read_unsigned<std::uint32_t>(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.model_max_retries = errors::get_value(parsed);
    } else if (key == "retry_backoff_ms") {
        auto parsed = read_unsigned<std::uint32_t>(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.retry_backoff_ms = errors::get_value(parsed);
    } else if (key == "tool_timeout_ms") {
        auto parsed = read_unsigned<std::uint32_t>(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.tool_timeout_ms = errors::get_value(parsed);
    } else if (key == "docs_dir") {
        auto parsed = read_string(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.docs_dir = errors::get_value(parsed);
    } else if (key == "detect_repeated_calls") {
        auto parsed = read_bool(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.detect_repeated_calls = errors::get_value(parsed);
    } else if (key == "allow_parallel_calls") {
        auto parsed = read_bool(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.allow_parallel_calls = errors::get_value(parsed);
    } else if (key == "trace_file") {
        auto parsed = read_string(value, key);
        if (errors::is_error(parsed)) return errors::get_error(parsed);
        config.trace_file = std::filesystem::path(errors::get_value(parsed));
    } else {
        return AgentError{ErrorCategory::Config, "Unknown config key: " + key,
                          "unknown_config_key"};
    }
    return errors::Ok{};
}

}  // namespace

errors::Result<AgentConfig> apply_environment(AgentConfig config) {
    const char* raw = std::getenv("OLLAMA_HOST");
    if (raw == nullptr || *raw == '\0') {
        return config;
    }

    std::string host = raw;
    for (const std::string scheme : {"http://", "https://"}) {
        if (host.rfind(scheme, 0) == 0) {
            host = host.substr(scheme.size());
        }
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }

    const auto colon = host.rfind(':');
    if (colon != std::string::npos) {
        auto port = parse_port(host.substr(colon + 1));
        if (errors::is_error(port)) {
            return errors::get_error(port);
        }
        config.model_port = errors::get_value(port);
        host = host.substr(0, colon);
    }
    if (!host.empty()) {
        config.model_host = host;
    }
    return config;
}

errors::Result<AgentConfig> load_config_file(const std::filesystem::path& path,
                                             AgentConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Config,
                          "Unable to open config file: " + path.string(),
                          "config_open_failed"};
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        return AgentError{ErrorCategory::Config,
                          "Config file is not valid JSON: " + std::string(e.what()),
                          "config_parse_failed"};
    }
    if (!document.is_object()) {
        return AgentError{ErrorCategory::Config,
                          "Config file must contain a JSON object.",
                          "config_parse_failed"};
    }

    for (const auto& item : document.items()) {
        auto applied = apply_key(base, item.key(), item.value());
        if (errors::is_error(applied)) {
            return errors::get_error(applied);
        }
    }
    return base;
}

errors::Result<errors::Ok> validate_config(const AgentConfig& config) {
    if (config.max_iterations < kMinIterations ||
        config.max_iterations > kMaxIterationsCeiling) {
        return AgentError{ErrorCategory::Config, "max_iterations out of bounds",
                          "bounds_error", "Must be between 1 and 1000."};
    }
    if (config.model_host.empty()) {
        return AgentError{ErrorCategory::Config, "model_host cannot be empty.",
                          "invalid_config_value"};
    }
    if (config.model_port == 0) {
        return AgentError{ErrorCategory::Config, "model_port cannot be zero.",
                          "invalid_port"};
    }
    if (config.model_name.empty()) {
        return AgentError{ErrorCategory::Config, "model_name cannot be empty.",
                          "invalid_config_value"};
    }
    if (config.model_max_retries == 0) {
        return AgentError{ErrorCategory::Config,
                          "model_max_retries must allow at least one attempt.",
                          "invalid_config_value"};
    }
    if (config.model_timeout_ms == 0) {
        return AgentError{ErrorCategory::Config,
                          "model_timeout_ms must be greater than zero.",
                          "invalid_config_value"};
    }
    return errors::Ok{};
}

}  // namespace toolgate::core::config
