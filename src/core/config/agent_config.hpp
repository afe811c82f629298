#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace toolgate::core::config {

constexpr std::uint32_t kMinIterations = 1;
constexpr std::uint32_t kMaxIterationsCeiling = 1000;

// Every tunable of one orchestrator run. Built from defaults, then an
// optional JSON file, then CLI flags.
struct AgentConfig {
    std::uint32_t max_iterations = 5;

    std::string model_host = "127.0.0.1";
    std::uint16_t model_port = 11434;
    std::string model_name = "llama3.2";
    double temperature = 0.0;
    std::uint32_t model_timeout_ms = 120000;
    std::uint32_t model_max_retries = 3;
    std::uint32_t retry_backoff_ms = 1000;

    // 0 disables the per-invocation bound.
    std::uint32_t tool_timeout_ms = 10000;
    std::filesystem::path docs_dir = "docs";

    bool detect_repeated_calls = true;
    bool allow_parallel_calls = false;
    std::optional<std::filesystem::path> trace_file;
};

// Applies OLLAMA_HOST ("host" or "host:port") when set.
errors::Result<AgentConfig> apply_environment(AgentConfig config);

// Overlays keys from a JSON object file; unknown keys are rejected.
errors::Result<AgentConfig> load_config_file(const std::filesystem::path& path,
                                             AgentConfig base);

errors::Result<errors::Ok> validate_config(const AgentConfig& config);

}  // namespace toolgate::core::config
