#pragma once
#include <string>
#include "protocol/run_request.hpp"
#include "core/errors/agent_errors.hpp"

namespace toolgate::app::cli {
    // Defaults, then OLLAMA_HOST, then --config FILE, then the remaining flags.
    toolgate::core::errors::Result<toolgate::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
