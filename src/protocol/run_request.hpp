#pragma once
#include <string>
#include "core/config/agent_config.hpp"

namespace toolgate::protocol {

    // The validated user input required to start one conversation
    struct RunRequest {
        std::string question;
        core::config::AgentConfig config;
        bool quiet = false;
        bool verbose = false;
    };

} // namespace toolgate::protocol
