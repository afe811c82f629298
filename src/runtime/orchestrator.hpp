#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "model/model_client.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/conversation_state.hpp"
#include "tools/tool_registry.hpp"

namespace toolgate::runtime {

struct OrchestratorOptions {
    std::uint32_t max_iterations = 5;
    std::chrono::milliseconds tool_timeout{10000};
    bool detect_repeated_calls = true;
    bool allow_parallel_calls = false;
};

struct ConversationOutcome {
    std::string conversation_id;
    protocol::TerminalStatus status = protocol::TerminalStatus::FatalError;
    // The answer, refusal reason, limit notice or fatal error message.
    std::string text;
    ConversationState state;
    std::size_t tool_executions = 0;
};

// Drives request -> interpret -> validate -> execute -> append until a
// terminal status is reached. Holds no per-conversation state, so one
// instance can serve concurrent conversations.
class Orchestrator {
public:
    Orchestrator(const tools::ToolRegistry& registry, model::ModelClient& model,
                 OrchestratorOptions options);

    // Cancellation is only observed between iterations.
    core::errors::Result<ConversationOutcome> run(
        const std::string& conversation_id, const std::string& question,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr,
        const protocol::EventListener& listener = nullptr) const;

private:
    const tools::ToolRegistry& registry_;
    model::ModelClient& model_;
    OrchestratorOptions options_;
};

}  // namespace toolgate::runtime
