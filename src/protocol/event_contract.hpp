#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include "protocol/conversation_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::protocol {

    // Lifecycle events the orchestrator streams to an optional listener
    struct ConversationStartEvent { std::string conversation_id; std::string question; };
    struct IterationStartEvent { std::uint32_t iteration; };
    struct ModelReplyEvent { std::string raw_text; std::string intent; };
    struct ToolExecutionStartEvent { std::string tool_name; nlohmann::json arguments; };
    struct ToolExecutionEndEvent { std::string tool_name; ExecutionResult result; };
    // Unknown tool or contract violation: the capability never ran.
    struct ToolRejectedEvent { std::string tool_name; ExecutionResult result; };
    struct CorrectiveEvent { std::string instruction; };
    struct ConversationEndEvent { TerminalStatus status; std::string text; };

    using OrchestratorEvent = std::variant<
        ConversationStartEvent,
        IterationStartEvent,
        ModelReplyEvent,
        ToolExecutionStartEvent,
        ToolExecutionEndEvent,
        ToolRejectedEvent,
        CorrectiveEvent,
        ConversationEndEvent
    >;

    using EventListener = std::function<void(const OrchestratorEvent&)>;

} // namespace toolgate::protocol
