#pragma once
#include <string>

namespace toolgate::protocol {

    enum class TurnRole {
        User,        // the question
        Model,       // a raw model reply
        ToolResult,  // an ExecutionResult serialized for the model
        Corrective   // an instruction appended after an unusable reply
    };

    struct Turn {
        TurnRole role;
        std::string content;
    };

    enum class TerminalStatus {
        Answered,
        Refused,
        IterationLimitExceeded,
        FatalError,
        Cancelled
    };

    inline std::string to_string(const TurnRole role) {
        switch (role) {
            case TurnRole::User:
                return "user";
            case TurnRole::Model:
                return "model";
            case TurnRole::ToolResult:
                return "tool_result";
            case TurnRole::Corrective:
                return "corrective";
            default:
                return "unknown";
        }
    }

    inline std::string to_string(const TerminalStatus status) {
        switch (status) {
            case TerminalStatus::Answered:
                return "answered";
            case TerminalStatus::Refused:
                return "refused";
            case TerminalStatus::IterationLimitExceeded:
                return "iteration_limit_exceeded";
            case TerminalStatus::FatalError:
                return "fatal_error";
            case TerminalStatus::Cancelled:
                return "cancelled";
            default:
                return "unknown";
        }
    }

} // namespace toolgate::protocol
