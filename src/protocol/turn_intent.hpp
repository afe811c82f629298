#pragma once
#include <string>
#include <variant>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace toolgate::protocol {

    // {"tool": ..., "arguments": {...}}
    struct ToolCallIntent {
        Invocation invocation;
    };

    // {"tool_calls": [...]}, only legal when parallel calls are enabled
    struct ToolBatchIntent {
        std::vector<Invocation> invocations;
    };

    // {"done": true, "answer": ...}
    struct CompletionIntent {
        std::string answer;
    };

    // {"refuse": true, "reason": ...}
    struct RefusalIntent {
        std::string reason;
    };

    // Anything else. Parsing failures are data, not faults.
    struct MalformedIntent {
        std::string raw_text;
        std::string detail;
    };

    using IntentKind = std::variant<
        ToolCallIntent,
        ToolBatchIntent,
        CompletionIntent,
        RefusalIntent,
        MalformedIntent
    >;

    struct TurnIntent {
        IntentKind kind;
        // Set when the reply carried markers for more than one shape and
        // precedence (refuse > done > tool) picked the winner.
        bool ambiguous = false;
    };

    inline std::string intent_name(const TurnIntent& intent) {
        struct Namer {
            std::string operator()(const ToolCallIntent&) const { return "tool_call"; }
            std::string operator()(const ToolBatchIntent&) const { return "tool_batch"; }
            std::string operator()(const CompletionIntent&) const { return "completion"; }
            std::string operator()(const RefusalIntent&) const { return "refusal"; }
            std::string operator()(const MalformedIntent&) const { return "malformed"; }
        };
        return std::visit(Namer{}, intent.kind);
    }

} // namespace toolgate::protocol
