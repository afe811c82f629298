#include "runtime/prompt_builder.hpp"

#include <sstream>

namespace toolgate::runtime {

using protocol::ExecutionResult;
using protocol::Turn;
using protocol::TurnRole;

PromptBuilder::PromptBuilder(const tools::ToolRegistry& registry, bool allow_tool_batches)
    : registry_(registry), allow_tool_batches_(allow_tool_batches) {}

std::string PromptBuilder::reply_contract() const {
    std::ostringstream out;
    out << "Reply with exactly one JSON object and nothing else, in one of these shapes:\n"
        << "1. Call a tool: {\"tool\": \"tool_name\", \"arguments\": {\"param\": value}}\n"
        << "2. Final answer: {\"done\": true, \"answer\": \"your answer using the tool results\"}\n"
        << "3. Decline: {\"refuse\": true, \"reason\": \"why no tool is appropriate\"}\n";
    if (allow_tool_batches_) {
        out << "4. Several independent tool calls: {\"tool_calls\": "
               "[{\"tool\": \"tool_name\", \"arguments\": {...}}, ...]}\n";
    }
    out << "Numbers must be JSON numbers, not strings. Use only the parameters a tool declares.";
    return out.str();
}

std::string PromptBuilder::build(const std::string& question,
                                 const Transcript& transcript) const {
    std::ostringstream out;
    out << "You are a helpful assistant with access to tools. Answer the user's question "
           "by calling the appropriate tools.\n\n"
        << "Available tools:\n"
        << registry_.describe_all().dump(2) << "\n\n"
        << "RULES:\n"
        << reply_contract() << "\n"
        << "Never invent tool results: wait for the actual result before answering.\n"
        << "Once a tool result answers the question, finish with the final answer shape.\n\n"
        << "User question: " << question << "\n";

    bool history_started = false;
    for (const Turn& turn : transcript.turns()) {
        if (turn.role == TurnRole::User) {
            continue;
        }
        if (!history_started) {
            out << "\nConversation so far:\n";
            history_started = true;
        }
        switch (turn.role) {
            case TurnRole::Model:
                out << "\nYou replied: " << turn.content << "\n";
                break;
            case TurnRole::ToolResult:
                out << "\n" << turn.content << "\n";
                break;
            case TurnRole::Corrective:
                out << "\nError: " << turn.content << "\n";
                break;
            case TurnRole::User:
                break;
        }
    }

    out << "\nRespond with JSON only:";
    return out.str();
}

std::string PromptBuilder::corrective_for_malformed(const std::string& detail) const {
    return "Your response was not valid under the reply contract (" + detail + ").\n" +
           reply_contract();
}

std::string PromptBuilder::corrective_for_repeated_call(const std::string& tool_name) const {
    return "You just called " + tool_name +
           " with the same arguments again. Use the result you already have and respond "
           "with: {\"done\": true, \"answer\": \"your final answer using the results you have\"}";
}

std::string PromptBuilder::tool_result_turn(const std::string& tool_name,
                                            const nlohmann::json& raw_arguments,
                                            const ExecutionResult& result) {
    std::ostringstream out;
    out << "Tool: " << tool_name << "\n"
        << "Arguments: " << raw_arguments.dump() << "\n"
        << "Result: "
        << protocol::result_to_json(result).dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace)
        << "\n";
    if (result.is_success()) {
        out << "Decide whether the question is fully answered. If yes, respond with "
               "{\"done\": true, \"answer\": \"...\"}. If another tool is needed, call it now.";
    } else {
        out << "The tool call failed. Correct the call if the error says how, otherwise "
               "respond with {\"done\": true, \"answer\": \"explain the error to the user\"}.";
    }
    return out.str();
}

}  // namespace toolgate::runtime
