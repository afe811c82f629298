#pragma once

#include <string>
#include "protocol/tool_contract.hpp"
#include "runtime/conversation_state.hpp"
#include "tools/tool_registry.hpp"

namespace toolgate::runtime {

// Renders the text sent to the model. Every request is rebuilt from the
// catalog and the transcript; nothing else carries conversation history.
class PromptBuilder {
public:
    PromptBuilder(const tools::ToolRegistry& registry, bool allow_tool_batches);

    std::string build(const std::string& question, const Transcript& transcript) const;

    // The legal reply shapes, quoted verbatim in corrective instructions.
    std::string reply_contract() const;

    std::string corrective_for_malformed(const std::string& detail) const;
    std::string corrective_for_repeated_call(const std::string& tool_name) const;

    // Serialized tool outcome plus follow-up guidance for the next reply.
    static std::string tool_result_turn(const std::string& tool_name,
                                        const nlohmann::json& raw_arguments,
                                        const protocol::ExecutionResult& result);

private:
    const tools::ToolRegistry& registry_;
    bool allow_tool_batches_;
};

}  // namespace toolgate::runtime
