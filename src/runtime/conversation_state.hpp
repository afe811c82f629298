#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/conversation_contract.hpp"

namespace toolgate::runtime {

// Append-only sequence of turns.
class Transcript {
public:
    void append(protocol::Turn turn);

    const std::vector<protocol::Turn>& turns() const { return turns_; }
    std::size_t size() const { return turns_.size(); }
    std::size_t count(protocol::TurnRole role) const;

private:
    std::vector<protocol::Turn> turns_;
};

// Owned by exactly one orchestrator run. Once a terminal status is set,
// every further mutation is rejected; re-setting the same status is a no-op.
class ConversationState {
public:
    std::uint32_t iteration_count() const { return iteration_count_; }
    const Transcript& transcript() const { return transcript_; }
    const std::optional<protocol::TerminalStatus>& terminal_status() const {
        return terminal_status_;
    }
    bool is_terminal() const { return terminal_status_.has_value(); }

    core::errors::Result<core::errors::Ok> append(protocol::TurnRole role,
                                                  std::string content);
    core::errors::Result<std::uint32_t> advance_iteration();
    core::errors::Result<core::errors::Ok> set_terminal(protocol::TerminalStatus status);

private:
    core::errors::AgentError terminal_error(const std::string& action) const;

    std::uint32_t iteration_count_ = 0;
    Transcript transcript_;
    std::optional<protocol::TerminalStatus> terminal_status_;
};

}  // namespace toolgate::runtime
