#include "runtime/conversation_state.hpp"

#include <algorithm>
#include <utility>

namespace toolgate::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::TerminalStatus;
using protocol::Turn;
using protocol::TurnRole;

void Transcript::append(Turn turn) {
    turns_.push_back(std::move(turn));
}

std::size_t Transcript::count(const TurnRole role) const {
    return static_cast<std::size_t>(
        std::count_if(turns_.begin(), turns_.end(),
                      [role](const Turn& turn) { return turn.role == role; }));
}

AgentError ConversationState::terminal_error(const std::string& action) const {
    return AgentError{ErrorCategory::Internal,
                      "Cannot " + action + ": conversation already ended as " +
                          protocol::to_string(terminal_status_.value()),
                      "conversation_terminal"};
}

core::errors::Result<core::errors::Ok> ConversationState::append(const TurnRole role,
                                                                 std::string content) {
    if (is_terminal()) {
        return terminal_error("append a turn");
    }
    transcript_.append(Turn{role, std::move(content)});
    return core::errors::Ok{};
}

core::errors::Result<std::uint32_t> ConversationState::advance_iteration() {
    if (is_terminal()) {
        return terminal_error("advance the iteration");
    }
    return ++iteration_count_;
}

core::errors::Result<core::errors::Ok> ConversationState::set_terminal(
    const TerminalStatus status) {
    if (is_terminal()) {
        if (terminal_status_.value() == status) {
            return core::errors::Ok{};
        }
        return AgentError{ErrorCategory::Internal,
                          "Terminal status already set to " +
                              protocol::to_string(terminal_status_.value()),
                          "terminal_already_set"};
    }
    terminal_status_ = status;
    return core::errors::Ok{};
}

}  // namespace toolgate::runtime
