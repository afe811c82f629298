#include "session/run_manager.hpp"
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"

namespace toolgate::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::RunRequest;
using protocol::TerminalStatus;

bool RunManager::is_terminal(const RunState state) {
    return state == RunState::Completed || state == RunState::Failed ||
           state == RunState::Cancelled;
}

std::string RunManager::to_string(const RunState state) {
    switch (state) {
        case RunState::Created:
            return "created";
        case RunState::Running:
            return "running";
        case RunState::Completed:
            return "completed";
        case RunState::Failed:
            return "failed";
        case RunState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::string> RunManager::start_run(const RunRequest& request) {
    if (request.question.empty()) {
        return AgentError{ErrorCategory::Input, "Run request must include a question.",
                          "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string run_id = core::config::generate_conversation_id();
        if (runs_.find(run_id) != runs_.end()) {
            continue;
        }

        RunRecord record;
        record.run_id = run_id;
        record.request = request;
        record.state = RunState::Created;
        record.cancel_token = std::make_shared<std::atomic_bool>(false);
        runs_.emplace(run_id, std::move(record));
        TOOLGATE_LOG_DEBUG("RunManager: run " + run_id + " transition created -> running");
        runs_[run_id].state = RunState::Running;
        return run_id;
    }

    return AgentError{ErrorCategory::Internal, "Unable to allocate unique run ID.",
                      "run_id_generation_failed"};
}

core::errors::Result<RunState> RunManager::request_cancel(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AgentError{ErrorCategory::Input, "Run ID not found: " + run_id,
                          "run_not_found"};
    }
    if (is_terminal(it->second.state)) {
        return AgentError{ErrorCategory::Input,
                          "Run is already terminal: " + to_string(it->second.state),
                          "invalid_state_transition"};
    }
    it->second.cancel_token->store(true);
    return it->second.state;
}

core::errors::Result<RunState> RunManager::mark_finished(const std::string& run_id,
                                                         const TerminalStatus status,
                                                         const std::string& detail) {
    RunState next_state = RunState::Completed;
    std::optional<std::string> failure_reason;
    switch (status) {
        case TerminalStatus::Answered:
        case TerminalStatus::Refused:
        case TerminalStatus::IterationLimitExceeded:
            next_state = RunState::Completed;
            break;
        case TerminalStatus::FatalError:
            next_state = RunState::Failed;
            failure_reason = detail;
            break;
        case TerminalStatus::Cancelled:
            next_state = RunState::Cancelled;
            break;
    }

    auto transitioned = transition_to_terminal(run_id, next_state, failure_reason);
    if (core::errors::is_error(transitioned)) {
        return transitioned;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    runs_[run_id].terminal_status = status;
    return transitioned;
}

core::errors::Result<RunState> RunManager::transition_to_terminal(
    const std::string& run_id, const RunState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AgentError{ErrorCategory::Input, "Run ID not found: " + run_id,
                          "run_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return AgentError{ErrorCategory::Input,
                          "Run is already terminal: " + to_string(it->second.state),
                          "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    TOOLGATE_LOG_DEBUG("RunManager: run " + run_id + " transition " + prev + " -> " +
                       to_string(next_state));
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RunManager::get_cancel_token(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AgentError{ErrorCategory::Input, "Run ID not found: " + run_id,
                          "run_not_found"};
    }
    return it->second.cancel_token;
}

InterruptForwarder::InterruptForwarder(RunManager& manager, std::string run_id,
                                       const std::atomic_bool& interrupted,
                                       std::chrono::milliseconds poll_interval)
    : manager_(manager),
      run_id_(std::move(run_id)),
      interrupted_(interrupted),
      poll_interval_(poll_interval),
      worker_([this]() { watch(); }) {}

InterruptForwarder::~InterruptForwarder() {
    stop();
}

void InterruptForwarder::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void InterruptForwarder::watch() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_cv_.wait_for(lock, poll_interval_, [this]() { return stopping_; })) {
        if (!interrupted_.load()) {
            continue;
        }
        lock.unlock();
        TOOLGATE_LOG_INFO("RunManager: interrupt received, cancelling run " + run_id_);
        auto requested = manager_.request_cancel(run_id_);
        if (core::errors::is_error(requested)) {
            TOOLGATE_LOG_WARN("RunManager: cancel request ignored: " +
                              core::errors::get_error(requested).message);
        }
        return;
    }
}

}  // namespace toolgate::session
