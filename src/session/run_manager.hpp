#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include "core/errors/agent_errors.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/run_request.hpp"

namespace toolgate::session {

enum class RunState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

struct RunRecord {
    std::string run_id;
    protocol::RunRequest request;
    RunState state = RunState::Created;
    std::optional<protocol::TerminalStatus> terminal_status;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks every conversation in the process. Each one gets its own id and
// cancel token; nothing else is shared between them.
class RunManager {
public:
    core::errors::Result<std::string> start_run(const protocol::RunRequest& request);

    // Raises the cancel token; the orchestrator honors it at the next
    // iteration boundary and reports the Cancelled status itself.
    core::errors::Result<RunState> request_cancel(const std::string& run_id);

    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& run_id) const;

    // Maps an orchestrator terminal status onto the run lifecycle.
    core::errors::Result<RunState> mark_finished(const std::string& run_id,
                                                 protocol::TerminalStatus status,
                                                 const std::string& detail);

    static std::string to_string(RunState state);

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
};

// Polls an interrupt flag raised by a signal handler and forwards it to
// RunManager::request_cancel, which is not safe to call from the handler.
class InterruptForwarder {
public:
    InterruptForwarder(RunManager& manager, std::string run_id,
                       const std::atomic_bool& interrupted,
                       std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
    ~InterruptForwarder();

    InterruptForwarder(const InterruptForwarder&) = delete;
    InterruptForwarder& operator=(const InterruptForwarder&) = delete;

    // Idempotent; joins the polling thread.
    void stop();

private:
    void watch();

    RunManager& manager_;
    std::string run_id_;
    const std::atomic_bool& interrupted_;
    std::chrono::milliseconds poll_interval_;
    std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace toolgate::session
