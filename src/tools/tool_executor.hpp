#pragma once

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace toolgate::tools {

// Domain error raised by a capability, e.g. "division by zero".
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

// The only caller of a capability. Every fault it raises comes back as an
// ExecutionResult failure; nothing propagates to the caller.
class ToolExecutor {
public:
    // A zero timeout runs capabilities inline without a bound.
    explicit ToolExecutor(const ToolRegistry& registry,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // Joins the workers of calls that timed out; their results are discarded.
    ~ToolExecutor();

    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    protocol::ExecutionResult execute(const protocol::ValidatedInvocation& invocation) const;

    // Runs independent invocations concurrently; results keep the input order.
    std::vector<protocol::ExecutionResult> execute_all(
        const std::vector<protocol::ValidatedInvocation>& invocations) const;

private:
    const ToolRegistry& registry_;
    std::chrono::milliseconds timeout_;
    mutable std::mutex stragglers_mutex_;
    mutable std::vector<std::thread> stragglers_;
};

}  // namespace toolgate::tools
