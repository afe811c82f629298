#include "tools/tool_executor.hpp"

#include <future>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::tools {

using protocol::ExecutionResult;
using protocol::FailureKind;
using protocol::TypedArguments;
using protocol::ValidatedInvocation;

namespace {

ExecutionResult invoke_guarded(const Capability& capability, const TypedArguments& args,
                               const std::string& tool_name) {
    try {
        return ExecutionResult::success(capability(args));
    } catch (const ToolError& e) {
        return ExecutionResult::failure(FailureKind::ToolExecutionFailure, e.what());
    } catch (const std::exception& e) {
        return ExecutionResult::failure(FailureKind::ToolExecutionFailure,
                                        "Tool execution failed: " + std::string(e.what()));
    } catch (...) {
        return ExecutionResult::failure(
            FailureKind::ToolExecutionFailure,
            "Tool '" + tool_name + "' raised a non-standard exception.");
    }
}

}  // namespace

ToolExecutor::ToolExecutor(const ToolRegistry& registry, std::chrono::milliseconds timeout)
    : registry_(registry), timeout_(timeout) {}

ToolExecutor::~ToolExecutor() {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    if (!stragglers_.empty()) {
        TOOLGATE_LOG_DEBUG("ToolExecutor: waiting for " + std::to_string(stragglers_.size()) +
                           " timed-out call(s) to finish");
    }
    for (auto& worker : stragglers_) {
        worker.join();
    }
}

ExecutionResult ToolExecutor::execute(const ValidatedInvocation& invocation) const {
    auto found = registry_.lookup(invocation.tool_name);
    if (core::errors::is_error(found)) {
        return ExecutionResult::failure(FailureKind::UnknownTool,
                                        core::errors::get_error(found).message);
    }
    const ToolDescriptor* descriptor = core::errors::get_value(found);

    if (timeout_.count() <= 0) {
        return invoke_guarded(descriptor->capability, invocation.typed_arguments,
                              invocation.tool_name);
    }

    // The worker owns copies of everything it touches so a timed-out call
    // can outlive this frame; the executor joins it on destruction.
    auto task = std::make_shared<std::packaged_task<ExecutionResult()>>(
        [capability = descriptor->capability, args = invocation.typed_arguments,
         name = invocation.tool_name]() { return invoke_guarded(capability, args, name); });
    auto future = task->get_future();

    std::thread worker;
    try {
        worker = std::thread([task]() { (*task)(); });
    } catch (const std::system_error& e) {
        return ExecutionResult::failure(
            FailureKind::ToolExecutionFailure,
            "Unable to start tool '" + invocation.tool_name + "': " + e.what());
    }

    if (future.wait_for(timeout_) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(stragglers_mutex_);
            stragglers_.push_back(std::move(worker));
        }
        TOOLGATE_LOG_WARN("ToolExecutor: '" + invocation.tool_name + "' exceeded " +
                          std::to_string(timeout_.count()) + " ms");
        return ExecutionResult::failure(
            FailureKind::Timeout, "Tool '" + invocation.tool_name + "' timed out after " +
                                      std::to_string(timeout_.count()) + " ms");
    }

    worker.join();
    return future.get();
}

std::vector<ExecutionResult> ToolExecutor::execute_all(
    const std::vector<ValidatedInvocation>& invocations) const {
    std::vector<std::future<ExecutionResult>> pending;
    pending.reserve(invocations.size());
    for (const auto& invocation : invocations) {
        pending.push_back(std::async(std::launch::async,
                                     [this, &invocation]() { return execute(invocation); }));
    }

    std::vector<ExecutionResult> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace toolgate::tools
