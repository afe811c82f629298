#include "runtime/orchestrator.hpp"

#include <optional>
#include <utility>
#include <variant>
#include <vector>
#include "core/logging/logger.hpp"
#include "runtime/prompt_builder.hpp"
#include "runtime/response_interpreter.hpp"
#include "tools/tool_executor.hpp"
#include "validation/contract_validator.hpp"

namespace toolgate::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Ok;
using core::errors::Result;
using protocol::CompletionIntent;
using protocol::ExecutionResult;
using protocol::FailureKind;
using protocol::Invocation;
using protocol::MalformedIntent;
using protocol::RefusalIntent;
using protocol::TerminalStatus;
using protocol::ToolBatchIntent;
using protocol::ToolCallIntent;
using protocol::TurnIntent;
using protocol::TurnRole;
using protocol::ValidatedInvocation;

namespace {

// Either the call may run, or the failure to report instead of running it.
using Admission = std::variant<ValidatedInvocation, ExecutionResult>;

std::string call_key(const ValidatedInvocation& invocation) {
    return invocation.tool_name + ":" + invocation.typed_arguments.to_json().dump();
}

// State and collaborators for exactly one conversation.
class ConversationRun {
public:
    ConversationRun(const tools::ToolRegistry& registry, model::ModelClient& model,
                    const OrchestratorOptions& options,
                    const protocol::EventListener& listener)
        : registry_(registry),
          model_(model),
          options_(options),
          listener_(listener),
          interpreter_(options.allow_parallel_calls),
          builder_(registry, options.allow_parallel_calls),
          executor_(registry, options.tool_timeout) {}

    Result<ConversationOutcome> run(const std::string& conversation_id,
                                    const std::string& question,
                                    const std::shared_ptr<std::atomic_bool>& cancel_token) {
        outcome_.conversation_id = conversation_id;
        auto seeded = outcome_.state.append(TurnRole::User, question);
        if (core::errors::is_error(seeded)) {
            return core::errors::get_error(seeded);
        }
        emit(protocol::ConversationStartEvent{conversation_id, question});
        TOOLGATE_LOG_DEBUG("Orchestrator: Init -> AwaitingModelReply");

        while (!outcome_.state.is_terminal()) {
            auto step = cycle(question, cancel_token);
            if (core::errors::is_error(step)) {
                return core::errors::get_error(step);
            }
        }
        return std::move(outcome_);
    }

private:
    // One pass through the state machine, ending either in a terminal
    // status or back at AwaitingModelReply.
    Result<Ok> cycle(const std::string& question,
                     const std::shared_ptr<std::atomic_bool>& cancel_token) {
        const std::uint32_t completed = outcome_.state.iteration_count();
        if (completed >= options_.max_iterations) {
            return finish(TerminalStatus::IterationLimitExceeded,
                          "Could not complete the task within " +
                              std::to_string(options_.max_iterations) +
                              " iterations. Tool calls made: " +
                              std::to_string(outcome_.tool_executions));
        }
        if (cancel_token && cancel_token->load()) {
            return finish(TerminalStatus::Cancelled,
                          "Conversation cancelled after " + std::to_string(completed) +
                              " iterations.");
        }

        emit(protocol::IterationStartEvent{completed + 1});
        auto reply = model_.complete(builder_.build(question, outcome_.state.transcript()));
        if (core::errors::is_error(reply)) {
            const auto& err = core::errors::get_error(reply);
            TOOLGATE_LOG_ERROR("Orchestrator: model service failed [" + err.code +
                               "]: " + err.message);
            return finish(TerminalStatus::FatalError, err.message);
        }
        const std::string& raw = core::errors::get_value(reply);
        TOOLGATE_LOG_DEBUG("Orchestrator: AwaitingModelReply -> Interpreting");

        auto recorded = outcome_.state.append(TurnRole::Model, raw);
        if (core::errors::is_error(recorded)) {
            return core::errors::get_error(recorded);
        }
        auto advanced = outcome_.state.advance_iteration();
        if (core::errors::is_error(advanced)) {
            return core::errors::get_error(advanced);
        }

        const TurnIntent intent = interpreter_.interpret(raw);
        emit(protocol::ModelReplyEvent{raw, protocol::intent_name(intent)});
        if (intent.ambiguous) {
            TOOLGATE_LOG_WARN("Orchestrator: reply matched several shapes, treating it as " +
                              protocol::intent_name(intent));
        }

        if (const auto* completion = std::get_if<CompletionIntent>(&intent.kind)) {
            return finish(TerminalStatus::Answered, completion->answer);
        }
        if (const auto* refusal = std::get_if<RefusalIntent>(&intent.kind)) {
            return finish(TerminalStatus::Refused, refusal->reason);
        }
        if (const auto* malformed = std::get_if<MalformedIntent>(&intent.kind)) {
            TOOLGATE_LOG_WARN("Orchestrator: malformed reply (" + malformed->detail + ")");
            return corrective(builder_.corrective_for_malformed(malformed->detail));
        }
        if (const auto* call = std::get_if<ToolCallIntent>(&intent.kind)) {
            return handle_tool_call(call->invocation);
        }
        if (const auto* batch = std::get_if<ToolBatchIntent>(&intent.kind)) {
            return handle_batch(batch->invocations);
        }
        return AgentError{ErrorCategory::Internal, "Unhandled turn intent.",
                          "unhandled_intent"};
    }

    Admission admit(const Invocation& invocation) const {
        TOOLGATE_LOG_DEBUG("Orchestrator: Interpreting -> Validating (" +
                           invocation.tool_name + ")");
        auto found = registry_.lookup(invocation.tool_name);
        if (core::errors::is_error(found)) {
            return ExecutionResult::failure(FailureKind::UnknownTool,
                                            core::errors::get_error(found).message);
        }
        auto validated =
            validator_.validate(*core::errors::get_value(found), invocation.raw_arguments);
        if (validation::is_violation(validated)) {
            return ExecutionResult::failure(
                FailureKind::SchemaViolation,
                std::get<validation::SchemaViolation>(validated).describe());
        }
        return std::get<ValidatedInvocation>(std::move(validated));
    }

    Result<Ok> handle_tool_call(const Invocation& invocation) {
        Admission admitted = admit(invocation);
        if (const auto* rejected = std::get_if<ExecutionResult>(&admitted)) {
            return record_rejection(invocation, *rejected);
        }
        const auto& validated = std::get<ValidatedInvocation>(admitted);

        const std::string key = call_key(validated);
        if (options_.detect_repeated_calls && last_call_ == key) {
            last_call_.reset();
            TOOLGATE_LOG_WARN("Orchestrator: repeated call to " + invocation.tool_name +
                              ", asking the model to finish");
            return corrective(builder_.corrective_for_repeated_call(invocation.tool_name));
        }
        last_call_ = key;

        TOOLGATE_LOG_DEBUG("Orchestrator: Validating -> Executing");
        emit(protocol::ToolExecutionStartEvent{invocation.tool_name, invocation.raw_arguments});
        ExecutionResult result = executor_.execute(validated);
        ++outcome_.tool_executions;
        return record_result(invocation, result);
    }

    Result<Ok> handle_batch(const std::vector<Invocation>& invocations) {
        last_call_.reset();

        std::vector<Admission> admitted;
        std::vector<ValidatedInvocation> runnable;
        admitted.reserve(invocations.size());
        for (const auto& invocation : invocations) {
            admitted.push_back(admit(invocation));
            if (const auto* validated = std::get_if<ValidatedInvocation>(&admitted.back())) {
                runnable.push_back(*validated);
                emit(protocol::ToolExecutionStartEvent{invocation.tool_name,
                                                       invocation.raw_arguments});
            }
        }

        const std::vector<ExecutionResult> results = executor_.execute_all(runnable);
        outcome_.tool_executions += results.size();

        // Re-join in the order the model wrote the calls.
        std::size_t next_result = 0;
        for (std::size_t i = 0; i < invocations.size(); ++i) {
            Result<Ok> appended = Ok{};
            if (const auto* rejected = std::get_if<ExecutionResult>(&admitted[i])) {
                appended = record_rejection(invocations[i], *rejected);
            } else {
                appended = record_result(invocations[i], results[next_result++]);
            }
            if (core::errors::is_error(appended)) {
                return appended;
            }
        }
        return Ok{};
    }

    Result<Ok> record_rejection(const Invocation& invocation, const ExecutionResult& result) {
        TOOLGATE_LOG_INFO("Orchestrator: rejected call to " + invocation.tool_name + " [" +
                          protocol::to_string(result.failure().kind) +
                          "]: " + result.failure().message);
        emit(protocol::ToolRejectedEvent{invocation.tool_name, result});
        return append(TurnRole::ToolResult,
                      PromptBuilder::tool_result_turn(invocation.tool_name,
                                                      invocation.raw_arguments, result));
    }

    Result<Ok> record_result(const Invocation& invocation, const ExecutionResult& result) {
        if (result.is_success()) {
            TOOLGATE_LOG_INFO("Orchestrator: " + invocation.tool_name + " succeeded");
        } else {
            TOOLGATE_LOG_INFO("Orchestrator: " + invocation.tool_name + " failed [" +
                              protocol::to_string(result.failure().kind) +
                              "]: " + result.failure().message);
        }
        emit(protocol::ToolExecutionEndEvent{invocation.tool_name, result});
        TOOLGATE_LOG_DEBUG("Orchestrator: Executing -> AppendingResult");
        return append(TurnRole::ToolResult,
                      PromptBuilder::tool_result_turn(invocation.tool_name,
                                                      invocation.raw_arguments, result));
    }

    Result<Ok> corrective(std::string instruction) {
        emit(protocol::CorrectiveEvent{instruction});
        return append(TurnRole::Corrective, std::move(instruction));
    }

    Result<Ok> append(const TurnRole role, std::string content) {
        return outcome_.state.append(role, std::move(content));
    }

    Result<Ok> finish(const TerminalStatus status, std::string text) {
        auto set = outcome_.state.set_terminal(status);
        if (core::errors::is_error(set)) {
            return set;
        }
        outcome_.status = status;
        outcome_.text = std::move(text);
        TOOLGATE_LOG_INFO("Orchestrator: terminal status " + protocol::to_string(status) +
                          " after " + std::to_string(outcome_.state.iteration_count()) +
                          " iterations");
        emit(protocol::ConversationEndEvent{status, outcome_.text});
        return Ok{};
    }

    void emit(const protocol::OrchestratorEvent& event) const {
        if (listener_) {
            listener_(event);
        }
    }

    const tools::ToolRegistry& registry_;
    model::ModelClient& model_;
    const OrchestratorOptions& options_;
    const protocol::EventListener& listener_;
    ResponseInterpreter interpreter_;
    PromptBuilder builder_;
    validation::ContractValidator validator_;
    tools::ToolExecutor executor_;

    ConversationOutcome outcome_;
    std::optional<std::string> last_call_;
};

}  // namespace

Orchestrator::Orchestrator(const tools::ToolRegistry& registry, model::ModelClient& model,
                           OrchestratorOptions options)
    : registry_(registry), model_(model), options_(options) {}

Result<ConversationOutcome> Orchestrator::run(
    const std::string& conversation_id, const std::string& question,
    std::shared_ptr<std::atomic_bool> cancel_token,
    const protocol::EventListener& listener) const {
    if (question.empty()) {
        return AgentError{ErrorCategory::Input, "Question cannot be empty.",
                          "empty_question"};
    }
    if (options_.max_iterations == 0) {
        return AgentError{ErrorCategory::Config, "max_iterations must be at least 1.",
                          "bounds_error"};
    }

    ConversationRun conversation(registry_, model_, options_, listener);
    return conversation.run(conversation_id, question, cancel_token);
}

}  // namespace toolgate::runtime
