#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/trace_renderer.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "model/ollama_client.hpp"
#include "runtime/orchestrator.hpp"
#include "session/artifact_writer.hpp"
#include "session/run_manager.hpp"
#include "tools/builtin_tools.hpp"

namespace {

namespace errors = toolgate::core::errors;
using toolgate::core::logging::LogLevel;
using toolgate::core::logging::Logger;
using toolgate::protocol::TerminalStatus;

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitInput = 2;
constexpr int kExitCancelled = 130;

// Only an atomic store happens inside the handler; InterruptForwarder
// turns it into a cancel request.
std::atomic_bool g_interrupted{false};
static_assert(std::atomic_bool::is_always_lock_free, "SIGINT flag must be lock-free");

extern "C" void handle_sigint(int) {
    g_interrupted.store(true);
}

void report_error(const std::string& what, const errors::AgentError& err) {
    TOOLGATE_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        TOOLGATE_LOG_INFO("Hint: " + err.hint);
    }
}

int exit_code_for(const TerminalStatus status) {
    switch (status) {
        case TerminalStatus::Answered:
        case TerminalStatus::Refused:
        case TerminalStatus::IterationLimitExceeded:
            return kExitOk;
        case TerminalStatus::Cancelled:
            return kExitCancelled;
        case TerminalStatus::FatalError:
            return kExitFatal;
    }
    return kExitFatal;
}

// The audit log is best effort: a failure is logged, never fatal to the answer.
void write_trace(const toolgate::session::ArtifactWriter& writer, const std::string& run_id,
                 const toolgate::protocol::RunRequest& request,
                 const toolgate::runtime::ConversationOutcome& outcome) {
    auto logged = writer.write_request(run_id, request);
    if (errors::is_error(logged)) {
        report_error("Failed to write trace request", errors::get_error(logged));
        return;
    }
    const auto& turns = outcome.state.transcript().turns();
    for (std::size_t i = 0; i < turns.size(); ++i) {
        auto turn = writer.write_turn(run_id, i, turns[i]);
        if (errors::is_error(turn)) {
            report_error("Failed to write trace turn", errors::get_error(turn));
            return;
        }
    }
    auto final_event = writer.write_final(run_id, outcome.status,
                                          outcome.state.iteration_count(), outcome.text);
    if (errors::is_error(final_event)) {
        report_error("Failed to write trace final event", errors::get_error(final_event));
        return;
    }
    TOOLGATE_LOG_INFO("Trace written: " + writer.log_path().string());
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag bootstrap logging until the run id is known
    Logger::get().set_conversation_id(toolgate::core::config::generate_id("boot"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = toolgate::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cout << err.hint << std::endl;
            return kExitOk;
        }
        report_error("Input error", err);
        return kExitInput;
    }
    const auto& req = errors::get_value(parsed);
    const auto& config = req.config;

    if (req.verbose) {
        Logger::get().set_min_level(LogLevel::DEBUG);
    } else if (req.quiet) {
        Logger::get().set_min_level(LogLevel::ERROR);
    }

    // 3. The tool catalog is built once and never changes afterwards
    auto registry_result = toolgate::tools::make_builtin_registry(config.docs_dir);
    if (errors::is_error(registry_result)) {
        report_error("Failed to build tool catalog", errors::get_error(registry_result));
        return kExitInput;
    }
    const auto& registry = errors::get_value(registry_result);

    toolgate::session::RunManager run_manager;
    auto started = run_manager.start_run(req);
    if (errors::is_error(started)) {
        report_error("Failed to start run", errors::get_error(started));
        return kExitInput;
    }
    const std::string run_id = errors::get_value(started);
    Logger::get().set_conversation_id(run_id);
    TOOLGATE_LOG_INFO("Run started with model " + config.model_name + " at " +
                      config.model_host + ":" + std::to_string(config.model_port));

    auto token_result = run_manager.get_cancel_token(run_id);
    if (errors::is_error(token_result)) {
        report_error("Failed to get cancellation token", errors::get_error(token_result));
        return kExitFatal;
    }
    const auto cancel_token = errors::get_value(token_result);
    std::signal(SIGINT, handle_sigint);
    toolgate::session::InterruptForwarder forwarder(run_manager, run_id, g_interrupted);

    // 4. Model service boundary
    toolgate::model::OllamaSettings settings;
    settings.host = config.model_host;
    settings.port = config.model_port;
    settings.model = config.model_name;
    settings.temperature = config.temperature;
    settings.timeout = std::chrono::milliseconds(config.model_timeout_ms);
    settings.max_attempts = config.model_max_retries;
    settings.initial_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
    toolgate::model::OllamaClient model(settings);

    toolgate::runtime::OrchestratorOptions options;
    options.max_iterations = config.max_iterations;
    options.tool_timeout = std::chrono::milliseconds(config.tool_timeout_ms);
    options.detect_repeated_calls = config.detect_repeated_calls;
    options.allow_parallel_calls = config.allow_parallel_calls;
    toolgate::runtime::Orchestrator orchestrator(registry, model, options);

    // 5. Run the conversation, streaming the trace unless --quiet
    toolgate::app::TraceRenderer renderer(std::cout);
    auto outcome_result = orchestrator.run(run_id, req.question, cancel_token,
                                           req.quiet ? toolgate::protocol::EventListener{}
                                                     : renderer.listener());
    forwarder.stop();
    std::signal(SIGINT, SIG_DFL);
    if (errors::is_error(outcome_result)) {
        const auto& err = errors::get_error(outcome_result);
        report_error("Conversation aborted", err);
        auto failed = run_manager.mark_finished(run_id, TerminalStatus::FatalError, err.message);
        if (errors::is_error(failed)) {
            report_error("Failed to mark run as failed", errors::get_error(failed));
        }
        return kExitFatal;
    }
    const auto& outcome = errors::get_value(outcome_result);
    renderer.render_outcome(outcome);

    // 6. Optional audit log
    if (config.trace_file) {
        toolgate::session::ArtifactWriter writer(*config.trace_file);
        write_trace(writer, run_id, req, outcome);
    }

    auto finished = run_manager.mark_finished(run_id, outcome.status, outcome.text);
    if (errors::is_error(finished)) {
        report_error("Failed to record run outcome", errors::get_error(finished));
    } else {
        TOOLGATE_LOG_DEBUG("Final run state: " +
                           toolgate::session::RunManager::to_string(errors::get_value(finished)));
    }

    return exit_code_for(outcome.status);
}
