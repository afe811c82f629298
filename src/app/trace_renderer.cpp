#include "app/trace_renderer.hpp"
#include <type_traits>
#include <variant>

namespace toolgate::app {

    using protocol::ExecutionResult;
    using protocol::TerminalStatus;

    namespace {

        const std::string kRule(60, '=');

        std::string describe_result(const ExecutionResult& result) {
            if (result.is_success()) {
                return "ok " + result.value().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            }
            return protocol::to_string(result.failure().kind) + ": " + result.failure().message;
        }

    } // namespace

    TraceRenderer::TraceRenderer(std::ostream& out, std::size_t excerpt_limit)
        : out_(out), excerpt_limit_(excerpt_limit) {}

    std::string TraceRenderer::excerpt(const std::string& text) const {
        if (text.size() <= excerpt_limit_) {
            return text;
        }
        return text.substr(0, excerpt_limit_) + "...";
    }

    void TraceRenderer::on_event(const protocol::OrchestratorEvent& event) {
        std::visit([this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, protocol::ConversationStartEvent>) {
                out_ << "Question: " << e.question << "\n";
            } else if constexpr (std::is_same_v<T, protocol::IterationStartEvent>) {
                out_ << "\n--- Iteration " << e.iteration << " ---\n";
            } else if constexpr (std::is_same_v<T, protocol::ModelReplyEvent>) {
                out_ << "Model (" << e.intent << "): " << excerpt(e.raw_text) << "\n";
            } else if constexpr (std::is_same_v<T, protocol::ToolExecutionStartEvent>) {
                out_ << "Calling " << e.tool_name << " "
                     << e.arguments.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            } else if constexpr (std::is_same_v<T, protocol::ToolExecutionEndEvent>) {
                out_ << "Result from " << e.tool_name << ": " << excerpt(describe_result(e.result)) << "\n";
            } else if constexpr (std::is_same_v<T, protocol::ToolRejectedEvent>) {
                out_ << "Rejected " << e.tool_name << ": " << excerpt(describe_result(e.result)) << "\n";
            } else if constexpr (std::is_same_v<T, protocol::CorrectiveEvent>) {
                out_ << "Corrective: " << excerpt(e.instruction) << "\n";
            } else if constexpr (std::is_same_v<T, protocol::ConversationEndEvent>) {
                out_ << "\nConversation ended: " << protocol::to_string(e.status) << "\n";
            }
        }, event);
        out_.flush();
    }

    void TraceRenderer::render_outcome(const runtime::ConversationOutcome& outcome) {
        out_ << "\n" << kRule << "\n";
        switch (outcome.status) {
            case TerminalStatus::FatalError:
                // Never presented as an answer.
                out_ << "FATAL ERROR\n" << kRule << "\n"
                     << "The model service could not be reached: " << outcome.text << "\n";
                break;
            case TerminalStatus::Refused:
                out_ << "FINAL ANSWER (refused)\n" << kRule << "\n" << outcome.text << "\n";
                break;
            case TerminalStatus::IterationLimitExceeded:
                out_ << "FINAL ANSWER (iteration limit reached)\n" << kRule << "\n" << outcome.text << "\n";
                break;
            case TerminalStatus::Cancelled:
                out_ << "CANCELLED\n" << kRule << "\n" << outcome.text << "\n";
                break;
            case TerminalStatus::Answered:
                out_ << "FINAL ANSWER\n" << kRule << "\n" << outcome.text << "\n";
                break;
        }
        out_ << "(" << outcome.state.iteration_count() << " iterations, "
             << outcome.tool_executions << " tool executions)\n";
        out_.flush();
    }

    protocol::EventListener TraceRenderer::listener() {
        return [this](const protocol::OrchestratorEvent& event) { on_event(event); };
    }

} // namespace toolgate::app
