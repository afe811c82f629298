#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include "protocol/event_contract.hpp"
#include "runtime/orchestrator.hpp"

namespace toolgate::app {

    // Human-readable live trace of one conversation, written to `out`.
    class TraceRenderer {
    public:
        explicit TraceRenderer(std::ostream& out, std::size_t excerpt_limit = 200);

        void on_event(const protocol::OrchestratorEvent& event);

        // Banner plus the answer line, or the FATAL ERROR report.
        void render_outcome(const runtime::ConversationOutcome& outcome);

        protocol::EventListener listener();

    private:
        std::string excerpt(const std::string& text) const;

        std::ostream& out_;
        std::size_t excerpt_limit_;
    };

} // namespace toolgate::app
