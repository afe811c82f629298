#include "session/artifact_writer.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolgate::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json request_to_json(const protocol::RunRequest& request) {
    const auto& config = request.config;
    json payload;
    payload["question"] = request.question;
    payload["max_iterations"] = config.max_iterations;
    payload["model"] = config.model_name;
    payload["model_endpoint"] =
        config.model_host + ":" + std::to_string(config.model_port);
    payload["model_timeout_ms"] = config.model_timeout_ms;
    payload["tool_timeout_ms"] = config.tool_timeout_ms;
    payload["allow_parallel_calls"] = config.allow_parallel_calls;
    payload["detect_repeated_calls"] = config.detect_repeated_calls;
    return payload;
}

json make_event(const std::string& name, const std::string& run_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = name;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

std::string serialize(const json& event) {
    // Tool output may carry invalid UTF-8; never let that abort the log.
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path log_path)
    : log_path_(std::move(log_path)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    if (run_id.empty()) {
        return AgentError{ErrorCategory::Input, "Run ID cannot be empty.",
                          "invalid_run_id"};
    }
    if (log_path_.empty()) {
        return AgentError{ErrorCategory::Config, "Trace file path cannot be empty.",
                          "invalid_trace_path"};
    }

    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to create trace directory: " + parent.string(),
                              "artifact_dir_create_failed"};
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open trace file: " + log_path_.string(),
                          "artifact_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write trace event: " + log_path_.string(),
                          "artifact_write_failed"};
    }

    return log_path_;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& run_id, const protocol::RunRequest& request) const {
    return append_event(run_id,
                        serialize(make_event("request", run_id, request_to_json(request))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_turn(
    const std::string& run_id, const std::size_t index, const protocol::Turn& turn) const {
    json payload;
    payload["index"] = index;
    payload["role"] = protocol::to_string(turn.role);
    payload["content"] = turn.content;
    return append_event(run_id, serialize(make_event("turn", run_id, payload)));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const std::string& run_id, const protocol::TerminalStatus status,
    const std::uint32_t iterations, const std::string& text) const {
    json payload;
    payload["status"] = protocol::to_string(status);
    payload["iterations"] = iterations;
    payload["text"] = text;
    return append_event(run_id, serialize(make_event("final", run_id, payload)));
}

}  // namespace toolgate::session
