#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/run_request.hpp"

namespace toolgate::session {

// Append-only JSON-lines audit log of a conversation. Written, never read back.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path log_path);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const protocol::RunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_turn(
        const std::string& run_id, std::size_t index, const protocol::Turn& turn) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, protocol::TerminalStatus status,
        std::uint32_t iterations, const std::string& text) const;

    const std::filesystem::path& log_path() const { return log_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path log_path_;
};

}  // namespace toolgate::session
