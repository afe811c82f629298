#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/run_request.hpp"
#include "session/artifact_writer.hpp"

namespace {

using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::protocol::RunRequest;
using toolgate::protocol::TerminalStatus;
using toolgate::protocol::Turn;
using toolgate::protocol::TurnRole;
using toolgate::session::ArtifactWriter;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_artifact_writer_" + toolgate::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

RunRequest make_request() {
    RunRequest request;
    request.question = "What is 234 + 567?";
    request.config.max_iterations = 7;
    request.config.model_name = "llama3.2";
    return request;
}

TEST(ArtifactWriterTest, WritesRequestTurnAndFinalEvents) {
    TempWorkspace workspace;
    ArtifactWriter writer(workspace.root() / "trace.jsonl");
    const std::string run_id = "conv-artifacts-1";

    const auto request_result = writer.write_request(run_id, make_request());
    ASSERT_FALSE(is_error(request_result));
    const auto log_path = get_value(request_result);
    EXPECT_TRUE(std::filesystem::exists(log_path));

    const auto turn_result =
        writer.write_turn(run_id, 0, Turn{TurnRole::User, "What is 234 + 567?"});
    ASSERT_FALSE(is_error(turn_result));

    const auto final_result = writer.write_final(run_id, TerminalStatus::Answered, 2, "801");
    ASSERT_FALSE(is_error(final_result));

    const auto lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 3u);

    const auto request_event = json::parse(lines[0]);
    EXPECT_EQ(request_event.at("event").get<std::string>(), "request");
    EXPECT_EQ(request_event.at("run_id").get<std::string>(), run_id);
    EXPECT_EQ(request_event.at("payload").at("question").get<std::string>(),
              "What is 234 + 567?");
    EXPECT_EQ(request_event.at("payload").at("max_iterations").get<int>(), 7);
    EXPECT_TRUE(request_event.contains("ts_unix_ms"));

    const auto turn_event = json::parse(lines[1]);
    EXPECT_EQ(turn_event.at("event").get<std::string>(), "turn");
    EXPECT_EQ(turn_event.at("payload").at("index").get<int>(), 0);
    EXPECT_EQ(turn_event.at("payload").at("role").get<std::string>(), "user");

    const auto final_event = json::parse(lines[2]);
    EXPECT_EQ(final_event.at("event").get<std::string>(), "final");
    EXPECT_EQ(final_event.at("payload").at("status").get<std::string>(), "answered");
    EXPECT_EQ(final_event.at("payload").at("iterations").get<int>(), 2);
    EXPECT_EQ(final_event.at("payload").at("text").get<std::string>(), "801");
}

TEST(ArtifactWriterTest, CreatesMissingParentDirectories) {
    TempWorkspace workspace;
    const auto nested = workspace.root() / "a" / "b" / "trace.jsonl";
    ArtifactWriter writer(nested);

    auto result = writer.write_final("conv-artifacts-2", TerminalStatus::Refused, 1, "no");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST(ArtifactWriterTest, AppendsAcrossWriters) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "trace.jsonl";
    ASSERT_FALSE(is_error(ArtifactWriter(path).write_final("conv-a", TerminalStatus::Answered, 1, "x")));
    ASSERT_FALSE(is_error(ArtifactWriter(path).write_final("conv-b", TerminalStatus::Answered, 1, "y")));
    EXPECT_EQ(read_lines(path).size(), 2u);
}

TEST(ArtifactWriterTest, ReplacesInvalidUtf8InsteadOfFailing) {
    TempWorkspace workspace;
    ArtifactWriter writer(workspace.root() / "trace.jsonl");
    const std::string bad = std::string("caf") + static_cast<char>(0xE9);

    auto result = writer.write_turn("conv-utf8", 3, Turn{TurnRole::ToolResult, bad});
    ASSERT_FALSE(is_error(result));

    const auto lines = read_lines(get_value(result));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NO_THROW(json::parse(lines[0]));
}

TEST(ArtifactWriterTest, FailsForEmptyRunId) {
    TempWorkspace workspace;
    ArtifactWriter writer(workspace.root() / "trace.jsonl");
    auto result = writer.write_request("", make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_run_id");
}

TEST(ArtifactWriterTest, FailsForEmptyPath) {
    ArtifactWriter writer{std::filesystem::path()};
    auto result = writer.write_request("conv-artifacts-3", make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_trace_path");
}

TEST(ArtifactWriterTest, FailsWhenPathIsADirectory) {
    TempWorkspace workspace;
    ArtifactWriter writer(workspace.root());
    auto result = writer.write_request("conv-artifacts-4", make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "artifact_open_failed");
}

}  // namespace
