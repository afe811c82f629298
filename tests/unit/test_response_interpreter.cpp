#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/turn_intent.hpp"
#include "runtime/response_interpreter.hpp"

namespace {

using nlohmann::json;
using toolgate::protocol::CompletionIntent;
using toolgate::protocol::MalformedIntent;
using toolgate::protocol::RefusalIntent;
using toolgate::protocol::ToolBatchIntent;
using toolgate::protocol::ToolCallIntent;
using toolgate::protocol::TurnIntent;
using toolgate::runtime::ResponseInterpreter;

template <typename T>
bool holds(const TurnIntent& intent) {
    return std::holds_alternative<T>(intent.kind);
}

TEST(ResponseInterpreterTest, ParsesToolCall) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(
        R"({"tool": "calculator", "arguments": {"operation": "add", "a": 234, "b": 567}})");
    ASSERT_TRUE(holds<ToolCallIntent>(intent));
    const auto& invocation = std::get<ToolCallIntent>(intent.kind).invocation;
    EXPECT_EQ(invocation.tool_name, "calculator");
    EXPECT_EQ(invocation.raw_arguments.at("a"), 234);
    EXPECT_FALSE(intent.ambiguous);
    EXPECT_EQ(toolgate::protocol::intent_name(intent), "tool_call");
}

TEST(ResponseInterpreterTest, ParsesCompletion) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(R"({"done": true, "answer": "801"})");
    ASSERT_TRUE(holds<CompletionIntent>(intent));
    EXPECT_EQ(std::get<CompletionIntent>(intent.kind).answer, "801");
}

TEST(ResponseInterpreterTest, ParsesRefusal) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(R"({"refuse": true, "reason": "no tool fits"})");
    ASSERT_TRUE(holds<RefusalIntent>(intent));
    EXPECT_EQ(std::get<RefusalIntent>(intent.kind).reason, "no tool fits");
}

TEST(ResponseInterpreterTest, FindsJsonWrappedInProse) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(
        "Sure! Here is my call:\n```json\n{\"tool\": \"web_fetch\", \"arguments\": "
        "{\"url\": \"example.com\"}}\n```\nLet me know.");
    ASSERT_TRUE(holds<ToolCallIntent>(intent));
    EXPECT_EQ(std::get<ToolCallIntent>(intent.kind).invocation.tool_name, "web_fetch");
}

TEST(ResponseInterpreterTest, RefusalWinsOverCompletionAndToolCall) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(
        R"({"refuse": true, "reason": "r", "done": true, "answer": "a", "tool": "calculator", "arguments": {}})");
    ASSERT_TRUE(holds<RefusalIntent>(intent));
    EXPECT_TRUE(intent.ambiguous);
}

TEST(ResponseInterpreterTest, CompletionWinsOverToolCall) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(
        R"({"done": true, "answer": "a", "tool": "calculator", "arguments": {}})");
    ASSERT_TRUE(holds<CompletionIntent>(intent));
    EXPECT_TRUE(intent.ambiguous);
}

TEST(ResponseInterpreterTest, NeverThrowsOnArbitraryText) {
    ResponseInterpreter interpreter;
    const std::vector<std::string> replies = {
        "",
        "I think the answer is 42.",
        "{",
        "}{",
        "[1, 2, 3]",
        "\"just a string\"",
        "{\"tool\": 5, \"arguments\": {}}",
        "{\"tool\": \"\", \"arguments\": {}}",
        "{\"tool\": \"calculator\"}",
        "{\"tool\": \"calculator\", \"arguments\": [1]}",
        "{\"done\": true}",
        "{\"done\": true, \"answer\": 801}",
        "{\"done\": \"yes\", \"answer\": \"x\"}",
        "{\"refuse\": true}",
        "{\"done\": false, \"answer\": \"x\"}",
        "{\"arguments\": {}}",
        "{}",
        std::string("{\"done\": true, \"answer\": \"caf") + static_cast<char>(0xE9) + "\"}",
    };
    for (const auto& reply : replies) {
        TurnIntent intent{MalformedIntent{}, false};
        EXPECT_NO_THROW(intent = interpreter.interpret(reply)) << reply;
        EXPECT_TRUE(holds<MalformedIntent>(intent)) << reply;
    }
}

TEST(ResponseInterpreterTest, MalformedKeepsRawTextAndDetail) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret("no json here");
    ASSERT_TRUE(holds<MalformedIntent>(intent));
    const auto& malformed = std::get<MalformedIntent>(intent.kind);
    EXPECT_EQ(malformed.raw_text, "no json here");
    EXPECT_EQ(malformed.detail, "no JSON object found in the reply");
}

TEST(ResponseInterpreterTest, RejectsInventedFields) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(R"({"done": true, "answer": "x", "confidence": 0.9})");
    ASSERT_TRUE(holds<MalformedIntent>(intent));
    EXPECT_EQ(std::get<MalformedIntent>(intent.kind).detail, "unexpected field \"confidence\"");
}

TEST(ResponseInterpreterTest, ToolCallCarryingAnAnswerIsMalformed) {
    ResponseInterpreter interpreter(false);
    auto intent = interpreter.interpret(
        R"({"tool": "calculator", "arguments": {"operation": "add", "a": 1, "b": 2}, "answer": "3"})");
    ASSERT_TRUE(holds<MalformedIntent>(intent));
    EXPECT_EQ(std::get<MalformedIntent>(intent.kind).detail,
              "field \"answer\" belongs to a \"done\" reply");
}

TEST(ResponseInterpreterTest, ToolCallCarryingAReasonIsMalformed) {
    ResponseInterpreter interpreter(false);
    auto intent = interpreter.interpret(
        R"({"tool": "calculator", "arguments": {"operation": "add", "a": 1, "b": 2}, "reason": "x"})");
    ASSERT_TRUE(holds<MalformedIntent>(intent));
    EXPECT_EQ(std::get<MalformedIntent>(intent.kind).detail,
              "field \"reason\" belongs to a \"refuse\" reply");
}

TEST(ResponseInterpreterTest, CompletionCarryingArgumentsIsMalformed) {
    ResponseInterpreter interpreter(false);
    auto intent = interpreter.interpret(R"({"done": true, "answer": "801", "arguments": {"a": 1}})");
    ASSERT_TRUE(holds<MalformedIntent>(intent));
    EXPECT_EQ(std::get<MalformedIntent>(intent.kind).detail,
              "field \"arguments\" belongs to a \"tool\" reply");
}

TEST(ResponseInterpreterTest, FalseMarkerBesideToolCallIsTolerated) {
    ResponseInterpreter interpreter;
    auto intent = interpreter.interpret(
        R"({"done": false, "tool": "calculator", "arguments": {"operation": "add", "a": 1, "b": 2}})");
    ASSERT_TRUE(holds<ToolCallIntent>(intent));
    EXPECT_FALSE(intent.ambiguous);
}

TEST(ResponseInterpreterTest, ToolCallsRejectedWhenBatchesDisabled) {
    ResponseInterpreter interpreter(false);
    auto intent = interpreter.interpret(
        R"({"tool_calls": [{"tool": "calculator", "arguments": {}}]})");
    ASSERT_TRUE(holds<MalformedIntent>(intent));
}

TEST(ResponseInterpreterTest, ToolCallsParsedInOrderWhenEnabled) {
    ResponseInterpreter interpreter(true);
    auto intent = interpreter.interpret(
        R"({"tool_calls": [{"tool": "web_fetch", "arguments": {"url": "github.com"}},
                           {"tool": "calculator", "arguments": {"operation": "add", "a": 1, "b": 2}}]})");
    ASSERT_TRUE(holds<ToolBatchIntent>(intent));
    const auto& invocations = std::get<ToolBatchIntent>(intent.kind).invocations;
    ASSERT_EQ(invocations.size(), 2u);
    EXPECT_EQ(invocations[0].tool_name, "web_fetch");
    EXPECT_EQ(invocations[1].tool_name, "calculator");
    EXPECT_EQ(toolgate::protocol::intent_name(intent), "tool_batch");
}

TEST(ResponseInterpreterTest, MalformedBatchEntriesAreRejected) {
    ResponseInterpreter interpreter(true);
    EXPECT_TRUE(holds<MalformedIntent>(interpreter.interpret(R"({"tool_calls": []})")));
    EXPECT_TRUE(holds<MalformedIntent>(interpreter.interpret(R"({"tool_calls": [1]})")));
    EXPECT_TRUE(holds<MalformedIntent>(
        interpreter.interpret(R"({"tool_calls": [{"tool": "x", "arguments": {}, "why": 1}]})")));
}

}  // namespace
