#include "runtime/response_interpreter.hpp"

#include <map>
#include <set>
#include <utility>
#include <vector>

namespace toolgate::runtime {

using nlohmann::json;
using protocol::CompletionIntent;
using protocol::Invocation;
using protocol::MalformedIntent;
using protocol::RefusalIntent;
using protocol::ToolBatchIntent;
using protocol::ToolCallIntent;
using protocol::TurnIntent;

namespace {

const std::set<std::string> kShapeKeys = {"tool", "arguments", "done",
                                          "answer", "refuse", "reason"};
const std::string kBatchKey = "tool_calls";

// Payload fields and the marker that must be set for them to appear.
const std::map<std::string, std::string> kFieldOwners = {
    {"reason", "refuse"}, {"answer", "done"}, {"arguments", "tool"}};

TurnIntent malformed(const std::string& raw_text, std::string detail) {
    return TurnIntent{MalformedIntent{raw_text, std::move(detail)}, false};
}

// Parses without exceptions; discarded values mean "not JSON".
std::optional<json> parse_object(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

ResponseInterpreter::ResponseInterpreter(bool allow_tool_batches)
    : allow_tool_batches_(allow_tool_batches) {}

std::optional<json> ResponseInterpreter::locate_payload(const std::string& raw_text) {
    if (auto whole = parse_object(raw_text)) {
        return whole;
    }

    // Models wrap JSON in prose or code fences; take the outermost braces.
    const auto start = raw_text.find('{');
    const auto end = raw_text.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return std::nullopt;
    }
    return parse_object(raw_text.substr(start, end - start + 1));
}

std::optional<Invocation> ResponseInterpreter::read_invocation(const json& call,
                                                               std::string& detail) {
    auto tool = call.find("tool");
    if (tool == call.end() || !tool->is_string() || tool->get<std::string>().empty()) {
        detail = "\"tool\" must be a non-empty string";
        return std::nullopt;
    }
    auto arguments = call.find("arguments");
    if (arguments == call.end()) {
        detail = "\"arguments\" is required with \"tool\"";
        return std::nullopt;
    }
    if (!arguments->is_object()) {
        detail = "\"arguments\" must be a JSON object";
        return std::nullopt;
    }
    return Invocation{tool->get<std::string>(), *arguments};
}

TurnIntent ResponseInterpreter::interpret(const std::string& raw_text) const {
    auto located = locate_payload(raw_text);
    if (!located) {
        return malformed(raw_text, "no JSON object found in the reply");
    }
    const json& payload = *located;

    for (const auto& item : payload.items()) {
        if (kShapeKeys.count(item.key()) != 0) {
            continue;
        }
        if (item.key() == kBatchKey) {
            if (allow_tool_batches_) {
                continue;
            }
            return malformed(raw_text, "\"tool_calls\" is not accepted; call one tool per reply");
        }
        return malformed(raw_text, "unexpected field \"" + item.key() + "\"");
    }

    auto refuse = payload.find("refuse");
    if (refuse != payload.end() && !refuse->is_boolean()) {
        return malformed(raw_text, "\"refuse\" must be true");
    }
    auto done = payload.find("done");
    if (done != payload.end() && !done->is_boolean()) {
        return malformed(raw_text, "\"done\" must be true");
    }

    const bool refusal_marked = refuse != payload.end() && refuse->get<bool>();
    const bool completion_marked = done != payload.end() && done->get<bool>();
    const bool tool_marked = payload.contains("tool");
    const bool batch_marked = payload.contains(kBatchKey);

    const int marker_count = static_cast<int>(refusal_marked) +
                             static_cast<int>(completion_marked) +
                             static_cast<int>(tool_marked) + static_cast<int>(batch_marked);
    const bool ambiguous = marker_count > 1;

    const std::map<std::string, bool> marked = {
        {"refuse", refusal_marked}, {"done", completion_marked}, {"tool", tool_marked}};
    for (const auto& [field, owner] : kFieldOwners) {
        if (payload.contains(field) && !marked.at(owner)) {
            return malformed(raw_text, "field \"" + field + "\" belongs to a \"" + owner +
                                           "\" reply");
        }
    }

    if (refusal_marked) {
        auto reason = payload.find("reason");
        if (reason == payload.end() || !reason->is_string()) {
            return malformed(raw_text, "a refusal needs a string \"reason\"");
        }
        return TurnIntent{RefusalIntent{reason->get<std::string>()}, ambiguous};
    }

    if (completion_marked) {
        auto answer = payload.find("answer");
        if (answer == payload.end() || !answer->is_string()) {
            return malformed(raw_text, "a completion needs a string \"answer\"");
        }
        return TurnIntent{CompletionIntent{answer->get<std::string>()}, ambiguous};
    }

    if (tool_marked) {
        std::string detail;
        auto invocation = read_invocation(payload, detail);
        if (!invocation) {
            return malformed(raw_text, detail);
        }
        return TurnIntent{ToolCallIntent{std::move(*invocation)}, ambiguous};
    }

    if (batch_marked) {
        const json& calls = payload.at(kBatchKey);
        if (!calls.is_array() || calls.empty()) {
            return malformed(raw_text, "\"tool_calls\" must be a non-empty array");
        }
        std::vector<Invocation> invocations;
        for (const auto& call : calls) {
            if (!call.is_object()) {
                return malformed(raw_text, "every entry of \"tool_calls\" must be an object");
            }
            for (const auto& item : call.items()) {
                if (item.key() != "tool" && item.key() != "arguments") {
                    return malformed(raw_text, "unexpected field \"" + item.key() +
                                                   "\" in \"tool_calls\"");
                }
            }
            std::string detail;
            auto invocation = read_invocation(call, detail);
            if (!invocation) {
                return malformed(raw_text, detail);
            }
            invocations.push_back(std::move(*invocation));
        }
        return TurnIntent{ToolBatchIntent{std::move(invocations)}, ambiguous};
    }

    return malformed(raw_text, "the reply matches none of the legal shapes");
}

}  // namespace toolgate::runtime
