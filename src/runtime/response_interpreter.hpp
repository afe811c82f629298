#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/turn_intent.hpp"

namespace toolgate::runtime {

// Maps one raw model reply onto a closed set of intents. Never throws:
// anything outside the legal shapes comes back as MalformedIntent.
//
// When a reply carries markers for more than one shape, precedence is
// refusal, then completion, then tool call, then tool batch, and the
// intent is flagged as ambiguous. A field of a shape whose marker is not
// set ("answer" without "done": true, for instance) makes the reply malformed.
class ResponseInterpreter {
public:
    explicit ResponseInterpreter(bool allow_tool_batches = false);

    protocol::TurnIntent interpret(const std::string& raw_text) const;

private:
    static std::optional<nlohmann::json> locate_payload(const std::string& raw_text);
    static std::optional<protocol::Invocation> read_invocation(const nlohmann::json& call,
                                                              std::string& detail);

    bool allow_tool_batches_;
};

}  // namespace toolgate::runtime
