#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "model/model_client.hpp"

namespace toolgate::model {

struct OllamaSettings {
    std::string host = "127.0.0.1";
    std::uint16_t port = 11434;
    std::string model = "llama3.2";
    double temperature = 0.0;
    std::chrono::milliseconds timeout{120000};
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
};

// POSTs to /api/generate over plain HTTP/1.1 (Boost.Beast), one bounded
// attempt at a time, backing off exponentially between attempts.
class OllamaClient : public ModelClient {
public:
    explicit OllamaClient(OllamaSettings settings);

    core::errors::Result<std::string> complete(const std::string& prompt) override;

    nlohmann::json build_payload(const std::string& prompt) const;

    // Pulls the trimmed "response" field out of a /api/generate body.
    static core::errors::Result<std::string> parse_response(const std::string& body);

private:
    struct HttpReply {
        unsigned status = 0;
        std::string body;
    };

    core::errors::Result<HttpReply> post_once(const std::string& body) const;

    OllamaSettings settings_;
};

}  // namespace toolgate::model
