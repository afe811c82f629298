#include "model/ollama_client.hpp"

#include <thread>
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include "core/logging/logger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace toolgate::model {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kGeneratePath = "/api/generate";

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

OllamaClient::OllamaClient(OllamaSettings settings) : settings_(std::move(settings)) {}

json OllamaClient::build_payload(const std::string& prompt) const {
    json payload;
    payload["model"] = settings_.model;
    payload["prompt"] = prompt;
    payload["stream"] = false;
    payload["format"] = "json";
    payload["options"] = {{"temperature", settings_.temperature}};
    return payload;
}

core::errors::Result<std::string> OllamaClient::parse_response(const std::string& body) {
    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return AgentError{ErrorCategory::Model, "Model service returned a non-JSON body.",
                          "model_bad_response"};
    }
    auto error = parsed.find("error");
    if (error != parsed.end() && error->is_string()) {
        return AgentError{ErrorCategory::Model,
                          "Model service error: " + error->get<std::string>(),
                          "model_bad_response"};
    }
    auto response = parsed.find("response");
    if (response == parsed.end() || !response->is_string()) {
        return AgentError{ErrorCategory::Model,
                          "Model service body has no \"response\" text.",
                          "model_bad_response"};
    }
    return trim(response->get<std::string>());
}

core::errors::Result<OllamaClient::HttpReply> OllamaClient::post_once(
    const std::string& body) const {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> request{http::verb::post, kGeneratePath, 11};
    request.set(http::field::host, settings_.host + ":" + std::to_string(settings_.port));
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::error_code failure;
    std::string stage = "resolve";

    // One deadline covers resolve, connect, write and read of this attempt.
    const auto deadline = net::steady_timer::clock_type::now() + settings_.timeout;
    net::steady_timer resolve_timer(ioc, deadline);
    bool resolve_expired = false;
    resolve_timer.async_wait([&](beast::error_code ec) {
        if (!ec) {
            resolve_expired = true;
            resolver.cancel();
        }
    });

    resolver.async_resolve(
        settings_.host, std::to_string(settings_.port),
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            resolve_timer.cancel();
            if (resolve_expired) {
                failure = beast::error::timeout;
                return;
            }
            if (ec) {
                failure = ec;
                return;
            }
            stage = "connect";
            stream.expires_at(deadline);
            stream.async_connect(results, [&](beast::error_code ec,
                                              tcp::resolver::results_type::endpoint_type) {
                if (ec) {
                    failure = ec;
                    return;
                }
                stage = "write";
                http::async_write(stream, request, [&](beast::error_code ec, std::size_t) {
                    if (ec) {
                        failure = ec;
                        return;
                    }
                    stage = "read";
                    http::async_read(stream, buffer, response,
                                     [&](beast::error_code ec, std::size_t) {
                                         if (ec) {
                                             failure = ec;
                                             return;
                                         }
                                         beast::error_code ignored;
                                         stream.socket().shutdown(
                                             tcp::socket::shutdown_both, ignored);
                                     });
                });
            });
        });

    try {
        ioc.run();
    } catch (const std::exception& e) {
        return AgentError{ErrorCategory::Model,
                          "Model transport failed: " + std::string(e.what()),
                          "model_unreachable"};
    }

    if (failure) {
        if (failure == beast::error::timeout) {
            return AgentError{ErrorCategory::Model,
                              "Model service timed out during " + stage + " after " +
                                  std::to_string(settings_.timeout.count()) + " ms",
                              "model_timeout"};
        }
        return AgentError{ErrorCategory::Model,
                          "Model service " + stage + " failed: " + failure.message(),
                          "model_unreachable",
                          "Is the model service running at " + settings_.host + ":" +
                              std::to_string(settings_.port) + "?"};
    }

    return HttpReply{response.result_int(), response.body()};
}

core::errors::Result<std::string> OllamaClient::complete(const std::string& prompt) {
    const std::string body =
        build_payload(prompt).dump(-1, ' ', false, json::error_handler_t::replace);

    AgentError last_error{ErrorCategory::Model, "Model service was never called.",
                          "model_unreachable"};
    std::chrono::milliseconds backoff = settings_.initial_backoff;

    for (std::uint32_t attempt = 1; attempt <= settings_.max_attempts; ++attempt) {
        auto reply = post_once(body);
        if (core::errors::is_error(reply)) {
            last_error = core::errors::get_error(reply);
        } else {
            const auto& http_reply = core::errors::get_value(reply);
            if (http_reply.status >= 200 && http_reply.status < 300) {
                auto text = parse_response(http_reply.body);
                if (!core::errors::is_error(text)) {
                    return core::errors::get_value(text);
                }
                last_error = core::errors::get_error(text);
            } else {
                last_error = AgentError{ErrorCategory::Model,
                                        "Model service answered HTTP " +
                                            std::to_string(http_reply.status),
                                        "model_unreachable"};
            }
        }

        if (attempt < settings_.max_attempts) {
            TOOLGATE_LOG_WARN("OllamaClient: attempt " + std::to_string(attempt) + "/" +
                              std::to_string(settings_.max_attempts) + " failed (" +
                              last_error.message + "), retrying in " +
                              std::to_string(backoff.count()) + " ms");
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    last_error.message = "Model call failed after " + std::to_string(settings_.max_attempts) +
                         " attempts: " + last_error.message;
    TOOLGATE_LOG_ERROR("OllamaClient: " + last_error.message);
    return last_error;
}

}  // namespace toolgate::model
