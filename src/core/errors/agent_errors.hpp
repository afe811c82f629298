#pragma once
#include <string>
#include <variant>

namespace toolgate::core::errors {

    // Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., missing question or a malformed CLI flag
        Config,     // E.g., a config file key with the wrong type
        Model,      // E.g., the model service is unreachable after retries
        Tool,       // E.g., a capability raised a domain error
        Contract,   // E.g., arguments rejected by a parameter contract
        Internal    // E.g., a state machine transition that should not happen
    };

    // The standardized error payload
    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";              // Helpful tips for the user
    };

    // A Result holds either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    // Stand-in value type for operations that only succeed or fail.
    struct Ok {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Model:    return "model";
            case ErrorCategory::Tool:     return "tool";
            case ErrorCategory::Contract: return "contract";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace toolgate::core::errors
