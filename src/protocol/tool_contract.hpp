#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolgate::protocol {

    // Primitive types a tool parameter can declare
    enum class ParamType {
        String,
        Integer,
        Number,
        Boolean
    };

    // One named entry of a tool's parameter contract
    struct ParameterSpec {
        std::string name;
        ParamType type = ParamType::String;
        bool required = true;
        std::string description;
        std::vector<nlohmann::json> allowed_values;    // empty = unconstrained
        std::optional<nlohmann::json> default_value;  // optional params only
    };

    // Integer parameters hold int64, Number parameters always hold double.
    using TypedValue = std::variant<std::string, std::int64_t, double, bool>;

    struct TypedArgument {
        std::string name;
        TypedValue value;
    };

    // Arguments after validation, in the contract's declared order.
    class TypedArguments {
    public:
        TypedArguments() = default;
        explicit TypedArguments(std::vector<TypedArgument> values)
            : values_(std::move(values)) {}

        const TypedValue* find(const std::string& name) const {
            for (const auto& arg : values_) {
                if (arg.name == name) {
                    return &arg.value;
                }
            }
            return nullptr;
        }

        template <typename T>
        std::optional<T> get(const std::string& name) const {
            const TypedValue* value = find(name);
            if (value == nullptr || !std::holds_alternative<T>(*value)) {
                return std::nullopt;
            }
            return std::get<T>(*value);
        }

        const std::vector<TypedArgument>& values() const { return values_; }
        std::size_t size() const { return values_.size(); }

        nlohmann::json to_json() const {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& arg : values_) {
                std::visit([&out, &arg](const auto& v) { out[arg.name] = v; }, arg.value);
            }
            return out;
        }

    private:
        std::vector<TypedArgument> values_;
    };

    // A proposed call, exactly as the model wrote it
    struct Invocation {
        std::string tool_name;
        nlohmann::json raw_arguments = nlohmann::json::object();
    };

    // A call whose arguments passed the tool's contract
    struct ValidatedInvocation {
        std::string tool_name;
        TypedArguments typed_arguments;
    };

    enum class FailureKind {
        UnknownTool,
        SchemaViolation,
        ToolExecutionFailure,
        Timeout
    };

    struct ExecutionSuccess {
        nlohmann::json value;
    };

    struct ExecutionFailure {
        FailureKind kind;
        std::string message;
    };

    // Exactly one of success or failure, never partially populated
    class ExecutionResult {
    public:
        static ExecutionResult success(nlohmann::json value) {
            return ExecutionResult(ExecutionSuccess{std::move(value)});
        }

        static ExecutionResult failure(FailureKind kind, std::string message) {
            return ExecutionResult(ExecutionFailure{kind, std::move(message)});
        }

        bool is_success() const {
            return std::holds_alternative<ExecutionSuccess>(outcome_);
        }

        const nlohmann::json& value() const {
            return std::get<ExecutionSuccess>(outcome_).value;
        }

        const ExecutionFailure& failure() const {
            return std::get<ExecutionFailure>(outcome_);
        }

    private:
        explicit ExecutionResult(std::variant<ExecutionSuccess, ExecutionFailure> outcome)
            : outcome_(std::move(outcome)) {}

        std::variant<ExecutionSuccess, ExecutionFailure> outcome_;
    };

    inline std::string to_string(const ParamType type) {
        switch (type) {
            case ParamType::String:
                return "string";
            case ParamType::Integer:
                return "integer";
            case ParamType::Number:
                return "number";
            case ParamType::Boolean:
                return "boolean";
            default:
                return "unknown";
        }
    }

    inline std::string to_string(const FailureKind kind) {
        switch (kind) {
            case FailureKind::UnknownTool:
                return "unknown_tool";
            case FailureKind::SchemaViolation:
                return "schema_violation";
            case FailureKind::ToolExecutionFailure:
                return "tool_execution_failure";
            case FailureKind::Timeout:
                return "timeout";
            default:
                return "unknown";
        }
    }

    // The exact JSON the model sees for a result: never a paraphrase.
    inline nlohmann::json result_to_json(const ExecutionResult& result) {
        nlohmann::json out;
        out["success"] = result.is_success();
        if (result.is_success()) {
            out["result"] = result.value();
        } else {
            out["error_kind"] = to_string(result.failure().kind);
            out["error"] = result.failure().message;
        }
        return out;
    }

} // namespace toolgate::protocol
