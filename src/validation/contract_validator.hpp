#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace toolgate::validation {

struct TypeMismatch {
    std::string param;
    std::string expected;
    std::string detail;
};

// Every reason a raw argument object failed its contract, all reported at once.
struct SchemaViolation {
    std::vector<std::string> missing_params;
    std::vector<TypeMismatch> type_errors;
    std::vector<std::string> unknown_params;

    bool empty() const {
        return missing_params.empty() && type_errors.empty() && unknown_params.empty();
    }

    std::string describe() const;
};

using ValidationOutcome = std::variant<protocol::ValidatedInvocation, SchemaViolation>;

inline bool is_violation(const ValidationOutcome& outcome) {
    return std::holds_alternative<SchemaViolation>(outcome);
}

// Pure and deterministic: never touches the registry or the transcript.
class ContractValidator {
public:
    ValidationOutcome validate(const tools::ToolDescriptor& descriptor,
                               const nlohmann::json& raw_arguments) const;

private:
    static bool coerce(const protocol::ParameterSpec& spec, const nlohmann::json& raw,
                       protocol::TypedValue& out, std::string& detail);
    static bool in_allowed_values(const protocol::ParameterSpec& spec,
                                  const nlohmann::json& raw);
};

}  // namespace toolgate::validation
