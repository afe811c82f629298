#include "validation/contract_validator.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace toolgate::validation {

using nlohmann::json;
using protocol::ParamType;
using protocol::ParameterSpec;
using protocol::TypedArgument;
using protocol::TypedArguments;
using protocol::TypedValue;
using protocol::ValidatedInvocation;

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

bool looks_numeric(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    std::size_t digits = 0;
    for (const char c : text) {
        if (c >= '0' && c <= '9') {
            ++digits;
        } else if (c != '-' && c != '+' && c != '.' && c != 'e' && c != 'E' && c != ' ') {
            return false;
        }
    }
    return digits > 0;
}

}  // namespace

std::string SchemaViolation::describe() const {
    std::ostringstream out;
    out << "Arguments do not match the tool's parameter contract.";
    if (!missing_params.empty()) {
        out << " Missing required parameters: " << join(missing_params) << ".";
    }
    for (const auto& mismatch : type_errors) {
        out << " Parameter '" << mismatch.param << "' expects " << mismatch.expected
            << ": " << mismatch.detail << ".";
    }
    if (!unknown_params.empty()) {
        out << " Unrecognized parameters: " << join(unknown_params) << ".";
    }
    return out.str();
}

bool ContractValidator::coerce(const ParameterSpec& spec, const json& raw,
                               TypedValue& out, std::string& detail) {
    switch (spec.type) {
        case ParamType::String:
            if (raw.is_string()) {
                out = raw.get<std::string>();
                return true;
            }
            break;
        case ParamType::Integer:
            if (raw.is_number_unsigned()) {
                const auto value = raw.get<std::uint64_t>();
                if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    detail = "integer out of range";
                    return false;
                }
                out = static_cast<std::int64_t>(value);
                return true;
            }
            if (raw.is_number_integer()) {
                out = raw.get<std::int64_t>();
                return true;
            }
            break;
        case ParamType::Number:
            if (raw.is_number()) {
                out = raw.get<double>();
                return true;
            }
            break;
        case ParamType::Boolean:
            if (raw.is_boolean()) {
                out = raw.get<bool>();
                return true;
            }
            break;
    }

    // Numbers written as text are never guessed into numbers.
    if (raw.is_string() &&
        (spec.type == ParamType::Integer || spec.type == ParamType::Number) &&
        looks_numeric(raw.get<std::string>())) {
        detail = "got numeric text \"" + raw.get<std::string>() +
                 "\"; send a JSON number, not a string";
        return false;
    }
    detail = std::string("got ") + raw.type_name() + " " + raw.dump();
    return false;
}

bool ContractValidator::in_allowed_values(const ParameterSpec& spec, const json& raw) {
    if (spec.allowed_values.empty()) {
        return true;
    }
    for (const auto& allowed : spec.allowed_values) {
        if (allowed == raw) {
            return true;
        }
    }
    return false;
}

ValidationOutcome ContractValidator::validate(const tools::ToolDescriptor& descriptor,
                                              const json& raw_arguments) const {
    SchemaViolation violation;

    if (!raw_arguments.is_object()) {
        violation.type_errors.push_back(
            TypeMismatch{"arguments", "object",
                         std::string("got ") + raw_arguments.type_name()});
        for (const auto& spec : descriptor.parameters) {
            if (spec.required) {
                violation.missing_params.push_back(spec.name);
            }
        }
        return violation;
    }

    std::vector<TypedArgument> typed;
    typed.reserve(descriptor.parameters.size());
    std::unordered_set<std::string> declared;

    for (const auto& spec : descriptor.parameters) {
        declared.insert(spec.name);

        auto it = raw_arguments.find(spec.name);
        if (it == raw_arguments.end()) {
            if (spec.required) {
                violation.missing_params.push_back(spec.name);
            } else if (spec.default_value.has_value()) {
                TypedValue value;
                std::string detail;
                if (coerce(spec, spec.default_value.value(), value, detail)) {
                    typed.push_back(TypedArgument{spec.name, std::move(value)});
                }
            }
            continue;
        }

        TypedValue value;
        std::string detail;
        if (!coerce(spec, *it, value, detail)) {
            violation.type_errors.push_back(
                TypeMismatch{spec.name, protocol::to_string(spec.type), detail});
            continue;
        }
        if (!in_allowed_values(spec, *it)) {
            violation.type_errors.push_back(
                TypeMismatch{spec.name,
                             "one of " + json(spec.allowed_values).dump(),
                             "got " + it->dump()});
            continue;
        }
        typed.push_back(TypedArgument{spec.name, std::move(value)});
    }

    for (const auto& item : raw_arguments.items()) {
        if (declared.find(item.key()) == declared.end()) {
            violation.unknown_params.push_back(item.key());
        }
    }

    if (!violation.empty()) {
        return violation;
    }
    return ValidatedInvocation{descriptor.name, TypedArguments(std::move(typed))};
}

}  // namespace toolgate::validation
