#include "tools/tool_registry.hpp"

#include <unordered_set>
#include <utility>

namespace toolgate::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Result<core::errors::Ok> check_descriptor(const ToolDescriptor& descriptor) {
    if (descriptor.name.empty()) {
        return AgentError{ErrorCategory::Internal, "Tool name cannot be empty.",
                          "invalid_tool_descriptor"};
    }
    if (!descriptor.capability) {
        return AgentError{ErrorCategory::Internal,
                          "Tool has no capability: " + descriptor.name,
                          "invalid_tool_descriptor"};
    }

    std::unordered_set<std::string> seen;
    for (const auto& param : descriptor.parameters) {
        if (param.name.empty() || !seen.insert(param.name).second) {
            return AgentError{ErrorCategory::Internal,
                              "Tool '" + descriptor.name +
                                  "' has an empty or duplicate parameter name.",
                              "invalid_tool_descriptor"};
        }
        if (param.required && param.default_value.has_value()) {
            return AgentError{ErrorCategory::Internal,
                              "Required parameter '" + param.name +
                                  "' cannot declare a default.",
                              "invalid_tool_descriptor"};
        }
    }
    return core::errors::Ok{};
}

}  // namespace

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {
    for (std::size_t i = 0; i < descriptors_.size(); ++i) {
        index_.emplace(descriptors_[i].name, i);
    }
}

core::errors::Result<ToolRegistry> ToolRegistry::create(
    std::vector<ToolDescriptor> descriptors) {
    std::unordered_set<std::string> names;
    for (const auto& descriptor : descriptors) {
        auto checked = check_descriptor(descriptor);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        if (!names.insert(descriptor.name).second) {
            return AgentError{ErrorCategory::Internal,
                              "Duplicate tool name: " + descriptor.name,
                              "duplicate_tool"};
        }
    }
    return ToolRegistry(std::move(descriptors));
}

core::errors::Result<const ToolDescriptor*> ToolRegistry::lookup(
    const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        std::string available;
        for (const auto& descriptor : descriptors_) {
            if (!available.empty()) {
                available += ", ";
            }
            available += descriptor.name;
        }
        return AgentError{ErrorCategory::Contract,
                          "Tool '" + name + "' not found. Available tools: " + available,
                          "unknown_tool"};
    }
    return &descriptors_[it->second];
}

const std::vector<ToolDescriptor>& ToolRegistry::list_all() const {
    return descriptors_;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(descriptors_.size());
    for (const auto& descriptor : descriptors_) {
        out.push_back(descriptor.name);
    }
    return out;
}

json ToolRegistry::describe(const ToolDescriptor& descriptor) {
    json properties = json::object();
    json required = json::array();
    for (const auto& param : descriptor.parameters) {
        json property;
        property["type"] = protocol::to_string(param.type);
        if (!param.description.empty()) {
            property["description"] = param.description;
        }
        if (!param.allowed_values.empty()) {
            property["enum"] = param.allowed_values;
        }
        if (param.default_value.has_value()) {
            property["default"] = param.default_value.value();
        }
        properties[param.name] = property;
        if (param.required) {
            required.push_back(param.name);
        }
    }

    json schema;
    schema["name"] = descriptor.name;
    schema["description"] = descriptor.description;
    schema["parameters"] = {{"type", "object"},
                            {"properties", properties},
                            {"required", required}};
    return schema;
}

json ToolRegistry::describe_all() const {
    json all = json::array();
    for (const auto& descriptor : descriptors_) {
        all.push_back(describe(descriptor));
    }
    return all;
}

}  // namespace toolgate::tools
