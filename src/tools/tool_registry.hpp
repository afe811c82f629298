#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::tools {

// External behavior behind a tool. Returns the result value or throws a
// domain error (ToolError or any std::exception).
using Capability = std::function<nlohmann::json(const protocol::TypedArguments&)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<protocol::ParameterSpec> parameters;
    Capability capability;
};

// Immutable catalog, fully populated at construction.
class ToolRegistry {
public:
    static core::errors::Result<ToolRegistry> create(
        std::vector<ToolDescriptor> descriptors);

    core::errors::Result<const ToolDescriptor*> lookup(const std::string& name) const;

    const std::vector<ToolDescriptor>& list_all() const;

    std::vector<std::string> names() const;

    // Model-facing rendering of one descriptor's contract.
    static nlohmann::json describe(const ToolDescriptor& descriptor);

    nlohmann::json describe_all() const;

private:
    explicit ToolRegistry(std::vector<ToolDescriptor> descriptors);

    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace toolgate::tools
