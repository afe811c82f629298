#pragma once

#include <filesystem>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "tools/tool_registry.hpp"

namespace toolgate::tools {

// calculator(operation, a, b)
ToolDescriptor make_calculator_tool();

// search_docs(query, max_results = 3) over .txt/.md files in docs_dir.
// Seeds sample documents when the directory does not exist yet.
ToolDescriptor make_search_docs_tool(std::filesystem::path docs_dir);

// web_fetch(url, extract = "content"), served from a fixed mock table.
ToolDescriptor make_web_fetch_tool();

std::vector<ToolDescriptor> builtin_descriptors(const std::filesystem::path& docs_dir);

core::errors::Result<ToolRegistry> make_builtin_registry(
    const std::filesystem::path& docs_dir);

}  // namespace toolgate::tools
