#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_executor.hpp"

namespace toolgate::tools {

using nlohmann::json;
using protocol::ParamType;
using protocol::ParameterSpec;
using protocol::TypedArguments;

namespace {

constexpr std::size_t kSnippetBefore = 50;
constexpr std::size_t kSnippetAfter = 150;

// Integral results are reported as integers so 234 + 567 reads as 801.
json number_result(const double value) {
    if (!std::isfinite(value)) {
        throw ToolError("result is not a finite number");
    }
    constexpr double kExactIntegerLimit = 9007199254740992.0;  // 2^53
    if (std::floor(value) == value && std::fabs(value) < kExactIntegerLimit) {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

void seed_sample_docs(const std::filesystem::path& docs_dir) {
    const std::map<std::string, std::string> samples = {
        {"cpp_overview.txt",
         "The C++ Programming Language\n\n"
         "C++ is a compiled, statically typed language created by Bjarne Stroustrup "
         "and first released in 1985.\n\n"
         "It is used for systems programming, game engines, databases, browsers and "
         "embedded devices. RAII, templates and the standard library let programs "
         "manage resources deterministically without a garbage collector.\n"},
        {"machine_learning.txt",
         "Machine Learning Basics\n\n"
         "Machine learning lets a system improve at a task from data instead of "
         "explicit rules.\n\n"
         "Common families are supervised learning (labeled examples), unsupervised "
         "learning (structure in unlabeled data) and reinforcement learning "
         "(rewards from trial and error). Python and C++ libraries such as PyTorch "
         "and ONNX Runtime are widely used to train and serve models.\n"},
        {"web_development.txt",
         "Web Development Overview\n\n"
         "Web development covers the frontend, which runs in the browser using HTML, "
         "CSS and JavaScript, and the backend, which stores data and runs business "
         "logic on a server.\n\n"
         "Backends are written in many languages, including Python, Go, Java and C++. "
         "Frameworks such as React, Django and Drogon speed up development.\n"}};

    std::error_code ec;
    std::filesystem::create_directories(docs_dir, ec);
    if (ec) {
        throw ToolError("unable to create docs directory: " + docs_dir.string());
    }
    for (const auto& [name, content] : samples) {
        std::ofstream out(docs_dir / name);
        out << content;
        if (!out.good()) {
            throw ToolError("unable to write sample document: " + name);
        }
    }
    TOOLGATE_LOG_INFO("search_docs: seeded sample documents in " + docs_dir.string());
}

json calculate(const TypedArguments& args) {
    const auto operation = args.get<std::string>("operation");
    const auto a = args.get<double>("a");
    const auto b = args.get<double>("b");
    if (!operation || !a || !b) {
        throw ToolError("calculator requires operation, a and b");
    }

    if (*operation == "add") {
        return number_result(*a + *b);
    }
    if (*operation == "subtract") {
        return number_result(*a - *b);
    }
    if (*operation == "multiply") {
        return number_result(*a * *b);
    }
    if (*operation == "divide") {
        if (*b == 0.0) {
            throw ToolError("division by zero");
        }
        return number_result(*a / *b);
    }
    throw ToolError("unknown operation: " + *operation);
}

json search_docs(const std::filesystem::path& docs_dir, const TypedArguments& args) {
    const auto query = args.get<std::string>("query");
    const auto max_results = args.get<std::int64_t>("max_results").value_or(3);
    if (!query || trim(*query).empty()) {
        throw ToolError("query cannot be empty");
    }
    if (max_results < 1) {
        throw ToolError("max_results must be at least 1");
    }

    std::error_code ec;
    if (!std::filesystem::exists(docs_dir, ec)) {
        seed_sample_docs(docs_dir);
    }
    if (!std::filesystem::is_directory(docs_dir, ec) || ec) {
        throw ToolError("docs path is not a directory: " + docs_dir.string());
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(docs_dir, ec)) {
        const auto ext = entry.path().extension().string();
        if (entry.is_regular_file(ec) && (ext == ".txt" || ext == ".md")) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw ToolError("unable to list docs directory: " + docs_dir.string());
    }
    std::sort(files.begin(), files.end());

    struct Hit {
        std::string filename;
        std::string snippet;
        std::size_t relevance;
    };
    std::vector<Hit> hits;
    const std::string needle = lowercase(*query);

    for (const auto& file : files) {
        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        const std::string content = buffer.str();
        const std::string lowered = lowercase(content);

        const auto idx = lowered.find(needle);
        if (idx == std::string::npos) {
            continue;
        }
        const std::size_t start = idx > kSnippetBefore ? idx - kSnippetBefore : 0;
        const std::size_t end = std::min(content.size(), idx + kSnippetAfter);
        hits.push_back(Hit{file.filename().string(), trim(content.substr(start, end - start)),
                           count_occurrences(lowered, needle)});
    }

    std::stable_sort(hits.begin(), hits.end(), [](const Hit& lhs, const Hit& rhs) {
        return lhs.relevance > rhs.relevance;
    });
    if (hits.size() > static_cast<std::size_t>(max_results)) {
        hits.resize(static_cast<std::size_t>(max_results));
    }
    if (hits.empty()) {
        throw ToolError("no documents found matching '" + *query + "'");
    }

    json results = json::array();
    for (const auto& hit : hits) {
        results.push_back(json{
            {"filename", hit.filename}, {"snippet", hit.snippet}, {"relevance", hit.relevance}});
    }
    return {{"query", *query}, {"count", hits.size()}, {"results", results}};
}

json web_fetch(const TypedArguments& args) {
    struct Page {
        std::string title;
        std::string summary;
        std::string content;
    };
    static const std::map<std::string, Page> kPages = {
        {"example.com",
         {"Example Domain",
          "A reserved domain for illustrative examples in documents.",
          "Example Domain. This domain is reserved for use in illustrative examples "
          "in documents and may be used in literature without prior coordination."}},
        {"python.org",
         {"Welcome to Python.org",
          "The official home of the Python programming language.",
          "Python is a programming language that lets you work quickly and integrate "
          "systems more effectively. It is easy to learn and runs everywhere."}},
        {"github.com",
         {"GitHub: Let's build from here",
          "A platform where developers host and review code together.",
          "GitHub is where developers host Git repositories, review code, track issues "
          "and run CI/CD workflows for open source and private projects."}}};

    const auto url = args.get<std::string>("url");
    const auto extract = args.get<std::string>("extract").value_or("content");
    if (!url) {
        throw ToolError("url is required");
    }

    std::string key = *url;
    for (const std::string prefix : {"http://", "https://", "www."}) {
        std::size_t pos = key.find(prefix);
        while (pos != std::string::npos) {
            key.erase(pos, prefix.size());
            pos = key.find(prefix);
        }
    }
    while (!key.empty() && key.front() == '/') {
        key.erase(key.begin());
    }
    while (!key.empty() && key.back() == '/') {
        key.pop_back();
    }

    auto it = kPages.find(key);
    if (it == kPages.end()) {
        std::string available;
        for (const auto& page : kPages) {
            if (!available.empty()) {
                available += ", ";
            }
            available += page.first;
        }
        throw ToolError("simulated network failure fetching '" + *url +
                        "'. Available: " + available);
    }

    std::string text;
    if (extract == "title") {
        text = it->second.title;
    } else if (extract == "summary") {
        text = it->second.summary;
    } else if (extract == "content") {
        text = it->second.content;
    } else {
        throw ToolError("unknown extract type: " + extract);
    }
    return {{"url", *url}, {"extract", extract}, {"content", text}};
}

}  // namespace

ToolDescriptor make_calculator_tool() {
    ToolDescriptor descriptor;
    descriptor.name = "calculator";
    descriptor.description =
        "Performs basic arithmetic operations (add, subtract, multiply, divide)";
    descriptor.parameters = {
        ParameterSpec{"operation", ParamType::String, true,
                      "The arithmetic operation to perform",
                      {"add", "subtract", "multiply", "divide"}, std::nullopt},
        ParameterSpec{"a", ParamType::Number, true, "First number", {}, std::nullopt},
        ParameterSpec{"b", ParamType::Number, true, "Second number", {}, std::nullopt}};
    descriptor.capability = calculate;
    return descriptor;
}

ToolDescriptor make_search_docs_tool(std::filesystem::path docs_dir) {
    ToolDescriptor descriptor;
    descriptor.name = "search_docs";
    descriptor.description = "Search through local documents for information";
    descriptor.parameters = {
        ParameterSpec{"query", ParamType::String, true, "Search query string", {},
                      std::nullopt},
        ParameterSpec{"max_results", ParamType::Integer, false,
                      "Maximum number of results to return (default: 3)", {}, json(3)}};
    descriptor.capability = [docs_dir = std::move(docs_dir)](const TypedArguments& args) {
        return search_docs(docs_dir, args);
    };
    return descriptor;
}

ToolDescriptor make_web_fetch_tool() {
    ToolDescriptor descriptor;
    descriptor.name = "web_fetch";
    descriptor.description = "Fetch content from a URL (example.com, python.org, github.com)";
    descriptor.parameters = {
        ParameterSpec{"url", ParamType::String, true, "URL to fetch", {}, std::nullopt},
        ParameterSpec{"extract", ParamType::String, false,
                      "What to extract from the page (default: content)",
                      {"title", "summary", "content"}, json("content")}};
    descriptor.capability = web_fetch;
    return descriptor;
}

std::vector<ToolDescriptor> builtin_descriptors(const std::filesystem::path& docs_dir) {
    std::vector<ToolDescriptor> descriptors;
    descriptors.push_back(make_calculator_tool());
    descriptors.push_back(make_search_docs_tool(docs_dir));
    descriptors.push_back(make_web_fetch_tool());
    return descriptors;
}

core::errors::Result<ToolRegistry> make_builtin_registry(
    const std::filesystem::path& docs_dir) {
    return ToolRegistry::create(builtin_descriptors(docs_dir));
}

}  // namespace toolgate::tools
