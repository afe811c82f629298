#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_executor.hpp"

namespace {

using nlohmann::json;
using toolgate::protocol::TypedArgument;
using toolgate::protocol::TypedArguments;
using toolgate::tools::ToolError;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_builtin_tools_" + toolgate::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void write(const std::string& name, const std::string& contents) const {
        std::ofstream out(root_ / name);
        out << contents;
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

json calculate(const std::string& operation, double a, double b) {
    const auto tool = toolgate::tools::make_calculator_tool();
    return tool.capability(TypedArguments({TypedArgument{"operation", operation},
                                           TypedArgument{"a", a}, TypedArgument{"b", b}}));
}

json search(const std::filesystem::path& docs, const std::string& query,
            std::int64_t max_results = 3) {
    const auto tool = toolgate::tools::make_search_docs_tool(docs);
    return tool.capability(TypedArguments(
        {TypedArgument{"query", query}, TypedArgument{"max_results", max_results}}));
}

json fetch(const std::string& url, const std::string& extract = "content") {
    const auto tool = toolgate::tools::make_web_fetch_tool();
    return tool.capability(
        TypedArguments({TypedArgument{"url", url}, TypedArgument{"extract", extract}}));
}

TEST(CalculatorToolTest, IntegralResultsAreIntegers) {
    EXPECT_EQ(calculate("add", 234, 567), json(801));
    EXPECT_EQ(calculate("subtract", 10, 25), json(-15));
    EXPECT_EQ(calculate("multiply", 6, 7), json(42));
    EXPECT_EQ(calculate("divide", 10, 4), json(2.5));
    EXPECT_TRUE(calculate("divide", 10, 5).is_number_integer());
}

TEST(CalculatorToolTest, DivisionByZeroRaisesDomainError) {
    try {
        calculate("divide", 10, 0);
        FAIL() << "expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_STREQ(e.what(), "division by zero");
    }
}

TEST(SearchDocsToolTest, SeedsSampleDocumentsWhenMissing) {
    TempWorkspace workspace;
    const auto docs = workspace.root() / "docs";
    ASSERT_FALSE(std::filesystem::exists(docs));

    const json result = search(docs, "python");
    EXPECT_TRUE(std::filesystem::exists(docs / "cpp_overview.txt"));
    EXPECT_TRUE(std::filesystem::exists(docs / "machine_learning.txt"));
    EXPECT_TRUE(std::filesystem::exists(docs / "web_development.txt"));
    EXPECT_EQ(result.at("query"), "python");
    EXPECT_EQ(result.at("count"), 2);
}

TEST(SearchDocsToolTest, RanksByOccurrencesThenFilename) {
    TempWorkspace workspace;
    workspace.write("b.txt", "kernel once");
    workspace.write("a.md", "Kernel and KERNEL and kernel");
    workspace.write("c.txt", "KERNEL once");
    workspace.write("ignored.json", "kernel kernel kernel kernel");

    const json result = search(workspace.root(), "kernel", 10);
    ASSERT_EQ(result.at("count"), 3);
    const json& hits = result.at("results");
    EXPECT_EQ(hits[0].at("filename"), "a.md");
    EXPECT_EQ(hits[0].at("relevance"), 3);
    EXPECT_EQ(hits[1].at("filename"), "b.txt");
    EXPECT_EQ(hits[2].at("filename"), "c.txt");
}

TEST(SearchDocsToolTest, HonorsMaxResults) {
    TempWorkspace workspace;
    workspace.write("a.txt", "token");
    workspace.write("b.txt", "token");
    workspace.write("c.txt", "token");
    const json result = search(workspace.root(), "token", 2);
    EXPECT_EQ(result.at("count"), 2);
    EXPECT_EQ(result.at("results").size(), 2u);
}

TEST(SearchDocsToolTest, SnippetSurroundsFirstMatch) {
    TempWorkspace workspace;
    const std::string before(80, 'x');
    const std::string after(300, 'y');
    workspace.write("long.txt", before + "needle" + after);

    const json result = search(workspace.root(), "needle");
    const std::string snippet = result.at("results")[0].at("snippet");
    EXPECT_EQ(snippet.size(), 200u);
    EXPECT_EQ(snippet.find("needle"), 50u);
}

TEST(SearchDocsToolTest, EmptyResultRaisesDomainError) {
    TempWorkspace workspace;
    workspace.write("a.txt", "nothing to see");
    try {
        search(workspace.root(), "quantum");
        FAIL() << "expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_STREQ(e.what(), "no documents found matching 'quantum'");
    }
}

TEST(SearchDocsToolTest, RejectsBadArguments) {
    TempWorkspace workspace;
    workspace.write("a.txt", "content");
    EXPECT_THROW(search(workspace.root(), "content", 0), ToolError);
    EXPECT_THROW(search(workspace.root(), "   "), ToolError);
}

TEST(WebFetchToolTest, NormalizesKnownUrls) {
    const json plain = fetch("example.com", "title");
    EXPECT_EQ(plain.at("content"), "Example Domain");
    EXPECT_EQ(plain.at("extract"), "title");

    const json decorated = fetch("https://www.python.org/", "title");
    EXPECT_EQ(decorated.at("content"), "Welcome to Python.org");
    EXPECT_EQ(decorated.at("url"), "https://www.python.org/");
}

TEST(WebFetchToolTest, ExtractsSummaryAndContent) {
    EXPECT_NE(fetch("github.com", "summary").at("content").get<std::string>().find("developers"),
              std::string::npos);
    EXPECT_NE(fetch("http://github.com").at("content").get<std::string>().find("Git"),
              std::string::npos);
}

TEST(WebFetchToolTest, UnknownHostSimulatesNetworkFailure) {
    try {
        fetch("https://unknown.invalid");
        FAIL() << "expected ToolError";
    } catch (const ToolError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("simulated network failure"), std::string::npos);
        EXPECT_NE(message.find("example.com, github.com, python.org"), std::string::npos);
    }
}

}  // namespace
