#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using toolgate::core::errors::ErrorCategory;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::protocol::ParamType;
using toolgate::protocol::ParameterSpec;
using toolgate::protocol::TypedArguments;
using toolgate::tools::ToolDescriptor;
using toolgate::tools::ToolRegistry;

ToolDescriptor make_echo(const std::string& name) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = "Echoes its text";
    descriptor.parameters = {ParameterSpec{"text", ParamType::String, true, "", {}, std::nullopt}};
    descriptor.capability = [](const TypedArguments& args) {
        return json(args.get<std::string>("text").value_or(""));
    };
    return descriptor;
}

TEST(ToolRegistryTest, LooksUpRegisteredTools) {
    auto created = ToolRegistry::create({make_echo("echo"), make_echo("shout")});
    ASSERT_FALSE(is_error(created));
    const auto& registry = get_value(created);

    auto found = registry.lookup("shout");
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found)->name, "shout");
}

TEST(ToolRegistryTest, ListAllKeepsRegistrationOrder) {
    auto created = toolgate::tools::make_builtin_registry("docs");
    ASSERT_FALSE(is_error(created));
    EXPECT_EQ(get_value(created).names(),
              (std::vector<std::string>{"calculator", "search_docs", "web_fetch"}));
    EXPECT_EQ(get_value(created).list_all().size(), 3u);
}

TEST(ToolRegistryTest, UnknownToolListsAvailableNames) {
    auto created = ToolRegistry::create({make_echo("echo"), make_echo("shout")});
    ASSERT_FALSE(is_error(created));

    auto missing = get_value(created).lookup("whisper");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::Contract);
    EXPECT_EQ(get_error(missing).code, "unknown_tool");
    EXPECT_EQ(get_error(missing).message,
              "Tool 'whisper' not found. Available tools: echo, shout");
}

TEST(ToolRegistryTest, RejectsDuplicateNames) {
    auto created = ToolRegistry::create({make_echo("echo"), make_echo("echo")});
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "duplicate_tool");
}

TEST(ToolRegistryTest, RejectsDescriptorWithoutCapability) {
    ToolDescriptor broken = make_echo("broken");
    broken.capability = nullptr;
    auto created = ToolRegistry::create({broken});
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "invalid_tool_descriptor");
}

TEST(ToolRegistryTest, RejectsDuplicateParameterNames) {
    ToolDescriptor broken = make_echo("broken");
    broken.parameters.push_back(broken.parameters.front());
    auto created = ToolRegistry::create({broken});
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "invalid_tool_descriptor");
}

TEST(ToolRegistryTest, RejectsDefaultOnRequiredParameter) {
    ToolDescriptor broken = make_echo("broken");
    broken.parameters.front().default_value = json("hi");
    auto created = ToolRegistry::create({broken});
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "invalid_tool_descriptor");
}

TEST(ToolRegistryTest, DescribesParameterContract) {
    const json schema = ToolRegistry::describe(toolgate::tools::make_web_fetch_tool());
    EXPECT_EQ(schema.at("name"), "web_fetch");
    EXPECT_EQ(schema.at("parameters").at("type"), "object");
    EXPECT_EQ(schema.at("parameters").at("required"), json::array({"url"}));

    const json& extract = schema.at("parameters").at("properties").at("extract");
    EXPECT_EQ(extract.at("type"), "string");
    EXPECT_EQ(extract.at("enum"), json::array({"title", "summary", "content"}));
    EXPECT_EQ(extract.at("default"), "content");
}

TEST(ToolRegistryTest, DescribeAllCoversEveryTool) {
    auto created = toolgate::tools::make_builtin_registry("docs");
    ASSERT_FALSE(is_error(created));
    const json all = get_value(created).describe_all();
    ASSERT_TRUE(all.is_array());
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].at("name"), "calculator");
    EXPECT_EQ(all[0].at("parameters").at("required"), json::array({"operation", "a", "b"}));
}

}  // namespace
