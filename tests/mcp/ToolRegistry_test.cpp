#include "mcp/ToolRegistry.hpp"
#include "mcp/Errors.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace mcpline;
using json = nlohmann::json;

namespace {

ToolInfo make_info(const std::string& name, json required = json::array()) {
    return {
        name,
        "Tool " + name,
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", required}
        }
    };
}

ToolHandler constant(json value) {
    return make_sync_handler([value](const json&, SessionContext&) { return value; });
}

} // namespace

TEST(ToolRegistryTest, EmptyRegistry) {
    ToolRegistry registry;

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.find("anything"), nullptr);
    EXPECT_TRUE(registry.list().is_array());
    EXPECT_TRUE(registry.list().empty());
}

TEST(ToolRegistryTest, RegisterAndFind) {
    ToolRegistry registry;
    registry.register_tool(make_info("echo"), constant("hi"));

    ASSERT_TRUE(registry.contains("echo"));
    const ToolRegistry::Entry* entry = registry.find("echo");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->info.description, "Tool echo");

    SessionContext context;
    EXPECT_EQ(entry->handler(json::object(), context).get(), "hi");
}

TEST(ToolRegistryTest, ListIsOrderedByName) {
    ToolRegistry registry;
    registry.register_tool(make_info("zeta"), constant(1));
    registry.register_tool(make_info("alpha"), constant(2));
    registry.register_tool(make_info("mid"), constant(3));

    json tools = registry.list();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0]["name"], "alpha");
    EXPECT_EQ(tools[1]["name"], "mid");
    EXPECT_EQ(tools[2]["name"], "zeta");
    EXPECT_TRUE(tools[0].contains("inputSchema"));
    EXPECT_TRUE(tools[0].contains("description"));
}

TEST(ToolRegistryTest, DuplicateNameReplacesEntry) {
    ToolRegistry registry;
    registry.register_tool(make_info("t"), constant("old"));
    registry.register_tool(make_info("t"), constant("new"));

    EXPECT_EQ(registry.size(), 1u);
    SessionContext context;
    EXPECT_EQ(registry.find("t")->handler(json::object(), context).get(), "new");
}

TEST(ToolRegistryTest, RejectsEmptyNameAndNullHandler) {
    ToolRegistry registry;

    EXPECT_THROW(registry.register_tool(make_info(""), constant(1)), std::invalid_argument);
    EXPECT_THROW(registry.register_tool(make_info("t"), ToolHandler()), std::invalid_argument);
    EXPECT_THROW(make_sync_handler(ToolFunction()), std::invalid_argument);
    EXPECT_THROW(make_async_handler(ToolFunction()), std::invalid_argument);
}

TEST(ToolRegistryTest, RequiredParametersFollowSchema) {
    EXPECT_EQ(make_info("t", json::array({"a", "b"})).required_parameters(),
              (std::vector<std::string>{"a", "b"}));

    ToolInfo no_schema{"t", "d", json::object()};
    EXPECT_TRUE(no_schema.required_parameters().empty());
}

TEST(ToolRegistryTest, SyncHandlerStoresException) {
    ToolHandler handler = make_sync_handler([](const json&, SessionContext&) -> json {
        throw ToolExecutionError("bad input");
    });

    SessionContext context;
    std::future<json> result;
    ASSERT_NO_THROW(result = handler(json::object(), context));
    EXPECT_THROW(result.get(), ToolExecutionError);
}

TEST(ToolRegistryTest, AsyncHandlerRunsOnAnotherThread) {
    const auto caller = std::this_thread::get_id();
    ToolHandler handler = make_async_handler([caller](const json& args, SessionContext& context) -> json {
        context.current_namespace = "changed";
        return {{"same_thread", std::this_thread::get_id() == caller}, {"value", args["value"]}};
    });

    SessionContext context;
    json result = handler({{"value", 7}}, context).get();

    EXPECT_EQ(result["same_thread"], false);
    EXPECT_EQ(result["value"], 7);
    EXPECT_EQ(context.current_namespace, "changed");
}
