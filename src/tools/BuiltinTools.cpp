#include "BuiltinTools.hpp"
#include "KeyValueTools.hpp"
#include "MathTool.hpp"
#include "NamespaceTools.hpp"
#include "RunCommandTool.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace mcpline {

void register_builtin_tools(ToolRegistry& registry,
                            const ServerConfig& config,
                            std::shared_ptr<const KeyValueStore> store) {
    for (auto operation : MathTool::all_operations()) {
        MathTool tool(operation);
        registry.register_tool(
            MathTool::get_info(operation),
            make_sync_handler([tool](const json& args, SessionContext&) {
                return tool.execute(args);
            })
        );
    }

    registry.register_tool(
        GetNamespaceTool::get_info(),
        make_sync_handler([](const json& args, SessionContext& context) {
            return GetNamespaceTool().execute(args, context);
        })
    );

    registry.register_tool(
        SetNamespaceTool::get_info(),
        make_sync_handler([](const json& args, SessionContext& context) {
            return SetNamespaceTool().execute(args, context);
        })
    );

    auto lookup_tool = std::make_shared<KvLookupTool>(store);
    registry.register_tool(
        KvLookupTool::get_info(),
        make_sync_handler([lookup_tool](const json& args, SessionContext&) {
            return lookup_tool->execute(args);
        })
    );

    auto keys_tool = std::make_shared<KvKeysTool>(store);
    registry.register_tool(
        KvKeysTool::get_info(),
        make_sync_handler([keys_tool](const json& args, SessionContext&) {
            return keys_tool->execute(args);
        })
    );

    auto runner = std::make_shared<CommandRunner>(std::chrono::milliseconds(config.command_timeout_ms));
    auto command_tool = std::make_shared<RunCommandTool>(runner, config.command_program);
    registry.register_tool(
        RunCommandTool::get_info(config.command_program),
        make_async_handler([command_tool](const json& args, SessionContext& context) {
            return command_tool->execute(args, context);
        })
    );

    spdlog::info("Registered {} built-in tools", registry.size());
}

} // namespace mcpline
