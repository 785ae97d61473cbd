#include "core/KeyValueStore.hpp"
#include "core/ServerConfig.hpp"
#include "mcp/Errors.hpp"
#include "mcp/Session.hpp"
#include "mcp/StdioTransport.hpp"
#include "mcp/ToolRegistry.hpp"
#include "tools/BuiltinTools.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"mcpline - line-delimited JSON-RPC tool server on stdin/stdout"};

    mcpline::ServerConfig config;
    mcpline::add_config_options(app, config);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << config.server_name << " version " << config.server_version << std::endl;
        return 0;
    }

    // stdout carries protocol frames only
    try {
        mcpline::configure_logging(config);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot set up logging: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting {} {}", config.server_name, config.server_version);
    spdlog::info("Log level: {}", config.log_level);

    try {
        auto store = std::make_shared<mcpline::KeyValueStore>();
        if (!config.kv_file.empty()) {
            store = std::make_shared<mcpline::KeyValueStore>(mcpline::KeyValueStore::load_file(config.kv_file));
        }

        auto registry = std::make_shared<mcpline::ToolRegistry>();
        mcpline::register_builtin_tools(*registry, config, store);

        mcpline::SessionContext context;
        context.current_namespace = config.initial_namespace;

        auto transport = std::make_unique<mcpline::StdioTransport>();
        mcpline::Session session(
            std::move(transport),
            registry,
            mcpline::ServerInfo{config.server_name, config.server_version},
            context);

        spdlog::info("All tools registered, starting session");

        // Blocks until shutdown or end of input
        session.run();

        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const mcpline::TransportError& e) {
        spdlog::critical("Transport failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
