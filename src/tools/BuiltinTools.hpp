#pragma once

#include "core/KeyValueStore.hpp"
#include "core/ServerConfig.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace mcpline {

/**
 * @brief Register every tool shipped with the server
 *
 * Math and key-value tools are synchronous. run_command is registered
 * asynchronously and bounded by config.command_timeout_ms.
 *
 * @param registry Registry to fill
 * @param config Program and timeout for run_command
 * @param store Store backing kv_lookup and kv_keys
 */
void register_builtin_tools(ToolRegistry& registry,
                            const ServerConfig& config,
                            std::shared_ptr<const KeyValueStore> store);

} // namespace mcpline
