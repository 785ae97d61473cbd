#pragma once

#include "mcp/ToolRegistry.hpp"

namespace mcpline {

/**
 * @brief Reports the session's current namespace
 */
class GetNamespaceTool {
public:
    static ToolInfo get_info();

    json execute(const json& args, const SessionContext& context) const;
};

/**
 * @brief Changes the session's current namespace
 *
 * Later tools (run_command) read the value from the session context.
 */
class SetNamespaceTool {
public:
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "namespace" parameter
     * @param context Session context updated in place
     * @return {previous, namespace, message}
     * @throws ToolExecutionError if namespace is not a non-empty string
     */
    json execute(const json& args, SessionContext& context) const;
};

} // namespace mcpline
