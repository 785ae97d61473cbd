#pragma once

#include "core/CommandRunner.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcpline {

/**
 * @brief MCP tool running the configured program with caller-supplied arguments
 *
 * The command string is split on whitespace and passed to the program
 * directly, without a shell. For kubectl the session's current namespace
 * is appended unless the command already selects one.
 */
class RunCommandTool {
public:
    /**
     * @brief Construct tool with runner and program
     * @param runner Command runner (owns the timeout)
     * @param program Executable prefixed to every command, e.g. "kubectl"
     */
    RunCommandTool(std::shared_ptr<const CommandRunner> runner, std::string program);

    /**
     * @brief Get tool metadata and JSON schema
     * @param program Program name shown in the description
     */
    static ToolInfo get_info(const std::string& program);

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "command" parameter
     * @param context Session context (current namespace)
     * @return {command, stdout, stderr, exit_status}
     * @throws ToolExecutionError on empty command, spawn failure or timeout
     */
    json execute(const json& args, const SessionContext& context) const;

    /**
     * @brief Build the argv for a command string
     */
    std::vector<std::string> build_argv(const std::string& command, const SessionContext& context) const;

private:
    std::shared_ptr<const CommandRunner> runner_;
    std::string program_;
};

} // namespace mcpline
