#pragma once

#include "SessionState.hpp"
#include <functional>
#include <future>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpline {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments

    /**
     * @brief Names listed in the schema's "required" array, in schema order
     */
    std::vector<std::string> required_parameters() const;

    /**
     * @brief Descriptor as listed by initialize and tools/list
     * @return {name, description, inputSchema}
     */
    json to_json() const;
};

/**
 * @brief Tool execution capability
 *
 * Every handler hands back a future, whether the work already finished
 * or still runs elsewhere. The dispatcher waits on it the same way in
 * both cases. Failures travel through the future as exceptions.
 */
using ToolHandler = std::function<std::future<json>(const json& args, SessionContext& context)>;

/**
 * @brief Plain function form of a tool body
 */
using ToolFunction = std::function<json(const json& args, SessionContext& context)>;

/**
 * @brief Wrap a function that completes before returning
 * @param fn Tool body; exceptions are stored in the returned future
 */
ToolHandler make_sync_handler(ToolFunction fn);

/**
 * @brief Wrap a function that runs on its own thread
 * @param fn Tool body, executed via std::async(std::launch::async)
 */
ToolHandler make_async_handler(ToolFunction fn);

/**
 * @brief Name-indexed set of tools, built at startup and read-only afterwards
 */
class ToolRegistry {
public:
    struct Entry {
        ToolInfo info;
        ToolHandler handler;
    };

    /**
     * @brief Register a tool with handler
     *
     * Registering an existing name replaces the previous entry.
     *
     * @param info Tool metadata with JSON schema
     * @param handler Capability executed on tools/call
     * @throws std::invalid_argument on empty name or null handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Find a tool by name
     * @return Entry or nullptr when the name is not registered
     */
    const Entry* find(const std::string& name) const;

    bool contains(const std::string& name) const;

    std::size_t size() const { return tools_.size(); }

    /**
     * @brief JSON array of all descriptors, ordered by name
     */
    json list() const;

private:
    std::map<std::string, Entry> tools_;
};

} // namespace mcpline
