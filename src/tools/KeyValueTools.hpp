#pragma once

#include "core/KeyValueStore.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace mcpline {

/**
 * @brief Looks up one key in the key-value store
 */
class KvLookupTool {
public:
    /**
     * @brief Construct tool over a shared store
     * @param store Store instance
     */
    explicit KvLookupTool(std::shared_ptr<const KeyValueStore> store);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with "key" parameter
     * @return {key, value}
     * @throws ToolExecutionError if the key is not a string or not present
     */
    json execute(const json& args) const;

private:
    std::shared_ptr<const KeyValueStore> store_;
};

/**
 * @brief Lists the keys of the key-value store
 */
class KvKeysTool {
public:
    explicit KvKeysTool(std::shared_ptr<const KeyValueStore> store);

    static ToolInfo get_info();

    json execute(const json& args) const;

private:
    std::shared_ptr<const KeyValueStore> store_;
};

} // namespace mcpline
