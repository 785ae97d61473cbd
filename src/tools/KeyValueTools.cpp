#include "KeyValueTools.hpp"
#include "mcp/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpline {

KvLookupTool::KvLookupTool(std::shared_ptr<const KeyValueStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("Store cannot be null");
    }
}

ToolInfo KvLookupTool::get_info() {
    return {
        "kv_lookup",
        "Look up the value stored under a key",
        {
            {"type", "object"},
            {"properties", {
                {"key", {
                    {"type", "string"},
                    {"description", "Key to look up"}
                }}
            }},
            {"required", json::array({"key"})}
        }
    };
}

json KvLookupTool::execute(const json& args) const {
    const json key = args.value("key", json());
    if (!key.is_string()) {
        throw ToolExecutionError("key must be a string");
    }

    const std::string name = key.get<std::string>();
    std::optional<json> value = store_->lookup(name);
    if (!value) {
        spdlog::debug("KvLookupTool: key '{}' not found", name);
        throw ToolExecutionError("Key not found: " + name);
    }

    return {
        {"key", name},
        {"value", *value}
    };
}

KvKeysTool::KvKeysTool(std::shared_ptr<const KeyValueStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("Store cannot be null");
    }
}

ToolInfo KvKeysTool::get_info() {
    return {
        "kv_keys",
        "List all keys in the key-value store",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json KvKeysTool::execute(const json&) const {
    return {{"keys", store_->keys()}};
}

} // namespace mcpline
