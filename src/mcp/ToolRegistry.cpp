#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpline {

std::vector<std::string> ToolInfo::required_parameters() const {
    std::vector<std::string> required;
    if (!input_schema.is_object() || !input_schema.contains("required")) {
        return required;
    }

    const json& names = input_schema["required"];
    if (!names.is_array()) {
        spdlog::warn("Tool {} has a non-array 'required' schema member", name);
        return required;
    }

    for (const auto& entry : names) {
        if (entry.is_string()) {
            required.push_back(entry.get<std::string>());
        }
    }
    return required;
}

json ToolInfo::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

ToolHandler make_sync_handler(ToolFunction fn) {
    if (!fn) {
        throw std::invalid_argument("Tool function cannot be null");
    }

    return [fn = std::move(fn)](const json& args, SessionContext& context) {
        std::promise<json> promise;
        try {
            promise.set_value(fn(args, context));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        return promise.get_future();
    };
}

ToolHandler make_async_handler(ToolFunction fn) {
    if (!fn) {
        throw std::invalid_argument("Tool function cannot be null");
    }

    return [fn = std::move(fn)](const json& args, SessionContext& context) {
        return std::async(std::launch::async, fn, args, std::ref(context));
    };
}

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    if (tools_.count(info.name) > 0) {
        spdlog::warn("Tool {} registered twice, replacing previous entry", info.name);
    }
    tools_[info.name] = Entry{info, std::move(handler)};
    spdlog::info("Registered tool: {}", info.name);
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

bool ToolRegistry::contains(const std::string& name) const {
    return tools_.count(name) > 0;
}

json ToolRegistry::list() const {
    json tools_array = json::array();
    for (const auto& [name, entry] : tools_) {
        tools_array.push_back(entry.info.to_json());
    }
    return tools_array;
}

} // namespace mcpline
