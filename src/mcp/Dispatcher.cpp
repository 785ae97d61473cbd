#include "Dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpline {

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> registry, ServerInfo info)
    : registry_(std::move(registry)), info_(std::move(info)) {
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }

    add_method({"initialize", {SessionState::UNINITIALIZED}, SessionState::READY,
        [this](const json& params, SessionContext&) { return handle_initialize(params); }});

    add_method({"tools/list", {SessionState::READY}, std::nullopt,
        [this](const json&, SessionContext&) { return handle_tools_list(); }});

    auto tools_call = [this](const json& params, SessionContext& context) {
        return handle_tools_call(params, context);
    };
    add_method({"tools/call", {SessionState::READY}, std::nullopt, tools_call});
    // Name used by older peers
    add_method({"callTool", {SessionState::READY}, std::nullopt, tools_call});

    add_method({"ping", {SessionState::READY}, std::nullopt,
        [](const json&, SessionContext&) { return json::object(); }});

    add_method({"shutdown", {SessionState::READY}, SessionState::SHUTTING_DOWN,
        [](const json&, SessionContext&) { return json(); }});

    notifications_.insert("notifications/initialized");

    spdlog::debug("Dispatcher ready with {} methods and {} tools", methods_.size(), registry_->size());
}

void Dispatcher::add_method(MethodSpec spec) {
    std::string name = spec.name;
    methods_[name] = std::move(spec);
}

const MethodSpec* Dispatcher::find_method(const std::string& method) const {
    auto it = methods_.find(method);
    return it == methods_.end() ? nullptr : &it->second;
}

bool Dispatcher::is_known_notification(const std::string& method) const {
    return notifications_.count(method) > 0;
}

Message Dispatcher::dispatch(const Request& request, SessionContext& context) const {
    const MethodSpec* spec = find_method(request.method);
    if (!spec) {
        spdlog::warn("Unknown method: {}", request.method);
        return ErrorResponse{request.id, ErrorMapper::method_not_found(request.method)};
    }

    spdlog::debug("Handling request: method={}, id={}", request.method, request.id.dump());

    try {
        return Response{request.id, spec->handler(request.params, context)};
    } catch (const McpError& e) {
        spdlog::warn("Request {} ({}) failed: {}", request.id.dump(), request.method, e.what());
        return ErrorResponse{request.id, ErrorMapper::from_error(e)};
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", request.method, e.what());
        return ErrorResponse{request.id, ErrorMapper::unexpected(e)};
    }
}

json Dispatcher::handle_initialize(const json& params) const {
    spdlog::info("Handling initialize request");

    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const json& client = params["clientInfo"];
        spdlog::info("Client: {} version {}",
            client.value("name", std::string("unknown")),
            client.value("version", std::string("unknown")));
    }

    return {
        {"name", info_.name},
        {"version", info_.version},
        {"capabilities", {
            {"tools", registry_->list()}
        }}
    };
}

json Dispatcher::handle_tools_list() const {
    json tools_array = registry_->list();
    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json Dispatcher::handle_tools_call(const json& params, SessionContext& context) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw ProtocolError(ErrorCode::METHOD_NOT_FOUND, "Tool not found: missing tool name",
                            json{{"tool", nullptr}});
    }

    const std::string tool_name = params["name"].get<std::string>();
    const ToolRegistry::Entry* entry = registry_->find(tool_name);
    if (!entry) {
        throw ProtocolError(ErrorCode::METHOD_NOT_FOUND, "Tool not found: " + tool_name,
                            json{{"tool", tool_name}});
    }

    const json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        ErrorObject error = ErrorMapper::invalid_params("arguments must be an object");
        error.data = {{"tool", tool_name}};
        throw ProtocolError(std::move(error));
    }

    for (const auto& required : entry->info.required_parameters()) {
        if (!arguments.contains(required)) {
            ErrorObject error = ErrorMapper::invalid_params("missing required parameter '" + required + "'");
            error.data = {{"tool", tool_name}, {"parameter", required}};
            throw ProtocolError(std::move(error));
        }
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    try {
        std::future<json> pending = entry->handler(arguments, context);
        if (!pending.valid()) {
            throw ToolExecutionError("handler returned no result");
        }
        return pending.get();
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", tool_name, e.what());
        throw McpError(ErrorMapper::tool_failure(tool_name, e));
    } catch (...) {
        spdlog::error("Tool {} failed with a non-standard exception", tool_name);
        throw McpError(ErrorMapper::tool_failure(tool_name, std::runtime_error("unknown exception")));
    }
}

} // namespace mcpline
