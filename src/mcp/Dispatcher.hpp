#pragma once

#include "Message.hpp"
#include "SessionState.hpp"
#include "ToolRegistry.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace mcpline {

/**
 * @brief Identity reported in the initialize result
 */
struct ServerInfo {
    std::string name;
    std::string version;
};

/**
 * @brief Entry of the method table
 */
struct MethodSpec {
    std::string name;
    std::set<SessionState> allowed_states;
    std::optional<SessionState> on_success;  // transition applied after a successful reply
    std::function<json(const json& params, SessionContext& context)> handler;
};

/**
 * @brief Routes requests to lifecycle handlers or registered tools
 *
 * The method table is built once in the constructor. dispatch() never
 * throws for handler failures; every outcome becomes a Response or an
 * ErrorResponse carrying the request id.
 */
class Dispatcher {
public:
    /**
     * @brief Construct dispatcher over an immutable tool registry
     * @param registry Tools exposed through tools/list and tools/call
     * @param info Server name and version for initialize
     * @throws std::invalid_argument if registry is null
     */
    Dispatcher(std::shared_ptr<const ToolRegistry> registry, ServerInfo info);

    // Table entries capture this
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Look up a request method
     * @return Table entry or nullptr for unknown methods
     */
    const MethodSpec* find_method(const std::string& method) const;

    /**
     * @brief Check whether a notification name is recognized
     */
    bool is_known_notification(const std::string& method) const;

    /**
     * @brief Execute a request and normalize its outcome
     * @param request Decoded request (params already normalized)
     * @param context Session-scoped mutable state passed to tools
     * @return Response or ErrorResponse with request.id
     */
    Message dispatch(const Request& request, SessionContext& context) const;

    const ServerInfo& server_info() const { return info_; }

private:
    json handle_initialize(const json& params) const;
    json handle_tools_list() const;
    json handle_tools_call(const json& params, SessionContext& context) const;

    void add_method(MethodSpec spec);

    std::shared_ptr<const ToolRegistry> registry_;
    ServerInfo info_;
    std::map<std::string, MethodSpec> methods_;
    std::set<std::string> notifications_;
};

} // namespace mcpline
