#include "Errors.hpp"

#include <utility>

namespace mcpline {

json ErrorObject::to_json() const {
    json error = {
        {"code", static_cast<int>(code)},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return error;
}

McpError::McpError(ErrorCode code, const std::string& message, json data)
    : std::runtime_error(message), error_{code, message, std::move(data)} {}

McpError::McpError(ErrorObject error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

LifecycleViolation::LifecycleViolation(const std::string& method, std::string_view state)
    : McpError(ErrorCode::INVALID_REQUEST,
               "Lifecycle violation: method '" + method + "' is not allowed in state " + std::string(state),
               json{{"method", method}, {"state", std::string(state)}}) {}

ErrorObject ErrorMapper::from_error(const McpError& error) {
    return error.error();
}

ErrorObject ErrorMapper::tool_failure(const std::string& tool_name, const std::exception& error) {
    return {ErrorCode::INTERNAL_ERROR, "Tool execution failed: " + tool_name, error.what()};
}

ErrorObject ErrorMapper::unexpected(const std::exception& error) {
    return {ErrorCode::INTERNAL_ERROR, "Internal error", error.what()};
}

ErrorObject ErrorMapper::parse_error(const std::string& reason) {
    return {ErrorCode::PARSE_ERROR, "Parse error", reason};
}

ErrorObject ErrorMapper::invalid_request(const std::string& reason) {
    return {ErrorCode::INVALID_REQUEST, "Invalid Request: " + reason, json()};
}

ErrorObject ErrorMapper::method_not_found(const std::string& method) {
    return {ErrorCode::METHOD_NOT_FOUND, "Method not found: " + method, json()};
}

ErrorObject ErrorMapper::invalid_params(const std::string& reason) {
    return {ErrorCode::INVALID_PARAMS, "Invalid params: " + reason, json()};
}

} // namespace mcpline
