#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcpline {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used on the wire
 */
enum class ErrorCode : int {
    PARSE_ERROR      = -32700,
    INVALID_REQUEST  = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS   = -32602,
    INTERNAL_ERROR   = -32603
};

/**
 * @brief Error payload attached as "error" in place of "result"
 */
struct ErrorObject {
    ErrorCode code;
    std::string message;
    json data;  // null when absent

    json to_json() const;
};

/**
 * @brief Recoverable failure that is reported to the peer
 *
 * Base of the protocol-level error categories. Carries the wire code,
 * a human readable message and optional structured data.
 */
class McpError : public std::runtime_error {
public:
    McpError(ErrorCode code, const std::string& message, json data = json());
    explicit McpError(ErrorObject error);

    ErrorCode code() const noexcept { return error_.code; }
    const ErrorObject& error() const noexcept { return error_; }

private:
    ErrorObject error_;
};

/**
 * @brief Malformed envelope, unknown method or bad parameters
 */
class ProtocolError : public McpError {
public:
    using McpError::McpError;
};

/**
 * @brief Method sent while the session state forbids it
 */
class LifecycleViolation : public McpError {
public:
    LifecycleViolation(const std::string& method, std::string_view state);
};

/**
 * @brief Thrown by tool handlers when they cannot produce a result
 *
 * Never reaches the wire as-is; the dispatcher converts it through
 * ErrorMapper::tool_failure().
 */
class ToolExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Underlying stream failed to read or write
 *
 * Fatal for the session and never reported to the peer.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Converts internal failure categories into protocol error objects
 */
class ErrorMapper {
public:
    static ErrorObject from_error(const McpError& error);

    /**
     * @brief Map a handler failure of any kind to an internal error
     * @param tool_name Tool whose handler failed
     * @param error Exception raised by the handler
     * @return Error with code -32603 and the handler message in data
     */
    static ErrorObject tool_failure(const std::string& tool_name, const std::exception& error);

    static ErrorObject unexpected(const std::exception& error);

    static ErrorObject parse_error(const std::string& reason);

    static ErrorObject invalid_request(const std::string& reason);

    static ErrorObject method_not_found(const std::string& method);

    static ErrorObject invalid_params(const std::string& reason);
};

} // namespace mcpline
