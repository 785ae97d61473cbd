#pragma once

#include "Errors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace mcpline {

using json = nlohmann::json;

/**
 * @brief Call that expects exactly one reply carrying the same id
 */
struct Request {
    json id;  // string, number or null; chosen by the peer
    std::string method;
    json params = json::object();
};

/**
 * @brief Call without an id; never answered
 */
struct Notification {
    std::string method;
    json params = json::object();
};

struct Response {
    json id;
    json result;
};

struct ErrorResponse {
    json id;  // null when the failing envelope had no readable id
    ErrorObject error;
};

using Message = std::variant<Request, Notification, Response, ErrorResponse>;

/**
 * @brief Line that could not be turned into a Message
 *
 * Keeps the original text for the log and the id when one was readable.
 */
struct ParseFailure {
    ErrorObject error;
    std::string raw;
    json id;
};

using DecodeResult = std::variant<Message, ParseFailure>;

/**
 * @brief Converts between wire lines and Message values
 */
class MessageCodec {
public:
    /**
     * @brief Decode one line into a message
     *
     * Tries a strict parse first. If that fails, retries once on the
     * substring between the first '{' and the last '}'. Argument containers
     * of tool calls are normalized to params.arguments.
     *
     * @param line Raw line without terminator
     * @return Decoded message or a ParseFailure describing the error reply
     */
    static DecodeResult decode(const std::string& line);

    /**
     * @brief Serialize a message as a single compact line
     */
    static std::string encode(const Message& message);

    static json to_json(const Message& message);

    /**
     * @brief Rewrite "parameters"/"input" containers of tool calls to "arguments"
     * @param method Method name of the call
     * @param params Params object as received
     * @return Params with a canonical "arguments" member for tool calls
     */
    static json normalize_params(const std::string& method, json params);

private:
    static std::optional<json> parse_json(const std::string& text);
    static DecodeResult from_json(const json& value, const std::string& raw);
    static bool is_valid_id(const json& id);
};

} // namespace mcpline
