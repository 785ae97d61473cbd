#include "Message.hpp"
#include <spdlog/spdlog.h>

namespace mcpline {

namespace {

const char* const kJsonRpcVersion = "2.0";

bool is_tool_call(const std::string& method) {
    return method == "tools/call" || method == "callTool";
}

} // namespace

std::optional<json> MessageCodec::parse_json(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::debug("JSON parse error: {}", e.what());
        return std::nullopt;
    }
}

DecodeResult MessageCodec::decode(const std::string& line) {
    std::optional<json> value = parse_json(line);

    if (!value) {
        // One recovery attempt: peers sometimes wrap the frame in log noise
        const auto start = line.find('{');
        const auto end = line.rfind('}');
        if (start != std::string::npos && end != std::string::npos && start < end) {
            value = parse_json(line.substr(start, end - start + 1));
            if (value) {
                spdlog::warn("Recovered JSON frame from noisy line");
            }
        }
    }

    if (!value) {
        return ParseFailure{ErrorMapper::parse_error("Line is not valid JSON"), line, json()};
    }

    return from_json(*value, line);
}

bool MessageCodec::is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

DecodeResult MessageCodec::from_json(const json& value, const std::string& raw) {
    if (!value.is_object()) {
        return ParseFailure{ErrorMapper::invalid_request("message must be a JSON object"), raw, json()};
    }

    const bool has_id = value.contains("id");
    json id = value.value("id", json());
    if (has_id && !is_valid_id(id)) {
        return ParseFailure{ErrorMapper::invalid_request("id must be a string, number or null"), raw, json()};
    }

    if (value.contains("method")) {
        const json& method = value["method"];
        if (!method.is_string()) {
            return ParseFailure{ErrorMapper::invalid_request("method must be a string"), raw, id};
        }

        json params = value.value("params", json::object());
        if (params.is_null()) {
            params = json::object();
        }
        if (!params.is_object() && !params.is_array()) {
            return ParseFailure{ErrorMapper::invalid_request("params must be an object or array"), raw, id};
        }

        std::string method_name = method.get<std::string>();
        params = normalize_params(method_name, std::move(params));

        if (has_id) {
            return Message{Request{id, std::move(method_name), std::move(params)}};
        }
        return Message{Notification{std::move(method_name), std::move(params)}};
    }

    if (has_id && value.contains("result")) {
        return Message{Response{id, value["result"]}};
    }

    if (value.contains("error")) {
        const json& error = value["error"];
        if (!error.is_object() || !error.contains("code") || !error["code"].is_number_integer()) {
            return ParseFailure{ErrorMapper::invalid_request("malformed error object"), raw, id};
        }
        ErrorObject object{
            static_cast<ErrorCode>(error["code"].get<int>()),
            error.value("message", std::string()),
            error.value("data", json())
        };
        return Message{ErrorResponse{id, std::move(object)}};
    }

    return ParseFailure{ErrorMapper::invalid_request("missing method field"), raw, id};
}

json MessageCodec::normalize_params(const std::string& method, json params) {
    if (!is_tool_call(method) || !params.is_object()) {
        return params;
    }

    if (!params.contains("arguments")) {
        json arguments = json::object();
        for (const char* alias : {"parameters", "input"}) {
            if (params.contains(alias)) {
                arguments = params[alias];
                params.erase(std::string(alias));
                spdlog::debug("Normalized tool-call container '{}' to 'arguments'", alias);
                break;
            }
        }
        params["arguments"] = std::move(arguments);
    } else if (params["arguments"].is_null()) {
        params["arguments"] = json::object();
    }

    return params;
}

json MessageCodec::to_json(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return {
            {"jsonrpc", kJsonRpcVersion},
            {"id", request->id},
            {"method", request->method},
            {"params", request->params}
        };
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        return {
            {"jsonrpc", kJsonRpcVersion},
            {"method", notification->method},
            {"params", notification->params}
        };
    }
    if (const auto* response = std::get_if<Response>(&message)) {
        return {
            {"jsonrpc", kJsonRpcVersion},
            {"id", response->id},
            {"result", response->result}
        };
    }

    const auto& error_response = std::get<ErrorResponse>(message);
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", error_response.id},
        {"error", error_response.error.to_json()}
    };
}

std::string MessageCodec::encode(const Message& message) {
    // dump() escapes control characters, so the frame never holds a raw newline
    return to_json(message).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace mcpline
