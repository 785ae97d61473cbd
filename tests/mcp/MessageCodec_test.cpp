#include "mcp/Message.hpp"
#include <gtest/gtest.h>

using namespace mcpline;
using json = nlohmann::json;

namespace {

Message decode_ok(const std::string& line) {
    DecodeResult result = MessageCodec::decode(line);
    EXPECT_TRUE(std::holds_alternative<Message>(result)) << "failed to decode: " << line;
    return std::get<Message>(result);
}

ParseFailure decode_fail(const std::string& line) {
    DecodeResult result = MessageCodec::decode(line);
    EXPECT_TRUE(std::holds_alternative<ParseFailure>(result)) << "unexpectedly decoded: " << line;
    return std::get<ParseFailure>(result);
}

} // namespace

TEST(MessageCodecTest, DecodesRequest) {
    Message message = decode_ok(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})");

    ASSERT_TRUE(std::holds_alternative<Request>(message));
    const auto& request = std::get<Request>(message);
    EXPECT_EQ(request.id, 1);
    EXPECT_EQ(request.method, "tools/list");
    EXPECT_TRUE(request.params.is_object());
}

TEST(MessageCodecTest, MissingParamsBecomesEmptyObject) {
    Message message = decode_ok(R"({"id":"abc","method":"shutdown"})");

    const auto& request = std::get<Request>(message);
    EXPECT_EQ(request.id, "abc");
    EXPECT_EQ(request.params, json::object());
}

TEST(MessageCodecTest, NullIdIsStillARequest) {
    Message message = decode_ok(R"({"id":null,"method":"ping"})");

    ASSERT_TRUE(std::holds_alternative<Request>(message));
    EXPECT_TRUE(std::get<Request>(message).id.is_null());
}

TEST(MessageCodecTest, DecodesNotification) {
    Message message = decode_ok(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    ASSERT_TRUE(std::holds_alternative<Notification>(message));
    EXPECT_EQ(std::get<Notification>(message).method, "notifications/initialized");
}

TEST(MessageCodecTest, DecodesPeerResponses) {
    Message response = decode_ok(R"({"jsonrpc":"2.0","id":4,"result":{"ok":true}})");
    ASSERT_TRUE(std::holds_alternative<Response>(response));
    EXPECT_EQ(std::get<Response>(response).result["ok"], true);

    Message error = decode_ok(R"({"jsonrpc":"2.0","id":5,"error":{"code":-32601,"message":"nope"}})");
    ASSERT_TRUE(std::holds_alternative<ErrorResponse>(error));
    EXPECT_EQ(std::get<ErrorResponse>(error).error.code, ErrorCode::METHOD_NOT_FOUND);
    EXPECT_EQ(std::get<ErrorResponse>(error).error.message, "nope");
}

TEST(MessageCodecTest, GarbageIsParseError) {
    ParseFailure failure = decode_fail("not json at all");

    EXPECT_EQ(failure.error.code, ErrorCode::PARSE_ERROR);
    EXPECT_TRUE(failure.id.is_null());
    EXPECT_EQ(failure.raw, "not json at all");
}

TEST(MessageCodecTest, TruncatedObjectIsParseError) {
    ParseFailure failure = decode_fail(R"({"id":1,"method":"tools/list")");

    EXPECT_EQ(failure.error.code, ErrorCode::PARSE_ERROR);
    EXPECT_TRUE(failure.id.is_null());
}

TEST(MessageCodecTest, RecoversBracedFrame) {
    Message message = decode_ok(R"(LOG: {"id":9,"method":"ping"} <- sent)");

    ASSERT_TRUE(std::holds_alternative<Request>(message));
    EXPECT_EQ(std::get<Request>(message).id, 9);
}

TEST(MessageCodecTest, RecoveryIsSingleAttempt) {
    // Substring between the outermost braces is still not JSON
    ParseFailure failure = decode_fail(R"(x {"id":1} junk {"id":2} y)");

    EXPECT_EQ(failure.error.code, ErrorCode::PARSE_ERROR);
}

TEST(MessageCodecTest, NonObjectIsInvalidRequest) {
    ParseFailure failure = decode_fail("[1,2,3]");

    EXPECT_EQ(failure.error.code, ErrorCode::INVALID_REQUEST);
    EXPECT_TRUE(failure.id.is_null());
}

TEST(MessageCodecTest, NonStringMethodEchoesId) {
    ParseFailure failure = decode_fail(R"({"id":12,"method":42})");

    EXPECT_EQ(failure.error.code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(failure.id, 12);
}

TEST(MessageCodecTest, StructuredIdIsInvalidRequest) {
    ParseFailure failure = decode_fail(R"({"id":{"nested":1},"method":"ping"})");

    EXPECT_EQ(failure.error.code, ErrorCode::INVALID_REQUEST);
    EXPECT_TRUE(failure.id.is_null());
}

TEST(MessageCodecTest, ScalarParamsAreInvalidRequest) {
    ParseFailure failure = decode_fail(R"({"id":3,"method":"ping","params":"x"})");

    EXPECT_EQ(failure.error.code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(failure.id, 3);
}

TEST(MessageCodecTest, MissingMethodIsInvalidRequest) {
    ParseFailure failure = decode_fail(R"({"id":3})");

    EXPECT_EQ(failure.error.code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(failure.id, 3);
}

TEST(MessageCodecTest, NormalizesParameterContainers) {
    json from_parameters = MessageCodec::normalize_params("callTool", {{"name", "t"}, {"parameters", {{"x", 1}}}});
    EXPECT_EQ(from_parameters["arguments"]["x"], 1);
    EXPECT_FALSE(from_parameters.contains("parameters"));

    json from_input = MessageCodec::normalize_params("tools/call", {{"name", "t"}, {"input", {{"y", 2}}}});
    EXPECT_EQ(from_input["arguments"]["y"], 2);
    EXPECT_FALSE(from_input.contains("input"));

    json missing = MessageCodec::normalize_params("tools/call", {{"name", "t"}});
    EXPECT_EQ(missing["arguments"], json::object());

    json canonical_wins = MessageCodec::normalize_params("tools/call",
        {{"name", "t"}, {"arguments", {{"a", 1}}}, {"parameters", {{"b", 2}}}});
    EXPECT_EQ(canonical_wins["arguments"], json({{"a", 1}}));
}

TEST(MessageCodecTest, OtherMethodsAreNotNormalized) {
    json params = {{"parameters", {{"x", 1}}}};
    EXPECT_EQ(MessageCodec::normalize_params("initialize", params), params);
}

TEST(MessageCodecTest, DecodeNormalizesToolCalls) {
    Message message = decode_ok(R"({"id":1,"method":"tools/call","params":{"name":"add","parameters":{"a":1}}})");

    const auto& request = std::get<Request>(message);
    EXPECT_EQ(request.params["arguments"]["a"], 1);
}

TEST(MessageCodecTest, EncodesResponse) {
    std::string line = MessageCodec::encode(Response{2, 5});

    json parsed = json::parse(line);
    EXPECT_EQ(parsed["jsonrpc"], "2.0");
    EXPECT_EQ(parsed["id"], 2);
    EXPECT_EQ(parsed["result"], 5);
}

TEST(MessageCodecTest, EncodesNullResultExplicitly) {
    json parsed = json::parse(MessageCodec::encode(Response{4, json()}));

    ASSERT_TRUE(parsed.contains("result"));
    EXPECT_TRUE(parsed["result"].is_null());
}

TEST(MessageCodecTest, EncodesErrorWithoutDataMember) {
    ErrorResponse response{json(), ErrorObject{ErrorCode::PARSE_ERROR, "Parse error", json()}};
    json parsed = json::parse(MessageCodec::encode(response));

    EXPECT_TRUE(parsed["id"].is_null());
    EXPECT_EQ(parsed["error"]["code"], -32700);
    EXPECT_FALSE(parsed["error"].contains("data"));
    EXPECT_FALSE(parsed.contains("result"));
}

TEST(MessageCodecTest, EncodedLineHasNoRawNewline) {
    std::string line = MessageCodec::encode(Response{1, {{"text", "line one\nline two\r\n"}}});

    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(line)["result"]["text"], "line one\nline two\r\n");
}

TEST(MessageCodecTest, InvalidUtf8IsReplacedNotThrown) {
    std::string bad = "ok";
    bad.push_back(static_cast<char>(0xFF));

    std::string line;
    EXPECT_NO_THROW(line = MessageCodec::encode(Response{1, bad}));
    EXPECT_NO_THROW(json::parse(line));
}
