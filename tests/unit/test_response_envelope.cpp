#include <gtest/gtest.h>

#include "ResponseEnvelope.h"

using namespace ChatStorage;

TEST(ResponseEnvelopeTest, SuccessFlagShape) {
    auto envelope = parseEnvelope(std::string(R"({"success":true,"message":"ok","data":{"userId":7}})"));
    ASSERT_TRUE(envelope.ok());
    EXPECT_TRUE(envelope->ok);
    EXPECT_EQ(envelope->code, 200);
    EXPECT_EQ(envelope->message, "ok");
    EXPECT_EQ(jsonInt64(envelope->data["userId"]), 7);
}

TEST(ResponseEnvelopeTest, FailedSuccessFlagWithoutCodeBecomes500) {
    auto envelope = parseEnvelope(std::string(R"({"success":false,"message":"wrong password"})"));
    ASSERT_TRUE(envelope.ok());
    EXPECT_FALSE(envelope->ok);
    EXPECT_EQ(envelope->code, 500);

    Error error = envelope->toError();
    EXPECT_EQ(error.code, ErrorCode::ServerError);
    EXPECT_EQ(error.serverCode, 500);
    EXPECT_EQ(error.message, "wrong password");
}

TEST(ResponseEnvelopeTest, CodeShapeUsesMsg) {
    auto envelope = parseEnvelope(std::string(R"({"code":404,"msg":"no such file"})"));
    ASSERT_TRUE(envelope.ok());
    EXPECT_FALSE(envelope->ok);
    EXPECT_EQ(envelope->code, 404);
    EXPECT_EQ(envelope->message, "no such file");
}

TEST(ResponseEnvelopeTest, NumericStringCodeIsAccepted) {
    auto envelope = parseEnvelope(std::string(R"({"code":"200","data":[1,2]})"));
    ASSERT_TRUE(envelope.ok());
    EXPECT_TRUE(envelope->ok);
    EXPECT_EQ(envelope->data.size(), 2u);
}

TEST(ResponseEnvelopeTest, HandshakeStatusIsKept) {
    auto envelope = parseEnvelope(std::string(R"({"status":"resume","taskId":"t-1","uploadedSize":4096})"));
    ASSERT_TRUE(envelope.ok());
    EXPECT_TRUE(envelope->ok);
    EXPECT_EQ(envelope->status, "resume");
    EXPECT_EQ(jsonInt64(envelope->raw["uploadedSize"]), 4096);
}

TEST(ResponseEnvelopeTest, ErrorStatusFails) {
    auto envelope = parseEnvelope(std::string(R"({"status":"error"})"));
    ASSERT_TRUE(envelope.ok());
    EXPECT_FALSE(envelope->ok);
    EXPECT_EQ(envelope->toError().message, "error");
}

TEST(ResponseEnvelopeTest, BareArrayIsInvalidResponse) {
    auto envelope = parseEnvelope(std::string(R"([{"id":1},{"id":2}])"));
    ASSERT_FALSE(envelope.ok());
    EXPECT_EQ(envelope.error().code, ErrorCode::InvalidResponse);
}

TEST(ResponseEnvelopeTest, EmptyPayloadIsSuccess) {
    auto envelope = parseEnvelope(std::string());
    ASSERT_TRUE(envelope.ok());
    EXPECT_TRUE(envelope->ok);
    EXPECT_TRUE(envelope->data.isNull());
}

TEST(ResponseEnvelopeTest, MalformedJsonIsInvalidResponse) {
    auto envelope = parseEnvelope(std::string("{\"code\":"));
    ASSERT_FALSE(envelope.ok());
    EXPECT_EQ(envelope.error().code, ErrorCode::InvalidResponse);

    auto scalar = parseEnvelope(std::string("42"));
    ASSERT_FALSE(scalar.ok());
    EXPECT_EQ(scalar.error().code, ErrorCode::InvalidResponse);
}

TEST(ResponseEnvelopeTest, ParsesFramePayload) {
    Json::Value body;
    body["code"] = 200;
    body["data"]["fileSize"] = static_cast<Json::Int64>(123);
    auto envelope = parseEnvelope(makeJsonFrame(FrameType::FileResponse, body));
    ASSERT_TRUE(envelope.ok());
    EXPECT_EQ(jsonInt64(envelope->data["fileSize"]), 123);
}

TEST(ResponseEnvelopeTest, WireJsonIsSingleLine) {
    Json::Value body;
    body["userName"] = "alice";
    body["password"] = "secret";
    std::string wire = toWireJson(body);
    EXPECT_EQ(wire.find('\n'), std::string::npos);
    EXPECT_NE(wire.find("\"userName\":\"alice\""), std::string::npos);
}

TEST(ResponseEnvelopeTest, JsonInt64Fallbacks) {
    EXPECT_EQ(jsonInt64(Json::Value("12345678901")), 12345678901LL);
    EXPECT_EQ(jsonInt64(Json::Value(3.9)), 3);
    EXPECT_EQ(jsonInt64(Json::Value("12abc"), -1), -1);
    EXPECT_EQ(jsonInt64(Json::Value(""), -2), -2);
    EXPECT_EQ(jsonInt64(Json::Value(Json::nullValue), -3), -3);
}
