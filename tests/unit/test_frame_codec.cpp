#include <gtest/gtest.h>

#include "Constants.h"
#include "FrameCodec.h"

using namespace ChatStorage;

TEST(FrameCodecTest, EncodesHeaderBigEndian) {
    Frame frame(FrameType::Ack, {'o', 'k'}, 0x07);
    auto bytes = FrameCodec::encode(frame);

    ASSERT_EQ(bytes.size(), 10u);
    EXPECT_EQ(bytes[0], 0xFA);
    EXPECT_EQ(bytes[1], 0xCE);
    EXPECT_EQ(bytes[2], 0x04);
    EXPECT_EQ(bytes[3], 0x07);
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x00);
    EXPECT_EQ(bytes[6], 0x00);
    EXPECT_EQ(bytes[7], 0x02);
    EXPECT_EQ(bytes[8], 'o');
    EXPECT_EQ(bytes[9], 'k');
}

TEST(FrameCodecTest, EmptyPayloadIsHeaderOnly) {
    auto bytes = FrameCodec::encode(Frame(FrameType::Heartbeat, {}));
    EXPECT_EQ(bytes.size(), 8u);

    auto decoded = FrameCodec::decode(bytes);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->type, FrameType::Heartbeat);
    EXPECT_TRUE(decoded->payload.empty());
}

TEST(FrameCodecTest, DecodeKeepsTypeFlagsAndPayload) {
    std::vector<uint8_t> payload(70000);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 31);
    }
    Frame frame(FrameType::Data, payload, 0x80);

    auto decoded = FrameCodec::decode(FrameCodec::encode(frame));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), frame);
}

TEST(FrameCodecTest, ShortInputIsTruncatedHeader) {
    std::vector<uint8_t> bytes = {0xFA, 0xCE, 0x04, 0x00, 0x00};
    auto decoded = FrameCodec::decode(bytes);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::TruncatedHeader);
}

TEST(FrameCodecTest, WrongMagicIsRejected) {
    std::vector<uint8_t> bytes = {0xCA, 0xFE, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00};
    auto decoded = FrameCodec::decode(bytes);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::BadMagic);
}

TEST(FrameCodecTest, UnknownTypeIsRejected) {
    std::vector<uint8_t> bytes = {0xFA, 0xCE, 0x7E, 0x00, 0x00, 0x00, 0x00, 0x00};
    auto decoded = FrameCodec::decode(bytes);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::UnknownType);
}

TEST(FrameCodecTest, DeclaredLengthBeyondInputIsTruncatedPayload) {
    auto bytes = FrameCodec::encode(Frame::fromString(FrameType::UserResponse, "{\"code\":200}"));
    bytes.pop_back();
    auto decoded = FrameCodec::decode(bytes);
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error().code, ErrorCode::TruncatedPayload);
}

TEST(FrameCodecTest, EveryProperPrefixFailsToDecode) {
    auto bytes = FrameCodec::encode(Frame::fromString(FrameType::FileResponse, "{\"code\":200,\"data\":{}}"));
    for (std::size_t size = 0; size < bytes.size(); ++size) {
        auto decoded = FrameCodec::decode(bytes.data(), size);
        ASSERT_FALSE(decoded.ok()) << "prefix of " << size << " bytes decoded";
        const ErrorCode expected =
            size < config::FRAME_HEADER_SIZE ? ErrorCode::TruncatedHeader : ErrorCode::TruncatedPayload;
        EXPECT_EQ(decoded.error().code, expected) << "prefix of " << size << " bytes";
    }
    EXPECT_TRUE(FrameCodec::decode(bytes.data(), bytes.size()).ok());
}

TEST(FrameCodecTest, PeekLengthNeedsFullHeader) {
    auto bytes = FrameCodec::encode(Frame::fromString(FrameType::Meta, "abcdef"));
    EXPECT_FALSE(FrameCodec::peekLength(bytes.data(), 7).has_value());
    ASSERT_TRUE(FrameCodec::peekLength(bytes.data(), 8).has_value());
    EXPECT_EQ(*FrameCodec::peekLength(bytes.data(), 8), 6u);
}

TEST(FrameCodecTest, EveryDeclaredTypeIsKnown) {
    const uint8_t known[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x0F, 0x10, 0x11, 0x12, 0x13, 0x14, 0x15,
                             0x20, 0x21, 0x22, 0x23, 0x30, 0x31, 0x32, 0x33, 0x34, 0x35, 0x36, 0x37, 0x38,
                             0x39, 0x40, 0x41, 0x42, 0x43};
    for (uint8_t code : known) {
        EXPECT_TRUE(isKnownFrameType(code)) << static_cast<int>(code);
    }
    EXPECT_FALSE(isKnownFrameType(0x00));
    EXPECT_FALSE(isKnownFrameType(0x07));
    EXPECT_FALSE(isKnownFrameType(0x44));
    EXPECT_FALSE(isKnownFrameType(0xFF));
}

TEST(FrameCodecTest, DescribeNamesTheFrame) {
    std::string text = FrameCodec::describe(Frame::fromString(FrameType::ResumeAck, "{}"));
    EXPECT_NE(text.find("ResumeAck"), std::string::npos);
    EXPECT_NE(text.find("0x06"), std::string::npos);
    EXPECT_NE(text.find("len=2"), std::string::npos);
}
