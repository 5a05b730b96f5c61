/**
 * @file test_framing.cpp
 * @brief Unit tests for length-prefixed framing
 */

#include <gtest/gtest.h>
#include "meshfs/errors.hpp"
#include "meshfs/framing.hpp"
#include <string>

using namespace meshfs;

class FramingTest : public ::testing::Test {};

TEST_F(FramingTest, HeaderIsBigEndian) {
    FrameHeader header = encode_frame_header(0x01020304u);

    EXPECT_EQ(header[0], 0x01);
    EXPECT_EQ(header[1], 0x02);
    EXPECT_EQ(header[2], 0x03);
    EXPECT_EQ(header[3], 0x04);
}

TEST_F(FramingTest, DecodeHeader) {
    FrameHeader header = {0x00, 0x00, 0x01, 0x00};
    EXPECT_EQ(decode_frame_header(header), 256u);

    FrameHeader max = {0xff, 0xff, 0xff, 0xff};
    EXPECT_EQ(decode_frame_header(max), 0xffffffffu);
}

TEST_F(FramingTest, FrameCarriesLengthAndBody) {
    std::string body = R"({"type":0,"payload":null})";
    auto frame = encode_frame(body);

    ASSERT_EQ(frame.size(), config::FRAME_HEADER_SIZE + body.size());

    FrameHeader header;
    std::copy(frame.begin(), frame.begin() + 4, header.begin());
    EXPECT_EQ(decode_frame_header(header), body.size());
    EXPECT_EQ(std::string(frame.begin() + 4, frame.end()), body);
}

TEST_F(FramingTest, EmptyBody) {
    auto frame = encode_frame("");
    ASSERT_EQ(frame.size(), 4u);
    EXPECT_EQ(frame[0], 0);
    EXPECT_EQ(frame[3], 0);
}

TEST_F(FramingTest, OversizedBodyRejected) {
    std::string body(config::MAX_FRAME_SIZE + 1, 'x');

    try {
        encode_frame(body);
        FAIL() << "Expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
    }
}

TEST_F(FramingTest, LengthLimit) {
    EXPECT_TRUE(frame_length_valid(0));
    EXPECT_TRUE(frame_length_valid(static_cast<uint32_t>(config::MAX_FRAME_SIZE)));
    EXPECT_FALSE(frame_length_valid(static_cast<uint32_t>(config::MAX_FRAME_SIZE + 1)));
    EXPECT_FALSE(frame_length_valid(0xffffffffu));
}

TEST_F(FramingTest, MessageFrameDecodesBack) {
    Message msg = MessageHelpers::make_message(MessageType::NODE_DISCOVERY);
    auto frame = encode_message_frame(msg);

    std::string body(frame.begin() + 4, frame.end());
    auto decoded = Message::from_json(body);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::NODE_DISCOVERY);
}
