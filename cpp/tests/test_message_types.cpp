/**
 * @file test_message_types.cpp
 * @brief Unit tests for message types and envelope serialization
 *
 * Tests message serialization including:
 * - Message type conversion
 * - Envelope JSON encoding/decoding
 * - Node announcement payloads
 * - Malformed input handling
 */

#include <gtest/gtest.h>
#include "meshfs/message_types.hpp"
#include <nlohmann/json.hpp>
#include <vector>

using namespace meshfs;

// Test fixture for message types tests
class MessageTypesTest : public ::testing::Test {
protected:
    Message make_binary_message() {
        Message msg;
        msg.type = MessageType::FILE_CHUNK;
        msg.payload = {0x00, 0x01, 0xfe, 0xff, 0x7f};
        return msg;
    }
};

// ============================================================================
// MessageType Enum Tests
// ============================================================================

TEST_F(MessageTypesTest, MessageTypeToString) {
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::PING), "PING");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::NODE_DISCOVERY), "NODE_DISCOVERY");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::NODE_ANNOUNCEMENT), "NODE_ANNOUNCEMENT");
    EXPECT_EQ(MessageHelpers::message_type_to_string(MessageType::ERROR), "ERROR");
}

TEST_F(MessageTypesTest, WireDiscriminators) {
    EXPECT_EQ(static_cast<int>(MessageType::PING), 0);
    EXPECT_EQ(static_cast<int>(MessageType::PONG), 1);
    EXPECT_EQ(static_cast<int>(MessageType::NODE_DISCOVERY), 2);
    EXPECT_EQ(static_cast<int>(MessageType::NODE_ANNOUNCEMENT), 3);
    EXPECT_EQ(static_cast<int>(MessageType::FILE_REQUEST), 4);
    EXPECT_EQ(static_cast<int>(MessageType::FILE_INFO), 5);
    EXPECT_EQ(static_cast<int>(MessageType::FILE_CHUNK), 6);
    EXPECT_EQ(static_cast<int>(MessageType::ERROR), 7);
}

TEST_F(MessageTypesTest, MessageTypeFromInt) {
    auto type = MessageHelpers::message_type_from_int(3);
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ(*type, MessageType::NODE_ANNOUNCEMENT);
}

TEST_F(MessageTypesTest, MessageTypeFromIntOutOfRange) {
    EXPECT_FALSE(MessageHelpers::message_type_from_int(-1).has_value());
    EXPECT_FALSE(MessageHelpers::message_type_from_int(8).has_value());
    EXPECT_FALSE(MessageHelpers::message_type_from_int(1000).has_value());
}

// ============================================================================
// Envelope Tests
// ============================================================================

TEST_F(MessageTypesTest, EmptyPayloadEncodesAsNull) {
    Message msg = MessageHelpers::make_message(MessageType::PING);

    auto j = nlohmann::json::parse(msg.to_json());
    EXPECT_EQ(j["type"].get<int>(), 0);
    EXPECT_TRUE(j["payload"].is_null());
}

TEST_F(MessageTypesTest, PayloadEncodesAsBase64) {
    Message msg = MessageHelpers::make_message(MessageType::FILE_REQUEST, "hello");

    auto j = nlohmann::json::parse(msg.to_json());
    EXPECT_EQ(j["type"].get<int>(), 4);
    EXPECT_EQ(j["payload"].get<std::string>(), "aGVsbG8=");
}

TEST_F(MessageTypesTest, BinaryPayloadSurvivesEnvelope) {
    Message msg = make_binary_message();

    auto decoded = Message::from_json(msg.to_json());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::FILE_CHUNK);
    EXPECT_EQ(decoded->payload, msg.payload);
}

TEST_F(MessageTypesTest, DecodeWithoutPayloadField) {
    auto decoded = Message::from_json(R"({"type":1})");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->type, MessageType::PONG);
    EXPECT_TRUE(decoded->payload.empty());
}

TEST_F(MessageTypesTest, DecodeRejectsGarbage) {
    EXPECT_FALSE(Message::from_json("").has_value());
    EXPECT_FALSE(Message::from_json("not json").has_value());
    EXPECT_FALSE(Message::from_json("[1,2,3]").has_value());
}

TEST_F(MessageTypesTest, DecodeRejectsUnknownType) {
    EXPECT_FALSE(Message::from_json(R"({"type":42,"payload":null})").has_value());
}

TEST_F(MessageTypesTest, DecodeRejectsNonIntegerType) {
    EXPECT_FALSE(Message::from_json(R"({"type":"PING","payload":null})").has_value());
    EXPECT_FALSE(Message::from_json(R"({"payload":null})").has_value());
}

TEST_F(MessageTypesTest, DecodeRejectsBadPayload) {
    EXPECT_FALSE(Message::from_json(R"({"type":0,"payload":"%%%"})").has_value());
    EXPECT_FALSE(Message::from_json(R"({"type":0,"payload":17})").has_value());
}

TEST_F(MessageTypesTest, PayloadAsString) {
    Message msg = MessageHelpers::make_message(MessageType::ERROR, "disk full");
    EXPECT_EQ(MessageHelpers::payload_as_string(msg), "disk full");
}

// ============================================================================
// NodeAnnouncement Tests
// ============================================================================

TEST_F(MessageTypesTest, AnnouncementIsJsonArray) {
    NodeAnnouncement announcement;
    announcement.addresses = {"10.0.0.1:9000", "10.0.0.2:9001"};

    auto j = nlohmann::json::parse(announcement.to_json());
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0].get<std::string>(), "10.0.0.1:9000");
}

TEST_F(MessageTypesTest, AnnouncementDecode) {
    auto decoded = NodeAnnouncement::from_json(R"(["a:1","b:2"])");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->addresses.size(), 2u);
    EXPECT_EQ(decoded->addresses[1], "b:2");
}

TEST_F(MessageTypesTest, AnnouncementNullIsEmpty) {
    auto decoded = NodeAnnouncement::from_json("null");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->addresses.empty());
}

TEST_F(MessageTypesTest, AnnouncementRejectsNonStrings) {
    EXPECT_FALSE(NodeAnnouncement::from_json(R"(["a:1", 5])").has_value());
    EXPECT_FALSE(NodeAnnouncement::from_json(R"({"addresses":[]})").has_value());
    EXPECT_FALSE(NodeAnnouncement::from_json("[").has_value());
}

TEST_F(MessageTypesTest, AnnouncementInsideEnvelope) {
    NodeAnnouncement announcement;
    announcement.addresses = {"127.0.0.1:9100"};

    Message msg = MessageHelpers::make_message(MessageType::NODE_ANNOUNCEMENT, announcement.to_json());
    auto decoded = Message::from_json(msg.to_json());
    ASSERT_TRUE(decoded.has_value());

    auto inner = NodeAnnouncement::from_json(MessageHelpers::payload_as_string(*decoded));
    ASSERT_TRUE(inner.has_value());
    EXPECT_EQ(inner->addresses, announcement.addresses);
}

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST_F(MessageTypesTest, GetCurrentTimestamp) {
    uint64_t ts1 = MessageHelpers::get_current_timestamp();
    uint64_t ts2 = MessageHelpers::get_current_timestamp();

    EXPECT_GT(ts1, 1700000000u);
    EXPECT_GE(ts2, ts1);
}
