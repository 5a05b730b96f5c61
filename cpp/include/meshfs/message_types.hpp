/**
 * @file message_types.hpp
 * @brief Message type definitions and serialization for meshfs
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wire envelope carried in every frame:
 *   {"type": <integer>, "payload": <base64 bytes or null>}
 *
 * Payload types:
 * - Liveness (PING / PONG, empty payload)
 * - Discovery (NODE_DISCOVERY request, NODE_ANNOUNCEMENT address list)
 * - File transfer (reserved, no handlers)
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace meshfs {

/**
 * @brief Message types in the meshfs peer protocol
 *
 * Values are the integer discriminators used on the wire.
 */
enum class MessageType : int {
    // Liveness
    PING = 0,                ///< Connectivity check, answered with PONG
    PONG = 1,                ///< Reply to PING

    // Discovery
    NODE_DISCOVERY = 2,      ///< Ask a peer for its active peer addresses
    NODE_ANNOUNCEMENT = 3,   ///< List of active peer addresses

    // File transfer (reserved)
    FILE_REQUEST = 4,
    FILE_INFO = 5,
    FILE_CHUNK = 6,

    ERROR = 7                ///< Error report
};

/**
 * @brief Envelope for all peer messages
 */
struct Message {
    MessageType type;               ///< Message type
    std::vector<uint8_t> payload;   ///< Opaque payload bytes

    /**
     * @brief Serialize message to JSON
     * @return JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize message from JSON
     * @param json JSON string
     * @return Message or std::nullopt if invalid
     */
    static std::optional<Message> from_json(const std::string& json);
};

/**
 * @brief Node announcement payload: addresses of the sender's active peers
 */
struct NodeAnnouncement {
    std::vector<std::string> addresses;

    std::string to_json() const;
    static std::optional<NodeAnnouncement> from_json(const std::string& json);
};

/**
 * @brief Helper functions for message handling
 */
class MessageHelpers {
public:
    /**
     * @brief Convert MessageType enum to string
     * @param type Message type
     * @return String representation
     */
    static std::string message_type_to_string(MessageType type);

    /**
     * @brief Convert a wire discriminator to MessageType
     * @param value Integer type field
     * @return MessageType or std::nullopt if not a known type
     */
    static std::optional<MessageType> message_type_from_int(int64_t value);

    /**
     * @brief Build a message with an empty payload
     */
    static Message make_message(MessageType type);

    /**
     * @brief Build a message whose payload is the bytes of a string
     */
    static Message make_message(MessageType type, const std::string& payload);

    /**
     * @brief Payload bytes as a string
     */
    static std::string payload_as_string(const Message& message);

    /**
     * @brief Get current timestamp in seconds since epoch
     * @return Unix timestamp
     */
    static uint64_t get_current_timestamp();
};

} // namespace meshfs
