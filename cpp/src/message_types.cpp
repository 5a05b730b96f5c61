/**
 * @file message_types.cpp
 * @brief Implementation of message types and serialization
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/message_types.hpp"
#include "meshfs/utilities.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;

namespace meshfs {

// ============================================================================
// Message Type Conversion
// ============================================================================

std::string MessageHelpers::message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::PING: return "PING";
        case MessageType::PONG: return "PONG";
        case MessageType::NODE_DISCOVERY: return "NODE_DISCOVERY";
        case MessageType::NODE_ANNOUNCEMENT: return "NODE_ANNOUNCEMENT";
        case MessageType::FILE_REQUEST: return "FILE_REQUEST";
        case MessageType::FILE_INFO: return "FILE_INFO";
        case MessageType::FILE_CHUNK: return "FILE_CHUNK";
        case MessageType::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<MessageType> MessageHelpers::message_type_from_int(int64_t value) {
    if (value < static_cast<int64_t>(MessageType::PING) ||
        value > static_cast<int64_t>(MessageType::ERROR)) {
        return std::nullopt;
    }
    return static_cast<MessageType>(value);
}

// ============================================================================
// Message Helpers
// ============================================================================

Message MessageHelpers::make_message(MessageType type) {
    Message message;
    message.type = type;
    return message;
}

Message MessageHelpers::make_message(MessageType type, const std::string& payload) {
    Message message;
    message.type = type;
    message.payload.assign(payload.begin(), payload.end());
    return message;
}

std::string MessageHelpers::payload_as_string(const Message& message) {
    return std::string(message.payload.begin(), message.payload.end());
}

uint64_t MessageHelpers::get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

// ============================================================================
// Envelope Serialization
// ============================================================================

std::string Message::to_json() const {
    json j;
    j["type"] = static_cast<int>(type);

    // An empty payload is encoded as null
    if (payload.empty()) {
        j["payload"] = nullptr;
    } else {
        j["payload"] = utilities::bytes_to_base64(payload);
    }

    return j.dump();
}

std::optional<Message> Message::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        if (!j.is_object() || !j.contains("type") || !j["type"].is_number_integer()) {
            return std::nullopt;
        }

        auto type_opt = MessageHelpers::message_type_from_int(j["type"].get<int64_t>());
        if (!type_opt) {
            return std::nullopt;
        }

        Message msg;
        msg.type = *type_opt;

        if (j.contains("payload") && !j["payload"].is_null()) {
            if (!j["payload"].is_string()) {
                return std::nullopt;
            }

            auto payload_opt = utilities::base64_to_bytes(j["payload"].get<std::string>());
            if (!payload_opt) {
                return std::nullopt;
            }
            msg.payload = std::move(*payload_opt);
        }

        return msg;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// NodeAnnouncement
// ============================================================================

std::string NodeAnnouncement::to_json() const {
    json j = addresses;
    return j.dump();
}

std::optional<NodeAnnouncement> NodeAnnouncement::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        NodeAnnouncement announcement;

        // An empty address list may arrive as null
        if (j.is_null()) {
            return announcement;
        }

        if (!j.is_array()) {
            return std::nullopt;
        }

        for (const auto& entry : j) {
            if (!entry.is_string()) {
                return std::nullopt;
            }
            announcement.addresses.push_back(entry.get<std::string>());
        }

        return announcement;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace meshfs
