/**
 * @file framing.cpp
 * @brief Implementation of length-prefixed framing
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/framing.hpp"
#include "meshfs/errors.hpp"

namespace meshfs {

FrameHeader encode_frame_header(uint32_t body_length) noexcept {
    FrameHeader header;
    header[0] = static_cast<uint8_t>((body_length >> 24) & 0xffu);
    header[1] = static_cast<uint8_t>((body_length >> 16) & 0xffu);
    header[2] = static_cast<uint8_t>((body_length >> 8) & 0xffu);
    header[3] = static_cast<uint8_t>((body_length >> 0) & 0xffu);
    return header;
}

uint32_t decode_frame_header(const FrameHeader& header) noexcept {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           (static_cast<uint32_t>(header[3]) << 0);
}

std::vector<uint8_t> encode_frame(const std::string& body) {
    if (body.size() > config::MAX_FRAME_SIZE) {
        throw MeshError(ErrorKind::INVALID_INPUT,
            "Frame body of " + std::to_string(body.size()) + " bytes exceeds limit");
    }

    FrameHeader header = encode_frame_header(static_cast<uint32_t>(body.size()));

    std::vector<uint8_t> frame;
    frame.reserve(header.size() + body.size());
    frame.insert(frame.end(), header.begin(), header.end());
    frame.insert(frame.end(), body.begin(), body.end());

    return frame;
}

std::vector<uint8_t> encode_message_frame(const Message& message) {
    return encode_frame(message.to_json());
}

} // namespace meshfs
