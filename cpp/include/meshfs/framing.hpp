/**
 * @file framing.hpp
 * @brief Length-prefixed framing for the meshfs peer stream
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Frame layout (network byte order):
 *   0..3   body length (uint32, big-endian)
 *   4..    body (JSON message envelope)
 */

#pragma once

#include "meshfs/message_types.hpp"
#include "meshfs/storage_config.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace meshfs {

using FrameHeader = std::array<uint8_t, config::FRAME_HEADER_SIZE>;

/**
 * @brief Encode a body length as a big-endian header
 */
FrameHeader encode_frame_header(uint32_t body_length) noexcept;

/**
 * @brief Decode a big-endian header
 */
uint32_t decode_frame_header(const FrameHeader& header) noexcept;

/**
 * @brief Build one complete frame (header + body) in a single buffer
 *
 * A single buffer lets the writer emit each frame with one write call.
 *
 * @throws MeshError INVALID_INPUT if the body exceeds MAX_FRAME_SIZE
 */
std::vector<uint8_t> encode_frame(const std::string& body);

/**
 * @brief Serialize a message envelope and frame it
 */
std::vector<uint8_t> encode_message_frame(const Message& message);

/**
 * @brief Check a decoded length against the frame limit
 */
inline bool frame_length_valid(uint32_t body_length) noexcept {
    return body_length <= config::MAX_FRAME_SIZE;
}

} // namespace meshfs
