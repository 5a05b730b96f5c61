/**
 * @file storage_config.hpp
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

namespace meshfs {
namespace config {

// ============================================================================
// Chunking
// ============================================================================

/// Default chunk size (64KB)
constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

/// Maximum chunk size (1MB)
constexpr size_t MAX_CHUNK_SIZE = 1024 * 1024;

// ============================================================================
// Wire protocol
// ============================================================================

/// Length prefix size in bytes (big-endian uint32)
constexpr size_t FRAME_HEADER_SIZE = 4;

/// Largest frame body accepted from a peer (16MB)
constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

/// TCP dial timeout, the only explicit timeout in the overlay
constexpr auto DIAL_TIMEOUT = std::chrono::seconds(5);

// ============================================================================
// Node defaults
// ============================================================================

/// Default P2P listen port
constexpr uint16_t DEFAULT_P2P_PORT = 9000;

/// Configured peer ceiling (advisory, not enforced)
constexpr size_t DEFAULT_MAX_PEERS = 50;

/// Interval between maintenance rounds (snapshot save, discovery)
constexpr auto MAINTENANCE_INTERVAL = std::chrono::seconds(30);

/// Bootstrap dial attempts per configured peer
constexpr int BOOTSTRAP_ATTEMPTS = 3;

/// Delay between bootstrap dial attempts
constexpr auto BOOTSTRAP_RETRY_DELAY = std::chrono::seconds(2);

/// Random bytes in a generated node id
constexpr size_t NODE_ID_BYTES = 8;

/// Maximum identifier length (node id, file id, chunk id)
constexpr size_t MAX_IDENTIFIER_LENGTH = 128;

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Chunk directory under a data directory
 */
std::filesystem::path get_chunks_directory(const std::filesystem::path& data_dir);

/**
 * @brief Node registry database path under a data directory
 */
std::filesystem::path get_database_path(const std::filesystem::path& data_dir);

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Host and port parsed from "host:port" or "[v6]:port"
 */
struct NetworkAddress {
    std::string host;
    uint16_t port;

    std::string to_string() const;
};

/**
 * @brief Parse a peer/node address
 * @param address "host:port", "[ipv6]:port"
 * @return Parsed address or std::nullopt if malformed (empty host, bad or zero port)
 */
std::optional<NetworkAddress> parse_address(const std::string& address);

/**
 * @brief Check that an address is well-formed
 */
bool validate_address(const std::string& address);

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen/dot/colon, no leading dot)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Check that a name can be used as a single path component
 *
 * Rejects empty names, "." and "..", and anything containing a separator.
 */
bool is_safe_path_component(const std::string& name);

} // namespace config
} // namespace meshfs
