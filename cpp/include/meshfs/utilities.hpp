/**
 * @file utilities.hpp
 * @brief Common utility functions for meshfs
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout meshfs:
 * - Logging and error reporting
 * - Content hashing (SHA-256)
 * - Time and size formatting
 * - File I/O helpers
 * - Encoding and random identifiers
 * - Network helpers
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace meshfs {
namespace utilities {

/**
 * @brief Log levels for meshfs logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Canonical lowercase level name
 */
std::string log_level_to_string(LogLevel level);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief Incremental SHA-256 digest (OpenSSL EVP)
 *
 * Used wherever content addressing needs to hash data that is read
 * in pieces, e.g. a whole file during chunk splitting.
 */
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    /**
     * @brief Feed bytes into the digest
     */
    void update(const uint8_t* data, size_t size);

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest (64 characters)
     */
    std::string finalize_hex();

private:
    void* ctx_;
    bool finalized_;
};

/**
 * @brief SHA-256 of a byte buffer
 * @return Lowercase hex digest
 */
std::string calculate_sha256(const uint8_t* data, size_t size);

/**
 * @brief SHA-256 of a byte vector
 * @return Lowercase hex digest
 */
std::string calculate_sha256(const std::vector<uint8_t>& data);

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp Unix timestamp (seconds since epoch)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Format file size in human-readable format
 * @param size Size in bytes
 * @return Formatted string (e.g., "1.5 MB", "3.2 GB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Format an uptime as "1h 2m 3s"
 */
std::string format_duration(uint64_t seconds);

// ============================================================================
// File I/O
// ============================================================================

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Read entire file into byte vector
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path);

/**
 * @brief Write byte buffer to file, truncating it
 *
 * Parent directories are not created.
 *
 * @return true if successful, false otherwise
 */
bool write_file_binary(const std::string& file_path, const uint8_t* data, size_t size);

// ============================================================================
// Strings and encoding
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter);

std::string trim_string(const std::string& str);

std::string to_lowercase(const std::string& str);

/**
 * @brief Encode bytes as standard base64 (libsodium)
 */
std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode standard base64 (libsodium)
 * @return Decoded bytes or std::nullopt if input is not valid base64
 */
std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

/**
 * @brief Generate random identifier from a CSPRNG (libsodium)
 * @param num_bytes Number of random bytes
 * @return Lowercase hex string of 2 * num_bytes characters
 */
std::string generate_random_hex(size_t num_bytes);

// ============================================================================
// Environment / network
// ============================================================================

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Get IP addresses of current machine
 * @return Vector of numeric IP address strings (IPv4 and IPv6)
 */
std::vector<std::string> get_local_ip_addresses();

} // namespace utilities
} // namespace meshfs
