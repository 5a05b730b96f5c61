/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for meshfs
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "meshfs/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sodium.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <unistd.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <ifaddrs.h>

// OpenSSL for SHA-256
#include <openssl/evp.h>

namespace meshfs {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }

    void ensure_sodium() {
        // sodium_init() is idempotent; a negative result means the library is unusable
        if (sodium_init() < 0) {
            throw std::runtime_error("libsodium initialization failed");
        }
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto new_logger = std::make_shared<spdlog::logger>("meshfs", sinks.begin(), sinks.end());
        new_logger->set_level(to_spdlog_level(level));
        new_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            g_logger = new_logger;
        }

        // Register as default logger
        spdlog::set_default_logger(new_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(trim_string(name));

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "debug";
        case LogLevel::INFO:     return "info";
        case LogLevel::WARN:     return "warn";
        case LogLevel::ERROR:    return "error";
        case LogLevel::CRITICAL: return "critical";
        default:                 return "info";
    }
}

void log(LogLevel level, const std::string& message) {
    auto current = logger();
    if (!current) {
        initialize_logging();
        current = logger();
        if (!current) {
            return;
        }
    }

    switch (level) {
        case LogLevel::DEBUG:    current->debug(message); break;
        case LogLevel::INFO:     current->info(message); break;
        case LogLevel::WARN:     current->warn(message); break;
        case LogLevel::ERROR:    current->error(message); break;
        case LogLevel::CRITICAL: current->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// HASHING FUNCTIONS
// ============================================================================

Sha256Stream::Sha256Stream()
    : ctx_(nullptr)
    , finalized_(false)
{
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("Failed to allocate SHA-256 context");
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    ctx_ = static_cast<void*>(ctx);
}

Sha256Stream::~Sha256Stream() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

void Sha256Stream::update(const uint8_t* data, size_t size) {
    if (finalized_) {
        throw std::logic_error("Sha256Stream: update after finalize");
    }
    if (size == 0) {
        return;
    }

    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256Stream::finalize_hex() {
    if (finalized_) {
        throw std::logic_error("Sha256Stream: already finalized");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
    finalized_ = true;

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    }

    return oss.str();
}

std::string calculate_sha256(const uint8_t* data, size_t size) {
    Sha256Stream hasher;
    hasher.update(data, size);
    return hasher.finalize_hex();
}

std::string calculate_sha256(const std::vector<uint8_t>& data) {
    return calculate_sha256(data.data(), data.size());
}

// ============================================================================
// FORMATTING FUNCTIONS
// ============================================================================

std::string format_timestamp(uint64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_file_size(uint64_t size) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size_d = static_cast<double>(size);

    while (size_d >= 1024.0 && unit_index < 4) {
        size_d /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size_d << " " << units[unit_index];
    return oss.str();
}

std::string format_duration(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = (seconds % 3600) / 60;
    uint64_t secs = seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m " << secs << "s";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::in);
        if (!file.is_open()) {
            log_error("Failed to open file for reading: " + file_path);
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();

    } catch (const std::exception& ex) {
        log_error("Exception reading file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            return std::nullopt;
        }

        auto size = file.tellg();
        if (size < 0) {
            log_error("Failed to determine size of file: " + file_path);
            return std::nullopt;
        }
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            log_error("Failed to read binary file: " + file_path);
            return std::nullopt;
        }

        return buffer;

    } catch (const std::exception& ex) {
        log_error("Exception reading binary file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

bool write_file_binary(const std::string& file_path, const uint8_t* data, size_t size) {
    try {
        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            log_error("Failed to open file for binary writing: " + file_path);
            return false;
        }

        file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        return file.good();

    } catch (const std::exception& ex) {
        log_error("Exception writing binary file " + file_path + ": " + ex.what());
        return false;
    }
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }

    return result;
}

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string bytes_to_base64(const std::vector<uint8_t>& bytes) {
    ensure_sodium();

    const size_t encoded_len = sodium_base64_encoded_len(
        bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');

    sodium_bin2base64(
        encoded.data(), encoded_len,
        bytes.data(), bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    // Drop the trailing NUL written by libsodium
    encoded.resize(encoded_len - 1);
    return encoded;
}

std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64) {
    ensure_sodium();

    std::vector<uint8_t> decoded(base64.size() / 4 * 3 + 3);
    size_t decoded_len = 0;

    int rc = sodium_base642bin(
        decoded.data(), decoded.size(),
        base64.data(), base64.size(),
        nullptr, &decoded_len, nullptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (rc != 0) {
        return std::nullopt;
    }

    decoded.resize(decoded_len);
    return decoded;
}

std::string generate_random_hex(size_t num_bytes) {
    ensure_sodium();

    std::vector<uint8_t> bytes(num_bytes);
    randombytes_buf(bytes.data(), bytes.size());

    std::string hex(num_bytes * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(num_bytes * 2);

    return hex;
}

// ============================================================================
// ENVIRONMENT/NETWORK FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::vector<std::string> get_local_ip_addresses() {
    std::vector<std::string> addresses;

    struct ifaddrs *ifaddr, *ifa;

    if (getifaddrs(&ifaddr) == -1) {
        return addresses;
    }

    for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;

        int family = ifa->ifa_addr->sa_family;

        if (family == AF_INET || family == AF_INET6) {
            char host[NI_MAXHOST];

            int result = getnameinfo(ifa->ifa_addr,
                (family == AF_INET) ? sizeof(struct sockaddr_in) : sizeof(struct sockaddr_in6),
                host, NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);

            if (result == 0) {
                // Strip IPv6 zone suffix ("fe80::1%eth0")
                std::string address(host);
                auto zone = address.find('%');
                if (zone != std::string::npos) {
                    address.erase(zone);
                }
                addresses.push_back(address);
            }
        }
    }

    freeifaddrs(ifaddr);

    return addresses;
}

} // namespace utilities
} // namespace meshfs
