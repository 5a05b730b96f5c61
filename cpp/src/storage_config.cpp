/**
 * @file storage_config.cpp
 * @brief Implementation of configuration constants helpers and validation functions
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/storage_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <charconv>

namespace meshfs {
namespace config {

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_chunks_directory(const std::filesystem::path& data_dir) {
    return data_dir / "chunks";
}

std::filesystem::path get_database_path(const std::filesystem::path& data_dir) {
    return data_dir / "nodes.db";
}

// ============================================================================
// Validation
// ============================================================================

std::string NetworkAddress::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::optional<NetworkAddress> parse_address(const std::string& address) {
    if (address.empty() || address.size() > 512) {
        return std::nullopt;
    }

    std::string host;
    std::string port_str;

    if (address.front() == '[') {
        // Bracketed IPv6 literal
        auto close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            return std::nullopt;
        }
        host = address.substr(1, close - 1);
        port_str = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        host = address.substr(0, colon);
        port_str = address.substr(colon + 1);

        // Unbracketed host must not contain further colons
        if (host.find(':') != std::string::npos) {
            return std::nullopt;
        }
    }

    if (host.empty() || port_str.empty()) {
        return std::nullopt;
    }

    for (char c : host) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '/' || c == '?' || c == '#' || c == '@') {
            return std::nullopt;
        }
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc() || ptr != port_str.data() + port_str.size()) {
        return std::nullopt;
    }
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }

    return NetworkAddress{host, static_cast<uint16_t>(port)};
}

bool validate_address(const std::string& address) {
    return parse_address(address).has_value();
}

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    if (identifier.front() == '.') {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.' && c != ':') {
            return false;
        }
    }

    return true;
}

bool is_safe_path_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }

    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return false;
    }

    // Embedded NUL would truncate the path at the OS boundary
    if (name.find('\0') != std::string::npos) {
        return false;
    }

    return true;
}

} // namespace config
} // namespace meshfs
