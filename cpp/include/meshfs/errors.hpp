/**
 * @file errors.hpp
 * @brief Error kinds reported by meshfs operations
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <stdexcept>
#include <string>

namespace meshfs {

/**
 * @brief Classification of a failed operation
 */
enum class ErrorKind {
    NOT_FOUND,        ///< Unknown node, peer, chunk or file
    CONFLICT,         ///< Address bound to a different node id
    INVALID_INPUT,    ///< Malformed address, bad status, out-of-range value, non-dense indices
    IO_FAILURE,       ///< Wrapped filesystem or socket error
    PROTOCOL_ERROR,   ///< Single-message decode failure (non-fatal)
    CONNECTION_LOST   ///< Fatal to one peer connection
};

/**
 * @brief Convert ErrorKind to its canonical name
 */
inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        case ErrorKind::CONFLICT: return "CONFLICT";
        case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorKind::IO_FAILURE: return "IO_FAILURE";
        case ErrorKind::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case ErrorKind::CONNECTION_LOST: return "CONNECTION_LOST";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Exception thrown by registry, store and overlay operations
 */
class MeshError : public std::runtime_error {
public:
    MeshError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace meshfs
