/**
 * @file peer_connection.cpp
 * @brief Implementation of framed peer connections
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/peer_connection.hpp"
#include "meshfs/errors.hpp"
#include "meshfs/framing.hpp"
#include "meshfs/utilities.hpp"

using json = nlohmann::json;

namespace meshfs {

// ============================================================================
// PeerState
// ============================================================================

std::string peer_state_to_string(PeerState state) {
    switch (state) {
        case PeerState::CONNECTING: return "connecting";
        case PeerState::ACTIVE: return "active";
        case PeerState::INACTIVE: return "inactive";
        default: return "unknown";
    }
}

bool peer_transition_allowed(PeerState from, PeerState to) noexcept {
    switch (from) {
        case PeerState::CONNECTING:
            return to == PeerState::ACTIVE || to == PeerState::INACTIVE;
        case PeerState::ACTIVE:
            return to == PeerState::INACTIVE;
        default:
            return false;
    }
}

void to_json(json& j, const PeerSummary& peer) {
    j = json{
        {"id", peer.id},
        {"address", peer.address},
        {"node_id", peer.node_id},
        {"state", peer_state_to_string(peer.state)},
        {"inbound", peer.inbound},
        {"last_active", peer.last_active}
    };
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

PeerConnection::PeerConnection(asio::ip::tcp::socket socket, std::string id, std::string address, bool inbound)
    : socket_(std::move(socket))
    , id_(std::move(id))
    , address_(std::move(address))
    , inbound_(inbound)
    , state_(PeerState::CONNECTING)
    , last_active_(MessageHelpers::get_current_timestamp())
    , shut_down_(false)
{
    asio::error_code ec;
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

PeerConnection::~PeerConnection() {
    close();

    asio::error_code ec;
    socket_.close(ec);
}

// ============================================================================
// State
// ============================================================================

bool PeerConnection::transition_to(PeerState next) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (!peer_transition_allowed(state_, next)) {
        return false;
    }
    state_ = next;
    return true;
}

PeerState PeerConnection::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string PeerConnection::node_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return node_id_;
}

void PeerConnection::set_node_id(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    node_id_ = node_id;
}

PeerSummary PeerConnection::summary() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    PeerSummary summary;
    summary.id = id_;
    summary.address = address_;
    summary.node_id = node_id_;
    summary.state = state_;
    summary.inbound = inbound_;
    summary.last_active = last_active_.load();
    return summary;
}

void PeerConnection::touch() {
    last_active_.store(MessageHelpers::get_current_timestamp());
}

// ============================================================================
// I/O
// ============================================================================

bool PeerConnection::send(const Message& message) {
    std::vector<uint8_t> frame;
    try {
        frame = encode_message_frame(message);
    } catch (const MeshError& e) {
        utilities::log_error("PeerConnection " + id_ + ": " + e.what());
        return false;
    }

    asio::error_code ec;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (shut_down_.load()) {
            return false;
        }
        asio::write(socket_, asio::buffer(frame), ec);
    }

    if (ec) {
        utilities::log_warn("PeerConnection " + id_ + ": send failed: " + ec.message());
        close();
        return false;
    }

    touch();
    return true;
}

std::optional<Message> PeerConnection::receive() {
    FrameHeader header;
    asio::error_code ec;

    asio::read(socket_, asio::buffer(header), ec);
    if (ec) {
        throw MeshError(ErrorKind::CONNECTION_LOST, "read frame header: " + ec.message());
    }

    uint32_t length = decode_frame_header(header);
    if (!frame_length_valid(length)) {
        throw MeshError(ErrorKind::CONNECTION_LOST,
            "frame of " + std::to_string(length) + " bytes exceeds limit");
    }

    std::string body(length, '\0');
    if (length > 0) {
        asio::read(socket_, asio::buffer(&body[0], body.size()), ec);
        if (ec) {
            throw MeshError(ErrorKind::CONNECTION_LOST, "read frame body: " + ec.message());
        }
    }

    touch();
    return Message::from_json(body);
}

void PeerConnection::close() {
    transition_to(PeerState::INACTIVE);

    // Shutdown wakes a blocked reader and a writer blocked on a full send buffer,
    // so it must not wait for write_mutex_. The descriptor is released in the destructor
    if (shut_down_.exchange(true)) {
        return;
    }

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
}

} // namespace meshfs
