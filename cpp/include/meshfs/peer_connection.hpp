/**
 * @file peer_connection.hpp
 * @brief One framed duplex TCP stream to a remote peer
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides:
 * - Length-prefixed message send (one write per frame, serialized per peer)
 * - Blocking exact-length frame receive for the peer's reader thread
 * - Peer state machine (CONNECTING -> ACTIVE -> INACTIVE)
 */

#pragma once

#include "meshfs/message_types.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace meshfs {

/**
 * @brief Lifecycle of a peer connection
 *
 * Allowed transitions: CONNECTING -> ACTIVE, ACTIVE -> INACTIVE,
 * CONNECTING -> INACTIVE. INACTIVE is terminal.
 */
enum class PeerState {
    CONNECTING,
    ACTIVE,
    INACTIVE
};

std::string peer_state_to_string(PeerState state);

/**
 * @brief Check whether a state transition is allowed
 */
bool peer_transition_allowed(PeerState from, PeerState to) noexcept;

/**
 * @brief Plain snapshot of a peer for callers
 */
struct PeerSummary {
    std::string id;             ///< Peer identifier (remote address)
    std::string address;        ///< Remote host:port
    std::string node_id;        ///< Associated node id (may be empty)
    PeerState state;            ///< Current state
    bool inbound;               ///< Accepted by our listener
    uint64_t last_active;       ///< Unix timestamp of last frame in or out
};

void to_json(nlohmann::json& j, const PeerSummary& peer);

/**
 * @brief PeerConnection - framed TCP stream with state tracking
 *
 * Thread model: exactly one reader thread calls receive(); any thread may
 * call send() and close().
 */
class PeerConnection {
public:
    /**
     * @brief Take ownership of a connected socket
     * @param socket Connected TCP socket
     * @param id Peer identifier
     * @param address Remote address (host:port)
     * @param inbound Whether the connection was accepted by our listener
     */
    PeerConnection(asio::ip::tcp::socket socket, std::string id, std::string address, bool inbound);

    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    // ========================================================================
    // State
    // ========================================================================

    /**
     * @brief Move to a new state
     * @return false if the transition is not allowed (state unchanged)
     */
    bool transition_to(PeerState next);

    PeerState state() const;

    bool is_active() const { return state() == PeerState::ACTIVE; }

    const std::string& id() const { return id_; }
    const std::string& address() const { return address_; }
    bool is_inbound() const { return inbound_; }

    std::string node_id() const;
    void set_node_id(const std::string& node_id);

    uint64_t last_active() const { return last_active_.load(); }

    PeerSummary summary() const;

    // ========================================================================
    // I/O
    // ========================================================================

    /**
     * @brief Send one framed message
     *
     * On write failure the peer is marked INACTIVE and its socket shut down.
     *
     * @return true if the whole frame was written
     */
    bool send(const Message& message);

    /**
     * @brief Block until one frame has been read
     *
     * @return Decoded message, or std::nullopt if the frame body is not a
     *         valid envelope (the stream stays usable)
     * @throws MeshError CONNECTION_LOST on EOF, short read, socket error or
     *         a frame above MAX_FRAME_SIZE
     */
    std::optional<Message> receive();

    /**
     * @brief Shut down the socket and mark INACTIVE
     *
     * Unblocks a pending receive() and a send() blocked on a full buffer.
     * Never waits for an in-flight send. Safe to call more than once.
     */
    void close();

private:
    asio::ip::tcp::socket socket_;
    const std::string id_;
    const std::string address_;
    const bool inbound_;

    PeerState state_;
    std::string node_id_;
    std::atomic<uint64_t> last_active_;
    std::atomic<bool> shut_down_;

    mutable std::mutex state_mutex_;
    std::mutex write_mutex_;

    void touch();
};

} // namespace meshfs
