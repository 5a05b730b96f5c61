/**
 * @file overlay.hpp
 * @brief Peer-to-peer overlay: live peer set, message dispatch, flood discovery
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides:
 * - TCP listener with unbounded accept loop (ASIO)
 * - Outbound dial with a fixed timeout, idempotent per address
 * - One reader thread per peer, dispatching to a type -> handler table
 * - Fire-and-forget broadcast on a background pool
 * - Flood discovery (NODE_DISCOVERY / NODE_ANNOUNCEMENT)
 * - Liveness (PING / PONG) feeding the node registry
 */

#pragma once

#include "meshfs/message_types.hpp"
#include "meshfs/node_registry.hpp"
#include "meshfs/peer_connection.hpp"
#include "meshfs/storage_config.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace meshfs {

/**
 * @brief Handler for one message type
 * @param peer Peer the message arrived from
 * @param message Decoded message
 */
using MessageHandler = std::function<void(
    const std::shared_ptr<PeerConnection>& peer,
    const Message& message
)>;

/**
 * @brief Callback for failures inside background tasks
 * @param task Short task description (e.g. "connect 10.0.0.2:9000")
 * @param error Error text
 */
using BackgroundErrorCallback = std::function<void(
    const std::string& task,
    const std::string& error
)>;

/**
 * @brief Overlay construction options
 */
struct OverlayOptions {
    uint16_t port = config::DEFAULT_P2P_PORT;       ///< Listen port (0 selects an ephemeral port)
    std::string node_id;                            ///< Local node id
    size_t max_peers = config::DEFAULT_MAX_PEERS;   ///< Advisory ceiling, not enforced
    std::chrono::milliseconds dial_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config::DIAL_TIMEOUT);
    size_t io_threads = 2;                          ///< Threads running the io_context
    size_t background_threads = 4;                  ///< Threads in the background pool
};

/**
 * @brief Overlay counters
 */
struct OverlayStats {
    uint64_t frames_received = 0;
    uint64_t decode_failures = 0;
    uint64_t unhandled_messages = 0;
    uint64_t dial_failures = 0;
    uint64_t send_failures = 0;
    uint64_t background_failures = 0;
};

void to_json(nlohmann::json& j, const OverlayStats& stats);

/**
 * @brief Overlay - live peer set keyed by address
 *
 * Thread-safe. Handlers run on the reader thread of the peer the message
 * arrived from; a slow handler delays only that peer.
 */
class Overlay {
public:
    /**
     * @brief Construct overlay bound to a node registry
     * @param options Listener and pool configuration
     * @param registry Registry updated by connect and liveness traffic
     */
    Overlay(OverlayOptions options, NodeRegistry& registry);

    /**
     * @brief Destructor - stops the overlay
     */
    ~Overlay();

    // Disable copy and move
    Overlay(const Overlay&) = delete;
    Overlay& operator=(const Overlay&) = delete;
    Overlay(Overlay&&) = delete;
    Overlay& operator=(Overlay&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Bind the listener, install default handlers, start accepting
     * @throws MeshError IO_FAILURE if the port cannot be bound
     */
    void start();

    /**
     * @brief Close the listener and every peer, join all threads
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Bound listener port (0 before start)
     */
    uint16_t port() const { return bound_port_.load(); }

    const std::string& node_id() const { return options_.node_id; }

    // ========================================================================
    // Peers
    // ========================================================================

    /**
     * @brief Install or replace the handler for a message type
     */
    void register_handler(MessageType type, MessageHandler handler);

    /**
     * @brief Dial a peer, or return the existing active peer for the address
     *
     * On success a node entry is upserted: an address already bound to a
     * node is heartbeated and associated with the peer, otherwise a node
     * with id = address and zero capacity is registered.
     *
     * @param address host:port
     * @return Summary of the active peer
     * @throws MeshError INVALID_INPUT for a malformed address
     * @throws MeshError IO_FAILURE if resolve or dial fails or times out
     */
    PeerSummary connect(const std::string& address);

    /**
     * @brief Close and remove a peer
     * @throws MeshError NOT_FOUND if no such peer
     */
    void disconnect(const std::string& peer_id);

    /**
     * @brief Snapshot of current peers
     */
    std::vector<PeerSummary> list_peers() const;

    /**
     * @brief Number of ACTIVE peers
     */
    size_t active_peer_count() const;

    /**
     * @brief Send a message to one peer
     * @return false if the peer is unknown, inactive, or the write failed
     */
    bool send_to(const std::string& peer_id, const Message& message);

    /**
     * @brief Send to every ACTIVE peer from the background pool
     *
     * Returns immediately. Per-peer failures are logged and counted.
     */
    void broadcast(const Message& message);

    /**
     * @brief Ask every active peer for its peer list
     */
    void discover();

    /**
     * @brief PING every active peer
     */
    void ping_all();

    /**
     * @brief Whether an address names this overlay's own listener
     *
     * True when the port equals the bound port and the host is "localhost",
     * a loopback address, or one of the local interface addresses.
     */
    bool is_self_address(const std::string& address) const;

    void set_background_error_callback(BackgroundErrorCallback callback);

    OverlayStats stats() const;

private:
    OverlayOptions options_;
    NodeRegistry& registry_;

    asio::io_context io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::thread> io_threads_;
    std::unique_ptr<asio::thread_pool> background_pool_;

    std::atomic<bool> running_;
    std::atomic<uint16_t> bound_port_;

    /// Peers keyed by id (remote address)
    std::map<std::string, std::shared_ptr<PeerConnection>> peers_;
    mutable std::shared_mutex peers_mutex_;

    /// Message handlers by type
    std::map<MessageType, MessageHandler> handlers_;
    mutable std::shared_mutex handlers_mutex_;

    /// Live reader threads
    size_t active_readers_;
    std::mutex readers_mutex_;
    std::condition_variable readers_cv_;

    BackgroundErrorCallback background_error_callback_;
    mutable std::mutex callback_mutex_;

    /// Local interface addresses, captured at start
    std::vector<std::string> local_addresses_;

    /// Counters
    std::atomic<uint64_t> frames_received_;
    std::atomic<uint64_t> decode_failures_;
    std::atomic<uint64_t> unhandled_messages_;
    std::atomic<uint64_t> dial_failures_;
    std::atomic<uint64_t> send_failures_;
    std::atomic<uint64_t> background_failures_;

    // ========================================================================
    // Private Methods - Network I/O
    // ========================================================================

    void start_accept();
    void handle_accept(const asio::error_code& error, std::shared_ptr<asio::ip::tcp::socket> socket);
    asio::ip::tcp::socket dial(const config::NetworkAddress& target);
    void spawn_reader(const std::shared_ptr<PeerConnection>& peer);
    void reader_loop(std::shared_ptr<PeerConnection> peer);
    void evict(const std::shared_ptr<PeerConnection>& peer);
    void attach_node(const std::shared_ptr<PeerConnection>& peer);

    // ========================================================================
    // Private Methods - Message Processing
    // ========================================================================

    void install_default_handlers();
    void dispatch(const std::shared_ptr<PeerConnection>& peer, const Message& message);
    void handle_ping(const std::shared_ptr<PeerConnection>& peer, const Message& message);
    void handle_pong(const std::shared_ptr<PeerConnection>& peer, const Message& message);
    void handle_discovery(const std::shared_ptr<PeerConnection>& peer, const Message& message);
    void handle_announcement(const std::shared_ptr<PeerConnection>& peer, const Message& message);
    void heartbeat_peer_node(const std::shared_ptr<PeerConnection>& peer);

    // ========================================================================
    // Private Methods - Background Tasks
    // ========================================================================

    void submit_background(const std::string& task, std::function<void()> work);
    void report_background_failure(const std::string& task, const std::string& error);
    std::vector<std::shared_ptr<PeerConnection>> active_peers() const;
};

} // namespace meshfs
