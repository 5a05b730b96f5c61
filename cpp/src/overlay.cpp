/**
 * @file overlay.cpp
 * @brief Implementation of the peer-to-peer overlay
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Thread-safe peer management with per-peer reader threads
 */

#include "meshfs/overlay.hpp"
#include "meshfs/errors.hpp"
#include "meshfs/utilities.hpp"

#include <algorithm>
#include <future>

using json = nlohmann::json;

namespace meshfs {

void to_json(json& j, const OverlayStats& stats) {
    j = json{
        {"frames_received", stats.frames_received},
        {"decode_failures", stats.decode_failures},
        {"unhandled_messages", stats.unhandled_messages},
        {"dial_failures", stats.dial_failures},
        {"send_failures", stats.send_failures},
        {"background_failures", stats.background_failures}
    };
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

Overlay::Overlay(OverlayOptions options, NodeRegistry& registry)
    : options_(std::move(options))
    , registry_(registry)
    , io_context_()
    , acceptor_(nullptr)
    , background_pool_(nullptr)
    , running_(false)
    , bound_port_(0)
    , active_readers_(0)
    , frames_received_(0)
    , decode_failures_(0)
    , unhandled_messages_(0)
    , dial_failures_(0)
    , send_failures_(0)
    , background_failures_(0)
{
    options_.io_threads = std::max<size_t>(1, options_.io_threads);
    options_.background_threads = std::max<size_t>(1, options_.background_threads);

    install_default_handlers();
}

Overlay::~Overlay() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void Overlay::start() {
    if (running_.exchange(true)) {
        utilities::log_warn("Overlay: already running");
        return;
    }

    try {
        io_context_.restart();
        work_guard_.emplace(asio::make_work_guard(io_context_));

        asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), options_.port);
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        bound_port_ = acceptor_->local_endpoint().port();

        local_addresses_ = utilities::get_local_ip_addresses();
        background_pool_ = std::make_unique<asio::thread_pool>(options_.background_threads);

        start_accept();

        for (size_t i = 0; i < options_.io_threads; ++i) {
            io_threads_.emplace_back([this]() {
                try {
                    io_context_.run();
                } catch (const std::exception& e) {
                    utilities::log_error("Overlay: I/O thread error: " + std::string(e.what()));
                }
            });
        }

    } catch (const std::exception& e) {
        running_ = false;
        work_guard_.reset();
        io_context_.stop();
        for (auto& thread : io_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        io_threads_.clear();
        acceptor_.reset();
        background_pool_.reset();
        bound_port_ = 0;
        throw MeshError(ErrorKind::IO_FAILURE,
            "Failed to listen on port " + std::to_string(options_.port) + ": " + e.what());
    }

    utilities::log_info("Overlay: node " + options_.node_id + " listening on port " +
                        std::to_string(bound_port_.load()));
}

void Overlay::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    utilities::log_info("Overlay: stopping...");

    // Acceptor is only touched from the io_context
    asio::post(io_context_, [this]() {
        asio::error_code ec;
        acceptor_->close(ec);
    });

    // Close every peer; connect() refuses new peers once running_ is false
    std::vector<std::shared_ptr<PeerConnection>> peers;
    {
        std::unique_lock<std::shared_mutex> lock(peers_mutex_);
        for (const auto& [id, peer] : peers_) {
            peers.push_back(peer);
        }
        peers_.clear();
    }
    for (const auto& peer : peers) {
        peer->close();
    }

    {
        std::unique_lock<std::mutex> lock(readers_mutex_);
        readers_cv_.wait(lock, [this]() { return active_readers_ == 0; });
    }

    if (background_pool_) {
        background_pool_->join();
    }

    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();

    acceptor_.reset();
    background_pool_.reset();
    bound_port_ = 0;

    utilities::log_info("Overlay: stopped");
}

// ============================================================================
// Handlers
// ============================================================================

void Overlay::register_handler(MessageType type, MessageHandler handler) {
    std::unique_lock<std::shared_mutex> lock(handlers_mutex_);
    handlers_[type] = std::move(handler);
}

void Overlay::install_default_handlers() {
    register_handler(MessageType::PING,
        [this](const std::shared_ptr<PeerConnection>& peer, const Message& message) {
            handle_ping(peer, message);
        });
    register_handler(MessageType::PONG,
        [this](const std::shared_ptr<PeerConnection>& peer, const Message& message) {
            handle_pong(peer, message);
        });
    register_handler(MessageType::NODE_DISCOVERY,
        [this](const std::shared_ptr<PeerConnection>& peer, const Message& message) {
            handle_discovery(peer, message);
        });
    register_handler(MessageType::NODE_ANNOUNCEMENT,
        [this](const std::shared_ptr<PeerConnection>& peer, const Message& message) {
            handle_announcement(peer, message);
        });
}

void Overlay::set_background_error_callback(BackgroundErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    background_error_callback_ = std::move(callback);
}

// ============================================================================
// Peers
// ============================================================================

PeerSummary Overlay::connect(const std::string& address) {
    auto target = config::parse_address(address);
    if (!target) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Invalid peer address: " + address);
    }

    if (!running_) {
        throw MeshError(ErrorKind::IO_FAILURE, "Overlay not running");
    }

    {
        std::shared_lock<std::shared_mutex> lock(peers_mutex_);
        auto it = peers_.find(address);
        if (it != peers_.end() && it->second->is_active()) {
            return it->second->summary();
        }
    }

    auto peer = std::make_shared<PeerConnection>(dial(*target), address, address, false);

    // Re-check: a concurrent dial to the same address may have won
    std::shared_ptr<PeerConnection> existing;
    std::shared_ptr<PeerConnection> stale;
    {
        std::unique_lock<std::shared_mutex> lock(peers_mutex_);

        if (!running_) {
            peer->close();
            throw MeshError(ErrorKind::IO_FAILURE, "Overlay stopped while connecting to " + address);
        }

        auto it = peers_.find(address);
        if (it != peers_.end() && it->second->is_active()) {
            existing = it->second;
        } else {
            if (it != peers_.end()) {
                stale = it->second;
            }
            peer->transition_to(PeerState::ACTIVE);
            peers_[address] = peer;
            std::lock_guard<std::mutex> readers_lock(readers_mutex_);
            ++active_readers_;
        }
    }

    if (existing) {
        peer->close();
        return existing->summary();
    }
    if (stale) {
        stale->close();
    }

    attach_node(peer);
    spawn_reader(peer);

    utilities::log_info("Overlay: connected to peer " + address);
    return peer->summary();
}

void Overlay::disconnect(const std::string& peer_id) {
    std::shared_ptr<PeerConnection> peer;
    {
        std::unique_lock<std::shared_mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            throw MeshError(ErrorKind::NOT_FOUND, "Peer not found: " + peer_id);
        }
        peer = it->second;
        peers_.erase(it);
    }

    peer->close();
    utilities::log_info("Overlay: disconnected peer " + peer_id);
}

std::vector<PeerSummary> Overlay::list_peers() const {
    std::shared_lock<std::shared_mutex> lock(peers_mutex_);

    std::vector<PeerSummary> result;
    result.reserve(peers_.size());
    for (const auto& [id, peer] : peers_) {
        result.push_back(peer->summary());
    }
    return result;
}

size_t Overlay::active_peer_count() const {
    std::shared_lock<std::shared_mutex> lock(peers_mutex_);
    return static_cast<size_t>(std::count_if(peers_.begin(), peers_.end(),
        [](const auto& entry) { return entry.second->is_active(); }));
}

std::vector<std::shared_ptr<PeerConnection>> Overlay::active_peers() const {
    std::shared_lock<std::shared_mutex> lock(peers_mutex_);

    std::vector<std::shared_ptr<PeerConnection>> result;
    for (const auto& [id, peer] : peers_) {
        if (peer->is_active()) {
            result.push_back(peer);
        }
    }
    return result;
}

bool Overlay::send_to(const std::string& peer_id, const Message& message) {
    std::shared_ptr<PeerConnection> peer;
    {
        std::shared_lock<std::shared_mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return false;
        }
        peer = it->second;
    }

    if (!peer->is_active() || !peer->send(message)) {
        ++send_failures_;
        return false;
    }
    return true;
}

void Overlay::broadcast(const Message& message) {
    std::string task = "broadcast " + MessageHelpers::message_type_to_string(message.type);

    submit_background(task, [this, message]() {
        for (const auto& peer : active_peers()) {
            if (!peer->send(message)) {
                ++send_failures_;
                utilities::log_warn("Overlay: broadcast of " +
                                    MessageHelpers::message_type_to_string(message.type) +
                                    " to " + peer->id() + " failed");
            }
        }
    });
}

void Overlay::discover() {
    broadcast(MessageHelpers::make_message(MessageType::NODE_DISCOVERY));
}

void Overlay::ping_all() {
    broadcast(MessageHelpers::make_message(MessageType::PING));
}

bool Overlay::is_self_address(const std::string& address) const {
    auto parsed = config::parse_address(address);
    if (!parsed) {
        return false;
    }

    uint16_t port = bound_port_.load();
    if (port == 0 || parsed->port != port) {
        return false;
    }

    if (utilities::to_lowercase(parsed->host) == "localhost") {
        return true;
    }

    asio::error_code ec;
    auto ip = asio::ip::make_address(parsed->host, ec);
    if (!ec && ip.is_loopback()) {
        return true;
    }

    return std::find(local_addresses_.begin(), local_addresses_.end(), parsed->host) != local_addresses_.end();
}

OverlayStats Overlay::stats() const {
    OverlayStats stats;
    stats.frames_received = frames_received_.load();
    stats.decode_failures = decode_failures_.load();
    stats.unhandled_messages = unhandled_messages_.load();
    stats.dial_failures = dial_failures_.load();
    stats.send_failures = send_failures_.load();
    stats.background_failures = background_failures_.load();
    return stats;
}

// ============================================================================
// Private Methods - Network I/O
// ============================================================================

void Overlay::start_accept() {
    auto socket = std::make_shared<asio::ip::tcp::socket>(io_context_);

    acceptor_->async_accept(
        *socket,
        [this, socket](const asio::error_code& error) {
            handle_accept(error, socket);
        }
    );
}

void Overlay::handle_accept(const asio::error_code& error, std::shared_ptr<asio::ip::tcp::socket> socket) {
    if (error == asio::error::operation_aborted || !running_) {
        return;
    }

    if (error) {
        utilities::log_warn("Overlay: accept failed: " + error.message());
    } else {
        asio::error_code ec;
        auto remote = socket->remote_endpoint(ec);

        if (ec) {
            utilities::log_warn("Overlay: accepted socket has no remote endpoint: " + ec.message());
        } else {
            std::string address = config::NetworkAddress{remote.address().to_string(), remote.port()}.to_string();
            auto peer = std::make_shared<PeerConnection>(std::move(*socket), address, address, true);

            bool inserted = false;
            std::shared_ptr<PeerConnection> replaced;
            {
                std::unique_lock<std::shared_mutex> lock(peers_mutex_);
                if (running_) {
                    auto it = peers_.find(address);
                    if (it != peers_.end()) {
                        replaced = it->second;
                    }
                    peer->transition_to(PeerState::ACTIVE);
                    peers_[address] = peer;
                    std::lock_guard<std::mutex> readers_lock(readers_mutex_);
                    ++active_readers_;
                    inserted = true;
                }
            }

            if (replaced) {
                replaced->close();
            }

            if (inserted) {
                utilities::log_info("Overlay: accepted peer " + address);
                spawn_reader(peer);
            } else {
                peer->close();
            }
        }
    }

    if (running_) {
        start_accept();
    }
}

asio::ip::tcp::socket Overlay::dial(const config::NetworkAddress& target) {
    asio::ip::tcp::resolver resolver(io_context_);
    asio::error_code ec;
    auto endpoints = resolver.resolve(target.host, std::to_string(target.port), ec);
    if (ec) {
        ++dial_failures_;
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to resolve " + target.to_string() + ": " + ec.message());
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(io_context_);
    std::future<asio::ip::tcp::endpoint> result = asio::async_connect(*socket, endpoints, asio::use_future);

    if (result.wait_for(options_.dial_timeout) == std::future_status::timeout) {
        asio::post(io_context_, [socket]() {
            asio::error_code ignored;
            socket->close(ignored);
        });
        result.wait();
        ++dial_failures_;
        throw MeshError(ErrorKind::IO_FAILURE, "Timed out connecting to " + target.to_string());
    }

    try {
        result.get();
    } catch (const std::system_error& e) {
        ++dial_failures_;
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to connect to " + target.to_string() + ": " + e.what());
    }

    return std::move(*socket);
}

void Overlay::attach_node(const std::shared_ptr<PeerConnection>& peer) {
    const std::string& address = peer->address();

    try {
        auto node_id = registry_.find_by_address(address);
        if (node_id) {
            registry_.heartbeat(*node_id);
            peer->set_node_id(*node_id);
        } else {
            registry_.register_node(address, address, 0);
            peer->set_node_id(address);
        }
    } catch (const MeshError& e) {
        utilities::log_warn("Overlay: could not record node for peer " + address + ": " + e.what());
    }
}

void Overlay::spawn_reader(const std::shared_ptr<PeerConnection>& peer) {
    try {
        std::thread(&Overlay::reader_loop, this, peer).detach();
    } catch (const std::system_error& e) {
        utilities::log_error("Overlay: failed to start reader for " + peer->id() + ": " + e.what());
        evict(peer);

        std::lock_guard<std::mutex> lock(readers_mutex_);
        --active_readers_;
        readers_cv_.notify_all();
    }
}

void Overlay::reader_loop(std::shared_ptr<PeerConnection> peer) {
    try {
        while (true) {
            auto message = peer->receive();
            ++frames_received_;

            if (!message) {
                ++decode_failures_;
                utilities::log_warn("Overlay: undecodable message from " + peer->id() + ", skipped");
                continue;
            }

            dispatch(peer, *message);
        }
    } catch (const MeshError& e) {
        if (running_ && peer->is_active()) {
            utilities::log_info("Overlay: peer " + peer->id() + " closed: " + e.what());
        }
    }

    evict(peer);

    // The socket belongs to io_context_ and must not outlive it
    peer.reset();

    // Notify under the lock: stop() may destroy the overlay as soon as the count reaches zero
    std::lock_guard<std::mutex> lock(readers_mutex_);
    --active_readers_;
    readers_cv_.notify_all();
}

void Overlay::evict(const std::shared_ptr<PeerConnection>& peer) {
    peer->close();

    std::unique_lock<std::shared_mutex> lock(peers_mutex_);
    auto it = peers_.find(peer->id());
    if (it != peers_.end() && it->second == peer) {
        peers_.erase(it);
    }
}

// ============================================================================
// Private Methods - Message Processing
// ============================================================================

void Overlay::dispatch(const std::shared_ptr<PeerConnection>& peer, const Message& message) {
    MessageHandler handler;
    {
        std::shared_lock<std::shared_mutex> lock(handlers_mutex_);
        auto it = handlers_.find(message.type);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        ++unhandled_messages_;
        utilities::log_info("Overlay: no handler for " + MessageHelpers::message_type_to_string(message.type) +
                            " from " + peer->id());
        return;
    }

    try {
        handler(peer, message);
    } catch (const std::exception& e) {
        utilities::log_error("Overlay: handler for " + MessageHelpers::message_type_to_string(message.type) +
                             " failed: " + e.what());
    }
}

void Overlay::heartbeat_peer_node(const std::shared_ptr<PeerConnection>& peer) {
    std::string node_id = peer->node_id();
    if (node_id.empty()) {
        return;
    }

    try {
        registry_.heartbeat(node_id);
    } catch (const MeshError& e) {
        utilities::log_debug("Overlay: heartbeat for " + node_id + " skipped: " + e.what());
    }
}

void Overlay::handle_ping(const std::shared_ptr<PeerConnection>& peer, const Message& /*message*/) {
    heartbeat_peer_node(peer);

    if (!peer->send(MessageHelpers::make_message(MessageType::PONG))) {
        ++send_failures_;
    }
}

void Overlay::handle_pong(const std::shared_ptr<PeerConnection>& peer, const Message& /*message*/) {
    heartbeat_peer_node(peer);
}

void Overlay::handle_discovery(const std::shared_ptr<PeerConnection>& peer, const Message& /*message*/) {
    NodeAnnouncement announcement;
    for (const auto& other : active_peers()) {
        if (other->id() == peer->id() || is_self_address(other->address())) {
            continue;
        }
        announcement.addresses.push_back(other->address());
    }

    if (!peer->send(MessageHelpers::make_message(MessageType::NODE_ANNOUNCEMENT, announcement.to_json()))) {
        ++send_failures_;
    }
}

void Overlay::handle_announcement(const std::shared_ptr<PeerConnection>& peer, const Message& message) {
    auto announcement = NodeAnnouncement::from_json(MessageHelpers::payload_as_string(message));
    if (!announcement) {
        ++decode_failures_;
        utilities::log_warn("Overlay: malformed announcement from " + peer->id());
        return;
    }

    for (const auto& address : announcement->addresses) {
        if (is_self_address(address)) {
            continue;
        }

        submit_background("connect " + address, [this, address]() {
            connect(address);
        });
    }
}

// ============================================================================
// Private Methods - Background Tasks
// ============================================================================

void Overlay::submit_background(const std::string& task, std::function<void()> work) {
    if (!running_ || !background_pool_) {
        utilities::log_debug("Overlay: dropping background task '" + task + "', not running");
        return;
    }

    asio::post(*background_pool_, [this, task, work = std::move(work)]() {
        try {
            work();
        } catch (const std::exception& e) {
            report_background_failure(task, e.what());
        }
    });
}

void Overlay::report_background_failure(const std::string& task, const std::string& error) {
    ++background_failures_;
    utilities::log_warn("Overlay: background task '" + task + "' failed: " + error);

    BackgroundErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = background_error_callback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(task, error);
    } catch (const std::exception& e) {
        utilities::log_error("Overlay: background error callback threw: " + std::string(e.what()));
    }
}

} // namespace meshfs
