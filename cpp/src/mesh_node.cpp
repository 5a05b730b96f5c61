/**
 * @file mesh_node.cpp
 * @brief Implementation of the meshfs node orchestrator
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/mesh_node.hpp"
#include "meshfs/errors.hpp"
#include "meshfs/utilities.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

using json = nlohmann::json;

namespace meshfs {

using namespace meshfs::utilities;

// ============================================================================
// SystemStatus
// ============================================================================

void to_json(json& j, const SystemStatus& status) {
    j = json{
        {"totalNodes", status.total_nodes},
        {"activeNodes", status.active_nodes},
        {"inactiveNodes", status.inactive_nodes},
        {"failedNodes", status.failed_nodes},
        {"totalStorage", status.total_storage},
        {"usedStorage", status.used_storage},
        {"availableStorage", status.available_storage},
        {"peerCount", status.peer_count},
        {"nodeId", status.node_id},
        {"p2pPort", status.p2p_port},
        {"uptimeSeconds", status.uptime_seconds}
    };
}

SystemStatus summarize_nodes(const std::vector<Node>& nodes) {
    SystemStatus status;
    status.total_nodes = nodes.size();

    for (const auto& node : nodes) {
        status.total_storage += node.storage_max;
        status.used_storage += node.storage_used;

        switch (node.status) {
            case NodeStatus::ACTIVE: ++status.active_nodes; break;
            case NodeStatus::INACTIVE: ++status.inactive_nodes; break;
            case NodeStatus::FAILED: ++status.failed_nodes; break;
        }
    }

    status.available_storage = status.total_storage - status.used_storage;
    return status;
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

MeshNode::MeshNode(NodeConfig config)
    : config_(std::move(config))
    , registry_()
    , placement_(registry_)
    , running_(false)
{
    config_.validate();
    data_dir_ = config_.data_dir;

    log_info("MeshNode: Initializing node '" + config_.node_id + "'");
}

MeshNode::~MeshNode() {
    if (running_) {
        log_warn("MeshNode: Destructor called while still running, forcing stop");
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool MeshNode::start() {
    if (running_) {
        log_warn("MeshNode: Already running");
        return false;
    }

    log_info("MeshNode: Starting node...");

    try {
        std::error_code ec;
        std::filesystem::create_directories(data_dir_, ec);
        if (ec) {
            log_error("MeshNode: Failed to create data directory " + data_dir_.string() + ": " + ec.message());
            return false;
        }

        // Restore the last registry snapshot
        database_ = std::make_unique<NodeDatabase>(config::get_database_path(data_dir_).string());
        size_t restored = registry_.restore(database_->load());
        if (restored > 0) {
            log_info("MeshNode: Restored " + std::to_string(restored) + " nodes from " + database_->path());
        }

        chunk_store_ = std::make_unique<ChunkStore>(
            config::get_chunks_directory(data_dir_), config_.chunk_size, config_.node_id);

        if (config_.enable_p2p) {
            OverlayOptions options;
            options.port = config_.p2p_port;
            options.node_id = config_.node_id;
            options.max_peers = config_.max_peers;

            overlay_ = std::make_unique<Overlay>(options, registry_);
            overlay_->set_background_error_callback([](const std::string& task, const std::string& error) {
                log_debug("MeshNode: background task '" + task + "' failed: " + error);
            });
            overlay_->start();
        } else {
            log_info("MeshNode: P2P overlay disabled");
        }

        running_ = true;
        start_time_ = std::chrono::steady_clock::now();

        register_self();

        for (const auto& address : config_.bootstrap_peers) {
            bootstrap_threads_.emplace_back(&MeshNode::bootstrap_peer, this, address);
        }

        log_info("MeshNode: Started successfully");
        return true;

    } catch (const std::exception& e) {
        log_error("MeshNode: Exception during start: " + std::string(e.what()));
        running_ = false;
        if (overlay_) {
            overlay_->stop();
            overlay_.reset();
        }
        return false;
    }
}

void MeshNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    log_info("MeshNode: Stopping node...");

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        wait_cv_.notify_all();
    }

    for (auto& thread : bootstrap_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    bootstrap_threads_.clear();

    if (overlay_) {
        overlay_->stop();
    }

    save_snapshot();

    log_info("MeshNode: Stopped successfully");
}

void MeshNode::run() {
    if (!running_) {
        log_error("MeshNode: Cannot run - not started");
        return;
    }

    log_info("MeshNode: Entering maintenance loop (interval " +
             format_duration(static_cast<uint64_t>(config_.maintenance_interval.count())) + ")");

    while (wait_unless_stopped(config_.maintenance_interval)) {
        try {
            run_maintenance();
        } catch (const std::exception& e) {
            log_error("MeshNode: Exception in maintenance: " + std::string(e.what()));
        }
    }

    log_info("MeshNode: Exited maintenance loop");
}

bool MeshNode::wait_unless_stopped(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, duration, [this]() { return !running_.load(); });
    return running_.load();
}

void MeshNode::run_maintenance() {
    refresh_self();
    save_snapshot();

    if (overlay_ && config_.enable_discovery) {
        overlay_->discover();
        overlay_->ping_all();
    }
}

bool MeshNode::save_snapshot() {
    if (!database_) {
        return false;
    }

    // Copy under the registry lock, write without it
    std::vector<Node> snapshot = registry_.list();

    try {
        database_->save(snapshot);
        return true;
    } catch (const MeshError& e) {
        log_error("MeshNode: Failed to save registry snapshot: " + std::string(e.what()));
        return false;
    }
}

// ============================================================================
// Self Registration
// ============================================================================

std::string MeshNode::self_address() const {
    uint16_t port = overlay_ ? overlay_->port() : config_.p2p_port;

    std::string host = "127.0.0.1";
    for (const auto& address : get_local_ip_addresses()) {
        // First non-loopback IPv4 address
        if (address.find(':') == std::string::npos && address.rfind("127.", 0) != 0) {
            host = address;
            break;
        }
    }

    return config::NetworkAddress{host, port}.to_string();
}

void MeshNode::register_self() {
    std::string address = self_address();
    if (!config::validate_address(address)) {
        log_warn("MeshNode: No usable self address (" + address + "), not registering self");
        return;
    }

    std::error_code ec;
    auto space = std::filesystem::space(data_dir_, ec);
    int64_t capacity = ec ? 0 : static_cast<int64_t>(space.capacity);

    try {
        registry_.register_node(config_.node_id, address, capacity);
        refresh_self();
    } catch (const MeshError& e) {
        log_warn("MeshNode: Could not register self as " + address + ": " + e.what());
    }
}

void MeshNode::refresh_self() {
    if (!chunk_store_) {
        return;
    }

    int64_t used = 0;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(chunk_store_->root(), ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            auto size = it->file_size(size_ec);
            if (!size_ec) {
                used += static_cast<int64_t>(size);
            }
        }
    }

    try {
        Node self = registry_.get(config_.node_id);
        registry_.set_storage_used(config_.node_id, std::min(used, self.storage_max));
    } catch (const MeshError& e) {
        log_debug("MeshNode: Self entry not refreshed: " + std::string(e.what()));
    }
}

// ============================================================================
// Bootstrap
// ============================================================================

void MeshNode::bootstrap_peer(const std::string& address) {
    if (!overlay_) {
        log_warn("MeshNode: P2P disabled, ignoring bootstrap peer " + address);
        return;
    }

    for (int attempt = 1; attempt <= config::BOOTSTRAP_ATTEMPTS && running_; ++attempt) {
        log_info("MeshNode: Connecting to peer " + address + " (attempt " + std::to_string(attempt) + ")");

        try {
            auto peer = overlay_->connect(address);
            log_info("MeshNode: Connected to peer " + address + " (node " + peer.node_id + ")");
            return;
        } catch (const MeshError& e) {
            log_warn("MeshNode: Failed to connect to peer " + address + ": " + e.what());
            if (e.kind() == ErrorKind::INVALID_INPUT) {
                return;
            }
        }

        if (attempt < config::BOOTSTRAP_ATTEMPTS &&
            !wait_unless_stopped(std::chrono::duration_cast<std::chrono::milliseconds>(config::BOOTSTRAP_RETRY_DELAY))) {
            return;
        }
    }
}

// ============================================================================
// Status
// ============================================================================

SystemStatus MeshNode::system_status() const {
    SystemStatus status = summarize_nodes(registry_.list());
    status.node_id = config_.node_id;
    status.peer_count = overlay_ ? overlay_->active_peer_count() : 0;
    status.p2p_port = overlay_ ? overlay_->port() : 0;
    status.uptime_seconds = get_uptime();
    return status;
}

uint64_t MeshNode::get_uptime() const {
    if (!running_) {
        return 0;
    }

    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count());
}

void MeshNode::print_status() const {
    auto status = system_status();

    std::cout << "\n+----------------------------------------------------------------+\n";
    std::cout << "|                     meshfs Node Status                         |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Node ID:          " << std::left << std::setw(44) << status.node_id << " |\n";
    std::cout << "| P2P Port:         " << std::left << std::setw(44)
              << (overlay_ ? std::to_string(status.p2p_port) : std::string("disabled")) << " |\n";
    std::cout << "| Status:           " << std::left << std::setw(44) << (running_ ? "RUNNING" : "STOPPED") << " |\n";
    std::cout << "| Uptime:           " << std::left << std::setw(44) << format_duration(status.uptime_seconds) << " |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| Active Peers:     " << std::left << std::setw(44) << status.peer_count << " |\n";
    std::cout << "| Nodes:            " << std::left << std::setw(44)
              << (std::to_string(status.total_nodes) + " (" + std::to_string(status.active_nodes) + " active, " +
                  std::to_string(status.inactive_nodes) + " inactive, " +
                  std::to_string(status.failed_nodes) + " failed)") << " |\n";
    std::cout << "| Total Storage:    " << std::left << std::setw(44)
              << format_file_size(static_cast<uint64_t>(std::max<int64_t>(0, status.total_storage))) << " |\n";
    std::cout << "| Used Storage:     " << std::left << std::setw(44)
              << format_file_size(static_cast<uint64_t>(std::max<int64_t>(0, status.used_storage))) << " |\n";
    std::cout << "+----------------------------------------------------------------+\n\n";
}

} // namespace meshfs
