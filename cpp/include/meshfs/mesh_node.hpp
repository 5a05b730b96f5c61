/**
 * @file mesh_node.hpp
 * @brief Main meshfs node orchestrator - wires all components together
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * MeshNode coordinates:
 * - Node registry and its SQLite snapshot
 * - P2P overlay and bootstrap dialing
 * - Chunk store under the data directory
 * - Placement selection
 * - Periodic maintenance (snapshot, discovery round)
 *
 * It is the facade a control plane (HTTP API, CLI) talks to.
 */

#pragma once

#include "meshfs/chunk_store.hpp"
#include "meshfs/node_config.hpp"
#include "meshfs/node_database.hpp"
#include "meshfs/node_registry.hpp"
#include "meshfs/overlay.hpp"
#include "meshfs/placement_selector.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meshfs {

/**
 * @brief Aggregate view of the mesh for status reporting
 */
struct SystemStatus {
    size_t total_nodes = 0;
    size_t active_nodes = 0;
    size_t inactive_nodes = 0;
    size_t failed_nodes = 0;
    int64_t total_storage = 0;          ///< Sum of storage_max
    int64_t used_storage = 0;           ///< Sum of storage_used
    int64_t available_storage = 0;      ///< total - used
    size_t peer_count = 0;              ///< Active overlay peers
    std::string node_id;
    uint16_t p2p_port = 0;              ///< 0 when the overlay is disabled
    uint64_t uptime_seconds = 0;
};

void to_json(nlohmann::json& j, const SystemStatus& status);

/**
 * @brief Node counts and storage totals over a registry snapshot
 */
SystemStatus summarize_nodes(const std::vector<Node>& nodes);

/**
 * @brief MeshNode - one participant of the storage mesh
 */
class MeshNode {
public:
    /**
     * @brief Construct node from configuration
     * @param config Configuration (validated here)
     * @throws MeshError INVALID_INPUT for an invalid configuration
     */
    explicit MeshNode(NodeConfig config);

    /**
     * @brief Destructor - graceful shutdown
     */
    ~MeshNode();

    // Disable copy and move
    MeshNode(const MeshNode&) = delete;
    MeshNode& operator=(const MeshNode&) = delete;
    MeshNode(MeshNode&&) = delete;
    MeshNode& operator=(MeshNode&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Open storage, restore the registry, start the overlay, dial bootstrap peers
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Save the registry snapshot and stop the overlay
     */
    void stop();

    /**
     * @brief Run maintenance rounds until stop() is called
     */
    void run();

    bool is_running() const { return running_.load(); }

    /**
     * @brief One maintenance round: refresh own entry, save snapshot, discovery
     */
    void run_maintenance();

    /**
     * @brief Write the current registry to the node database
     * @return true if saved
     */
    bool save_snapshot();

    // ========================================================================
    // Status
    // ========================================================================

    SystemStatus system_status() const;

    void print_status() const;

    uint64_t get_uptime() const;

    const std::string& node_id() const { return config_.node_id; }

    /**
     * @brief Address this node advertises for itself (host:port)
     */
    std::string self_address() const;

    // ========================================================================
    // Components
    // ========================================================================

    const NodeConfig& config() const { return config_; }
    NodeRegistry& registry() { return registry_; }
    PlacementSelector& placement() { return placement_; }

    /**
     * @brief Chunk store (nullptr before start)
     */
    ChunkStore* chunk_store() { return chunk_store_.get(); }

    /**
     * @brief Overlay (nullptr before start or when P2P is disabled)
     */
    Overlay* overlay() { return overlay_.get(); }

private:
    NodeConfig config_;
    std::filesystem::path data_dir_;

    NodeRegistry registry_;
    PlacementSelector placement_;
    std::unique_ptr<NodeDatabase> database_;
    std::unique_ptr<ChunkStore> chunk_store_;
    std::unique_ptr<Overlay> overlay_;

    std::atomic<bool> running_;
    std::chrono::steady_clock::time_point start_time_;

    /// Wakes run() and bootstrap retries on stop
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::vector<std::thread> bootstrap_threads_;

    void register_self();
    void refresh_self();
    void bootstrap_peer(const std::string& address);
    bool wait_unless_stopped(std::chrono::milliseconds duration);
};

} // namespace meshfs
