/**
 * @file node_registry.hpp
 * @brief Directory of known storage nodes
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Tracks every storage participant the mesh knows about:
 * - Capacity (storage_used / storage_max)
 * - Liveness (status, last_seen)
 * - Address binding (one address maps to at most one node id)
 *
 * Thread-safe for concurrent access
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace meshfs {

/**
 * @brief Node liveness status
 */
enum class NodeStatus {
    ACTIVE,
    INACTIVE,
    FAILED
};

/**
 * @brief Canonical lowercase name ("active", "inactive", "failed")
 */
std::string node_status_to_string(NodeStatus status);

/**
 * @brief Parse a status name
 * @return NodeStatus or std::nullopt if not one of the canonical names
 */
std::optional<NodeStatus> node_status_from_string(const std::string& name);

/**
 * @brief Durable record of one storage participant
 */
struct Node {
    std::string id;                 ///< Node identifier
    std::string address;            ///< host:port
    NodeStatus status;              ///< Liveness status
    int64_t storage_used;           ///< Bytes in use
    int64_t storage_max;            ///< Capacity in bytes
    uint64_t last_seen;             ///< Unix timestamp of last contact

    int64_t free_space() const { return storage_max - storage_used; }
};

void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

/**
 * @brief NodeRegistry - map of node id to Node with reverse address index
 *
 * All mutating calls throw MeshError on failure:
 * - NOT_FOUND for unknown ids
 * - CONFLICT when an address belongs to another id
 * - INVALID_INPUT for malformed arguments
 */
class NodeRegistry {
public:
    NodeRegistry() = default;

    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    /**
     * @brief Register a new node or refresh an existing one
     *
     * A new id starts active with zero usage. An existing id gets the new
     * address, status active and the new capacity; its usage is kept,
     * clamped to the new capacity.
     *
     * @param id Node identifier (non-empty)
     * @param address host:port
     * @param storage_max Capacity in bytes (>= 0)
     * @return Registered node
     */
    Node register_node(const std::string& id, const std::string& address, int64_t storage_max);

    /**
     * @brief Look up a node
     */
    Node get(const std::string& id) const;

    /**
     * @brief Node id bound to an address, if any
     */
    std::optional<std::string> find_by_address(const std::string& address) const;

    /**
     * @brief Refresh last_seen
     */
    void heartbeat(const std::string& id);

    /**
     * @brief Change node status by name ("active", "inactive", "failed")
     */
    void set_status(const std::string& id, const std::string& status);

    void set_status(const std::string& id, NodeStatus status);

    /**
     * @brief Update the usage counter
     * @throws MeshError INVALID_INPUT if used < 0 or used > storage_max
     */
    void set_storage_used(const std::string& id, int64_t used);

    /**
     * @brief Delete a node and its address binding
     */
    void remove(const std::string& id);

    /**
     * @brief Snapshot of all nodes (unspecified order)
     */
    std::vector<Node> list() const;

    /**
     * @brief Bulk-load a persisted snapshot
     *
     * Entries with an address already bound to another id are skipped.
     *
     * @return Number of nodes loaded
     */
    size_t restore(const std::vector<Node>& nodes);

    size_t size() const;

private:
    std::map<std::string, Node> nodes_;
    std::map<std::string, std::string> address_index_;

    mutable std::shared_mutex mutex_;

    Node& find_locked(const std::string& id);
};

} // namespace meshfs
