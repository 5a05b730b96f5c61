/**
 * @file node_registry.cpp
 * @brief Implementation of the node registry
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/node_registry.hpp"
#include "meshfs/errors.hpp"
#include "meshfs/message_types.hpp"
#include "meshfs/storage_config.hpp"
#include "meshfs/utilities.hpp"

#include <mutex>

using json = nlohmann::json;

namespace meshfs {

// ============================================================================
// NodeStatus
// ============================================================================

std::string node_status_to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::ACTIVE: return "active";
        case NodeStatus::INACTIVE: return "inactive";
        case NodeStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

std::optional<NodeStatus> node_status_from_string(const std::string& name) {
    if (name == "active") return NodeStatus::ACTIVE;
    if (name == "inactive") return NodeStatus::INACTIVE;
    if (name == "failed") return NodeStatus::FAILED;
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const Node& node) {
    j = json{
        {"id", node.id},
        {"address", node.address},
        {"status", node_status_to_string(node.status)},
        {"storage_used", node.storage_used},
        {"storage_max", node.storage_max},
        {"last_seen", node.last_seen}
    };
}

void from_json(const json& j, Node& node) {
    j.at("id").get_to(node.id);
    j.at("address").get_to(node.address);

    auto status = node_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Unknown node status: " + j.at("status").dump());
    }
    node.status = *status;

    node.storage_used = j.value("storage_used", int64_t{0});
    node.storage_max = j.value("storage_max", int64_t{0});
    node.last_seen = j.value("last_seen", uint64_t{0});
}

// ============================================================================
// Registration
// ============================================================================

Node NodeRegistry::register_node(const std::string& id, const std::string& address, int64_t storage_max) {
    if (id.empty()) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Node id must not be empty");
    }
    if (!config::validate_address(address)) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Invalid node address: " + address);
    }
    if (storage_max < 0) {
        throw MeshError(ErrorKind::INVALID_INPUT, "storage_max must not be negative");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto bound = address_index_.find(address);
    if (bound != address_index_.end() && bound->second != id) {
        throw MeshError(ErrorKind::CONFLICT,
            "Address " + address + " already registered to node " + bound->second);
    }

    uint64_t now = MessageHelpers::get_current_timestamp();

    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        Node node;
        node.id = id;
        node.address = address;
        node.status = NodeStatus::ACTIVE;
        node.storage_used = 0;
        node.storage_max = storage_max;
        node.last_seen = now;

        nodes_.emplace(id, node);
        address_index_[address] = id;

        utilities::log_info("NodeRegistry: registered node " + id + " at " + address);
        return node;
    }

    Node& node = it->second;
    if (node.address != address) {
        address_index_.erase(node.address);
        address_index_[address] = id;
        utilities::log_info("NodeRegistry: node " + id + " moved from " + node.address + " to " + address);
        node.address = address;
    }
    node.status = NodeStatus::ACTIVE;
    node.storage_max = storage_max;
    if (node.storage_used > storage_max) {
        utilities::log_warn("NodeRegistry: node " + id + " capacity shrank below usage, clamping usage to " +
                            std::to_string(storage_max));
        node.storage_used = storage_max;
    }
    node.last_seen = now;

    return node;
}

// ============================================================================
// Queries
// ============================================================================

Node NodeRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw MeshError(ErrorKind::NOT_FOUND, "Node not found: " + id);
    }
    return it->second;
}

std::optional<std::string> NodeRegistry::find_by_address(const std::string& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = address_index_.find(address);
    if (it == address_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Node> NodeRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Node> result;
    result.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        result.push_back(node);
    }
    return result;
}

size_t NodeRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

// ============================================================================
// Updates
// ============================================================================

Node& NodeRegistry::find_locked(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw MeshError(ErrorKind::NOT_FOUND, "Node not found: " + id);
    }
    return it->second;
}

void NodeRegistry::heartbeat(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    find_locked(id).last_seen = MessageHelpers::get_current_timestamp();
}

void NodeRegistry::set_status(const std::string& id, const std::string& status) {
    auto parsed = node_status_from_string(status);
    if (!parsed) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Invalid node status: " + status);
    }
    set_status(id, *parsed);
}

void NodeRegistry::set_status(const std::string& id, NodeStatus status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Node& node = find_locked(id);
    if (node.status != status) {
        utilities::log_info("NodeRegistry: node " + id + " " +
                            node_status_to_string(node.status) + " -> " + node_status_to_string(status));
    }
    node.status = status;
    node.last_seen = MessageHelpers::get_current_timestamp();
}

void NodeRegistry::set_storage_used(const std::string& id, int64_t used) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Node& node = find_locked(id);
    if (used < 0 || used > node.storage_max) {
        throw MeshError(ErrorKind::INVALID_INPUT,
            "storage_used " + std::to_string(used) + " outside [0, " +
            std::to_string(node.storage_max) + "] for node " + id);
    }
    node.storage_used = used;
    node.last_seen = MessageHelpers::get_current_timestamp();
}

void NodeRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw MeshError(ErrorKind::NOT_FOUND, "Node not found: " + id);
    }

    auto bound = address_index_.find(it->second.address);
    if (bound != address_index_.end() && bound->second == id) {
        address_index_.erase(bound);
    }
    nodes_.erase(it);

    utilities::log_info("NodeRegistry: removed node " + id);
}

size_t NodeRegistry::restore(const std::vector<Node>& nodes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t loaded = 0;
    for (const auto& node : nodes) {
        if (node.id.empty() || !config::validate_address(node.address)) {
            utilities::log_warn("NodeRegistry: skipping malformed stored node '" + node.id + "'");
            continue;
        }

        auto bound = address_index_.find(node.address);
        if (bound != address_index_.end() && bound->second != node.id) {
            utilities::log_warn("NodeRegistry: skipping stored node " + node.id +
                                ", address " + node.address + " owned by " + bound->second);
            continue;
        }

        auto existing = nodes_.find(node.id);
        if (existing != nodes_.end()) {
            address_index_.erase(existing->second.address);
        }

        Node copy = node;
        if (copy.storage_max < 0) {
            copy.storage_max = 0;
        }
        if (copy.storage_used < 0 || copy.storage_used > copy.storage_max) {
            copy.storage_used = 0;
        }

        nodes_[copy.id] = copy;
        address_index_[copy.address] = copy.id;
        ++loaded;
    }

    return loaded;
}

} // namespace meshfs
