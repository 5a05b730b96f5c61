/**
 * @file placement_selector.hpp
 * @brief Ranked replica placement over the node registry
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "meshfs/node_registry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace meshfs {

/**
 * @brief Rank nodes for a placement request
 *
 * Keeps ACTIVE nodes with free space >= required_size, orders them by
 * descending free space (ties keep input order) and returns the ids of the
 * first min(replica_count, eligible) of them.
 *
 * @throws MeshError INVALID_INPUT if required_size or replica_count is negative
 */
std::vector<std::string> select_placement(
    const std::vector<Node>& nodes,
    int64_t required_size,
    int64_t replica_count
);

/**
 * @brief PlacementSelector - advisory placement over a live registry
 *
 * Nothing is reserved: two concurrent requests may pick the same nodes.
 */
class PlacementSelector {
public:
    explicit PlacementSelector(const NodeRegistry& registry);

    /**
     * @brief Pick nodes for replica_count copies of required_size bytes
     * @return Node ids, best first (possibly fewer than requested)
     */
    std::vector<std::string> select(int64_t required_size, int64_t replica_count) const;

private:
    const NodeRegistry& registry_;
};

} // namespace meshfs
