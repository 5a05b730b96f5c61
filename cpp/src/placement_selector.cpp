/**
 * @file placement_selector.cpp
 * @brief Implementation of replica placement ranking
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/placement_selector.hpp"
#include "meshfs/errors.hpp"

#include <algorithm>

namespace meshfs {

std::vector<std::string> select_placement(
    const std::vector<Node>& nodes,
    int64_t required_size,
    int64_t replica_count
) {
    if (required_size < 0) {
        throw MeshError(ErrorKind::INVALID_INPUT, "required_size must not be negative");
    }
    if (replica_count < 0) {
        throw MeshError(ErrorKind::INVALID_INPUT, "replica_count must not be negative");
    }

    std::vector<const Node*> eligible;
    for (const auto& node : nodes) {
        if (node.status == NodeStatus::ACTIVE && node.free_space() >= required_size) {
            eligible.push_back(&node);
        }
    }

    std::stable_sort(eligible.begin(), eligible.end(),
        [](const Node* a, const Node* b) {
            return a->free_space() > b->free_space();
        });

    size_t count = std::min(eligible.size(), static_cast<size_t>(replica_count));

    std::vector<std::string> selected;
    selected.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        selected.push_back(eligible[i]->id);
    }

    return selected;
}

PlacementSelector::PlacementSelector(const NodeRegistry& registry)
    : registry_(registry)
{
}

std::vector<std::string> PlacementSelector::select(int64_t required_size, int64_t replica_count) const {
    return select_placement(registry_.list(), required_size, replica_count);
}

} // namespace meshfs
