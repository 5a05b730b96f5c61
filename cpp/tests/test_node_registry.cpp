/**
 * @file test_node_registry.cpp
 * @brief Unit tests for NodeRegistry
 *
 * Tests node registry including:
 * - Registration and upsert
 * - Address uniqueness
 * - Status and storage updates
 * - Snapshot restore
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "meshfs/errors.hpp"
#include "meshfs/node_registry.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

using namespace meshfs;

// Test fixture for node registry tests
class NodeRegistryTest : public ::testing::Test {
protected:
    void expect_error(ErrorKind kind, const std::function<void()>& call) {
        try {
            call();
            FAIL() << "Expected MeshError " << error_kind_to_string(kind);
        } catch (const MeshError& e) {
            EXPECT_EQ(e.kind(), kind) << e.what();
        }
    }

    NodeRegistry registry_;
};

// ============================================================================
// Registration Tests
// ============================================================================

TEST_F(NodeRegistryTest, RegisterNewNode) {
    Node node = registry_.register_node("node-a", "10.0.0.1:9000", 1000);

    EXPECT_EQ(node.id, "node-a");
    EXPECT_EQ(node.address, "10.0.0.1:9000");
    EXPECT_EQ(node.status, NodeStatus::ACTIVE);
    EXPECT_EQ(node.storage_used, 0);
    EXPECT_EQ(node.storage_max, 1000);
    EXPECT_GT(node.last_seen, 0u);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(NodeRegistryTest, ReRegisterMovesAddress) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);
    registry_.register_node("node-a", "10.0.0.2:9000", 100);

    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.get("node-a").address, "10.0.0.2:9000");
    EXPECT_FALSE(registry_.find_by_address("10.0.0.1:9000").has_value());
    EXPECT_EQ(registry_.find_by_address("10.0.0.2:9000").value(), "node-a");
}

TEST_F(NodeRegistryTest, ReRegisterKeepsUsageAndReactivates) {
    registry_.register_node("node-a", "10.0.0.1:9000", 1000);
    registry_.set_storage_used("node-a", 400);
    registry_.set_status("node-a", "failed");

    Node node = registry_.register_node("node-a", "10.0.0.1:9000", 2000);
    EXPECT_EQ(node.storage_used, 400);
    EXPECT_EQ(node.storage_max, 2000);
    EXPECT_EQ(node.status, NodeStatus::ACTIVE);
}

TEST_F(NodeRegistryTest, ReRegisterShrinkingCapacityClampsUsage) {
    registry_.register_node("node-a", "10.0.0.1:9000", 1000);
    registry_.set_storage_used("node-a", 800);

    Node node = registry_.register_node("node-a", "10.0.0.1:9000", 100);
    EXPECT_EQ(node.storage_max, 100);
    EXPECT_EQ(node.storage_used, 100);
    EXPECT_EQ(node.free_space(), 0);

    Node stored = registry_.get("node-a");
    EXPECT_EQ(stored.storage_used, 100);
    EXPECT_LE(stored.storage_used, stored.storage_max);

    // Zero capacity, as an overlay dial registers it
    registry_.register_node("node-a", "10.0.0.1:9000", 0);
    EXPECT_EQ(registry_.get("node-a").storage_used, 0);
}

TEST_F(NodeRegistryTest, AddressConflict) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);

    expect_error(ErrorKind::CONFLICT, [this]() {
        registry_.register_node("node-b", "10.0.0.1:9000", 100);
    });
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(NodeRegistryTest, RegisterInvalidInput) {
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.register_node("node-a", "no-port", 100); });
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.register_node("node-a", "host:0", 100); });
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.register_node("node-a", ":9000", 100); });
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.register_node("", "10.0.0.1:9000", 100); });
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.register_node("node-a", "10.0.0.1:9000", -1); });
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(NodeRegistryTest, RegisterIpv6Address) {
    Node node = registry_.register_node("node-6", "[::1]:9000", 100);
    EXPECT_EQ(node.address, "[::1]:9000");
}

// ============================================================================
// Query Tests
// ============================================================================

TEST_F(NodeRegistryTest, GetUnknown) {
    expect_error(ErrorKind::NOT_FOUND, [this]() { registry_.get("ghost"); });
}

TEST_F(NodeRegistryTest, ListReturnsCopies) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);
    registry_.register_node("node-b", "10.0.0.2:9000", 200);

    auto nodes = registry_.list();
    ASSERT_EQ(nodes.size(), 2u);

    nodes[0].storage_max = 999999;
    EXPECT_NE(registry_.get(nodes[0].id).storage_max, 999999);
}

// ============================================================================
// Update Tests
// ============================================================================

TEST_F(NodeRegistryTest, HeartbeatUnknown) {
    expect_error(ErrorKind::NOT_FOUND, [this]() { registry_.heartbeat("ghost"); });
}

TEST_F(NodeRegistryTest, Heartbeat) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);
    uint64_t before = registry_.get("node-a").last_seen;

    registry_.heartbeat("node-a");
    EXPECT_GE(registry_.get("node-a").last_seen, before);
}

TEST_F(NodeRegistryTest, SetStatus) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);

    registry_.set_status("node-a", "inactive");
    EXPECT_EQ(registry_.get("node-a").status, NodeStatus::INACTIVE);

    registry_.set_status("node-a", NodeStatus::FAILED);
    EXPECT_EQ(registry_.get("node-a").status, NodeStatus::FAILED);
}

TEST_F(NodeRegistryTest, SetStatusInvalid) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);

    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.set_status("node-a", "sleeping"); });
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.set_status("node-a", "ACTIVE"); });
    expect_error(ErrorKind::NOT_FOUND, [this]() { registry_.set_status("ghost", "active"); });
}

TEST_F(NodeRegistryTest, SetStorageUsedBounds) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);

    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.set_storage_used("node-a", -1); });
    expect_error(ErrorKind::INVALID_INPUT, [this]() { registry_.set_storage_used("node-a", 101); });
    EXPECT_EQ(registry_.get("node-a").storage_used, 0);

    registry_.set_storage_used("node-a", 100);
    EXPECT_EQ(registry_.get("node-a").storage_used, 100);
    EXPECT_EQ(registry_.get("node-a").free_space(), 0);

    registry_.set_storage_used("node-a", 0);
    EXPECT_EQ(registry_.get("node-a").storage_used, 0);
}

TEST_F(NodeRegistryTest, RemoveReleasesAddress) {
    registry_.register_node("node-a", "10.0.0.1:9000", 100);
    registry_.remove("node-a");

    EXPECT_EQ(registry_.size(), 0u);
    expect_error(ErrorKind::NOT_FOUND, [this]() { registry_.remove("node-a"); });

    // Address is free for another id now
    Node node = registry_.register_node("node-b", "10.0.0.1:9000", 100);
    EXPECT_EQ(node.id, "node-b");
}

// ============================================================================
// Restore Tests
// ============================================================================

TEST_F(NodeRegistryTest, RestoreSnapshot) {
    Node a{"node-a", "10.0.0.1:9000", NodeStatus::INACTIVE, 10, 100, 1700000000};
    Node b{"node-b", "10.0.0.2:9000", NodeStatus::FAILED, 0, 50, 1700000001};

    EXPECT_EQ(registry_.restore({a, b}), 2u);

    Node restored = registry_.get("node-a");
    EXPECT_EQ(restored.status, NodeStatus::INACTIVE);
    EXPECT_EQ(restored.storage_used, 10);
    EXPECT_EQ(restored.last_seen, 1700000000u);
    EXPECT_EQ(registry_.find_by_address("10.0.0.2:9000").value(), "node-b");
}

TEST_F(NodeRegistryTest, RestoreSkipsConflictsAndMalformed) {
    registry_.register_node("live", "10.0.0.1:9000", 100);

    Node clash{"stored", "10.0.0.1:9000", NodeStatus::ACTIVE, 0, 100, 1};
    Node broken{"broken", "nowhere", NodeStatus::ACTIVE, 0, 100, 1};
    Node fine{"fine", "10.0.0.3:9000", NodeStatus::ACTIVE, 0, 100, 1};

    EXPECT_EQ(registry_.restore({clash, broken, fine}), 1u);
    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_EQ(registry_.find_by_address("10.0.0.1:9000").value(), "live");
}

TEST_F(NodeRegistryTest, RestoreClampsUsage) {
    Node over{"node-a", "10.0.0.1:9000", NodeStatus::ACTIVE, 500, 100, 1};
    registry_.restore({over});

    EXPECT_EQ(registry_.get("node-a").storage_used, 0);
}

// ============================================================================
// JSON Tests
// ============================================================================

TEST_F(NodeRegistryTest, NodeJson) {
    Node node = registry_.register_node("node-a", "10.0.0.1:9000", 100);

    nlohmann::json j = node;
    EXPECT_EQ(j["id"], "node-a");
    EXPECT_EQ(j["status"], "active");
    EXPECT_EQ(j["storage_max"], 100);

    Node parsed = j.get<Node>();
    EXPECT_EQ(parsed.address, node.address);
    EXPECT_EQ(parsed.status, node.status);
}

TEST_F(NodeRegistryTest, StatusNames) {
    EXPECT_EQ(node_status_to_string(NodeStatus::ACTIVE), "active");
    EXPECT_EQ(node_status_to_string(NodeStatus::INACTIVE), "inactive");
    EXPECT_EQ(node_status_to_string(NodeStatus::FAILED), "failed");
    EXPECT_FALSE(node_status_from_string("unknown").has_value());
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(NodeRegistryTest, ConcurrentRegistration) {
    const int num_threads = 8;
    const int per_thread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < per_thread; ++i) {
                std::string id = "node-" + std::to_string(t) + "-" + std::to_string(i);
                std::string address = "10." + std::to_string(t) + ".0." + std::to_string(i) + ":9000";
                registry_.register_node(id, address, 1000);
                registry_.heartbeat(id);
                registry_.list();
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry_.size(), static_cast<size_t>(num_threads * per_thread));
}

TEST_F(NodeRegistryTest, ConcurrentAddressClaim) {
    std::atomic<int> conflicts(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t, &conflicts]() {
            try {
                registry_.register_node("claimant-" + std::to_string(t), "10.9.9.9:9000", 10);
            } catch (const MeshError& e) {
                if (e.kind() == ErrorKind::CONFLICT) {
                    ++conflicts;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(conflicts.load(), 7);
}
