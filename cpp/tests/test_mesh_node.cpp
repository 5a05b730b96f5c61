/**
 * @file test_mesh_node.cpp
 * @brief Integration tests for MeshNode
 *
 * Tests node orchestration including:
 * - Start / stop lifecycle
 * - Self registration
 * - Registry snapshot persistence across restarts
 * - Bootstrap dialing
 * - Status aggregation
 */

#include <gtest/gtest.h>
#include "meshfs/errors.hpp"
#include "meshfs/mesh_node.hpp"
#include "meshfs/utilities.hpp"
#include <asio.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>

using namespace meshfs;
namespace fs = std::filesystem;

// Test fixture for mesh node tests
class MeshNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            ("meshfs_node_test_" + utilities::generate_random_hex(4));
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    NodeConfig make_config(const std::string& node_id) {
        NodeConfig config;
        config.node_id = node_id;
        config.p2p_port = 0;
        config.data_dir = (test_dir_ / node_id).string();
        config.enable_discovery = false;
        config.chunk_size = 1024;
        config.maintenance_interval = std::chrono::seconds(1);
        return config;
    }

    static bool wait_until(const std::function<bool()>& condition) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return condition();
    }

    fs::path test_dir_;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(MeshNodeTest, StartCreatesComponents) {
    MeshNode node(make_config("node-a"));

    EXPECT_EQ(node.chunk_store(), nullptr);
    EXPECT_EQ(node.overlay(), nullptr);

    ASSERT_TRUE(node.start());
    EXPECT_TRUE(node.is_running());

    ASSERT_NE(node.chunk_store(), nullptr);
    ASSERT_NE(node.overlay(), nullptr);
    EXPECT_NE(node.overlay()->port(), 0);
    EXPECT_EQ(node.chunk_store()->default_chunk_size(), 1024u);
    EXPECT_TRUE(fs::is_directory(test_dir_ / "node-a" / "chunks"));

    node.stop();
    EXPECT_FALSE(node.is_running());
    EXPECT_TRUE(fs::exists(test_dir_ / "node-a" / "nodes.db"));
}

TEST_F(MeshNodeTest, StartTwiceFails) {
    MeshNode node(make_config("node-a"));

    ASSERT_TRUE(node.start());
    EXPECT_FALSE(node.start());
    node.stop();
}

TEST_F(MeshNodeTest, DisabledOverlay) {
    NodeConfig config = make_config("node-a");
    config.enable_p2p = false;

    MeshNode node(config);
    ASSERT_TRUE(node.start());

    EXPECT_EQ(node.overlay(), nullptr);
    EXPECT_EQ(node.system_status().p2p_port, 0);
    EXPECT_EQ(node.system_status().peer_count, 0u);
    node.stop();
}

TEST_F(MeshNodeTest, InvalidConfigRejected) {
    NodeConfig config = make_config("node-a");
    config.node_id = "bad id";

    try {
        MeshNode node(config);
        FAIL() << "Expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_INPUT);
    }
}

TEST_F(MeshNodeTest, RunReturnsOnStop) {
    MeshNode node(make_config("node-a"));
    ASSERT_TRUE(node.start());

    std::thread runner([&node]() { node.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    node.stop();
    runner.join();
    EXPECT_FALSE(node.is_running());
}

// ============================================================================
// Registry Tests
// ============================================================================

TEST_F(MeshNodeTest, RegistersSelf) {
    MeshNode node(make_config("node-a"));
    ASSERT_TRUE(node.start());

    Node self = node.registry().get("node-a");
    EXPECT_EQ(self.address, node.self_address());
    EXPECT_EQ(self.status, NodeStatus::ACTIVE);
    EXPECT_GE(self.storage_max, 0);

    node.stop();
}

TEST_F(MeshNodeTest, SnapshotSurvivesRestart) {
    {
        MeshNode node(make_config("node-a"));
        ASSERT_TRUE(node.start());

        node.registry().register_node("remote", "10.20.30.40:9000", 4096);
        node.registry().set_storage_used("remote", 1024);
        node.registry().set_status("remote", "inactive");

        node.stop();
    }

    MeshNode restarted(make_config("node-a"));
    ASSERT_TRUE(restarted.start());

    Node remote = restarted.registry().get("remote");
    EXPECT_EQ(remote.address, "10.20.30.40:9000");
    EXPECT_EQ(remote.storage_used, 1024);
    EXPECT_EQ(remote.status, NodeStatus::INACTIVE);

    restarted.stop();
}

TEST_F(MeshNodeTest, MaintenanceSavesSnapshot) {
    MeshNode node(make_config("node-a"));
    ASSERT_TRUE(node.start());

    node.registry().register_node("late", "10.1.2.3:9000", 10);
    node.run_maintenance();

    NodeDatabase database((test_dir_ / "node-a" / "nodes.db").string());
    auto stored = database.load();
    bool found = std::any_of(stored.begin(), stored.end(), [](const Node& n) { return n.id == "late"; });
    EXPECT_TRUE(found);

    node.stop();
}

TEST_F(MeshNodeTest, SelfUsageTracksChunks) {
    MeshNode node(make_config("node-a"));
    ASSERT_TRUE(node.start());

    Node self = node.registry().get("node-a");
    if (self.storage_max < 4096) {
        GTEST_SKIP() << "Filesystem capacity unavailable";
    }

    fs::path input = test_dir_ / "input.bin";
    std::vector<uint8_t> data(3000, 0x5a);
    utilities::write_file_binary(input.string(), data.data(), data.size());

    node.chunk_store()->split(input.string());
    node.run_maintenance();

    // Three chunks of 1024, 1024 and 952 bytes, two of them identical
    EXPECT_EQ(node.registry().get("node-a").storage_used, 1024 + 952);

    node.stop();
}

// ============================================================================
// Overlay Tests
// ============================================================================

TEST_F(MeshNodeTest, BootstrapConnectsToPeer) {
    MeshNode a(make_config("node-a"));
    ASSERT_TRUE(a.start());

    NodeConfig config_b = make_config("node-b");
    config_b.bootstrap_peers = {"127.0.0.1:" + std::to_string(a.overlay()->port())};
    MeshNode b(config_b);
    ASSERT_TRUE(b.start());

    EXPECT_TRUE(wait_until([&b]() { return b.overlay()->active_peer_count() == 1; }));
    EXPECT_TRUE(wait_until([&a]() { return a.system_status().peer_count == 1; }));

    b.stop();
    a.stop();
}

TEST_F(MeshNodeTest, StopInterruptsBootstrapRetries) {
    // Nothing listens here; stop() must not wait out every retry delay
    asio::io_context io;
    asio::ip::tcp::acceptor listener(io, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    uint16_t dead_port = listener.local_endpoint().port();
    listener.close();

    NodeConfig config = make_config("node-a");
    config.bootstrap_peers = {"127.0.0.1:" + std::to_string(dead_port)};

    MeshNode node(config);
    ASSERT_TRUE(node.start());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto before = std::chrono::steady_clock::now();
    node.stop();
    auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_LT(elapsed, config::BOOTSTRAP_RETRY_DELAY);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST_F(MeshNodeTest, SummarizeNodes) {
    std::vector<Node> nodes = {
        Node{"a", "10.0.0.1:1", NodeStatus::ACTIVE, 100, 1000, 0},
        Node{"b", "10.0.0.2:1", NodeStatus::INACTIVE, 0, 500, 0},
        Node{"c", "10.0.0.3:1", NodeStatus::FAILED, 50, 50, 0},
        Node{"d", "10.0.0.4:1", NodeStatus::ACTIVE, 0, 0, 0}
    };

    SystemStatus status = summarize_nodes(nodes);

    EXPECT_EQ(status.total_nodes, 4u);
    EXPECT_EQ(status.active_nodes, 2u);
    EXPECT_EQ(status.inactive_nodes, 1u);
    EXPECT_EQ(status.failed_nodes, 1u);
    EXPECT_EQ(status.total_storage, 1550);
    EXPECT_EQ(status.used_storage, 150);
    EXPECT_EQ(status.available_storage, 1400);
}

TEST_F(MeshNodeTest, SystemStatusJson) {
    MeshNode node(make_config("node-a"));
    ASSERT_TRUE(node.start());

    nlohmann::json j = node.system_status();
    EXPECT_EQ(j["nodeId"], "node-a");
    EXPECT_EQ(j["p2pPort"], node.overlay()->port());
    EXPECT_GE(j["totalNodes"].get<size_t>(), 1u);
    EXPECT_TRUE(j.contains("availableStorage"));
    EXPECT_TRUE(j.contains("uptimeSeconds"));

    node.stop();
    EXPECT_EQ(node.get_uptime(), 0u);
}
