/**
 * @file test_node_database.cpp
 * @brief Unit tests for NodeDatabase
 *
 * Tests SQLite registry snapshots including:
 * - Save / load
 * - Snapshot replacement
 * - Transaction rollback
 * - Reopening an existing database
 */

#include <gtest/gtest.h>
#include "meshfs/errors.hpp"
#include "meshfs/node_database.hpp"
#include "meshfs/utilities.hpp"
#include <filesystem>
#include <vector>

using namespace meshfs;
namespace fs = std::filesystem;

// Test fixture for node database tests
class NodeDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temporary test directory
        test_dir_ = fs::temp_directory_path() /
            ("meshfs_db_test_" + utilities::generate_random_hex(4));
        fs::create_directories(test_dir_);

        db_path_ = (test_dir_ / "nodes.db").string();
        database_ = std::make_unique<NodeDatabase>(db_path_);
    }

    void TearDown() override {
        database_.reset();

        // Clean up test directory
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    static Node make_node(const std::string& id, const std::string& address, NodeStatus status,
                          int64_t used, int64_t max) {
        return Node{id, address, status, used, max, 1700000000};
    }

    fs::path test_dir_;
    std::string db_path_;
    std::unique_ptr<NodeDatabase> database_;
};

TEST_F(NodeDatabaseTest, EmptyDatabaseLoadsNothing) {
    EXPECT_TRUE(database_->load().empty());
    EXPECT_EQ(database_->path(), db_path_);
}

TEST_F(NodeDatabaseTest, SaveAndLoad) {
    std::vector<Node> nodes = {
        make_node("node-b", "10.0.0.2:9000", NodeStatus::FAILED, 0, 50),
        make_node("node-a", "10.0.0.1:9000", NodeStatus::ACTIVE, 10, 100)
    };

    database_->save(nodes);
    auto loaded = database_->load();

    ASSERT_EQ(loaded.size(), 2u);
    // Ordered by id
    EXPECT_EQ(loaded[0].id, "node-a");
    EXPECT_EQ(loaded[0].address, "10.0.0.1:9000");
    EXPECT_EQ(loaded[0].status, NodeStatus::ACTIVE);
    EXPECT_EQ(loaded[0].storage_used, 10);
    EXPECT_EQ(loaded[0].storage_max, 100);
    EXPECT_EQ(loaded[0].last_seen, 1700000000u);
    EXPECT_EQ(loaded[1].status, NodeStatus::FAILED);
}

TEST_F(NodeDatabaseTest, SaveReplacesSnapshot) {
    database_->save({make_node("old", "10.0.0.1:9000", NodeStatus::ACTIVE, 0, 1)});
    database_->save({make_node("new", "10.0.0.2:9000", NodeStatus::INACTIVE, 0, 1)});

    auto loaded = database_->load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "new");
}

TEST_F(NodeDatabaseTest, SaveEmptyClears) {
    database_->save({make_node("old", "10.0.0.1:9000", NodeStatus::ACTIVE, 0, 1)});
    database_->save({});

    EXPECT_TRUE(database_->load().empty());
}

TEST_F(NodeDatabaseTest, FailedSaveKeepsPreviousSnapshot) {
    database_->save({make_node("keep", "10.0.0.1:9000", NodeStatus::ACTIVE, 0, 1)});

    // Duplicate primary key aborts the transaction
    std::vector<Node> bad = {
        make_node("dup", "10.0.0.2:9000", NodeStatus::ACTIVE, 0, 1),
        make_node("dup", "10.0.0.3:9000", NodeStatus::ACTIVE, 0, 1)
    };

    try {
        database_->save(bad);
        FAIL() << "Expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IO_FAILURE);
    }

    auto loaded = database_->load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "keep");

    // Database is still usable afterwards
    database_->save({make_node("next", "10.0.0.4:9000", NodeStatus::ACTIVE, 0, 1)});
    EXPECT_EQ(database_->load().size(), 1u);
}

TEST_F(NodeDatabaseTest, UsageConstraintEnforced) {
    EXPECT_THROW(database_->save({make_node("over", "10.0.0.1:9000", NodeStatus::ACTIVE, 5, 1)}), MeshError);
    EXPECT_TRUE(database_->load().empty());
}

TEST_F(NodeDatabaseTest, SnapshotSurvivesReopen) {
    database_->save({make_node("node-a", "10.0.0.1:9000", NodeStatus::INACTIVE, 3, 30)});
    database_.reset();

    NodeDatabase reopened(db_path_);
    auto loaded = reopened.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].status, NodeStatus::INACTIVE);
    EXPECT_EQ(loaded[0].storage_used, 3);
}

TEST_F(NodeDatabaseTest, RegistryRoundTrip) {
    NodeRegistry registry;
    registry.register_node("node-a", "10.0.0.1:9000", 1000);
    registry.set_storage_used("node-a", 250);
    registry.register_node("node-b", "10.0.0.2:9000", 500);
    registry.set_status("node-b", "failed");

    database_->save(registry.list());

    NodeRegistry restored;
    EXPECT_EQ(restored.restore(database_->load()), 2u);
    EXPECT_EQ(restored.get("node-a").storage_used, 250);
    EXPECT_EQ(restored.get("node-b").status, NodeStatus::FAILED);
    EXPECT_EQ(restored.find_by_address("10.0.0.2:9000").value(), "node-b");
}

TEST_F(NodeDatabaseTest, SavesAfterCapacityShrink) {
    NodeRegistry registry;
    registry.register_node("node-a", "10.0.0.1:9000", 1000);
    registry.set_storage_used("node-a", 800);
    registry.register_node("node-a", "10.0.0.1:9000", 100);

    EXPECT_NO_THROW(database_->save(registry.list()));

    auto loaded = database_->load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].storage_used, 100);
    EXPECT_EQ(loaded[0].storage_max, 100);
}

TEST_F(NodeDatabaseTest, UnopenablePath) {
    std::string bad_path = (test_dir_ / "missing_dir" / "nested" / "nodes.db").string();

    try {
        NodeDatabase db(bad_path);
        FAIL() << "Expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IO_FAILURE);
    }
}
