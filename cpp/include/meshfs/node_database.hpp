/**
 * @file node_database.hpp
 * @brief SQLite persistence of the node registry
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Stores registry snapshots so a restarted node remembers the mesh.
 * The registry is copied first and written afterwards; no registry lock is
 * held during disk I/O.
 */

#pragma once

#include "meshfs/node_registry.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace meshfs {

/**
 * @brief NodeDatabase - snapshot store for Node records
 *
 * Thread-safe for concurrent access
 */
class NodeDatabase {
public:
    /**
     * @brief Open or create the database
     * @param database_path Path to SQLite database file
     * @throws MeshError IO_FAILURE if the database cannot be opened or initialized
     */
    explicit NodeDatabase(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~NodeDatabase();

    // Disable copy and move
    NodeDatabase(const NodeDatabase&) = delete;
    NodeDatabase& operator=(const NodeDatabase&) = delete;
    NodeDatabase(NodeDatabase&&) = delete;
    NodeDatabase& operator=(NodeDatabase&&) = delete;

    /**
     * @brief Replace the stored snapshot in one transaction
     * @throws MeshError IO_FAILURE on any SQLite error (previous snapshot kept)
     */
    void save(const std::vector<Node>& nodes);

    /**
     * @brief Read the stored snapshot
     * @throws MeshError IO_FAILURE on SQLite error
     */
    std::vector<Node> load() const;

    const std::string& path() const { return database_path_; }

private:
    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    void initialize_database();
    void exec(const char* sql);
};

} // namespace meshfs
