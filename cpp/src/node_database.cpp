/**
 * @file node_database.cpp
 * @brief Implementation of SQLite node persistence
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/node_database.hpp"
#include "meshfs/errors.hpp"
#include "meshfs/utilities.hpp"

#include <sqlite3.h>

namespace meshfs {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

NodeDatabase::NodeDatabase(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) {
            sqlite3_close(db);
        }
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to open node database " + database_path_ + ": " + reason);
    }

    db_connection_ = static_cast<void*>(db);

    try {
        initialize_database();
    } catch (const MeshError&) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw;
    }
}

NodeDatabase::~NodeDatabase() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void NodeDatabase::exec(const char* sql) {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string reason = error_msg ? error_msg : sqlite3_errstr(rc);
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        throw MeshError(ErrorKind::IO_FAILURE, "Node database error: " + reason);
    }
}

void NodeDatabase::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    exec(R"(
        CREATE TABLE IF NOT EXISTS nodes (
            id TEXT PRIMARY KEY,
            address TEXT NOT NULL,
            status TEXT NOT NULL,
            storage_used INTEGER NOT NULL,
            storage_max INTEGER NOT NULL,
            last_seen INTEGER NOT NULL,
            CONSTRAINT valid_usage CHECK (storage_used >= 0 AND storage_used <= storage_max)
        );
    )");
}

// ============================================================================
// Snapshot
// ============================================================================

void NodeDatabase::save(const std::vector<Node>& nodes) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    exec("BEGIN IMMEDIATE TRANSACTION;");

    try {
        exec("DELETE FROM nodes;");

        const char* sql = R"(
            INSERT INTO nodes (id, address, status, storage_used, storage_max, last_seen)
            VALUES (?, ?, ?, ?, ?, ?)
        )";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw MeshError(ErrorKind::IO_FAILURE, std::string("Node database error: ") + sqlite3_errmsg(db));
        }

        for (const auto& node : nodes) {
            std::string status = node_status_to_string(node.status);

            sqlite3_bind_text(stmt, 1, node.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, node.address.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, status.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 4, node.storage_used);
            sqlite3_bind_int64(stmt, 5, node.storage_max);
            sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(node.last_seen));

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE) {
                std::string reason = sqlite3_errmsg(db);
                sqlite3_finalize(stmt);
                throw MeshError(ErrorKind::IO_FAILURE, "Failed to store node " + node.id + ": " + reason);
            }

            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }

        sqlite3_finalize(stmt);
        exec("COMMIT;");

    } catch (const MeshError&) {
        char* error_msg = nullptr;
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &error_msg);
        if (error_msg) {
            utilities::log_error("NodeDatabase: rollback failed: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        throw;
    }

    utilities::log_debug("NodeDatabase: saved " + std::to_string(nodes.size()) + " nodes");
}

std::vector<Node> NodeDatabase::load() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<Node> nodes;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT id, address, status, storage_used, storage_max, last_seen
        FROM nodes
        ORDER BY id
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw MeshError(ErrorKind::IO_FAILURE, std::string("Node database error: ") + sqlite3_errmsg(db));
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Node node;
        node.id = column_text(stmt, 0);
        node.address = column_text(stmt, 1);

        std::string status = column_text(stmt, 2);
        auto parsed = node_status_from_string(status);
        if (!parsed) {
            utilities::log_warn("NodeDatabase: node " + node.id + " has unknown status '" + status + "', loading as inactive");
        }
        node.status = parsed.value_or(NodeStatus::INACTIVE);

        node.storage_used = sqlite3_column_int64(stmt, 3);
        node.storage_max = sqlite3_column_int64(stmt, 4);
        node.last_seen = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));

        nodes.push_back(std::move(node));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw MeshError(ErrorKind::IO_FAILURE, std::string("Failed to read nodes: ") + sqlite3_errstr(rc));
    }

    return nodes;
}

} // namespace meshfs
