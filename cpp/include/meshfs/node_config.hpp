/**
 * @file node_config.hpp
 * @brief Runtime configuration of a meshfs node
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Sources, in increasing precedence:
 *   1. Built-in defaults
 *   2. JSON config file (--config)
 *   3. Environment (MESHFS_NODE_ID, MESHFS_P2P_PORT, MESHFS_DATA_DIR,
 *      MESHFS_PEERS, MESHFS_LOG_LEVEL)
 *   4. Command line flags
 */

#pragma once

#include "meshfs/storage_config.hpp"
#include "meshfs/utilities.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace meshfs {

/**
 * @brief Node configuration
 */
struct NodeConfig {
    std::string node_id;                                        ///< Empty: generated at validate()
    uint16_t p2p_port = config::DEFAULT_P2P_PORT;               ///< 0 selects an ephemeral port
    std::string data_dir = "./data";
    std::vector<std::string> bootstrap_peers;                   ///< host:port entries
    bool enable_p2p = true;
    bool enable_discovery = true;
    size_t max_peers = config::DEFAULT_MAX_PEERS;
    size_t chunk_size = config::DEFAULT_CHUNK_SIZE;
    std::chrono::seconds maintenance_interval = config::MAINTENANCE_INTERVAL;
    std::string log_file;
    utilities::LogLevel log_level = utilities::LogLevel::INFO;

    /**
     * @brief Overlay fields from a JSON config file
     * @throws MeshError NOT_FOUND if the file is missing, INVALID_INPUT if malformed
     */
    void load_file(const std::string& path);

    /**
     * @brief Overlay fields from a parsed JSON object (unknown keys ignored)
     * @throws MeshError INVALID_INPUT on a type mismatch
     */
    void apply_json(const nlohmann::json& j);

    /**
     * @brief Overlay fields from MESHFS_* environment variables
     * @throws MeshError INVALID_INPUT for an unparseable value
     */
    void apply_environment();

    /**
     * @brief Fill in generated values and check every field
     * @throws MeshError INVALID_INPUT for the first invalid field
     */
    void validate();

    /**
     * @brief Build a configuration from defaults, file, environment and flags
     *
     * A --config flag is honored before the environment is applied, so the
     * file always sits below environment and flags.
     *
     * @throws MeshError INVALID_INPUT for an unknown flag or bad value
     */
    static NodeConfig from_command_line(int argc, const char* const argv[]);

    /**
     * @brief Usage text for the command line flags
     */
    static std::string usage(const std::string& program);
};

void to_json(nlohmann::json& j, const NodeConfig& config);

/**
 * @brief Split a comma-separated peer list, dropping empty entries
 */
std::vector<std::string> parse_peer_list(const std::string& list);

} // namespace meshfs
