/**
 * @file node_config.cpp
 * @brief Implementation of node configuration loading
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/node_config.hpp"
#include "meshfs/errors.hpp"

#include <charconv>
#include <filesystem>
#include <sstream>

using json = nlohmann::json;

namespace meshfs {

namespace {

uint16_t parse_port(const std::string& value, const std::string& source) {
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() || port > 65535) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Invalid port in " + source + ": '" + value + "'");
    }
    return static_cast<uint16_t>(port);
}

utilities::LogLevel parse_level(const std::string& value, const std::string& source) {
    auto level = utilities::parse_log_level(value);
    if (!level) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Invalid log level in " + source + ": '" + value + "'");
    }
    return *level;
}

/// Split "--name=value" into name and value
bool split_inline_value(const std::string& arg, std::string& name, std::string& value) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) {
        name = arg;
        return false;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // anonymous namespace

std::vector<std::string> parse_peer_list(const std::string& list) {
    std::vector<std::string> peers;
    for (const auto& entry : utilities::split_string(list, ',')) {
        std::string peer = utilities::trim_string(entry);
        if (!peer.empty()) {
            peers.push_back(peer);
        }
    }
    return peers;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const NodeConfig& config) {
    j = json{
        {"node_id", config.node_id},
        {"p2p_port", config.p2p_port},
        {"data_dir", config.data_dir},
        {"bootstrap_peers", config.bootstrap_peers},
        {"enable_p2p", config.enable_p2p},
        {"enable_discovery", config.enable_discovery},
        {"max_peers", config.max_peers},
        {"chunk_size", config.chunk_size},
        {"maintenance_interval", config.maintenance_interval.count()},
        {"log_file", config.log_file},
        {"log_level", utilities::log_level_to_string(config.log_level)}
    };
}

void NodeConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Configuration must be a JSON object");
    }

    try {
        if (j.contains("node_id")) j.at("node_id").get_to(node_id);
        if (j.contains("p2p_port")) {
            auto port = j.at("p2p_port").get<int64_t>();
            if (port < 0 || port > 65535) {
                throw MeshError(ErrorKind::INVALID_INPUT, "p2p_port out of range: " + std::to_string(port));
            }
            p2p_port = static_cast<uint16_t>(port);
        }
        if (j.contains("data_dir")) j.at("data_dir").get_to(data_dir);
        if (j.contains("bootstrap_peers")) j.at("bootstrap_peers").get_to(bootstrap_peers);
        if (j.contains("enable_p2p")) j.at("enable_p2p").get_to(enable_p2p);
        if (j.contains("enable_discovery")) j.at("enable_discovery").get_to(enable_discovery);
        if (j.contains("max_peers")) j.at("max_peers").get_to(max_peers);
        if (j.contains("chunk_size")) j.at("chunk_size").get_to(chunk_size);
        if (j.contains("maintenance_interval")) {
            maintenance_interval = std::chrono::seconds(j.at("maintenance_interval").get<int64_t>());
        }
        if (j.contains("log_file")) j.at("log_file").get_to(log_file);
        if (j.contains("log_level")) {
            log_level = parse_level(j.at("log_level").get<std::string>(), "config file");
        }
    } catch (const json::exception& e) {
        throw MeshError(ErrorKind::INVALID_INPUT, std::string("Invalid configuration value: ") + e.what());
    }
}

void NodeConfig::load_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw MeshError(ErrorKind::NOT_FOUND, "Config file not found: " + path);
    }

    auto content = utilities::read_file(path);
    if (!content) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to read config file: " + path);
    }

    json j;
    try {
        j = json::parse(*content);
    } catch (const json::parse_error& e) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Malformed config file " + path + ": " + e.what());
    }

    apply_json(j);
}

// ============================================================================
// Environment
// ============================================================================

void NodeConfig::apply_environment() {
    std::string value = utilities::get_env("MESHFS_NODE_ID");
    if (!value.empty()) {
        node_id = value;
    }

    value = utilities::get_env("MESHFS_P2P_PORT");
    if (!value.empty()) {
        p2p_port = parse_port(value, "MESHFS_P2P_PORT");
    }

    value = utilities::get_env("MESHFS_DATA_DIR");
    if (!value.empty()) {
        data_dir = value;
    }

    value = utilities::get_env("MESHFS_PEERS");
    if (!value.empty()) {
        bootstrap_peers = parse_peer_list(value);
    }

    value = utilities::get_env("MESHFS_LOG_LEVEL");
    if (!value.empty()) {
        log_level = parse_level(value, "MESHFS_LOG_LEVEL");
    }
}

// ============================================================================
// Validation
// ============================================================================

void NodeConfig::validate() {
    if (node_id.empty()) {
        node_id = "node-" + utilities::generate_random_hex(config::NODE_ID_BYTES);
    }
    if (!config::validate_identifier(node_id)) {
        throw MeshError(ErrorKind::INVALID_INPUT, "Invalid node id: '" + node_id + "'");
    }

    if (data_dir.empty()) {
        throw MeshError(ErrorKind::INVALID_INPUT, "data_dir must not be empty");
    }

    for (const auto& peer : bootstrap_peers) {
        if (!config::validate_address(peer)) {
            throw MeshError(ErrorKind::INVALID_INPUT, "Invalid bootstrap peer address: '" + peer + "'");
        }
    }

    if (max_peers == 0) {
        throw MeshError(ErrorKind::INVALID_INPUT, "max_peers must be positive");
    }

    if (chunk_size == 0) {
        chunk_size = config::DEFAULT_CHUNK_SIZE;
    } else if (chunk_size > config::MAX_CHUNK_SIZE) {
        utilities::log_warn("Configured chunk_size " + std::to_string(chunk_size) +
                            " clamped to " + std::to_string(config::MAX_CHUNK_SIZE));
        chunk_size = config::MAX_CHUNK_SIZE;
    }

    if (maintenance_interval.count() <= 0) {
        throw MeshError(ErrorKind::INVALID_INPUT, "maintenance_interval must be positive");
    }
}

// ============================================================================
// Command Line
// ============================================================================

NodeConfig NodeConfig::from_command_line(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    NodeConfig config;

    // The config file sits below environment and flags, so load it first
    for (size_t i = 0; i < args.size(); ++i) {
        std::string name;
        std::string value;
        bool has_inline = split_inline_value(args[i], name, value);
        if (name != "--config") {
            continue;
        }
        if (!has_inline) {
            if (i + 1 >= args.size()) {
                throw MeshError(ErrorKind::INVALID_INPUT, "--config requires a value");
            }
            value = args[i + 1];
        }
        config.load_file(value);
    }

    config.apply_environment();

    for (size_t i = 0; i < args.size(); ++i) {
        std::string name;
        std::string value;
        bool has_inline = split_inline_value(args[i], name, value);

        auto take_value = [&]() -> std::string {
            if (has_inline) {
                return value;
            }
            if (i + 1 >= args.size()) {
                throw MeshError(ErrorKind::INVALID_INPUT, name + " requires a value");
            }
            return args[++i];
        };

        if (name == "--id") {
            config.node_id = take_value();
        } else if (name == "--p2p-port") {
            config.p2p_port = parse_port(take_value(), "--p2p-port");
        } else if (name == "--data") {
            config.data_dir = take_value();
        } else if (name == "--peers") {
            config.bootstrap_peers = parse_peer_list(take_value());
        } else if (name == "--no-p2p") {
            config.enable_p2p = false;
        } else if (name == "--no-discovery") {
            config.enable_discovery = false;
        } else if (name == "--config") {
            take_value();
        } else if (name == "--log-file") {
            config.log_file = take_value();
        } else if (name == "--log-level") {
            config.log_level = parse_level(take_value(), "--log-level");
        } else {
            throw MeshError(ErrorKind::INVALID_INPUT, "Unknown option: " + args[i]);
        }
    }

    return config;
}

std::string NodeConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --id <node_id>          Node identifier (default: random)\n"
        << "  --p2p-port <port>       P2P listen port (default: " << config::DEFAULT_P2P_PORT << ", 0 = ephemeral)\n"
        << "  --data <dir>            Data directory (default: ./data)\n"
        << "  --peers <a:p,b:p>       Comma-separated bootstrap peers\n"
        << "  --no-p2p                Disable the P2P overlay\n"
        << "  --no-discovery          Disable periodic peer discovery\n"
        << "  --config <file>         JSON configuration file\n"
        << "  --log-file <file>       Also log to a rotating file\n"
        << "  --log-level <level>     debug, info, warn, error, critical\n"
        << "  --help                  Show this help\n"
        << "\n"
        << "Environment: MESHFS_NODE_ID, MESHFS_P2P_PORT, MESHFS_DATA_DIR, MESHFS_PEERS, MESHFS_LOG_LEVEL\n";
    return out.str();
}

} // namespace meshfs
