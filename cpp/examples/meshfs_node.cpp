/**
 * @file meshfs_node.cpp
 * @brief Interactive meshfs node daemon
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Drives MeshNode through the same calls a control plane would make:
 * - Node registry management
 * - Peer connect / disconnect / discovery
 * - Replica placement
 * - File split / reassemble
 */

#include "meshfs/errors.hpp"
#include "meshfs/mesh_node.hpp"
#include "meshfs/utilities.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h>

using namespace meshfs;
using namespace meshfs::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    g_shutdown = true;
    // Unblock the command loop; main() performs the actual shutdown
    ::close(STDIN_FILENO);
}

// Print help menu
void print_help() {
    std::cout << "\n+----------------------------------------------------------------+\n";
    std::cout << "|                     meshfs Node Commands                       |\n";
    std::cout << "+----------------------------------------------------------------+\n";
    std::cout << "| help                          - Show this help menu            |\n";
    std::cout << "| status [json]                 - Show node and mesh status      |\n";
    std::cout << "| peers                         - List overlay peers             |\n";
    std::cout << "| connect <host:port>           - Connect to a peer              |\n";
    std::cout << "| disconnect <peer_id>          - Drop a peer                    |\n";
    std::cout << "| discover                      - Ask peers for their peers      |\n";
    std::cout << "| ping                          - Ping every peer                |\n";
    std::cout << "| nodes                         - List known nodes               |\n";
    std::cout << "| register <id> <addr> <max>    - Register or refresh a node     |\n";
    std::cout << "| heartbeat <id>                - Refresh a node's last_seen     |\n";
    std::cout << "| node-status <id> <status>     - active | inactive | failed     |\n";
    std::cout << "| usage <id> <bytes>            - Set a node's storage used      |\n";
    std::cout << "| remove <id>                   - Forget a node                  |\n";
    std::cout << "| place <size> <replicas>       - Rank nodes for placement       |\n";
    std::cout << "| split <path> [chunk_size]     - Split a file into chunks       |\n";
    std::cout << "| reassemble <file_id> <out>    - Rebuild a split file           |\n";
    std::cout << "| verify <file_id>              - Re-hash every chunk of a file  |\n";
    std::cout << "| quit / exit                   - Shutdown node                  |\n";
    std::cout << "+----------------------------------------------------------------+\n\n";
}

void list_peers(MeshNode& node) {
    if (!node.overlay()) {
        std::cout << "P2P overlay disabled.\n";
        return;
    }

    auto peers = node.overlay()->list_peers();
    if (peers.empty()) {
        std::cout << "No peers connected.\n";
        return;
    }

    for (const auto& peer : peers) {
        std::cout << "  " << std::left << std::setw(24) << peer.id
                  << std::setw(10) << peer_state_to_string(peer.state)
                  << std::setw(10) << (peer.inbound ? "inbound" : "outbound")
                  << "node=" << (peer.node_id.empty() ? "-" : peer.node_id)
                  << "  last=" << format_timestamp(peer.last_active) << "\n";
    }
}

void list_nodes(MeshNode& node) {
    auto nodes = node.registry().list();
    if (nodes.empty()) {
        std::cout << "No nodes registered.\n";
        return;
    }

    for (const auto& n : nodes) {
        std::cout << "  " << std::left << std::setw(24) << n.id
                  << std::setw(24) << n.address
                  << std::setw(10) << node_status_to_string(n.status)
                  << format_file_size(static_cast<uint64_t>(n.storage_used)) << " / "
                  << format_file_size(static_cast<uint64_t>(n.storage_max))
                  << "  seen=" << format_timestamp(n.last_seen) << "\n";
    }
}

// Handle user commands
bool handle_command(MeshNode& node, std::map<std::string, std::vector<ChunkInfo>>& split_files,
                    const std::string& command_line) {
    if (command_line.empty()) {
        return true;
    }

    std::istringstream iss(command_line);
    std::string cmd;
    iss >> cmd;

    try {
        if (cmd == "help" || cmd == "h" || cmd == "?") {
            print_help();
        }
        else if (cmd == "status") {
            std::string format;
            iss >> format;
            if (format == "json") {
                nlohmann::json j = node.system_status();
                std::cout << j.dump(2) << "\n";
            } else {
                node.print_status();
            }
        }
        else if (cmd == "peers") {
            list_peers(node);
        }
        else if (cmd == "connect") {
            std::string address;
            iss >> address;
            if (address.empty()) {
                std::cout << "Usage: connect <host:port>\n";
            } else if (!node.overlay()) {
                std::cout << "[FAIL] P2P overlay disabled\n";
            } else {
                auto peer = node.overlay()->connect(address);
                std::cout << "[OK] Connected to " << peer.address << " (node " << peer.node_id << ")\n";
            }
        }
        else if (cmd == "disconnect") {
            std::string peer_id;
            iss >> peer_id;
            if (peer_id.empty()) {
                std::cout << "Usage: disconnect <peer_id>\n";
            } else if (node.overlay()) {
                node.overlay()->disconnect(peer_id);
                std::cout << "[OK] Disconnected " << peer_id << "\n";
            }
        }
        else if (cmd == "discover") {
            if (node.overlay()) {
                node.overlay()->discover();
                std::cout << "[OK] Discovery request broadcast\n";
            }
        }
        else if (cmd == "ping") {
            if (node.overlay()) {
                node.overlay()->ping_all();
                std::cout << "[OK] Ping broadcast\n";
            }
        }
        else if (cmd == "nodes") {
            list_nodes(node);
        }
        else if (cmd == "register") {
            std::string id, address;
            int64_t storage_max = -1;
            iss >> id >> address >> storage_max;
            if (id.empty() || address.empty() || iss.fail()) {
                std::cout << "Usage: register <id> <host:port> <storage_max>\n";
            } else {
                auto registered = node.registry().register_node(id, address, storage_max);
                std::cout << "[OK] Registered " << registered.id << " at " << registered.address << "\n";
            }
        }
        else if (cmd == "heartbeat") {
            std::string id;
            iss >> id;
            node.registry().heartbeat(id);
            std::cout << "[OK] Heartbeat recorded for " << id << "\n";
        }
        else if (cmd == "node-status") {
            std::string id, status;
            iss >> id >> status;
            node.registry().set_status(id, status);
            std::cout << "[OK] " << id << " is now " << status << "\n";
        }
        else if (cmd == "usage") {
            std::string id;
            int64_t used = -1;
            iss >> id >> used;
            if (id.empty() || iss.fail()) {
                std::cout << "Usage: usage <id> <bytes>\n";
            } else {
                node.registry().set_storage_used(id, used);
                std::cout << "[OK] " << id << " uses " << format_file_size(static_cast<uint64_t>(used)) << "\n";
            }
        }
        else if (cmd == "remove") {
            std::string id;
            iss >> id;
            node.registry().remove(id);
            std::cout << "[OK] Removed " << id << "\n";
        }
        else if (cmd == "place") {
            int64_t size = 0;
            int64_t replicas = 0;
            iss >> size >> replicas;
            if (iss.fail()) {
                std::cout << "Usage: place <size> <replicas>\n";
            } else {
                auto selected = node.placement().select(size, replicas);
                if (selected.empty()) {
                    std::cout << "No eligible nodes.\n";
                }
                for (size_t i = 0; i < selected.size(); ++i) {
                    std::cout << "  " << (i + 1) << ". " << selected[i] << "\n";
                }
            }
        }
        else if (cmd == "split") {
            std::string path;
            size_t chunk_size = 0;
            iss >> path;
            if (!(iss >> chunk_size)) {
                chunk_size = 0;
            }
            if (path.empty()) {
                std::cout << "Usage: split <path> [chunk_size]\n";
            } else if (node.chunk_store()) {
                auto result = node.chunk_store()->split(path, chunk_size);
                split_files[result.file_id] = result.chunks;
                std::cout << "[OK] " << path << " -> file " << result.file_id << ", "
                          << result.chunks.size() << " chunks, " << format_file_size(result.total_size) << "\n";
            }
        }
        else if (cmd == "reassemble") {
            std::string file_id, output;
            iss >> file_id >> output;
            auto it = split_files.find(file_id);
            if (file_id.empty() || output.empty()) {
                std::cout << "Usage: reassemble <file_id> <output_path>\n";
            } else if (it == split_files.end()) {
                std::cout << "[FAIL] No chunk list for file " << file_id << " in this session\n";
            } else if (node.chunk_store()) {
                node.chunk_store()->reassemble(file_id, it->second, output);
                std::cout << "[OK] Reassembled " << file_id << " into " << output << "\n";
            }
        }
        else if (cmd == "verify") {
            std::string file_id;
            iss >> file_id;
            auto it = split_files.find(file_id);
            if (it == split_files.end()) {
                std::cout << "[FAIL] No chunk list for file " << file_id << " in this session\n";
            } else if (node.chunk_store()) {
                size_t bad = 0;
                for (const auto& chunk : it->second) {
                    if (!node.chunk_store()->verify(file_id, chunk.id)) {
                        std::cout << "  corrupt chunk " << chunk.index << " (" << chunk.id << ")\n";
                        ++bad;
                    }
                }
                std::cout << (bad == 0 ? "[OK] " : "[FAIL] ") << it->second.size() - bad << "/"
                          << it->second.size() << " chunks intact\n";
            }
        }
        else if (cmd == "quit" || cmd == "exit") {
            return false;
        }
        else {
            std::cout << "Unknown command: " << cmd << "\n";
            std::cout << "Type 'help' for available commands\n";
        }

    } catch (const MeshError& e) {
        std::cout << "[" << error_kind_to_string(e.kind()) << "] " << e.what() << "\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << NodeConfig::usage(argv[0]);
            return 0;
        }
    }

    NodeConfig config;
    try {
        config = NodeConfig::from_command_line(argc, argv);
    } catch (const MeshError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << NodeConfig::usage(argv[0]);
        return 1;
    }

    initialize_logging(config.log_file, config.log_level);

    std::cout << "\n================================================================\n";
    std::cout << "                      meshfs Storage Node                        \n";
    std::cout << "              Copyright © 2025 Fortified Solutions Inc.          \n";
    std::cout << "================================================================\n\n";

    try {
        MeshNode node(config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << "Starting node '" << node.node_id() << "'...\n";
        if (!node.start()) {
            std::cerr << "Failed to start node\n";
            return 1;
        }
        node.print_status();

        // Maintenance loop in the background
        std::thread maintenance([&node]() {
            node.run();
        });

        print_help();

        std::map<std::string, std::vector<ChunkInfo>> split_files;
        std::string line;
        while (!g_shutdown && std::cout << "> " && std::getline(std::cin, line)) {
            if (!handle_command(node, split_files, line)) {
                break;
            }
        }

        std::cout << "\nShutting down node...\n";
        g_shutdown = true;
        node.stop();

        if (maintenance.joinable()) {
            maintenance.join();
        }

        std::cout << "Node stopped successfully\n";

    } catch (const std::exception& e) {
        log_critical("meshfs_node: Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
