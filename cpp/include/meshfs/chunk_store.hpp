/**
 * @file chunk_store.hpp
 * @brief Content-addressed chunk storage on the local filesystem
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Layout: <root>/<file_id>/<chunk_id>
 * - file_id  = SHA-256 hex of the whole file
 * - chunk_id = SHA-256 hex of the chunk bytes
 *
 * Identical chunks of one file share a single file on disk.
 */

#pragma once

#include "meshfs/storage_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshfs {

/**
 * @brief Metadata for one chunk of a split file
 */
struct ChunkInfo {
    std::string id;             ///< SHA-256 hex of the chunk bytes
    int64_t index;              ///< Position within the file
    int64_t size;               ///< Chunk length in bytes
    std::string file_id;        ///< SHA-256 hex of the whole file
    std::string location;       ///< Node id holding the chunk
};

void to_json(nlohmann::json& j, const ChunkInfo& chunk);
void from_json(const nlohmann::json& j, ChunkInfo& chunk);

/**
 * @brief Outcome of splitting one file
 */
struct SplitResult {
    std::string file_id;
    std::vector<ChunkInfo> chunks;      ///< Ordered by index
    uint64_t total_size;
};

void to_json(nlohmann::json& j, const SplitResult& result);

/**
 * @brief ChunkStore - split, reassemble, get and put chunks under a root directory
 *
 * Calls are reentrant. Writes are neither fsynced nor atomically renamed.
 * Failures throw MeshError (NOT_FOUND, INVALID_INPUT, IO_FAILURE).
 */
class ChunkStore {
public:
    /**
     * @brief Open (and create) a chunk root
     * @param root Directory holding one subdirectory per file
     * @param default_chunk_size Size used when split() is given 0
     * @param location Node id recorded in ChunkInfo::location
     * @throws MeshError IO_FAILURE if the root cannot be created
     */
    explicit ChunkStore(
        std::filesystem::path root,
        size_t default_chunk_size = config::DEFAULT_CHUNK_SIZE,
        std::string location = ""
    );

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    /**
     * @brief Split a file into content-addressed chunks
     *
     * The file is read once to compute file_id, then again to write the
     * chunks. An empty file yields zero chunks.
     *
     * @param file_path Source file
     * @param chunk_size Chunk size; 0 selects the default, values above
     *        MAX_CHUNK_SIZE are clamped
     * @throws MeshError NOT_FOUND if the file does not exist
     */
    SplitResult split(const std::string& file_path, size_t chunk_size = 0);

    /**
     * @brief Write a file's chunks to output_path in index order
     *
     * Indices must form a dense 0..N-1 permutation.
     *
     * @throws MeshError INVALID_INPUT for an index outside [0, N) or a duplicate index
     * @throws MeshError NOT_FOUND if a chunk file is missing
     */
    void reassemble(
        const std::string& file_id,
        const std::vector<ChunkInfo>& chunks,
        const std::string& output_path
    ) const;

    /**
     * @brief Read one chunk
     * @throws MeshError NOT_FOUND if absent
     */
    std::vector<uint8_t> get(const std::string& file_id, const std::string& chunk_id) const;

    /**
     * @brief Store one chunk, creating the per-file directory on demand
     */
    void put(const std::string& file_id, const std::string& chunk_id, const std::vector<uint8_t>& data);

    /**
     * @brief Recompute a chunk's hash and compare it with its id
     * @throws MeshError NOT_FOUND if absent
     */
    bool verify(const std::string& file_id, const std::string& chunk_id) const;

    /**
     * @brief Metadata recorded for a chunk by split()
     */
    std::optional<ChunkInfo> chunk_info(const std::string& chunk_id) const;

    size_t chunk_count() const;

    const std::filesystem::path& root() const { return root_; }

    size_t default_chunk_size() const { return default_chunk_size_; }

    /**
     * @brief Chunk size actually used for a request
     */
    static size_t effective_chunk_size(size_t requested, size_t fallback);

private:
    std::filesystem::path root_;
    size_t default_chunk_size_;
    std::string location_;

    /// Chunk metadata (chunk_id -> info)
    std::map<std::string, ChunkInfo> chunks_;
    mutable std::mutex chunks_mutex_;

    std::filesystem::path chunk_path(const std::string& file_id, const std::string& chunk_id) const;
};

} // namespace meshfs
