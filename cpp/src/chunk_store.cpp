/**
 * @file chunk_store.cpp
 * @brief Implementation of content-addressed chunk storage
 *
 * meshfs - Peer-discovered chunk storage mesh
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshfs/chunk_store.hpp"
#include "meshfs/errors.hpp"
#include "meshfs/utilities.hpp"

#include <algorithm>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace meshfs {

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const ChunkInfo& chunk) {
    j = json{
        {"id", chunk.id},
        {"index", chunk.index},
        {"size", chunk.size},
        {"fileId", chunk.file_id},
        {"location", chunk.location}
    };
}

void from_json(const json& j, ChunkInfo& chunk) {
    j.at("id").get_to(chunk.id);
    j.at("index").get_to(chunk.index);
    chunk.size = j.value("size", int64_t{0});
    chunk.file_id = j.value("fileId", std::string());
    chunk.location = j.value("location", std::string());
}

void to_json(json& j, const SplitResult& result) {
    j = json{
        {"fileId", result.file_id},
        {"chunks", result.chunks},
        {"totalSize", result.total_size}
    };
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

void require_safe_id(const std::string& id, const char* what) {
    if (!config::is_safe_path_component(id)) {
        throw MeshError(ErrorKind::INVALID_INPUT, std::string("Invalid ") + what + ": '" + id + "'");
    }
}

void create_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to create directory " + dir.string() + ": " + ec.message());
    }
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

ChunkStore::ChunkStore(fs::path root, size_t default_chunk_size, std::string location)
    : root_(std::move(root))
    , default_chunk_size_(effective_chunk_size(default_chunk_size, config::DEFAULT_CHUNK_SIZE))
    , location_(std::move(location))
{
    meshfs::create_directory(root_);
}

size_t ChunkStore::effective_chunk_size(size_t requested, size_t fallback) {
    size_t size = requested == 0 ? fallback : requested;
    if (size == 0) {
        size = config::DEFAULT_CHUNK_SIZE;
    }
    return std::min(size, config::MAX_CHUNK_SIZE);
}

fs::path ChunkStore::chunk_path(const std::string& file_id, const std::string& chunk_id) const {
    require_safe_id(file_id, "file id");
    require_safe_id(chunk_id, "chunk id");
    return root_ / file_id / chunk_id;
}

// ============================================================================
// Split / Reassemble
// ============================================================================

SplitResult ChunkStore::split(const std::string& file_path, size_t chunk_size) {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw MeshError(ErrorKind::NOT_FOUND, "File not found: " + file_path);
    }

    size_t size = effective_chunk_size(chunk_size, default_chunk_size_);

    std::ifstream input(file_path, std::ios::binary);
    if (!input) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to open file: " + file_path);
    }

    std::vector<uint8_t> buffer(size);

    // First pass: whole-file hash
    utilities::Sha256Stream hasher;
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytes_read = input.gcount();
        if (bytes_read > 0) {
            hasher.update(buffer.data(), static_cast<size_t>(bytes_read));
        }
    }
    if (input.bad()) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to hash file: " + file_path);
    }
    std::string file_id = hasher.finalize_hex();

    // Rewind the same stream for the chunking pass
    input.clear();
    input.seekg(0, std::ios::beg);
    if (!input) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to rewind file: " + file_path);
    }

    fs::path file_dir = root_ / file_id;
    meshfs::create_directory(file_dir);

    SplitResult result;
    result.file_id = file_id;
    result.total_size = 0;

    // Second pass: chunks
    int64_t index = 0;

    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytes_read = input.gcount();
        if (bytes_read <= 0) {
            break;
        }

        ChunkInfo chunk;
        chunk.id = utilities::calculate_sha256(buffer.data(), static_cast<size_t>(bytes_read));
        chunk.index = index++;
        chunk.size = bytes_read;
        chunk.file_id = result.file_id;
        chunk.location = location_;

        fs::path path = file_dir / chunk.id;
        if (!utilities::write_file_binary(path.string(), buffer.data(), static_cast<size_t>(bytes_read))) {
            throw MeshError(ErrorKind::IO_FAILURE, "Failed to write chunk: " + path.string());
        }

        {
            std::lock_guard<std::mutex> lock(chunks_mutex_);
            chunks_[chunk.id] = chunk;
        }

        result.total_size += static_cast<uint64_t>(bytes_read);
        result.chunks.push_back(std::move(chunk));
    }

    if (input.bad()) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to read file: " + file_path);
    }

    utilities::log_info("ChunkStore: split " + file_path + " into " + std::to_string(result.chunks.size()) +
                        " chunks (" + utilities::format_file_size(result.total_size) + ", file " +
                        result.file_id.substr(0, 12) + ")");

    return result;
}

void ChunkStore::reassemble(
    const std::string& file_id,
    const std::vector<ChunkInfo>& chunks,
    const std::string& output_path
) const {
    require_safe_id(file_id, "file id");

    // Order by index; indices must be a permutation of 0..N-1
    std::vector<const ChunkInfo*> ordered(chunks.size(), nullptr);
    for (const auto& chunk : chunks) {
        if (chunk.index < 0 || chunk.index >= static_cast<int64_t>(chunks.size())) {
            throw MeshError(ErrorKind::INVALID_INPUT,
                "Chunk index " + std::to_string(chunk.index) + " outside [0, " +
                std::to_string(chunks.size()) + ")");
        }
        auto& slot = ordered[static_cast<size_t>(chunk.index)];
        if (slot != nullptr) {
            throw MeshError(ErrorKind::INVALID_INPUT, "Duplicate chunk index " + std::to_string(chunk.index));
        }
        slot = &chunk;
    }

    for (const auto* chunk : ordered) {
        fs::path path = chunk_path(file_id, chunk->id);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw MeshError(ErrorKind::NOT_FOUND, "Chunk not found: " + file_id + "/" + chunk->id);
        }
    }

    std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to create output file: " + output_path);
    }

    for (const auto* chunk : ordered) {
        auto data = utilities::read_file_binary(chunk_path(file_id, chunk->id).string());
        if (!data) {
            throw MeshError(ErrorKind::NOT_FOUND, "Chunk not found: " + file_id + "/" + chunk->id);
        }

        output.write(reinterpret_cast<const char*>(data->data()), static_cast<std::streamsize>(data->size()));
        if (!output) {
            throw MeshError(ErrorKind::IO_FAILURE, "Failed to write output file: " + output_path);
        }
    }

    output.close();
    if (output.fail()) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to close output file: " + output_path);
    }

    utilities::log_info("ChunkStore: reassembled " + std::to_string(chunks.size()) + " chunks of file " +
                        file_id.substr(0, 12) + " into " + output_path);
}

// ============================================================================
// Chunk Access
// ============================================================================

std::vector<uint8_t> ChunkStore::get(const std::string& file_id, const std::string& chunk_id) const {
    fs::path path = chunk_path(file_id, chunk_id);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw MeshError(ErrorKind::NOT_FOUND, "Chunk not found: " + file_id + "/" + chunk_id);
    }

    auto data = utilities::read_file_binary(path.string());
    if (!data) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to read chunk: " + path.string());
    }
    return std::move(*data);
}

void ChunkStore::put(const std::string& file_id, const std::string& chunk_id, const std::vector<uint8_t>& data) {
    fs::path path = chunk_path(file_id, chunk_id);
    meshfs::create_directory(path.parent_path());

    if (!utilities::write_file_binary(path.string(), data.data(), data.size())) {
        throw MeshError(ErrorKind::IO_FAILURE, "Failed to write chunk: " + path.string());
    }
}

bool ChunkStore::verify(const std::string& file_id, const std::string& chunk_id) const {
    auto data = get(file_id, chunk_id);
    return utilities::calculate_sha256(data) == chunk_id;
}

std::optional<ChunkInfo> ChunkStore::chunk_info(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(chunks_mutex_);

    auto it = chunks_.find(chunk_id);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ChunkStore::chunk_count() const {
    std::lock_guard<std::mutex> lock(chunks_mutex_);
    return chunks_.size();
}

} // namespace meshfs
