#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::storage {

enum class ChunkStatus {
    PENDING = 0,
    UPLOADING,
    COMPLETED,
    FAILED,
    RETRYING
};

const char* chunk_status_to_string(ChunkStatus status);
std::optional<ChunkStatus> chunk_status_from_string(const std::string& value);

struct ChunkState {
    std::string chunk_id;
    uint32_t chunk_index = 0;
    ChunkStatus status = ChunkStatus::PENDING;
    std::string checksum;
    std::string upload_path;
    uint64_t size = 0;
    uint64_t start_byte = 0;
    uint64_t end_byte = 0;
    uint32_t attempts = 0;
    int64_t last_attempt_ms = 0;
    std::string error_message;
};

struct UploadProgress {
    uint32_t total_chunks = 0;
    uint32_t completed_chunks = 0;
    uint32_t failed_chunks = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t total_bytes = 0;
    int64_t start_time_ms = 0;
    int64_t last_update_ms = 0;
};

// Resumable state of one file transfer, keyed by file_id
struct FileProgressState {
    std::string file_id;
    std::string file_name;
    std::string file_path;
    uint64_t file_size = 0;
    int64_t last_modified_ms = 0;
    uint64_t chunk_size = 0;
    std::string file_checksum;
    std::map<std::string, ChunkState> chunk_states;
    UploadProgress upload_progress;

    // Rebuilds completed/failed/bytes counters from chunk_states
    void recompute_counters();

    bool has_completed_chunk() const;
    bool all_chunks_completed() const;

    std::vector<ChunkState> sorted_chunks() const;
    ChunkState* find_chunk(const std::string& chunk_id);
    const ChunkState* find_chunk(const std::string& chunk_id) const;
};

struct ChunkCacheEntry {
    std::string chunk_id;
    std::string file_id;
    uint32_t chunk_index = 0;
    std::string checksum;
    ChunkStatus status = ChunkStatus::PENDING;
    std::string upload_path;
    uint32_t retry_count = 0;
    uint64_t size = 0;
    std::vector<uint8_t> payload;
    int64_t updated_at_ms = 0;

    bool is_completed() const { return status == ChunkStatus::COMPLETED && !upload_path.empty(); }
};

} // namespace chunkvault::storage
