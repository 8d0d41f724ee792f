#pragma once

#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/file_progress.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault::transfer {

using storage::ChunkStatus;

enum class MemoryPressure {
    LOW = 0,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class JobPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

const char* memory_pressure_to_string(MemoryPressure pressure);
const char* job_priority_to_string(JobPriority priority);
bool job_priority_from_string(const std::string& value, JobPriority& out);

// Immutable position of a chunk inside its file. end_byte is exclusive.
struct ChunkDescriptor {
    std::string chunk_id;
    std::string file_id;
    std::string file_name;
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 0;
    uint64_t start_byte = 0;
    uint64_t end_byte = 0;
    uint64_t chunk_size = 0;
    bool is_last_chunk = false;

    uint64_t actual_size() const { return end_byte - start_byte; }

    static std::string make_chunk_id(const std::string& file_id, uint32_t chunk_index);
};

struct UploadedChunk {
    ChunkDescriptor descriptor;
    std::string upload_path;
    std::string checksum;
};

struct ChunkReassemblyInfo {
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t total_chunks = 0;
    std::vector<UploadedChunk> uploaded_chunks;
    bool is_complete = false;
};

struct ChunkUploadResult {
    std::string chunk_id;
    core::Result result;
    std::string upload_path;
    std::string checksum;
    bool from_cache = false;

    bool success() const { return result.success(); }
};

} // namespace chunkvault::transfer
