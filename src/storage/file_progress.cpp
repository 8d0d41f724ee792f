#include "chunkvault/storage/file_progress.hpp"
#include <algorithm>

namespace chunkvault::storage {

const char* chunk_status_to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::PENDING: return "pending";
        case ChunkStatus::UPLOADING: return "uploading";
        case ChunkStatus::COMPLETED: return "completed";
        case ChunkStatus::FAILED: return "failed";
        case ChunkStatus::RETRYING: return "retrying";
    }
    return "pending";
}

std::optional<ChunkStatus> chunk_status_from_string(const std::string& value) {
    if (value == "pending") return ChunkStatus::PENDING;
    if (value == "uploading") return ChunkStatus::UPLOADING;
    if (value == "completed") return ChunkStatus::COMPLETED;
    if (value == "failed") return ChunkStatus::FAILED;
    if (value == "retrying") return ChunkStatus::RETRYING;
    return std::nullopt;
}

void FileProgressState::recompute_counters() {
    uint32_t completed = 0;
    uint32_t failed = 0;
    uint64_t bytes = 0;

    for (const auto& [chunk_id, chunk] : chunk_states) {
        if (chunk.status == ChunkStatus::COMPLETED) {
            completed++;
            bytes += chunk.size;
        } else if (chunk.status == ChunkStatus::FAILED) {
            failed++;
        }
    }

    upload_progress.total_chunks = static_cast<uint32_t>(chunk_states.size());
    upload_progress.completed_chunks = completed;
    upload_progress.failed_chunks = failed;
    upload_progress.bytes_uploaded = bytes;
    upload_progress.total_bytes = file_size;
}

bool FileProgressState::has_completed_chunk() const {
    return std::any_of(chunk_states.begin(), chunk_states.end(), [](const auto& entry) {
        return entry.second.status == ChunkStatus::COMPLETED;
    });
}

bool FileProgressState::all_chunks_completed() const {
    if (chunk_states.empty()) {
        return false;
    }
    return std::all_of(chunk_states.begin(), chunk_states.end(), [](const auto& entry) {
        return entry.second.status == ChunkStatus::COMPLETED;
    });
}

std::vector<ChunkState> FileProgressState::sorted_chunks() const {
    std::vector<ChunkState> chunks;
    chunks.reserve(chunk_states.size());
    for (const auto& [chunk_id, chunk] : chunk_states) {
        chunks.push_back(chunk);
    }

    std::sort(chunks.begin(), chunks.end(), [](const ChunkState& a, const ChunkState& b) {
        return a.chunk_index < b.chunk_index;
    });
    return chunks;
}

ChunkState* FileProgressState::find_chunk(const std::string& chunk_id) {
    auto it = chunk_states.find(chunk_id);
    return it != chunk_states.end() ? &it->second : nullptr;
}

const ChunkState* FileProgressState::find_chunk(const std::string& chunk_id) const {
    auto it = chunk_states.find(chunk_id);
    return it != chunk_states.end() ? &it->second : nullptr;
}

} // namespace chunkvault::storage
