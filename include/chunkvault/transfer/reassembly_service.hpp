#pragma once

#include "transfer_types.hpp"
#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/storage_backend.hpp"
#include "chunkvault/storage/storage_config.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkvault::storage {
class ResumeManager;
}

namespace chunkvault::transfer {

struct ReassemblyResult {
    core::Result result;
    std::string file_path;
    uint64_t bytes_written = 0;
    uint32_t chunks_verified = 0;
    uint32_t chunks_skipped = 0;

    bool success() const { return result.success(); }
};

struct ChunkAvailability {
    uint32_t total_chunks = 0;
    std::vector<uint32_t> available;
    std::vector<uint32_t> missing;

    bool complete() const { return total_chunks > 0 && missing.empty(); }
};

// Downloads, verifies and concatenates uploaded chunks in index order, then
// uploads the result as the final artifact.
class ReassemblyService {
public:
    ReassemblyService(std::shared_ptr<storage::StorageBackend> backend,
                      std::shared_ptr<storage::ResumeManager> resume_manager,
                      storage::StorageConfig config);

    ReassemblyResult reassemble(const ChunkReassemblyInfo& info);

    ChunkAvailability check_chunk_availability(const ChunkReassemblyInfo& info) const;

    // Continues after the last confirmed chunk of an earlier attempt
    ReassemblyResult resume_reassembly(const ChunkReassemblyInfo& info);

    core::Result verify_reassembled_file(const std::string& path, uint64_t expected_size);

    static uint64_t get_total_chunk_size(const std::vector<UploadedChunk>& chunks);

    // Number of leading chunks already written to the staging file
    uint32_t get_checkpoint(const std::string& file_id) const;

private:
    std::shared_ptr<storage::StorageBackend> backend_;
    std::shared_ptr<storage::ResumeManager> resume_manager_;
    storage::StorageConfig config_;

    std::unordered_map<std::string, uint32_t> checkpoints_;
    mutable std::mutex mutex_;

    core::Result validate(const ChunkReassemblyInfo& info, std::vector<UploadedChunk>& ordered) const;
    ReassemblyResult run(const ChunkReassemblyInfo& info, uint32_t start_index);
    core::Result download_and_verify(const UploadedChunk& chunk, std::vector<uint8_t>& bytes);
    uint32_t usable_checkpoint(const ChunkReassemblyInfo& info, const std::vector<UploadedChunk>& ordered,
                               const std::filesystem::path& staging_path) const;
    void cleanup_chunks(const std::vector<UploadedChunk>& chunks);
    void set_checkpoint(const std::string& file_id, uint32_t confirmed);
    void clear_checkpoint(const std::string& file_id);
};

} // namespace chunkvault::transfer
