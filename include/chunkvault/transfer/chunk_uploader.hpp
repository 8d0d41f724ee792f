#pragma once

#include "transfer_scheduler.hpp"
#include "transfer_types.hpp"
#include "chunkvault/storage/storage_backend.hpp"
#include "chunkvault/storage/storage_config.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace chunkvault::storage {
class ResumeManager;
}

namespace chunkvault::transfer {

class ProgressTracker;

// One upload attempt of one chunk: cache short-circuit, byte-range check,
// checksum, backend upload, then the completed record.
class ChunkUploader : public ChunkJobExecutor {
public:
    ChunkUploader(std::shared_ptr<storage::StorageBackend> backend,
                  std::shared_ptr<storage::ResumeManager> resume_manager,
                  std::shared_ptr<ProgressTracker> tracker,
                  storage::StorageConfig config);

    ChunkUploadResult execute(const ChunkDescriptor& descriptor,
                              const std::vector<uint8_t>& bytes,
                              const std::atomic<bool>& abandoned) override;

    ChunkUploadResult upload(const ChunkDescriptor& descriptor, const std::vector<uint8_t>& bytes);

private:
    std::shared_ptr<storage::StorageBackend> backend_;
    std::shared_ptr<storage::ResumeManager> resume_manager_;
    std::shared_ptr<ProgressTracker> tracker_;
    storage::StorageConfig config_;

    bool try_cached(const ChunkDescriptor& descriptor, ChunkUploadResult& result);
    void cache_entry(const ChunkDescriptor& descriptor, ChunkStatus status, const std::string& checksum,
                     const std::string& upload_path, const std::vector<uint8_t>& bytes);
    void report_bytes(const ChunkDescriptor& descriptor, uint32_t percent);

    static ChunkUploadResult cancelled(const ChunkDescriptor& descriptor);
};

} // namespace chunkvault::transfer
