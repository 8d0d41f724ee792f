#include "chunkvault/transfer/chunk_uploader.hpp"
#include "chunkvault/transfer/progress_tracker.hpp"
#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <fmt/format.h>

namespace chunkvault::transfer {

using core::ErrorCode;
using core::Result;

ChunkUploader::ChunkUploader(std::shared_ptr<storage::StorageBackend> backend,
                             std::shared_ptr<storage::ResumeManager> resume_manager,
                             std::shared_ptr<ProgressTracker> tracker,
                             storage::StorageConfig config)
    : backend_(std::move(backend))
    , resume_manager_(std::move(resume_manager))
    , tracker_(std::move(tracker))
    , config_(std::move(config)) {
}

ChunkUploadResult ChunkUploader::upload(const ChunkDescriptor& descriptor, const std::vector<uint8_t>& bytes) {
    std::atomic<bool> never_abandoned{false};
    return execute(descriptor, bytes, never_abandoned);
}

ChunkUploadResult ChunkUploader::execute(const ChunkDescriptor& descriptor,
                                         const std::vector<uint8_t>& bytes,
                                         const std::atomic<bool>& abandoned) {
    ChunkUploadResult result;
    result.chunk_id = descriptor.chunk_id;

    if (try_cached(descriptor, result)) {
        return result;
    }

    if (bytes.size() != descriptor.actual_size()) {
        result.result = Result(ErrorCode::VALIDATION_ERROR,
                               fmt::format("Byte range mismatch for {}: expected {} bytes, got {}",
                                           descriptor.chunk_id, descriptor.actual_size(), bytes.size()));
        return result;
    }

    std::string checksum;
    try {
        checksum = crypto::hash_utils::checksum_hex(bytes);
    } catch (const std::exception& e) {
        result.result = Result(ErrorCode::STORAGE_ERROR,
                               fmt::format("Failed to checksum {}: {}", descriptor.chunk_id, e.what()));
        return result;
    }

    if (abandoned.load()) {
        return cancelled(descriptor);
    }

    cache_entry(descriptor, ChunkStatus::UPLOADING, checksum, "", bytes);
    if (resume_manager_) {
        storage::TransitionDetails details;
        details.checksum = checksum;
        resume_manager_->record_transition(descriptor.file_id, descriptor.chunk_id, ChunkStatus::UPLOADING, details);
    }
    if (tracker_) {
        tracker_->update_chunk_status(descriptor.file_id, descriptor.chunk_id, ChunkStatus::UPLOADING);
    }
    report_bytes(descriptor, 25);

    if (abandoned.load()) {
        return cancelled(descriptor);
    }

    storage::UploadResponse response;
    report_bytes(descriptor, 50);
    try {
        response = backend_->upload(bytes, descriptor.chunk_id, config_.bucket, config_.chunk_folder());
    } catch (const std::exception& e) {
        response.error = e.what();
    }

    if (!response.success()) {
        LOG_WARN("Upload of {} failed: {}", descriptor.chunk_id, response.error);
        result.result = Result(ErrorCode::TRANSPORT_ERROR, response.error);
        result.checksum = checksum;
        return result;
    }

    if (abandoned.load()) {
        LOG_DEBUG("Chunk {} uploaded after its file was cancelled", descriptor.chunk_id);
        return cancelled(descriptor);
    }

    report_bytes(descriptor, 75);

    cache_entry(descriptor, ChunkStatus::COMPLETED, checksum, response.path, bytes);
    if (resume_manager_) {
        storage::TransitionDetails details;
        details.checksum = checksum;
        details.upload_path = response.path;
        resume_manager_->record_transition(descriptor.file_id, descriptor.chunk_id, ChunkStatus::COMPLETED, details);
    }
    if (tracker_) {
        tracker_->update_chunk_bytes(descriptor.file_id, descriptor.chunk_id, descriptor.actual_size());
        tracker_->update_chunk_status(descriptor.file_id, descriptor.chunk_id, ChunkStatus::COMPLETED);
    }

    LOG_DEBUG("Uploaded {} ({}) to {}", descriptor.chunk_id,
              core::utils::StringUtils::format_bytes(descriptor.actual_size()), response.path);

    result.upload_path = response.path;
    result.checksum = checksum;
    return result;
}

bool ChunkUploader::try_cached(const ChunkDescriptor& descriptor, ChunkUploadResult& result) {
    if (!resume_manager_) {
        return false;
    }

    auto cached = resume_manager_->get_cached_chunk(descriptor.chunk_id);
    if (!cached || !cached->is_completed()) {
        return false;
    }

    // Same id under a different plan covers a different byte range
    if (cached->file_id != descriptor.file_id || cached->size != descriptor.actual_size()) {
        LOG_DEBUG("Ignoring cached entry for {}: plan changed", descriptor.chunk_id);
        return false;
    }

    storage::TransitionDetails details;
    details.checksum = cached->checksum;
    details.upload_path = cached->upload_path;
    resume_manager_->record_transition(descriptor.file_id, descriptor.chunk_id, ChunkStatus::COMPLETED, details);
    if (tracker_) {
        tracker_->update_chunk_status(descriptor.file_id, descriptor.chunk_id, ChunkStatus::COMPLETED);
    }

    LOG_DEBUG("Chunk {} already uploaded to {}", descriptor.chunk_id, cached->upload_path);

    result.upload_path = cached->upload_path;
    result.checksum = cached->checksum;
    result.from_cache = true;
    return true;
}

void ChunkUploader::cache_entry(const ChunkDescriptor& descriptor, ChunkStatus status, const std::string& checksum,
                                const std::string& upload_path, const std::vector<uint8_t>& bytes) {
    if (!resume_manager_) {
        return;
    }

    storage::ChunkCacheEntry entry;
    entry.chunk_id = descriptor.chunk_id;
    entry.file_id = descriptor.file_id;
    entry.chunk_index = descriptor.chunk_index;
    entry.checksum = checksum;
    entry.status = status;
    entry.upload_path = upload_path;
    entry.size = descriptor.actual_size();
    entry.updated_at_ms = core::utils::TimeUtils::now_ms();
    if (config_.store_chunk_payloads) {
        entry.payload = bytes;
    }

    if (!resume_manager_->store_chunk_entry(entry)) {
        LOG_DEBUG("Cache entry for {} not written", descriptor.chunk_id);
    }
}

void ChunkUploader::report_bytes(const ChunkDescriptor& descriptor, uint32_t percent) {
    if (!tracker_) {
        return;
    }
    tracker_->update_chunk_bytes(descriptor.file_id, descriptor.chunk_id, descriptor.actual_size() * percent / 100);
}

ChunkUploadResult ChunkUploader::cancelled(const ChunkDescriptor& descriptor) {
    ChunkUploadResult result;
    result.chunk_id = descriptor.chunk_id;
    result.result = Result(ErrorCode::CANCELLED, "File transfer cancelled");
    return result;
}

} // namespace chunkvault::transfer
