#include "chunkvault/transfer/reassembly_service.hpp"
#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <fstream>
#include <system_error>

namespace chunkvault::transfer {

using core::ErrorCode;
using core::Result;

ReassemblyService::ReassemblyService(std::shared_ptr<storage::StorageBackend> backend,
                                     std::shared_ptr<storage::ResumeManager> resume_manager,
                                     storage::StorageConfig config)
    : backend_(std::move(backend))
    , resume_manager_(std::move(resume_manager))
    , config_(std::move(config)) {
}

ReassemblyResult ReassemblyService::reassemble(const ChunkReassemblyInfo& info) {
    clear_checkpoint(info.file_id);
    return run(info, 0);
}

ReassemblyResult ReassemblyService::resume_reassembly(const ChunkReassemblyInfo& info) {
    auto checkpoint = get_checkpoint(info.file_id);
    LOG_INFO("Resuming reassembly of {} after {} confirmed chunks", info.file_id, checkpoint);
    return run(info, checkpoint);
}

ChunkAvailability ReassemblyService::check_chunk_availability(const ChunkReassemblyInfo& info) const {
    ChunkAvailability availability;
    availability.total_chunks = info.total_chunks;

    std::vector<bool> present(info.total_chunks, false);
    for (const auto& chunk : info.uploaded_chunks) {
        auto index = chunk.descriptor.chunk_index;
        if (index < info.total_chunks && !chunk.upload_path.empty()) {
            present[index] = true;
        }
    }

    for (uint32_t i = 0; i < info.total_chunks; ++i) {
        if (present[i]) {
            availability.available.push_back(i);
        } else {
            availability.missing.push_back(i);
        }
    }
    return availability;
}

uint64_t ReassemblyService::get_total_chunk_size(const std::vector<UploadedChunk>& chunks) {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.descriptor.actual_size();
    }
    return total;
}

Result ReassemblyService::validate(const ChunkReassemblyInfo& info, std::vector<UploadedChunk>& ordered) const {
    if (info.total_chunks == 0) {
        return Result(ErrorCode::VALIDATION_ERROR, "No chunks to reassemble for " + info.file_id);
    }

    if (info.uploaded_chunks.size() != info.total_chunks) {
        auto availability = check_chunk_availability(info);
        std::vector<std::string> missing;
        for (auto index : availability.missing) {
            missing.push_back(std::to_string(index));
        }

        auto message = fmt::format("Missing chunks: have {}, need {}", info.uploaded_chunks.size(), info.total_chunks);
        if (!missing.empty()) {
            message += fmt::format(" (missing indexes: {})", fmt::join(missing, ", "));
        }
        return Result(ErrorCode::VALIDATION_ERROR, message);
    }

    ordered = info.uploaded_chunks;
    std::sort(ordered.begin(), ordered.end(), [](const UploadedChunk& a, const UploadedChunk& b) {
        return a.descriptor.chunk_index < b.descriptor.chunk_index;
    });

    uint64_t expected_start = 0;
    for (uint32_t i = 0; i < ordered.size(); ++i) {
        const auto& descriptor = ordered[i].descriptor;

        if (descriptor.chunk_index != i || ordered[i].upload_path.empty()) {
            return Result(ErrorCode::VALIDATION_ERROR, fmt::format("Missing chunk at index {}", i));
        }
        if (descriptor.start_byte != expected_start || descriptor.end_byte <= descriptor.start_byte) {
            return Result(ErrorCode::VALIDATION_ERROR,
                          fmt::format("Chunk boundary mismatch at index {}: expected start {}, got {}", i,
                                      expected_start, descriptor.start_byte));
        }
        expected_start = descriptor.end_byte;
    }

    if (expected_start != info.file_size) {
        return Result(ErrorCode::VALIDATION_ERROR,
                      fmt::format("Chunk boundary mismatch at index {}: expected end {}, got {}",
                                  ordered.size() - 1, info.file_size, expected_start));
    }

    return Result();
}

Result ReassemblyService::download_and_verify(const UploadedChunk& chunk, std::vector<uint8_t>& bytes) {
    const auto& chunk_id = chunk.descriptor.chunk_id;

    auto response = backend_->download(chunk.upload_path, config_.bucket);
    if (!response.success()) {
        return Result(ErrorCode::TRANSPORT_ERROR,
                      fmt::format("Failed to download chunk {}: {}", chunk_id, response.error));
    }

    if (response.bytes.size() != chunk.descriptor.actual_size()) {
        return Result(ErrorCode::INTEGRITY_ERROR,
                      fmt::format("Chunk size mismatch for {}: expected {}, got {}", chunk_id,
                                  chunk.descriptor.actual_size(), response.bytes.size()));
    }

    if (!crypto::hash_utils::verify_checksum(response.bytes, chunk.checksum)) {
        return Result(ErrorCode::INTEGRITY_ERROR,
                      fmt::format("Chunk checksum mismatch for {}: expected {}, got {}", chunk_id,
                                  chunk.checksum.empty() ? "<none>" : chunk.checksum,
                                  crypto::hash_utils::checksum_hex(response.bytes)));
    }

    bytes = std::move(response.bytes);
    return Result();
}

uint32_t ReassemblyService::usable_checkpoint(const ChunkReassemblyInfo& info, const std::vector<UploadedChunk>& ordered,
                                              const std::filesystem::path& staging_path) const {
    auto checkpoint = get_checkpoint(info.file_id);
    if (checkpoint == 0 || checkpoint > ordered.size()) {
        return 0;
    }

    // The staging file must hold exactly the confirmed prefix
    auto staged = core::utils::FileUtils::file_size(staging_path);
    uint64_t expected = ordered[checkpoint - 1].descriptor.end_byte;
    if (!staged || *staged < expected) {
        LOG_WARN("Staging file for {} does not match checkpoint {}, starting over", info.file_id, checkpoint);
        return 0;
    }
    return checkpoint;
}

ReassemblyResult ReassemblyService::run(const ChunkReassemblyInfo& info, uint32_t start_index) {
    ReassemblyResult outcome;

    std::vector<UploadedChunk> ordered;
    outcome.result = validate(info, ordered);
    if (!outcome.result) {
        LOG_WARN("Cannot reassemble {}: {}", info.file_id, outcome.result.message);
        return outcome;
    }

    if (!config_.create_directories()) {
        outcome.result = Result(ErrorCode::STORAGE_ERROR, "Cannot create staging directory");
        return outcome;
    }

    auto staging_path = config_.get_staging_path(info.file_id);
    if (start_index > 0) {
        start_index = std::min(start_index, usable_checkpoint(info, ordered, staging_path));
    }

    std::error_code ec;
    if (start_index > 0) {
        std::filesystem::resize_file(staging_path, ordered[start_index - 1].descriptor.end_byte, ec);
        if (ec) {
            LOG_WARN("Cannot trim staging file for {}: {}", info.file_id, ec.message());
            start_index = 0;
        }
    }

    {
        auto mode = std::ios::binary | (start_index > 0 ? std::ios::app : std::ios::trunc);
        std::ofstream output(staging_path, mode);
        if (!output.is_open()) {
            outcome.result = Result(ErrorCode::STORAGE_ERROR, "Cannot open staging file " + staging_path.string());
            return outcome;
        }

        outcome.chunks_skipped = start_index;
        outcome.bytes_written = start_index > 0 ? ordered[start_index - 1].descriptor.end_byte : 0;

        for (uint32_t i = start_index; i < ordered.size(); ++i) {
            std::vector<uint8_t> bytes;
            outcome.result = download_and_verify(ordered[i], bytes);
            if (!outcome.result) {
                LOG_ERROR("Reassembly of {} stopped at chunk {}: {}", info.file_id, i, outcome.result.message);
                return outcome;
            }

            output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            output.flush();
            if (!output.good()) {
                outcome.result = Result(ErrorCode::STORAGE_ERROR, "Write failed for " + staging_path.string());
                return outcome;
            }

            outcome.bytes_written += bytes.size();
            outcome.chunks_verified++;
            set_checkpoint(info.file_id, i + 1);
        }
    }

    auto key = core::utils::StringUtils::sanitize_file_name(info.file_name);
    if (key.empty()) {
        key = info.file_id;
    }

    auto response = backend_->upload_file(staging_path, key, config_.bucket, config_.output_folder);
    if (!response.success()) {
        outcome.result = Result(ErrorCode::TRANSPORT_ERROR, "Failed to upload reassembled file: " + response.error);
        return outcome;
    }

    outcome.result = verify_reassembled_file(response.path, info.file_size);
    if (!outcome.result) {
        auto error = backend_->remove(response.path, config_.bucket);
        if (!error.empty()) {
            LOG_WARN("Cannot remove rejected artifact {}: {}", response.path, error);
        }
        return outcome;
    }

    cleanup_chunks(ordered);

    std::filesystem::remove(staging_path, ec);
    clear_checkpoint(info.file_id);

    if (resume_manager_) {
        auto cleared = resume_manager_->clear(info.file_id);
        if (!cleared) {
            LOG_WARN("Cannot clear cached state of {}: {}", info.file_id, cleared.message);
        }
    }

    outcome.file_path = response.path;
    LOG_INFO("Reassembled {} from {} chunks into {} ({})", info.file_id, ordered.size(), response.path,
             core::utils::StringUtils::format_bytes(outcome.bytes_written));
    return outcome;
}

Result ReassemblyService::verify_reassembled_file(const std::string& path, uint64_t expected_size) {
    auto response = backend_->download(path, config_.bucket);
    if (!response.success()) {
        return Result(ErrorCode::TRANSPORT_ERROR, "Cannot read back reassembled file: " + response.error);
    }

    if (response.bytes.size() != expected_size) {
        return Result(ErrorCode::INTEGRITY_ERROR,
                      fmt::format("Reassembled file size mismatch: expected {}, got {}", expected_size,
                                  response.bytes.size()));
    }
    return Result();
}

void ReassemblyService::cleanup_chunks(const std::vector<UploadedChunk>& chunks) {
    uint32_t failures = 0;
    for (const auto& chunk : chunks) {
        auto error = backend_->remove(chunk.upload_path, config_.bucket);
        if (!error.empty()) {
            failures++;
            LOG_DEBUG("Cannot remove chunk artifact {}: {}", chunk.upload_path, error);
        }
    }

    if (failures > 0) {
        LOG_WARN("{} of {} chunk artifacts were not removed", failures, chunks.size());
    }
}

uint32_t ReassemblyService::get_checkpoint(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.find(file_id);
    return it != checkpoints_.end() ? it->second : 0;
}

void ReassemblyService::set_checkpoint(const std::string& file_id, uint32_t confirmed) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoints_[file_id] = confirmed;
}

void ReassemblyService::clear_checkpoint(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoints_.erase(file_id);
}

} // namespace chunkvault::transfer
