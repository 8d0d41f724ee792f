#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/crypto/hash.hpp"
#include <span>

namespace chunkvault::storage {

using core::ErrorCode;
using core::Result;
using transfer::ChunkDescriptor;

std::optional<FileIdentity> FileIdentity::from_path(const std::filesystem::path& path) {
    using core::utils::FileUtils;

    if (!FileUtils::is_file(path)) {
        return std::nullopt;
    }

    auto size = FileUtils::file_size(path);
    auto modified = FileUtils::last_modified_ms(path);
    if (!size || !modified) {
        return std::nullopt;
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    auto absolute_str = absolute.lexically_normal().string();
    auto digest = crypto::hash_utils::checksum_hex(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(absolute_str.data()), absolute_str.size()));

    FileIdentity identity;
    identity.file_name = path.filename().string();
    identity.file_path = absolute_str;
    identity.file_size = *size;
    identity.last_modified_ms = *modified;
    identity.file_id = core::utils::StringUtils::sanitize_file_name(identity.file_name) + "_" + digest.substr(0, 12);
    return identity;
}

ResumeManager::ResumeManager(std::shared_ptr<ChunkCache> cache)
    : cache_(std::move(cache)) {
}

std::optional<FileProgressState> ResumeManager::try_resume(const FileIdentity& identity) {
    auto cached = cache_->get_file_progress(identity.file_id);
    if (!cached) {
        LOG_DEBUG("No cached progress for {}", identity.file_id);
        return std::nullopt;
    }

    if (cached->file_size != identity.file_size || cached->last_modified_ms != identity.last_modified_ms) {
        purge(identity.file_id, "source file changed since the cached transfer");
        return std::nullopt;
    }

    auto state = std::move(*cached);
    normalize_for_resume(state);

    if (!state.has_completed_chunk()) {
        purge(identity.file_id, "no completed chunks to resume from");
        return std::nullopt;
    }

    std::vector<ChunkDescriptor> descriptors;
    auto rebuilt = rebuild_descriptors(state, descriptors);
    if (!rebuilt) {
        purge(identity.file_id, rebuilt.message);
        return std::nullopt;
    }

    state.file_path = identity.file_path;
    LOG_INFO("Resuming {}: {}/{} chunks already uploaded", identity.file_id,
             state.upload_progress.completed_chunks, state.upload_progress.total_chunks);
    return state;
}

void ResumeManager::begin_tracking(const FileProgressState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& tracked = tracked_[state.file_id];
    tracked = state;
    tracked.recompute_counters();
    if (tracked.upload_progress.start_time_ms == 0) {
        tracked.upload_progress.start_time_ms = core::utils::TimeUtils::now_ms();
    }
    tracked.upload_progress.last_update_ms = core::utils::TimeUtils::now_ms();
    persist_locked(tracked);
}

bool ResumeManager::is_tracking(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.find(file_id) != tracked_.end();
}

bool ResumeManager::persist(const std::string& file_id, const FileProgressState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(file_id);
    if (it == tracked_.end()) {
        LOG_DEBUG("Discarding persist for untracked file {}", file_id);
        return false;
    }

    it->second = state;
    it->second.recompute_counters();
    return persist_locked(it->second);
}

bool ResumeManager::record_transition(const std::string& file_id, const std::string& chunk_id,
                                      ChunkStatus status, const TransitionDetails& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(file_id);
    if (it == tracked_.end()) {
        LOG_DEBUG("Discarding {} transition for {}: file not tracked", chunk_status_to_string(status), chunk_id);
        return false;
    }

    auto& state = it->second;
    auto* chunk = state.find_chunk(chunk_id);
    if (!chunk) {
        LOG_WARN("Transition for unknown chunk {} of {}", chunk_id, file_id);
        return false;
    }

    auto now = core::utils::TimeUtils::now_ms();
    if (status == ChunkStatus::UPLOADING) {
        chunk->attempts++;
        chunk->last_attempt_ms = now;
    }
    if (!details.checksum.empty()) {
        chunk->checksum = details.checksum;
    }
    if (!details.upload_path.empty()) {
        chunk->upload_path = details.upload_path;
    }
    if (status == ChunkStatus::FAILED || status == ChunkStatus::RETRYING) {
        chunk->error_message = details.error_message;
    } else if (status == ChunkStatus::COMPLETED) {
        chunk->error_message.clear();
    }
    chunk->status = status;

    state.recompute_counters();
    state.upload_progress.last_update_ms = now;
    return persist_chunk_locked(state, chunk_id);
}

std::optional<ChunkCacheEntry> ResumeManager::get_cached_chunk(const std::string& chunk_id) {
    return cache_->get_chunk(chunk_id);
}

bool ResumeManager::store_chunk_entry(const ChunkCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tracked_.find(entry.file_id) == tracked_.end()) {
        LOG_DEBUG("Discarding cache entry for {}: file not tracked", entry.chunk_id);
        return false;
    }

    auto result = cache_->put_chunk(entry);
    if (!result) {
        persist_failures_++;
        LOG_WARN("Failed to cache chunk {}: {}", entry.chunk_id, result.message);
        return false;
    }
    return true;
}

std::optional<FileProgressState> ResumeManager::get_state(const std::string& file_id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tracked_.find(file_id);
        if (it != tracked_.end()) {
            return it->second;
        }
    }
    return cache_->get_file_progress(file_id);
}

std::vector<FileProgressState> ResumeManager::list_states() const {
    return cache_->list_file_progress();
}

void ResumeManager::release(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(file_id);
    if (it == tracked_.end()) {
        return;
    }
    if (unsynced_.count(file_id) > 0) {
        persist_locked(it->second);
    }
    unsynced_.erase(file_id);
    tracked_.erase(it);
}

Result ResumeManager::clear(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.erase(file_id);
    unsynced_.erase(file_id);

    auto result = cache_->clear_file_cache(file_id);
    if (!result) {
        LOG_WARN("Failed to clear cache for {}: {}", file_id, result.message);
    }
    return result;
}

Result ResumeManager::rebuild_descriptors(const FileProgressState& state,
                                          std::vector<ChunkDescriptor>& descriptors) {
    descriptors.clear();

    auto chunks = state.sorted_chunks();
    if (chunks.empty() || state.file_size == 0) {
        return Result(ErrorCode::RESUMABILITY_ERROR, "Cached state has no chunks");
    }

    auto total = static_cast<uint32_t>(chunks.size());
    if (state.upload_progress.total_chunks != 0 && state.upload_progress.total_chunks != total) {
        return Result(ErrorCode::RESUMABILITY_ERROR,
                      "Cached state lists " + std::to_string(total) + " chunks, expected " +
                      std::to_string(state.upload_progress.total_chunks));
    }

    uint64_t expected_start = 0;
    for (uint32_t i = 0; i < total; ++i) {
        const auto& chunk = chunks[i];
        if (chunk.chunk_index != i) {
            return Result(ErrorCode::RESUMABILITY_ERROR, "Cached state missing chunk at index " + std::to_string(i));
        }
        if (chunk.start_byte != expected_start || chunk.end_byte <= chunk.start_byte ||
            chunk.size != chunk.end_byte - chunk.start_byte) {
            return Result(ErrorCode::RESUMABILITY_ERROR, "Cached byte range broken at chunk " + std::to_string(i));
        }
        if (chunk.chunk_id != ChunkDescriptor::make_chunk_id(state.file_id, i)) {
            return Result(ErrorCode::RESUMABILITY_ERROR, "Unexpected chunk id " + chunk.chunk_id);
        }

        ChunkDescriptor descriptor;
        descriptor.chunk_id = chunk.chunk_id;
        descriptor.file_id = state.file_id;
        descriptor.file_name = state.file_name;
        descriptor.chunk_index = i;
        descriptor.total_chunks = total;
        descriptor.start_byte = chunk.start_byte;
        descriptor.end_byte = chunk.end_byte;
        descriptor.chunk_size = state.chunk_size;
        descriptor.is_last_chunk = (i + 1 == total);
        descriptors.push_back(std::move(descriptor));

        expected_start = chunk.end_byte;
    }

    if (expected_start != state.file_size) {
        descriptors.clear();
        return Result(ErrorCode::RESUMABILITY_ERROR, "Cached chunks cover " + std::to_string(expected_start) +
                      " of " + std::to_string(state.file_size) + " bytes");
    }

    return Result();
}

Result ResumeManager::build_reassembly_info(const std::string& file_id, transfer::ChunkReassemblyInfo& info) const {
    auto state = get_state(file_id);
    if (!state) {
        return Result(ErrorCode::NOT_FOUND, "No transfer state for " + file_id);
    }

    info = transfer::ChunkReassemblyInfo{};
    info.file_id = state->file_id;
    info.file_name = state->file_name;
    info.file_size = state->file_size;
    info.total_chunks = static_cast<uint32_t>(state->chunk_states.size());

    for (const auto& chunk : state->sorted_chunks()) {
        if (chunk.status != ChunkStatus::COMPLETED || chunk.upload_path.empty()) {
            continue;
        }

        transfer::UploadedChunk uploaded;
        uploaded.descriptor.chunk_id = chunk.chunk_id;
        uploaded.descriptor.file_id = state->file_id;
        uploaded.descriptor.file_name = state->file_name;
        uploaded.descriptor.chunk_index = chunk.chunk_index;
        uploaded.descriptor.total_chunks = info.total_chunks;
        uploaded.descriptor.start_byte = chunk.start_byte;
        uploaded.descriptor.end_byte = chunk.end_byte;
        uploaded.descriptor.chunk_size = state->chunk_size;
        uploaded.descriptor.is_last_chunk = (chunk.chunk_index + 1 == info.total_chunks);
        uploaded.upload_path = chunk.upload_path;
        uploaded.checksum = chunk.checksum;
        info.uploaded_chunks.push_back(std::move(uploaded));
    }

    info.is_complete = info.total_chunks > 0 && info.uploaded_chunks.size() == info.total_chunks;
    return Result();
}

uint64_t ResumeManager::get_persist_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return persist_failures_;
}

bool ResumeManager::persist_locked(const FileProgressState& state) {
    auto result = cache_->put_file_progress(state);
    if (!result) {
        persist_failures_++;
        unsynced_.insert(state.file_id);
        LOG_WARN("Failed to persist progress for {}: {}", state.file_id, result.message);
        return false;
    }
    unsynced_.erase(state.file_id);
    return true;
}

bool ResumeManager::persist_chunk_locked(const FileProgressState& state, const std::string& chunk_id) {
    if (unsynced_.count(state.file_id) > 0) {
        return persist_locked(state);
    }

    auto result = cache_->put_chunk_state(state, chunk_id);
    if (!result) {
        persist_failures_++;
        unsynced_.insert(state.file_id);
        LOG_WARN("Failed to persist chunk {} of {}: {}", chunk_id, state.file_id, result.message);
        return false;
    }
    return true;
}

void ResumeManager::purge(const std::string& file_id, const std::string& reason) {
    LOG_INFO("Discarding cached transfer state for {}: {}", file_id, reason);
    auto result = clear(file_id);
    if (!result) {
        LOG_WARN("Stale cache for {} could not be removed", file_id);
    }
}

void ResumeManager::normalize_for_resume(FileProgressState& state) {
    // Only chunks the backend confirmed count as done; anything else is re-attempted
    for (auto& [chunk_id, chunk] : state.chunk_states) {
        if (chunk.status == ChunkStatus::COMPLETED && !chunk.upload_path.empty()) {
            continue;
        }
        chunk.status = ChunkStatus::PENDING;
        chunk.error_message.clear();
    }
    state.recompute_counters();
}

} // namespace chunkvault::storage
