#pragma once

#include "chunk_cache.hpp"
#include "file_progress.hpp"
#include "../transfer/transfer_types.hpp"
#include "chunkvault/core/result.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chunkvault::storage {

// What identifies a source file across restarts
struct FileIdentity {
    std::string file_id;
    std::string file_name;
    std::string file_path;
    uint64_t file_size = 0;
    int64_t last_modified_ms = 0;

    // file_id is the sanitized name plus a short digest of the absolute path
    static std::optional<FileIdentity> from_path(const std::filesystem::path& path);
};

struct TransitionDetails {
    std::string checksum;
    std::string upload_path;
    std::string error_message;
};

// Single writer of persisted transfer state. Every mutation for a file that is
// not tracked (never started, cancelled or released) is discarded.
class ResumeManager {
public:
    explicit ResumeManager(std::shared_ptr<ChunkCache> cache);

    // Resume state management
    std::optional<FileProgressState> try_resume(const FileIdentity& identity);
    void begin_tracking(const FileProgressState& state);
    bool is_tracking(const std::string& file_id) const;
    bool persist(const std::string& file_id, const FileProgressState& state);

    // Chunk transitions
    bool record_transition(const std::string& file_id, const std::string& chunk_id,
                           ChunkStatus status, const TransitionDetails& details = {});

    // Chunk cache access for the uploader
    std::optional<ChunkCacheEntry> get_cached_chunk(const std::string& chunk_id);
    bool store_chunk_entry(const ChunkCacheEntry& entry);

    std::optional<FileProgressState> get_state(const std::string& file_id) const;
    std::vector<FileProgressState> list_states() const;

    // Stops tracking; persisted state is kept for a later resume
    void release(const std::string& file_id);

    // Stops tracking and drops every persisted row of the file
    core::Result clear(const std::string& file_id);

    static core::Result rebuild_descriptors(const FileProgressState& state,
                                            std::vector<transfer::ChunkDescriptor>& descriptors);

    core::Result build_reassembly_info(const std::string& file_id, transfer::ChunkReassemblyInfo& info) const;

    uint64_t get_persist_failures() const;

private:
    std::shared_ptr<ChunkCache> cache_;
    std::unordered_map<std::string, FileProgressState> tracked_;
    // Files whose stored chunk rows missed a write and need a full rewrite
    std::unordered_set<std::string> unsynced_;
    uint64_t persist_failures_ = 0;
    mutable std::mutex mutex_;

    bool persist_locked(const FileProgressState& state);
    bool persist_chunk_locked(const FileProgressState& state, const std::string& chunk_id);
    void purge(const std::string& file_id, const std::string& reason);
    static void normalize_for_resume(FileProgressState& state);
};

} // namespace chunkvault::storage
