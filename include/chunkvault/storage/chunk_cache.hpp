#pragma once

#include "file_progress.hpp"
#include "chunkvault/core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::storage {

// Persistent cache backing resumability. Survives process restarts.
class ChunkCache {
public:
    virtual ~ChunkCache() = default;

    virtual std::optional<ChunkCacheEntry> get_chunk(const std::string& chunk_id) = 0;
    virtual core::Result put_chunk(const ChunkCacheEntry& entry) = 0;

    virtual std::optional<FileProgressState> get_file_progress(const std::string& file_id) = 0;
    virtual core::Result put_file_progress(const FileProgressState& state) = 0;

    // Writes the file row and the one chunk row that changed; other chunk rows are left as stored
    virtual core::Result put_chunk_state(const FileProgressState& state, const std::string& chunk_id) = 0;

    // Drops the progress row and every chunk entry of the file
    virtual core::Result clear_file_cache(const std::string& file_id) = 0;

    virtual std::vector<FileProgressState> list_file_progress() = 0;
};

} // namespace chunkvault::storage
