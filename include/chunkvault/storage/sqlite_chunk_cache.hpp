#pragma once

#include "chunk_cache.hpp"
#include <filesystem>
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace chunkvault::storage {

class SqliteChunkCache : public ChunkCache {
public:
    explicit SqliteChunkCache(const std::filesystem::path& database_path, bool store_payloads = false);
    ~SqliteChunkCache() override;

    SqliteChunkCache(const SqliteChunkCache&) = delete;
    SqliteChunkCache& operator=(const SqliteChunkCache&) = delete;

    bool initialize();
    bool is_open() const { return db_ != nullptr; }

    std::optional<ChunkCacheEntry> get_chunk(const std::string& chunk_id) override;
    core::Result put_chunk(const ChunkCacheEntry& entry) override;

    std::optional<FileProgressState> get_file_progress(const std::string& file_id) override;
    core::Result put_file_progress(const FileProgressState& state) override;
    core::Result put_chunk_state(const FileProgressState& state, const std::string& chunk_id) override;

    core::Result clear_file_cache(const std::string& file_id) override;

    std::vector<FileProgressState> list_file_progress() override;

    size_t get_chunk_count() const;

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    bool store_payloads_;
    mutable std::mutex mutex_;

    bool create_tables();
    bool exec(const char* sql);
    std::string last_error() const;

    core::Result write_file_row(const FileProgressState& state);
    core::Result write_chunk_row(sqlite3_stmt* stmt, const std::string& file_id, const ChunkState& chunk);

    std::optional<FileProgressState> load_file_progress(const std::string& file_id);
    bool load_chunk_states(FileProgressState& state);
};

} // namespace chunkvault::storage
