#include "chunkvault/storage/sqlite_chunk_cache.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <sqlite3.h>

namespace chunkvault::storage {

using core::ErrorCode;
using core::Result;

namespace {

// Finalizes on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

}

SqliteChunkCache::SqliteChunkCache(const std::filesystem::path& database_path, bool store_payloads)
    : db_path_(database_path)
    , db_(nullptr)
    , store_payloads_(store_payloads) {
}

SqliteChunkCache::~SqliteChunkCache() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteChunkCache::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open chunk cache {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_DEBUG("Chunk cache opened at {}", db_path_.string());
    return true;
}

bool SqliteChunkCache::create_tables() {
    const char* create_chunk_cache_table = R"(
        CREATE TABLE IF NOT EXISTS chunk_cache (
            chunk_id TEXT PRIMARY KEY,
            file_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            checksum TEXT,
            status TEXT NOT NULL,
            upload_path TEXT,
            retry_count INTEGER DEFAULT 0,
            size INTEGER NOT NULL,
            payload BLOB,
            updated_at INTEGER NOT NULL
        );
    )";

    const char* create_file_progress_table = R"(
        CREATE TABLE IF NOT EXISTS file_progress (
            file_id TEXT PRIMARY KEY,
            file_name TEXT NOT NULL,
            file_path TEXT,
            file_size INTEGER NOT NULL,
            last_modified INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            file_checksum TEXT,
            total_chunks INTEGER NOT NULL,
            completed_chunks INTEGER NOT NULL,
            failed_chunks INTEGER NOT NULL,
            bytes_uploaded INTEGER NOT NULL,
            total_bytes INTEGER NOT NULL,
            start_time INTEGER NOT NULL,
            last_update INTEGER NOT NULL
        );
    )";

    const char* create_chunk_states_table = R"(
        CREATE TABLE IF NOT EXISTS chunk_states (
            file_id TEXT NOT NULL,
            chunk_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            status TEXT NOT NULL,
            checksum TEXT,
            upload_path TEXT,
            size INTEGER NOT NULL,
            start_byte INTEGER NOT NULL,
            end_byte INTEGER NOT NULL,
            attempts INTEGER DEFAULT 0,
            last_attempt INTEGER DEFAULT 0,
            error_message TEXT,
            PRIMARY KEY (file_id, chunk_id)
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_chunk_cache_file ON chunk_cache(file_id);
        CREATE INDEX IF NOT EXISTS idx_chunk_states_file ON chunk_states(file_id);
    )";

    return exec("PRAGMA journal_mode=WAL;") &&
           exec(create_chunk_cache_table) &&
           exec(create_file_progress_table) &&
           exec(create_chunk_states_table) &&
           exec(create_indexes);
}

bool SqliteChunkCache::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQLite error: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

std::string SqliteChunkCache::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

std::optional<ChunkCacheEntry> SqliteChunkCache::get_chunk(const std::string& chunk_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    Statement stmt(db_, R"(
        SELECT chunk_id, file_id, chunk_index, checksum, status, upload_path,
               retry_count, size, payload, updated_at
        FROM chunk_cache WHERE chunk_id = ?;
    )");
    if (!stmt) {
        return std::nullopt;
    }

    bind_text(stmt.get(), 1, chunk_id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    auto status = chunk_status_from_string(column_text(stmt.get(), 4));
    if (!status) {
        LOG_WARN("Ignoring chunk cache entry {} with unknown status", chunk_id);
        return std::nullopt;
    }

    ChunkCacheEntry entry;
    entry.chunk_id = column_text(stmt.get(), 0);
    entry.file_id = column_text(stmt.get(), 1);
    entry.chunk_index = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 2));
    entry.checksum = column_text(stmt.get(), 3);
    entry.status = *status;
    entry.upload_path = column_text(stmt.get(), 5);
    entry.retry_count = static_cast<uint32_t>(sqlite3_column_int(stmt.get(), 6));
    entry.size = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 7));

    const void* blob_data = sqlite3_column_blob(stmt.get(), 8);
    int blob_size = sqlite3_column_bytes(stmt.get(), 8);
    if (blob_data && blob_size > 0) {
        auto bytes = static_cast<const uint8_t*>(blob_data);
        entry.payload.assign(bytes, bytes + blob_size);
    }

    entry.updated_at_ms = sqlite3_column_int64(stmt.get(), 9);
    return entry;
}

Result SqliteChunkCache::put_chunk(const ChunkCacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::STORAGE_ERROR, "Chunk cache not initialized");
    }

    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO chunk_cache
        (chunk_id, file_id, chunk_index, checksum, status, upload_path, retry_count, size, payload, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (!stmt) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to prepare chunk insert: " + last_error());
    }

    auto updated_at = entry.updated_at_ms != 0 ? entry.updated_at_ms : core::utils::TimeUtils::now_ms();

    bind_text(stmt.get(), 1, entry.chunk_id);
    bind_text(stmt.get(), 2, entry.file_id);
    sqlite3_bind_int64(stmt.get(), 3, entry.chunk_index);
    bind_text(stmt.get(), 4, entry.checksum);
    sqlite3_bind_text(stmt.get(), 5, chunk_status_to_string(entry.status), -1, SQLITE_STATIC);
    bind_text(stmt.get(), 6, entry.upload_path);
    sqlite3_bind_int(stmt.get(), 7, static_cast<int>(entry.retry_count));
    sqlite3_bind_int64(stmt.get(), 8, static_cast<sqlite3_int64>(entry.size));
    if (store_payloads_ && !entry.payload.empty()) {
        sqlite3_bind_blob(stmt.get(), 9, entry.payload.data(), static_cast<int>(entry.payload.size()),
                          SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt.get(), 9);
    }
    sqlite3_bind_int64(stmt.get(), 10, updated_at);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to store chunk " + entry.chunk_id + ": " + last_error());
    }

    return Result();
}

std::optional<FileProgressState> SqliteChunkCache::get_file_progress(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    return load_file_progress(file_id);
}

std::optional<FileProgressState> SqliteChunkCache::load_file_progress(const std::string& file_id) {
    Statement stmt(db_, R"(
        SELECT file_id, file_name, file_path, file_size, last_modified, chunk_size, file_checksum,
               total_chunks, completed_chunks, failed_chunks, bytes_uploaded, total_bytes,
               start_time, last_update
        FROM file_progress WHERE file_id = ?;
    )");
    if (!stmt) {
        return std::nullopt;
    }

    bind_text(stmt.get(), 1, file_id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    FileProgressState state;
    state.file_id = column_text(stmt.get(), 0);
    state.file_name = column_text(stmt.get(), 1);
    state.file_path = column_text(stmt.get(), 2);
    state.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 3));
    state.last_modified_ms = sqlite3_column_int64(stmt.get(), 4);
    state.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 5));
    state.file_checksum = column_text(stmt.get(), 6);

    auto& progress = state.upload_progress;
    progress.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 7));
    progress.completed_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 8));
    progress.failed_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 9));
    progress.bytes_uploaded = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 10));
    progress.total_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 11));
    progress.start_time_ms = sqlite3_column_int64(stmt.get(), 12);
    progress.last_update_ms = sqlite3_column_int64(stmt.get(), 13);

    if (!load_chunk_states(state)) {
        LOG_WARN("Progress state for {} has unreadable chunk rows", file_id);
        return std::nullopt;
    }

    return state;
}

bool SqliteChunkCache::load_chunk_states(FileProgressState& state) {
    Statement stmt(db_, R"(
        SELECT chunk_id, chunk_index, status, checksum, upload_path, size, start_byte, end_byte,
               attempts, last_attempt, error_message
        FROM chunk_states WHERE file_id = ? ORDER BY chunk_index;
    )");
    if (!stmt) {
        return false;
    }

    bind_text(stmt.get(), 1, state.file_id);

    int result;
    while ((result = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto status = chunk_status_from_string(column_text(stmt.get(), 2));
        if (!status) {
            return false;
        }

        ChunkState chunk;
        chunk.chunk_id = column_text(stmt.get(), 0);
        chunk.chunk_index = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 1));
        chunk.status = *status;
        chunk.checksum = column_text(stmt.get(), 3);
        chunk.upload_path = column_text(stmt.get(), 4);
        chunk.size = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 5));
        chunk.start_byte = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 6));
        chunk.end_byte = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 7));
        chunk.attempts = static_cast<uint32_t>(sqlite3_column_int(stmt.get(), 8));
        chunk.last_attempt_ms = sqlite3_column_int64(stmt.get(), 9);
        chunk.error_message = column_text(stmt.get(), 10);

        state.chunk_states[chunk.chunk_id] = std::move(chunk);
    }

    return result == SQLITE_DONE;
}

namespace {

const char* const UPSERT_CHUNK_STATE_SQL = R"(
    INSERT OR REPLACE INTO chunk_states
    (file_id, chunk_id, chunk_index, status, checksum, upload_path, size, start_byte, end_byte,
     attempts, last_attempt, error_message)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";

}

Result SqliteChunkCache::write_file_row(const FileProgressState& state) {
    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO file_progress
        (file_id, file_name, file_path, file_size, last_modified, chunk_size, file_checksum,
         total_chunks, completed_chunks, failed_chunks, bytes_uploaded, total_bytes,
         start_time, last_update)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    if (!stmt) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to prepare progress insert: " + last_error());
    }

    const auto& progress = state.upload_progress;
    bind_text(stmt.get(), 1, state.file_id);
    bind_text(stmt.get(), 2, state.file_name);
    bind_text(stmt.get(), 3, state.file_path);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(state.file_size));
    sqlite3_bind_int64(stmt.get(), 5, state.last_modified_ms);
    sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(state.chunk_size));
    bind_text(stmt.get(), 7, state.file_checksum);
    sqlite3_bind_int64(stmt.get(), 8, progress.total_chunks);
    sqlite3_bind_int64(stmt.get(), 9, progress.completed_chunks);
    sqlite3_bind_int64(stmt.get(), 10, progress.failed_chunks);
    sqlite3_bind_int64(stmt.get(), 11, static_cast<sqlite3_int64>(progress.bytes_uploaded));
    sqlite3_bind_int64(stmt.get(), 12, static_cast<sqlite3_int64>(progress.total_bytes));
    sqlite3_bind_int64(stmt.get(), 13, progress.start_time_ms);
    sqlite3_bind_int64(stmt.get(), 14, progress.last_update_ms);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to store progress for " + state.file_id + ": " + last_error());
    }
    return Result();
}

Result SqliteChunkCache::write_chunk_row(sqlite3_stmt* stmt, const std::string& file_id, const ChunkState& chunk) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);

    bind_text(stmt, 1, file_id);
    bind_text(stmt, 2, chunk.chunk_id);
    sqlite3_bind_int64(stmt, 3, chunk.chunk_index);
    sqlite3_bind_text(stmt, 4, chunk_status_to_string(chunk.status), -1, SQLITE_STATIC);
    bind_text(stmt, 5, chunk.checksum);
    bind_text(stmt, 6, chunk.upload_path);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(chunk.size));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(chunk.start_byte));
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(chunk.end_byte));
    sqlite3_bind_int(stmt, 10, static_cast<int>(chunk.attempts));
    sqlite3_bind_int64(stmt, 11, chunk.last_attempt_ms);
    bind_text(stmt, 12, chunk.error_message);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to store chunk state " + chunk.chunk_id + ": " + last_error());
    }
    return Result();
}

Result SqliteChunkCache::put_file_progress(const FileProgressState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::STORAGE_ERROR, "Chunk cache not initialized");
    }

    if (!exec("BEGIN IMMEDIATE;")) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to begin transaction: " + last_error());
    }

    auto rollback = [this](Result failure) {
        exec("ROLLBACK;");
        return failure;
    };

    auto written = write_file_row(state);
    if (!written) {
        return rollback(written);
    }

    {
        Statement stmt(db_, "DELETE FROM chunk_states WHERE file_id = ?;");
        if (!stmt) {
            return rollback(Result(ErrorCode::STORAGE_ERROR, "Failed to prepare chunk state delete: " + last_error()));
        }
        bind_text(stmt.get(), 1, state.file_id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return rollback(Result(ErrorCode::STORAGE_ERROR, "Failed to replace chunk states: " + last_error()));
        }
    }

    Statement insert(db_, UPSERT_CHUNK_STATE_SQL);
    if (!insert) {
        return rollback(Result(ErrorCode::STORAGE_ERROR, "Failed to prepare chunk state insert: " + last_error()));
    }

    for (const auto& [chunk_id, chunk] : state.chunk_states) {
        auto stored = write_chunk_row(insert.get(), state.file_id, chunk);
        if (!stored) {
            return rollback(stored);
        }
    }

    if (!exec("COMMIT;")) {
        return rollback(Result(ErrorCode::STORAGE_ERROR, "Failed to commit progress for " + state.file_id));
    }

    return Result();
}

Result SqliteChunkCache::put_chunk_state(const FileProgressState& state, const std::string& chunk_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::STORAGE_ERROR, "Chunk cache not initialized");
    }

    auto it = state.chunk_states.find(chunk_id);
    if (it == state.chunk_states.end()) {
        return Result(ErrorCode::NOT_FOUND, "Chunk " + chunk_id + " is not part of " + state.file_id);
    }

    if (!exec("BEGIN IMMEDIATE;")) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to begin transaction: " + last_error());
    }

    auto rollback = [this](Result failure) {
        exec("ROLLBACK;");
        return failure;
    };

    auto written = write_file_row(state);
    if (!written) {
        return rollback(written);
    }

    Statement upsert(db_, UPSERT_CHUNK_STATE_SQL);
    if (!upsert) {
        return rollback(Result(ErrorCode::STORAGE_ERROR, "Failed to prepare chunk state upsert: " + last_error()));
    }

    auto stored = write_chunk_row(upsert.get(), state.file_id, it->second);
    if (!stored) {
        return rollback(stored);
    }

    if (!exec("COMMIT;")) {
        return rollback(Result(ErrorCode::STORAGE_ERROR, "Failed to commit chunk state " + chunk_id));
    }

    return Result();
}

Result SqliteChunkCache::clear_file_cache(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Result(ErrorCode::STORAGE_ERROR, "Chunk cache not initialized");
    }

    if (!exec("BEGIN IMMEDIATE;")) {
        return Result(ErrorCode::STORAGE_ERROR, "Failed to begin transaction: " + last_error());
    }

    const char* statements[] = {
        "DELETE FROM chunk_cache WHERE file_id = ?;",
        "DELETE FROM chunk_states WHERE file_id = ?;",
        "DELETE FROM file_progress WHERE file_id = ?;"
    };

    for (const char* sql : statements) {
        Statement stmt(db_, sql);
        if (!stmt) {
            auto message = "Failed to prepare cache delete: " + last_error();
            exec("ROLLBACK;");
            return Result(ErrorCode::STORAGE_ERROR, message);
        }

        bind_text(stmt.get(), 1, file_id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            auto message = "Failed to clear cache for " + file_id + ": " + last_error();
            exec("ROLLBACK;");
            return Result(ErrorCode::STORAGE_ERROR, message);
        }
    }

    if (!exec("COMMIT;")) {
        auto message = "Failed to commit cache clear for " + file_id + ": " + last_error();
        exec("ROLLBACK;");
        return Result(ErrorCode::STORAGE_ERROR, message);
    }

    LOG_DEBUG("Cleared cache for file {}", file_id);
    return Result();
}

std::vector<FileProgressState> SqliteChunkCache::list_file_progress() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileProgressState> states;
    if (!db_) {
        return states;
    }

    std::vector<std::string> file_ids;
    {
        Statement stmt(db_, "SELECT file_id FROM file_progress ORDER BY last_update DESC;");
        if (!stmt) {
            return states;
        }
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            file_ids.push_back(column_text(stmt.get(), 0));
        }
    }

    for (const auto& file_id : file_ids) {
        auto state = load_file_progress(file_id);
        if (state) {
            states.push_back(std::move(*state));
        }
    }

    return states;
}

size_t SqliteChunkCache::get_chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    Statement stmt(db_, "SELECT COUNT(*) FROM chunk_cache;");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace chunkvault::storage
