#include <gtest/gtest.h>
#include "chunkvault/storage/sqlite_chunk_cache.hpp"
#include "test_support.hpp"

using namespace chunkvault::storage;
using namespace chunkvault::testing;

namespace {

FileProgressState make_state(const std::string& file_id, uint32_t chunks, uint64_t chunk_size) {
    FileProgressState state;
    state.file_id = file_id;
    state.file_name = file_id + ".bin";
    state.file_path = "/data/" + file_id + ".bin";
    state.file_size = chunks * chunk_size;
    state.last_modified_ms = 1700000000000;
    state.chunk_size = chunk_size;

    for (uint32_t i = 0; i < chunks; ++i) {
        ChunkState chunk;
        chunk.chunk_id = file_id + "_chunk_" + std::to_string(i);
        chunk.chunk_index = i;
        chunk.size = chunk_size;
        chunk.start_byte = i * chunk_size;
        chunk.end_byte = (i + 1) * chunk_size;
        state.chunk_states[chunk.chunk_id] = chunk;
    }

    state.upload_progress.start_time_ms = 1700000000000;
    state.upload_progress.last_update_ms = 1700000001000;
    state.recompute_counters();
    return state;
}

}

class SqliteChunkCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_ = std::make_unique<SqliteChunkCache>(dir_ / "cache.db");
        ASSERT_TRUE(cache_->initialize());
    }

    TempDirectory dir_{"chunkvault_cache"};
    std::unique_ptr<SqliteChunkCache> cache_;
};

TEST_F(SqliteChunkCacheTest, InitializeIsIdempotent) {
    EXPECT_TRUE(cache_->is_open());
    EXPECT_TRUE(cache_->initialize());
}

TEST_F(SqliteChunkCacheTest, PutAndGetChunk) {
    ChunkCacheEntry entry;
    entry.chunk_id = "f_chunk_0";
    entry.file_id = "f";
    entry.chunk_index = 0;
    entry.checksum = "abc123";
    entry.status = ChunkStatus::COMPLETED;
    entry.upload_path = "chunks/f_chunk_0";
    entry.retry_count = 2;
    entry.size = 5 * MB;

    ASSERT_TRUE(cache_->put_chunk(entry).success());

    auto loaded = cache_->get_chunk("f_chunk_0");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->file_id, "f");
    EXPECT_EQ(loaded->checksum, "abc123");
    EXPECT_EQ(loaded->status, ChunkStatus::COMPLETED);
    EXPECT_EQ(loaded->upload_path, "chunks/f_chunk_0");
    EXPECT_EQ(loaded->retry_count, 2u);
    EXPECT_EQ(loaded->size, 5 * MB);
    EXPECT_GT(loaded->updated_at_ms, 0);
    EXPECT_TRUE(loaded->is_completed());

    EXPECT_FALSE(cache_->get_chunk("unknown").has_value());
    EXPECT_EQ(cache_->get_chunk_count(), 1u);
}

TEST_F(SqliteChunkCacheTest, PayloadsStoredOnlyWhenEnabled) {
    ChunkCacheEntry entry;
    entry.chunk_id = "p_chunk_0";
    entry.file_id = "p";
    entry.size = 16;
    entry.payload = random_bytes(16);

    ASSERT_TRUE(cache_->put_chunk(entry).success());
    EXPECT_TRUE(cache_->get_chunk("p_chunk_0")->payload.empty());

    SqliteChunkCache with_payloads(dir_ / "payloads.db", true);
    ASSERT_TRUE(with_payloads.initialize());
    ASSERT_TRUE(with_payloads.put_chunk(entry).success());
    EXPECT_EQ(with_payloads.get_chunk("p_chunk_0")->payload, entry.payload);
}

TEST_F(SqliteChunkCacheTest, FileProgressRoundTrip) {
    auto state = make_state("movie", 5, 5 * MB);
    state.chunk_states["movie_chunk_0"].status = ChunkStatus::COMPLETED;
    state.chunk_states["movie_chunk_0"].upload_path = "chunks/movie_chunk_0";
    state.chunk_states["movie_chunk_0"].checksum = "deadbeef";
    state.chunk_states["movie_chunk_1"].status = ChunkStatus::FAILED;
    state.chunk_states["movie_chunk_1"].error_message = "timeout";
    state.chunk_states["movie_chunk_1"].attempts = 4;
    state.recompute_counters();

    ASSERT_TRUE(cache_->put_file_progress(state).success());

    auto loaded = cache_->get_file_progress("movie");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->file_name, "movie.bin");
    EXPECT_EQ(loaded->file_size, 25 * MB);
    EXPECT_EQ(loaded->last_modified_ms, 1700000000000);
    EXPECT_EQ(loaded->chunk_size, 5 * MB);
    EXPECT_EQ(loaded->chunk_states.size(), 5u);
    EXPECT_EQ(loaded->upload_progress.completed_chunks, 1u);
    EXPECT_EQ(loaded->upload_progress.failed_chunks, 1u);
    EXPECT_EQ(loaded->upload_progress.bytes_uploaded, 5 * MB);

    auto* failed = loaded->find_chunk("movie_chunk_1");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, ChunkStatus::FAILED);
    EXPECT_EQ(failed->error_message, "timeout");
    EXPECT_EQ(failed->attempts, 4u);
    EXPECT_EQ(loaded->find_chunk("movie_chunk_0")->checksum, "deadbeef");
}

TEST_F(SqliteChunkCacheTest, PutFileProgressReplacesChunkRows) {
    ASSERT_TRUE(cache_->put_file_progress(make_state("f", 4, MB)).success());
    ASSERT_TRUE(cache_->put_file_progress(make_state("f", 2, 2 * MB)).success());

    auto loaded = cache_->get_file_progress("f");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunk_states.size(), 2u);
    EXPECT_EQ(loaded->chunk_size, 2 * MB);
}

TEST_F(SqliteChunkCacheTest, PutChunkStateWritesOnlyTheChangedRow) {
    auto state = make_state("f", 3, MB);
    ASSERT_TRUE(cache_->put_file_progress(state).success());

    auto* changed = state.find_chunk("f_chunk_1");
    ASSERT_NE(changed, nullptr);
    changed->status = ChunkStatus::COMPLETED;
    changed->checksum = "cafe";
    changed->attempts = 2;

    // Modified in memory only, never handed to the cache
    state.find_chunk("f_chunk_2")->status = ChunkStatus::FAILED;

    state.recompute_counters();
    state.upload_progress.last_update_ms = 1700000005000;
    ASSERT_TRUE(cache_->put_chunk_state(state, "f_chunk_1").success());

    auto loaded = cache_->get_file_progress("f");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunk_states.size(), 3u);
    EXPECT_EQ(loaded->find_chunk("f_chunk_1")->status, ChunkStatus::COMPLETED);
    EXPECT_EQ(loaded->find_chunk("f_chunk_1")->checksum, "cafe");
    EXPECT_EQ(loaded->find_chunk("f_chunk_1")->attempts, 2u);
    EXPECT_EQ(loaded->find_chunk("f_chunk_0")->status, ChunkStatus::PENDING);
    EXPECT_EQ(loaded->find_chunk("f_chunk_2")->status, ChunkStatus::PENDING);
    EXPECT_EQ(loaded->upload_progress.last_update_ms, 1700000005000);
}

TEST_F(SqliteChunkCacheTest, PutChunkStateCreatesMissingFileRow) {
    auto state = make_state("fresh", 2, MB);
    ASSERT_TRUE(cache_->put_chunk_state(state, "fresh_chunk_0").success());

    auto loaded = cache_->get_file_progress("fresh");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunk_states.size(), 1u);
    EXPECT_EQ(loaded->file_size, 2 * MB);
}

TEST_F(SqliteChunkCacheTest, PutChunkStateRejectsUnknownChunk) {
    auto state = make_state("f", 2, MB);
    ASSERT_TRUE(cache_->put_file_progress(state).success());

    auto result = cache_->put_chunk_state(state, "other_chunk_0");
    EXPECT_EQ(result.error, chunkvault::core::ErrorCode::NOT_FOUND);

    auto loaded = cache_->get_file_progress("f");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunk_states.size(), 2u);
}

TEST_F(SqliteChunkCacheTest, ClearFileCacheLeavesNoChunkRowsBehind) {
    ASSERT_TRUE(cache_->put_file_progress(make_state("a", 3, MB)).success());
    ASSERT_TRUE(cache_->clear_file_cache("a").success());

    // A later single-row write must not resurrect the cleared rows
    auto state = make_state("a", 3, MB);
    ASSERT_TRUE(cache_->put_chunk_state(state, "a_chunk_2").success());

    auto loaded = cache_->get_file_progress("a");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->chunk_states.size(), 1u);
    EXPECT_NE(loaded->find_chunk("a_chunk_2"), nullptr);
}

TEST_F(SqliteChunkCacheTest, ClearFileCacheDropsEverything) {
    ASSERT_TRUE(cache_->put_file_progress(make_state("a", 2, MB)).success());
    ASSERT_TRUE(cache_->put_file_progress(make_state("b", 2, MB)).success());

    ChunkCacheEntry entry;
    entry.chunk_id = "a_chunk_0";
    entry.file_id = "a";
    ASSERT_TRUE(cache_->put_chunk(entry).success());

    ASSERT_TRUE(cache_->clear_file_cache("a").success());

    EXPECT_FALSE(cache_->get_file_progress("a").has_value());
    EXPECT_FALSE(cache_->get_chunk("a_chunk_0").has_value());
    EXPECT_TRUE(cache_->get_file_progress("b").has_value());
}

TEST_F(SqliteChunkCacheTest, ListFileProgress) {
    EXPECT_TRUE(cache_->list_file_progress().empty());

    ASSERT_TRUE(cache_->put_file_progress(make_state("a", 1, MB)).success());
    ASSERT_TRUE(cache_->put_file_progress(make_state("b", 3, MB)).success());

    auto states = cache_->list_file_progress();
    EXPECT_EQ(states.size(), 2u);
}

TEST_F(SqliteChunkCacheTest, SurvivesReopen) {
    ASSERT_TRUE(cache_->put_file_progress(make_state("persisted", 3, MB)).success());
    cache_.reset();

    SqliteChunkCache reopened(dir_ / "cache.db");
    ASSERT_TRUE(reopened.initialize());

    auto loaded = reopened.get_file_progress("persisted");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunk_states.size(), 3u);
}

TEST_F(SqliteChunkCacheTest, OperationsFailBeforeInitialize) {
    SqliteChunkCache closed(dir_ / "closed.db");

    EXPECT_FALSE(closed.is_open());
    EXPECT_EQ(closed.put_chunk(ChunkCacheEntry{}).error, chunkvault::core::ErrorCode::STORAGE_ERROR);
    EXPECT_FALSE(closed.get_file_progress("x").has_value());
    EXPECT_TRUE(closed.list_file_progress().empty());
}

TEST_F(SqliteChunkCacheTest, InitializeFailsForUnwritableLocation) {
    SqliteChunkCache bad(dir_ / "missing_dir" / "nested" / "cache.db");
    EXPECT_FALSE(bad.initialize());
}
