#include <gtest/gtest.h>
#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/storage/sqlite_chunk_cache.hpp"
#include "chunkvault/transfer/chunk_planner.hpp"
#include "test_support.hpp"

using namespace chunkvault::storage;
using namespace chunkvault::transfer;
using namespace chunkvault::testing;
using chunkvault::core::ErrorCode;
using chunkvault::core::Result;

namespace {

// Sqlite-backed cache that can fail the next single-row chunk write
class FlakyChunkCache : public ChunkCache {
public:
    explicit FlakyChunkCache(std::shared_ptr<SqliteChunkCache> inner) : inner_(std::move(inner)) {}

    std::optional<ChunkCacheEntry> get_chunk(const std::string& chunk_id) override {
        return inner_->get_chunk(chunk_id);
    }
    Result put_chunk(const ChunkCacheEntry& entry) override { return inner_->put_chunk(entry); }
    std::optional<FileProgressState> get_file_progress(const std::string& file_id) override {
        return inner_->get_file_progress(file_id);
    }
    Result put_file_progress(const FileProgressState& state) override {
        full_writes++;
        return inner_->put_file_progress(state);
    }
    Result put_chunk_state(const FileProgressState& state, const std::string& chunk_id) override {
        if (fail_next_chunk_write) {
            fail_next_chunk_write = false;
            return Result(ErrorCode::STORAGE_ERROR, "disk I/O error");
        }
        chunk_writes++;
        return inner_->put_chunk_state(state, chunk_id);
    }
    Result clear_file_cache(const std::string& file_id) override { return inner_->clear_file_cache(file_id); }
    std::vector<FileProgressState> list_file_progress() override { return inner_->list_file_progress(); }

    bool fail_next_chunk_write = false;
    int full_writes = 0;
    int chunk_writes = 0;

private:
    std::shared_ptr<SqliteChunkCache> inner_;
};

}

class ResumeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_ = std::make_shared<SqliteChunkCache>(dir_ / "cache.db");
        ASSERT_TRUE(cache_->initialize());
        manager_ = std::make_unique<ResumeManager>(cache_);

        source_ = dir_ / "video file.bin";
        write_file(source_, random_bytes(10 * 1024));

        auto identity = FileIdentity::from_path(source_);
        ASSERT_TRUE(identity.has_value());
        identity_ = *identity;
    }

    // Four 2560-byte chunks covering the source file
    FileProgressState initial_state() {
        ChunkPlan plan;
        plan.chunk_size = 2560;
        plan.descriptors = ChunkPlanner::make_descriptors(identity_.file_id, identity_.file_name,
                                                          identity_.file_size, plan.chunk_size);
        plan.total_chunks = static_cast<uint32_t>(plan.descriptors.size());
        return ChunkPlanner::make_initial_state(identity_, plan);
    }

    std::string chunk_id(uint32_t index) const {
        return ChunkDescriptor::make_chunk_id(identity_.file_id, index);
    }

    void complete(uint32_t index) {
        TransitionDetails details;
        details.checksum = "sum" + std::to_string(index);
        details.upload_path = "chunks/" + chunk_id(index);
        ASSERT_TRUE(manager_->record_transition(identity_.file_id, chunk_id(index), ChunkStatus::COMPLETED, details));
    }

    TempDirectory dir_{"chunkvault_resume"};
    std::shared_ptr<SqliteChunkCache> cache_;
    std::unique_ptr<ResumeManager> manager_;
    std::filesystem::path source_;
    FileIdentity identity_;
};

TEST_F(ResumeManagerTest, FileIdentityFromPath) {
    EXPECT_EQ(identity_.file_name, "video file.bin");
    EXPECT_EQ(identity_.file_size, 10u * 1024);
    EXPECT_GT(identity_.last_modified_ms, 0);
    EXPECT_EQ(identity_.file_id.rfind("video_file.bin_", 0), 0u);

    auto again = FileIdentity::from_path(source_);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->file_id, identity_.file_id);

    EXPECT_FALSE(FileIdentity::from_path(dir_ / "missing.bin").has_value());
    EXPECT_FALSE(FileIdentity::from_path(dir_.path()).has_value());
}

TEST_F(ResumeManagerTest, SameNameInDifferentDirectoriesGetsDistinctIds) {
    std::filesystem::create_directories(dir_ / "other");
    auto other_path = dir_ / "other" / "video file.bin";
    write_file(other_path, random_bytes(10));

    auto other = FileIdentity::from_path(other_path);
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(other->file_id, identity_.file_id);
}

TEST_F(ResumeManagerTest, BeginTrackingPersistsPendingState) {
    manager_->begin_tracking(initial_state());

    EXPECT_TRUE(manager_->is_tracking(identity_.file_id));

    auto persisted = cache_->get_file_progress(identity_.file_id);
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->upload_progress.total_chunks, 4u);
    EXPECT_EQ(persisted->upload_progress.completed_chunks, 0u);
    EXPECT_GT(persisted->upload_progress.start_time_ms, 0);
}

TEST_F(ResumeManagerTest, RecordTransitionUpdatesCounters) {
    manager_->begin_tracking(initial_state());

    ASSERT_TRUE(manager_->record_transition(identity_.file_id, chunk_id(0), ChunkStatus::UPLOADING));
    complete(0);

    TransitionDetails failure;
    failure.error_message = "connection reset";
    ASSERT_TRUE(manager_->record_transition(identity_.file_id, chunk_id(1), ChunkStatus::FAILED, failure));

    auto state = manager_->get_state(identity_.file_id);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->upload_progress.completed_chunks, 1u);
    EXPECT_EQ(state->upload_progress.failed_chunks, 1u);
    EXPECT_EQ(state->upload_progress.bytes_uploaded, 2560u);

    auto* first = state->find_chunk(chunk_id(0));
    EXPECT_EQ(first->attempts, 1u);
    EXPECT_EQ(first->upload_path, "chunks/" + chunk_id(0));
    EXPECT_EQ(first->checksum, "sum0");
    EXPECT_EQ(state->find_chunk(chunk_id(1))->error_message, "connection reset");

    auto persisted = cache_->get_file_progress(identity_.file_id);
    EXPECT_EQ(persisted->upload_progress.completed_chunks, 1u);
}

TEST_F(ResumeManagerTest, UntrackedWritesAreDiscarded) {
    EXPECT_FALSE(manager_->record_transition("nobody", "nobody_chunk_0", ChunkStatus::COMPLETED));

    manager_->begin_tracking(initial_state());
    EXPECT_FALSE(manager_->record_transition(identity_.file_id, "unknown_chunk", ChunkStatus::COMPLETED));

    manager_->release(identity_.file_id);
    EXPECT_FALSE(manager_->is_tracking(identity_.file_id));
    EXPECT_FALSE(manager_->record_transition(identity_.file_id, chunk_id(0), ChunkStatus::COMPLETED));

    ChunkCacheEntry entry;
    entry.chunk_id = chunk_id(0);
    entry.file_id = identity_.file_id;
    EXPECT_FALSE(manager_->store_chunk_entry(entry));

    // Released state is still on disk for a later resume
    EXPECT_TRUE(cache_->get_file_progress(identity_.file_id).has_value());
}

TEST_F(ResumeManagerTest, ResumeReturnsStateWithCompletedChunks) {
    manager_->begin_tracking(initial_state());
    complete(0);
    complete(1);
    ASSERT_TRUE(manager_->record_transition(identity_.file_id, chunk_id(2), ChunkStatus::UPLOADING));
    manager_->release(identity_.file_id);

    ResumeManager restarted(cache_);
    auto resumed = restarted.try_resume(identity_);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->upload_progress.completed_chunks, 2u);

    // In-flight chunks of the crashed run are retried from scratch
    EXPECT_EQ(resumed->find_chunk(chunk_id(2))->status, ChunkStatus::PENDING);
    EXPECT_EQ(resumed->find_chunk(chunk_id(3))->status, ChunkStatus::PENDING);
}

TEST_F(ResumeManagerTest, ResumeWithoutCompletedChunksPurges) {
    manager_->begin_tracking(initial_state());
    manager_->release(identity_.file_id);

    EXPECT_FALSE(manager_->try_resume(identity_).has_value());
    EXPECT_FALSE(cache_->get_file_progress(identity_.file_id).has_value());
}

TEST_F(ResumeManagerTest, ResumeOfChangedFilePurges) {
    manager_->begin_tracking(initial_state());
    complete(0);
    manager_->release(identity_.file_id);

    auto changed = identity_;
    changed.file_size += 1;
    EXPECT_FALSE(manager_->try_resume(changed).has_value());
    EXPECT_FALSE(cache_->get_file_progress(identity_.file_id).has_value());
}

TEST_F(ResumeManagerTest, ResumeOfCorruptRangesPurges) {
    auto state = initial_state();
    state.chunk_states[chunk_id(0)].status = ChunkStatus::COMPLETED;
    state.chunk_states[chunk_id(0)].upload_path = "chunks/x";
    state.chunk_states[chunk_id(2)].start_byte += 1;
    ASSERT_TRUE(cache_->put_file_progress(state).success());

    EXPECT_FALSE(manager_->try_resume(identity_).has_value());
    EXPECT_FALSE(cache_->get_file_progress(identity_.file_id).has_value());
}

TEST_F(ResumeManagerTest, RebuildDescriptors) {
    std::vector<ChunkDescriptor> descriptors;
    ASSERT_TRUE(ResumeManager::rebuild_descriptors(initial_state(), descriptors).success());

    ASSERT_EQ(descriptors.size(), 4u);
    EXPECT_EQ(descriptors[0].start_byte, 0u);
    EXPECT_EQ(descriptors[3].end_byte, 10u * 1024);
    EXPECT_TRUE(descriptors[3].is_last_chunk);
    EXPECT_FALSE(descriptors[2].is_last_chunk);
    EXPECT_EQ(descriptors[1].chunk_id, chunk_id(1));

    auto missing = initial_state();
    missing.chunk_states.erase(chunk_id(1));
    missing.upload_progress.total_chunks = 0;
    auto result = ResumeManager::rebuild_descriptors(missing, descriptors);
    EXPECT_EQ(result.error, ErrorCode::RESUMABILITY_ERROR);
    EXPECT_TRUE(descriptors.empty());

    auto short_cover = initial_state();
    short_cover.file_size += 100;
    EXPECT_EQ(ResumeManager::rebuild_descriptors(short_cover, descriptors).error, ErrorCode::RESUMABILITY_ERROR);
}

TEST_F(ResumeManagerTest, BuildReassemblyInfo) {
    manager_->begin_tracking(initial_state());
    complete(0);
    complete(2);

    ChunkReassemblyInfo info;
    ASSERT_TRUE(manager_->build_reassembly_info(identity_.file_id, info).success());
    EXPECT_EQ(info.total_chunks, 4u);
    EXPECT_EQ(info.uploaded_chunks.size(), 2u);
    EXPECT_FALSE(info.is_complete);
    EXPECT_EQ(info.uploaded_chunks[1].descriptor.chunk_index, 2u);
    EXPECT_EQ(info.uploaded_chunks[1].checksum, "sum2");

    complete(1);
    complete(3);
    ASSERT_TRUE(manager_->build_reassembly_info(identity_.file_id, info).success());
    EXPECT_TRUE(info.is_complete);
    EXPECT_TRUE(info.uploaded_chunks.back().descriptor.is_last_chunk);

    EXPECT_EQ(manager_->build_reassembly_info("unknown", info).error, ErrorCode::NOT_FOUND);
}

TEST_F(ResumeManagerTest, ClearDropsTrackingAndRows) {
    manager_->begin_tracking(initial_state());
    complete(0);

    ASSERT_TRUE(manager_->clear(identity_.file_id).success());
    EXPECT_FALSE(manager_->is_tracking(identity_.file_id));
    EXPECT_FALSE(manager_->get_state(identity_.file_id).has_value());
    EXPECT_TRUE(manager_->list_states().empty());
}

TEST_F(ResumeManagerTest, PersistFailuresAreCounted) {
    auto closed = std::make_shared<SqliteChunkCache>(dir_ / "never_opened.db");
    ResumeManager manager(closed);

    manager.begin_tracking(initial_state());
    EXPECT_TRUE(manager.is_tracking(identity_.file_id));
    EXPECT_FALSE(manager.record_transition(identity_.file_id, chunk_id(0), ChunkStatus::UPLOADING));
    EXPECT_EQ(manager.get_persist_failures(), 2u);
}

TEST_F(ResumeManagerTest, TransitionsWriteSingleChunkRows) {
    auto flaky = std::make_shared<FlakyChunkCache>(cache_);
    ResumeManager manager(flaky);

    manager.begin_tracking(initial_state());
    EXPECT_EQ(flaky->full_writes, 1);

    ASSERT_TRUE(manager.record_transition(identity_.file_id, chunk_id(0), ChunkStatus::UPLOADING));
    ASSERT_TRUE(manager.record_transition(identity_.file_id, chunk_id(0), ChunkStatus::COMPLETED));
    EXPECT_EQ(flaky->full_writes, 1);
    EXPECT_EQ(flaky->chunk_writes, 2);

    auto persisted = cache_->get_file_progress(identity_.file_id);
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->find_chunk(chunk_id(0))->status, ChunkStatus::COMPLETED);
    EXPECT_EQ(persisted->upload_progress.completed_chunks, 1u);
}

TEST_F(ResumeManagerTest, FailedChunkWriteIsRepairedByFullRewrite) {
    auto flaky = std::make_shared<FlakyChunkCache>(cache_);
    ResumeManager manager(flaky);
    manager.begin_tracking(initial_state());

    flaky->fail_next_chunk_write = true;
    EXPECT_FALSE(manager.record_transition(identity_.file_id, chunk_id(0), ChunkStatus::COMPLETED));
    EXPECT_EQ(manager.get_persist_failures(), 1u);
    EXPECT_EQ(cache_->get_file_progress(identity_.file_id)->find_chunk(chunk_id(0))->status,
              ChunkStatus::PENDING);

    ASSERT_TRUE(manager.record_transition(identity_.file_id, chunk_id(1), ChunkStatus::COMPLETED));
    EXPECT_EQ(flaky->full_writes, 2);

    auto persisted = cache_->get_file_progress(identity_.file_id);
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->find_chunk(chunk_id(0))->status, ChunkStatus::COMPLETED);
    EXPECT_EQ(persisted->find_chunk(chunk_id(1))->status, ChunkStatus::COMPLETED);

    // Back in sync, so the next transition is a single-row write again
    ASSERT_TRUE(manager.record_transition(identity_.file_id, chunk_id(2), ChunkStatus::UPLOADING));
    EXPECT_EQ(flaky->full_writes, 2);
    EXPECT_EQ(flaky->chunk_writes, 1);
}

TEST_F(ResumeManagerTest, ReleaseFlushesUnsyncedState) {
    auto flaky = std::make_shared<FlakyChunkCache>(cache_);
    ResumeManager manager(flaky);
    manager.begin_tracking(initial_state());

    flaky->fail_next_chunk_write = true;
    EXPECT_FALSE(manager.record_transition(identity_.file_id, chunk_id(3), ChunkStatus::COMPLETED));

    manager.release(identity_.file_id);
    EXPECT_FALSE(manager.is_tracking(identity_.file_id));

    auto persisted = cache_->get_file_progress(identity_.file_id);
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->find_chunk(chunk_id(3))->status, ChunkStatus::COMPLETED);
}
