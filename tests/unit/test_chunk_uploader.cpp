#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "chunkvault/transfer/chunk_uploader.hpp"
#include "chunkvault/transfer/chunk_planner.hpp"
#include "chunkvault/transfer/progress_tracker.hpp"
#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/storage/sqlite_chunk_cache.hpp"
#include "chunkvault/crypto/hash.hpp"
#include "test_support.hpp"
#include <stdexcept>

using namespace chunkvault::transfer;
using namespace chunkvault::testing;
using chunkvault::core::ErrorCode;
using chunkvault::storage::UploadResponse;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class ChunkUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_ = std::make_shared<chunkvault::storage::SqliteChunkCache>(dir_ / "cache.db", true);
        ASSERT_TRUE(cache_->initialize());
        resume_ = std::make_shared<chunkvault::storage::ResumeManager>(cache_);
        tracker_ = std::make_shared<ProgressTracker>();
        backend_ = std::make_shared<::testing::StrictMock<MockStorageBackend>>();

        identity_.file_id = "f";
        identity_.file_name = "f.bin";
        identity_.file_path = (dir_ / "f.bin").string();
        identity_.file_size = 2500;
        identity_.last_modified_ms = 1700000000000;

        ChunkPlan plan;
        plan.chunk_size = 1000;
        plan.descriptors = ChunkPlanner::make_descriptors("f", "f.bin", 2500, 1000);
        plan.total_chunks = static_cast<uint32_t>(plan.descriptors.size());
        descriptors_ = plan.descriptors;

        auto state = ChunkPlanner::make_initial_state(identity_, plan);
        resume_->begin_tracking(state);
        tracker_->initialize_file(state);

        data_ = random_bytes(2500);
        uploader_ = std::make_unique<ChunkUploader>(backend_, resume_, tracker_, config_);
    }

    std::vector<uint8_t> bytes_of(const ChunkDescriptor& descriptor) const {
        return std::vector<uint8_t>(data_.begin() + descriptor.start_byte, data_.begin() + descriptor.end_byte);
    }

    TempDirectory dir_{"chunkvault_uploader"};
    std::shared_ptr<chunkvault::storage::SqliteChunkCache> cache_;
    std::shared_ptr<chunkvault::storage::ResumeManager> resume_;
    std::shared_ptr<ProgressTracker> tracker_;
    std::shared_ptr<::testing::StrictMock<MockStorageBackend>> backend_;
    chunkvault::storage::StorageConfig config_;
    chunkvault::storage::FileIdentity identity_;
    std::vector<ChunkDescriptor> descriptors_;
    std::vector<uint8_t> data_;
    std::unique_ptr<ChunkUploader> uploader_;
};

TEST_F(ChunkUploaderTest, UploadsChunkAndRecordsCompletion) {
    const auto& descriptor = descriptors_[1];
    auto bytes = bytes_of(descriptor);

    EXPECT_CALL(*backend_, upload(bytes, "f_chunk_1", "qa-files", "chunks"))
        .WillOnce(Return(UploadResponse{"chunks/f_chunk_1", ""}));

    auto result = uploader_->upload(descriptor, bytes);
    ASSERT_TRUE(result.success()) << result.result.message;
    EXPECT_EQ(result.chunk_id, "f_chunk_1");
    EXPECT_EQ(result.upload_path, "chunks/f_chunk_1");
    EXPECT_EQ(result.checksum, chunkvault::crypto::hash_utils::checksum_hex(bytes));
    EXPECT_FALSE(result.from_cache);

    auto state = resume_->get_state("f");
    ASSERT_TRUE(state.has_value());
    auto* chunk = state->find_chunk("f_chunk_1");
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->status, ChunkStatus::COMPLETED);
    EXPECT_EQ(chunk->upload_path, "chunks/f_chunk_1");
    EXPECT_EQ(chunk->checksum, result.checksum);

    auto cached = cache_->get_chunk("f_chunk_1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->is_completed());
    EXPECT_EQ(cached->payload, bytes);

    auto progress = tracker_->get_chunk_progress("f", "f_chunk_1");
    EXPECT_EQ(progress->status, ChunkStatus::COMPLETED);
    EXPECT_EQ(progress->bytes_uploaded, 1000u);
}

TEST_F(ChunkUploaderTest, UsesConfiguredFolder) {
    config_.folder = "team";
    config_.bucket = "archive";
    ChunkUploader uploader(backend_, resume_, tracker_, config_);
    auto bytes = bytes_of(descriptors_[0]);

    EXPECT_CALL(*backend_, upload(_, "f_chunk_0", "archive", "team/chunks"))
        .WillOnce(Return(UploadResponse{"team/chunks/f_chunk_0", ""}));

    auto result = uploader.upload(descriptors_[0], bytes);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.upload_path, "team/chunks/f_chunk_0");
}

TEST_F(ChunkUploaderTest, SizeMismatchIsValidationError) {
    auto bytes = bytes_of(descriptors_[0]);
    bytes.pop_back();

    auto result = uploader_->upload(descriptors_[0], bytes);
    EXPECT_EQ(result.result.error, ErrorCode::VALIDATION_ERROR);
    EXPECT_FALSE(result.result.retryable());
    EXPECT_EQ(resume_->get_state("f")->find_chunk("f_chunk_0")->status, ChunkStatus::PENDING);
}

TEST_F(ChunkUploaderTest, BackendErrorIsRetryableTransportError) {
    EXPECT_CALL(*backend_, upload(_, "f_chunk_0", _, _))
        .WillOnce(Return(UploadResponse{"", "503 service unavailable"}));

    auto result = uploader_->upload(descriptors_[0], bytes_of(descriptors_[0]));
    EXPECT_EQ(result.result.error, ErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(result.result.message, "503 service unavailable");
    EXPECT_TRUE(result.result.retryable());

    // The failure itself is recorded by whoever decides between retrying and failing
    auto state = resume_->get_state("f");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->find_chunk("f_chunk_0")->status, ChunkStatus::UPLOADING);
    EXPECT_EQ(tracker_->get_chunk_progress("f", "f_chunk_0")->status, ChunkStatus::UPLOADING);
}

TEST_F(ChunkUploaderTest, BackendExceptionIsTransportError) {
    EXPECT_CALL(*backend_, upload(_, _, _, _))
        .WillOnce(Throw(std::runtime_error("connection reset")));

    auto result = uploader_->upload(descriptors_[2], bytes_of(descriptors_[2]));
    EXPECT_EQ(result.result.error, ErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(result.result.message, "connection reset");
}

TEST_F(ChunkUploaderTest, CompletedCacheEntryShortCircuits) {
    auto bytes = bytes_of(descriptors_[0]);
    EXPECT_CALL(*backend_, upload(_, "f_chunk_0", _, _))
        .Times(1)
        .WillOnce(Return(UploadResponse{"chunks/f_chunk_0", ""}));

    auto first = uploader_->upload(descriptors_[0], bytes);
    ASSERT_TRUE(first.success());

    auto second = uploader_->upload(descriptors_[0], bytes);
    ASSERT_TRUE(second.success());
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(second.upload_path, first.upload_path);
    EXPECT_EQ(second.checksum, first.checksum);
}

TEST_F(ChunkUploaderTest, CacheEntryFromAnotherPlanIsIgnored) {
    chunkvault::storage::ChunkCacheEntry stale;
    stale.chunk_id = "f_chunk_0";
    stale.file_id = "f";
    stale.status = ChunkStatus::COMPLETED;
    stale.upload_path = "chunks/f_chunk_0";
    stale.size = 4000;
    ASSERT_TRUE(resume_->store_chunk_entry(stale));

    EXPECT_CALL(*backend_, upload(_, "f_chunk_0", _, _))
        .WillOnce(Return(UploadResponse{"chunks/f_chunk_0", ""}));

    auto result = uploader_->upload(descriptors_[0], bytes_of(descriptors_[0]));
    ASSERT_TRUE(result.success());
    EXPECT_FALSE(result.from_cache);
}

TEST_F(ChunkUploaderTest, AbandonedJobIsCancelled) {
    std::atomic<bool> abandoned{true};

    auto result = uploader_->execute(descriptors_[0], bytes_of(descriptors_[0]), abandoned);
    EXPECT_EQ(result.result.error, ErrorCode::CANCELLED);
    EXPECT_FALSE(cache_->get_chunk("f_chunk_0").has_value());
}

TEST_F(ChunkUploaderTest, WorksWithoutStateOrProgress) {
    ChunkUploader bare(backend_, nullptr, nullptr, config_);
    EXPECT_CALL(*backend_, upload(_, "f_chunk_2", _, _))
        .WillOnce(Return(UploadResponse{"chunks/f_chunk_2", ""}));

    auto result = bare.upload(descriptors_[2], bytes_of(descriptors_[2]));
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.upload_path, "chunks/f_chunk_2");
    EXPECT_EQ(descriptors_[2].actual_size(), 500u);
}
