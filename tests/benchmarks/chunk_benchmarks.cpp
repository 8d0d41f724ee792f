#include <benchmark/benchmark.h>
#include "chunkvault/crypto/hash.hpp"
#include "chunkvault/transfer/chunk_planner.hpp"
#include "chunkvault/transfer/progress_tracker.hpp"
#include "chunkvault/storage/local_storage_backend.hpp"
#include "chunkvault/storage/sqlite_chunk_cache.hpp"
#include "chunkvault/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <random>
#include <vector>

using namespace chunkvault;
constexpr uint64_t MB = 1024 * 1024;

static std::vector<std::uint8_t> make_data(size_t size) {
    std::vector<std::uint8_t> data(size);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::generate(data.begin(), data.end(), gen);
    return data;
}

static void BM_ChunkChecksum(benchmark::State& state) {
    auto data = make_data(state.range(0));

    for (auto _ : state) {
        benchmark::DoNotOptimize(crypto::hash_utils::checksum_hex(data));
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkChecksum)->Range(64 * 1024, 10 * 1024 * 1024);

static void BM_ChunkChecksumVerify(benchmark::State& state) {
    auto data = make_data(state.range(0));
    auto checksum = crypto::hash_utils::checksum_hex(data);

    for (auto _ : state) {
        bool valid = crypto::hash_utils::verify_checksum(data, checksum);
        benchmark::DoNotOptimize(valid);
    }

    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkChecksumVerify)->Range(64 * 1024, 10 * 1024 * 1024);

static void BM_MakeDescriptors(benchmark::State& state) {
    auto file_size = static_cast<uint64_t>(state.range(0)) * MB;

    for (auto _ : state) {
        auto descriptors = transfer::ChunkPlanner::make_descriptors("bench", "bench.bin", file_size, 5 * MB);
        benchmark::DoNotOptimize(descriptors.data());
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MakeDescriptors)->Arg(25)->Arg(1024)->Arg(100 * 1024);

class ChunkStorageFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        core::Logger::get()->set_level(spdlog::level::err);

        directory_ = std::filesystem::temp_directory_path() / "chunkvault_bench";
        std::filesystem::create_directories(directory_);
        backend_ = std::make_unique<storage::LocalStorageBackend>(directory_ / "objects");
        cache_ = std::make_unique<storage::SqliteChunkCache>(directory_ / "cache.db");
        cache_->initialize();
        chunk_ = make_data(1 * MB);
    }

    void TearDown(const ::benchmark::State& state) override {
        cache_.reset();
        backend_.reset();

        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

protected:
    std::filesystem::path directory_;
    std::unique_ptr<storage::LocalStorageBackend> backend_;
    std::unique_ptr<storage::SqliteChunkCache> cache_;
    std::vector<std::uint8_t> chunk_;
};

BENCHMARK_F(ChunkStorageFixture, LocalBackend_Upload1MB)(benchmark::State& state) {
    uint64_t index = 0;
    for (auto _ : state) {
        auto response = backend_->upload(chunk_, "chunk_" + std::to_string(index++ % 16), "bench", "chunks");
        benchmark::DoNotOptimize(response.path);
    }
    state.SetBytesProcessed(state.iterations() * chunk_.size());
}

BENCHMARK_F(ChunkStorageFixture, LocalBackend_Download1MB)(benchmark::State& state) {
    auto path = backend_->upload(chunk_, "chunk", "bench", "chunks").path;
    for (auto _ : state) {
        auto response = backend_->download(path, "bench");
        benchmark::DoNotOptimize(response.bytes.data());
    }
    state.SetBytesProcessed(state.iterations() * chunk_.size());
}

BENCHMARK_F(ChunkStorageFixture, ChunkCache_PutEntry)(benchmark::State& state) {
    storage::ChunkCacheEntry entry;
    entry.file_id = "bench";
    entry.status = storage::ChunkStatus::COMPLETED;
    entry.checksum = crypto::hash_utils::checksum_hex(chunk_);
    entry.upload_path = "chunks/bench";
    entry.size = chunk_.size();

    uint64_t index = 0;
    for (auto _ : state) {
        entry.chunk_id = "bench_chunk_" + std::to_string(index++ % 1000);
        benchmark::DoNotOptimize(cache_->put_chunk(entry));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(ChunkStorageFixture, ChunkCache_PutFileProgress)(benchmark::State& state) {
    storage::FileProgressState progress;
    progress.file_id = "bench";
    progress.file_name = "bench.bin";
    progress.file_size = 100 * 5 * MB;
    progress.chunk_size = 5 * MB;
    for (uint32_t i = 0; i < 100; ++i) {
        storage::ChunkState chunk;
        chunk.chunk_id = transfer::ChunkDescriptor::make_chunk_id("bench", i);
        chunk.chunk_index = i;
        chunk.size = 5 * MB;
        chunk.start_byte = i * 5 * MB;
        chunk.end_byte = (i + 1) * 5 * MB;
        progress.chunk_states[chunk.chunk_id] = chunk;
    }
    progress.recompute_counters();

    for (auto _ : state) {
        benchmark::DoNotOptimize(cache_->put_file_progress(progress));
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_ProgressByteUpdates(benchmark::State& state) {
    core::Logger::get()->set_level(spdlog::level::err);

    transfer::ProgressTracker tracker;
    storage::FileProgressState progress;
    progress.file_id = "bench";
    progress.file_size = 5 * MB;
    storage::ChunkState chunk;
    chunk.chunk_id = "bench_chunk_0";
    chunk.size = 5 * MB;
    chunk.end_byte = 5 * MB;
    progress.chunk_states[chunk.chunk_id] = chunk;
    tracker.initialize_file(progress);
    tracker.update_chunk_status("bench", "bench_chunk_0", storage::ChunkStatus::UPLOADING);

    uint64_t bytes = 0;
    for (auto _ : state) {
        bytes = std::min<uint64_t>(bytes + 1, 5 * MB);
        benchmark::DoNotOptimize(tracker.update_chunk_bytes("bench", "bench_chunk_0", bytes));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ProgressByteUpdates);

BENCHMARK_MAIN();
