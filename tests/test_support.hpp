#pragma once

#include <gmock/gmock.h>
#include "chunkvault/storage/storage_backend.hpp"
#include "chunkvault/transfer/resource_monitor.hpp"
#include "chunkvault/transfer/transfer_types.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace chunkvault::testing {

constexpr uint64_t MB = 1024 * 1024;

// Unique directory under the system temp dir, removed on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix) {
        static std::atomic<uint64_t> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> random_bytes(size_t size, uint32_t seed = 42) {
    std::vector<uint8_t> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dist(gen));
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

inline transfer::ChunkDescriptor make_descriptor(const std::string& file_id, uint32_t index, uint32_t total,
                                                 uint64_t chunk_size, uint64_t file_size) {
    transfer::ChunkDescriptor descriptor;
    descriptor.chunk_id = transfer::ChunkDescriptor::make_chunk_id(file_id, index);
    descriptor.file_id = file_id;
    descriptor.file_name = file_id + ".bin";
    descriptor.chunk_index = index;
    descriptor.total_chunks = total;
    descriptor.start_byte = static_cast<uint64_t>(index) * chunk_size;
    descriptor.end_byte = std::min(descriptor.start_byte + chunk_size, file_size);
    descriptor.chunk_size = chunk_size;
    descriptor.is_last_chunk = (index + 1 == total);
    return descriptor;
}

// Resource monitor with fixed, adjustable readings
class FakeResourceMonitor : public transfer::ResourceMonitor {
public:
    FakeResourceMonitor() {
        resources_.cpu_cores = 8;
        resources_.total_memory_bytes = 16384 * MB;
        resources_.available_memory_bytes = 12288 * MB;
        resources_.cpu_load_percent = 20.0;
    }

    transfer::SystemResources get_system_resources() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return resources_;
    }

    void set_usage_ratio(double ratio) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_.available_memory_bytes =
            static_cast<uint64_t>(resources_.total_memory_bytes * (1.0 - ratio));
    }

    void set_resources(const transfer::SystemResources& resources) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_ = resources;
    }

private:
    transfer::SystemResources resources_;
    std::mutex mutex_;
};

// Forwards to a real backend, failing scripted calls first
class FlakyStorageBackend : public storage::StorageBackend {
public:
    explicit FlakyStorageBackend(std::shared_ptr<storage::StorageBackend> inner)
        : inner_(std::move(inner)) {}

    storage::UploadResponse upload(const std::vector<uint8_t>& bytes, const std::string& destination_key,
                                   const std::string& bucket, const std::string& folder) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            upload_calls_++;
            if (consume(upload_failures_, destination_key)) {
                return storage::UploadResponse{"", "injected upload failure"};
            }
        }
        return inner_->upload(bytes, destination_key, bucket, folder);
    }

    storage::DownloadResponse download(const std::string& path, const std::string& bucket) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            download_calls_++;
            if (consume(download_failures_, path)) {
                return storage::DownloadResponse{{}, "injected download failure"};
            }
        }
        return inner_->download(path, bucket);
    }

    std::string remove(const std::string& path, const std::string& bucket) override {
        return inner_->remove(path, bucket);
    }

    void fail_uploads(const std::string& key, int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_failures_[key] += times;
    }

    void fail_downloads(const std::string& path, int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        download_failures_[path] += times;
    }

    int upload_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return upload_calls_;
    }

    int download_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return download_calls_;
    }

private:
    std::shared_ptr<storage::StorageBackend> inner_;
    std::map<std::string, int> upload_failures_;
    std::map<std::string, int> download_failures_;
    int upload_calls_ = 0;
    int download_calls_ = 0;
    mutable std::mutex mutex_;

    static bool consume(std::map<std::string, int>& failures, const std::string& key) {
        auto it = failures.find(key);
        if (it == failures.end() || it->second <= 0) {
            return false;
        }
        it->second--;
        return true;
    }
};

class MockStorageBackend : public storage::StorageBackend {
public:
    MOCK_METHOD(storage::UploadResponse, upload,
                (const std::vector<uint8_t>& bytes, const std::string& destination_key,
                 const std::string& bucket, const std::string& folder), (override));
    MOCK_METHOD(storage::DownloadResponse, download,
                (const std::string& path, const std::string& bucket), (override));
    MOCK_METHOD(std::string, remove, (const std::string& path, const std::string& bucket), (override));
};

} // namespace chunkvault::testing
