#pragma once

#include "storage_backend.hpp"
#include <filesystem>
#include <mutex>

namespace chunkvault::storage {

// Object store rooted at a directory: <root>/<bucket>/<folder>/<key>
class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::filesystem::path& root_directory);

    UploadResponse upload(const std::vector<uint8_t>& bytes,
                          const std::string& destination_key,
                          const std::string& bucket,
                          const std::string& folder) override;

    DownloadResponse download(const std::string& path, const std::string& bucket) override;

    std::string remove(const std::string& path, const std::string& bucket) override;

    UploadResponse upload_file(const std::filesystem::path& local_path,
                               const std::string& destination_key,
                               const std::string& bucket,
                               const std::string& folder) override;

    bool exists(const std::string& path, const std::string& bucket) const;
    std::filesystem::path resolve(const std::string& path, const std::string& bucket) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::mutex mutex_;

    static bool is_safe_component(const std::string& value);
    static std::string join_key(const std::string& folder, const std::string& key);
};

} // namespace chunkvault::storage
