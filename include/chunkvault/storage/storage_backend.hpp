#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkvault::storage {

// A non-empty error is the only failure signal the engine looks at.
struct UploadResponse {
    std::string path;
    std::string error;

    bool success() const { return error.empty(); }
};

struct DownloadResponse {
    std::vector<uint8_t> bytes;
    std::string error;

    bool success() const { return error.empty(); }
};

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual UploadResponse upload(const std::vector<uint8_t>& bytes,
                                  const std::string& destination_key,
                                  const std::string& bucket,
                                  const std::string& folder) = 0;

    virtual DownloadResponse download(const std::string& path, const std::string& bucket) = 0;

    // Returns an empty string on success
    virtual std::string remove(const std::string& path, const std::string& bucket) = 0;

    // Uploads a local file. The default reads it whole and forwards to upload().
    virtual UploadResponse upload_file(const std::filesystem::path& local_path,
                                       const std::string& destination_key,
                                       const std::string& bucket,
                                       const std::string& folder);
};

} // namespace chunkvault::storage
