#include "chunkvault/storage/local_storage_backend.hpp"
#include "chunkvault/core/logger.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace chunkvault::storage {

LocalStorageBackend::LocalStorageBackend(const std::filesystem::path& root_directory)
    : root_(root_directory) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        LOG_WARN("Cannot create storage root {}: {}", root_.string(), ec.message());
    }
}

UploadResponse LocalStorageBackend::upload(const std::vector<uint8_t>& bytes,
                                           const std::string& destination_key,
                                           const std::string& bucket,
                                           const std::string& folder) {
    if (!is_safe_component(bucket) || !is_safe_component(folder) ||
        destination_key.empty() || !is_safe_component(destination_key)) {
        return UploadResponse{"", "Invalid destination: " + bucket + "/" + join_key(folder, destination_key)};
    }

    auto key = join_key(folder, destination_key);
    auto target = resolve(key, bucket);
    auto temp = target;
    temp += ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return UploadResponse{"", "Cannot create directory: " + ec.message()};
    }

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return UploadResponse{"", "Cannot open " + temp.string() + " for writing"};
        }

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file.good()) {
            return UploadResponse{"", "Write failed for " + temp.string()};
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return UploadResponse{"", "Cannot commit object " + key};
    }

    LOG_TRACE("Stored object {}/{} ({} bytes)", bucket, key, bytes.size());
    return UploadResponse{key, ""};
}

DownloadResponse LocalStorageBackend::download(const std::string& path, const std::string& bucket) {
    if (path.empty() || !is_safe_component(bucket) || !is_safe_component(path)) {
        return DownloadResponse{{}, "Invalid object path: " + path};
    }

    std::ifstream file(resolve(path, bucket), std::ios::binary);
    if (!file.is_open()) {
        return DownloadResponse{{}, "Object not found: " + bucket + "/" + path};
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return DownloadResponse{std::move(bytes), ""};
}

std::string LocalStorageBackend::remove(const std::string& path, const std::string& bucket) {
    if (path.empty() || !is_safe_component(bucket) || !is_safe_component(path)) {
        return "Invalid object path: " + path;
    }

    std::error_code ec;
    if (!std::filesystem::remove(resolve(path, bucket), ec)) {
        return ec ? ec.message() : "Object not found: " + bucket + "/" + path;
    }
    return "";
}

UploadResponse LocalStorageBackend::upload_file(const std::filesystem::path& local_path,
                                                const std::string& destination_key,
                                                const std::string& bucket,
                                                const std::string& folder) {
    if (!is_safe_component(bucket) || !is_safe_component(folder) ||
        destination_key.empty() || !is_safe_component(destination_key)) {
        return UploadResponse{"", "Invalid destination: " + bucket + "/" + join_key(folder, destination_key)};
    }

    auto key = join_key(folder, destination_key);
    auto target = resolve(key, bucket);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return UploadResponse{"", "Cannot create directory: " + ec.message()};
    }

    std::filesystem::copy_file(local_path, target, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return UploadResponse{"", "Cannot copy " + local_path.string() + ": " + ec.message()};
    }

    return UploadResponse{key, ""};
}

bool LocalStorageBackend::exists(const std::string& path, const std::string& bucket) const {
    std::error_code ec;
    return std::filesystem::exists(resolve(path, bucket), ec);
}

std::filesystem::path LocalStorageBackend::resolve(const std::string& path, const std::string& bucket) const {
    return root_ / bucket / path;
}

bool LocalStorageBackend::is_safe_component(const std::string& value) {
    if (value.find("..") != std::string::npos) {
        return false;
    }
    return value.empty() || value.front() != '/';
}

std::string LocalStorageBackend::join_key(const std::string& folder, const std::string& key) {
    if (folder.empty()) {
        return key;
    }
    return folder + "/" + key;
}

} // namespace chunkvault::storage
