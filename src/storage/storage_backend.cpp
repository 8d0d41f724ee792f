#include "chunkvault/storage/storage_backend.hpp"
#include <fstream>
#include <iterator>

namespace chunkvault::storage {

UploadResponse StorageBackend::upload_file(const std::filesystem::path& local_path,
                                           const std::string& destination_key,
                                           const std::string& bucket,
                                           const std::string& folder) {
    std::ifstream file(local_path, std::ios::binary);
    if (!file.is_open()) {
        return UploadResponse{"", "Cannot open " + local_path.string()};
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return upload(bytes, destination_key, bucket, folder);
}

} // namespace chunkvault::storage
