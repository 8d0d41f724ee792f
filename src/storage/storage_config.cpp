#include "chunkvault/storage/storage_config.hpp"
#include "chunkvault/core/config.hpp"

namespace chunkvault::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage(config.get_string("storage.root", "./chunkvault_data"));
    storage.bucket = config.get_string("storage.bucket", storage.bucket);
    storage.folder = config.get_string("storage.folder", "");
    storage.output_folder = config.get_string("storage.output_folder", storage.output_folder);
    storage.store_chunk_payloads = config.get_bool("cache.store_payloads", false);
    return storage;
}

bool StorageConfig::validate() const {
    if (objects_directory.empty() || staging_directory.empty() || database_path.empty()) {
        return false;
    }

    if (bucket.empty() || output_folder.empty()) {
        return false;
    }

    // Bucket and folders become path components of the object store
    if (bucket.find("..") != std::string::npos || folder.find("..") != std::string::npos ||
        output_folder.find("..") != std::string::npos) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(objects_directory);
        std::filesystem::create_directories(staging_directory);

        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }

        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

uint64_t StorageConfig::get_available_space() const {
    try {
        auto space_info = std::filesystem::space(objects_directory);
        return space_info.available;
    } catch (const std::filesystem::filesystem_error&) {
        return 0;
    }
}

bool StorageConfig::has_sufficient_space(uint64_t required_bytes) const {
    uint64_t available = get_available_space();

    // Keep at least 100MB free after staging
    uint64_t safety_margin = 100ULL * 1024 * 1024;

    return available > (required_bytes + safety_margin);
}

std::string StorageConfig::chunk_folder() const {
    return folder.empty() ? "chunks" : folder + "/chunks";
}

std::filesystem::path StorageConfig::get_staging_path(const std::string& file_id) const {
    return staging_directory / (file_id + ".partial");
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    objects_directory = base_dir / "objects";
    staging_directory = base_dir / "incomplete";
    database_path = base_dir / "chunkvault.db";
}

} // namespace chunkvault::storage
