#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkvault::core {
class Config;
}

namespace chunkvault::storage {

struct StorageConfig {
    std::filesystem::path objects_directory;
    std::filesystem::path staging_directory;
    std::filesystem::path database_path;

    std::string bucket = "qa-files";
    std::string folder;                     // optional prefix for chunk keys
    std::string output_folder = "uploads";  // where reassembled files land

    bool store_chunk_payloads = false;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& base_dir);

    static StorageConfig from_config(const core::Config& config);

    bool validate() const;

    bool create_directories() const;

    uint64_t get_available_space() const;

    bool has_sufficient_space(uint64_t required_bytes) const;

    // "<folder>/chunks", or "chunks" without a folder
    std::string chunk_folder() const;

    std::filesystem::path get_staging_path(const std::string& file_id) const;

    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace chunkvault::storage
