#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string format_bytes(size_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // Keeps [A-Za-z0-9._-], everything else becomes '_'
    static std::string sanitize_file_name(const std::string& name);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);

    // Modification time in milliseconds since the epoch
    static std::optional<int64_t> last_modified_ms(const std::filesystem::path& path);

    static std::optional<std::vector<uint8_t>> read_range(const std::filesystem::path& path,
                                                          uint64_t offset, uint64_t length);
};

class TimeUtils {
public:
    static int64_t now_ms();
    static std::string format_timestamp_ms(int64_t epoch_ms);
};

} // namespace chunkvault::core::utils
