#include "chunkvault/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace chunkvault::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# chunkvault configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

uint64_t Config::get_uint64(const std::string& key, uint64_t default_value) const {
    // istream accepts "-1" for unsigned types, so reject signs explicitly
    auto raw = get(key);
    if (!raw || raw->empty() || raw->front() == '-') return default_value;

    auto value = get_as<uint64_t>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["chunking.base_chunk_size"] = "5242880";
    values_["chunking.min_chunk_size"] = "1048576";
    values_["chunking.max_chunk_size"] = "10485760";
    values_["chunking.memory_threshold_percent"] = "25";
    values_["chunking.network_adaptive"] = "true";

    values_["scheduler.max_workers"] = "6";
    values_["scheduler.max_retries"] = "3";
    values_["scheduler.retry_base_delay_ms"] = "1000";
    values_["scheduler.retry_backoff_factor"] = "2";
    values_["scheduler.retry_max_delay_ms"] = "30000";
    values_["scheduler.tick_interval_ms"] = "1000";
    values_["scheduler.resource_poll_interval_ms"] = "2000";
    values_["scheduler.adaptive"] = "true";

    values_["storage.root"] = "./chunkvault_data";
    values_["storage.bucket"] = "qa-files";
    values_["storage.output_folder"] = "uploads";
    values_["storage.folder"] = "";

    values_["cache.store_payloads"] = "false";

    values_["log.level"] = "info";
    values_["log.file"] = "chunkvault.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == str.end()) {
        return "";
    }

    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

} // namespace chunkvault::core
