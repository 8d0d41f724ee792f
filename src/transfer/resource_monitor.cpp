#include "chunkvault/transfer/resource_monitor.hpp"
#include "chunkvault/core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace chunkvault::transfer {

namespace {
constexpr uint64_t MB = 1024 * 1024;
}

double SystemResources::memory_usage_ratio() const {
    if (total_memory_bytes == 0) {
        return 0.0;
    }
    auto used = total_memory_bytes - std::min(available_memory_bytes, total_memory_bytes);
    return static_cast<double>(used) / static_cast<double>(total_memory_bytes);
}

MemoryPressure ResourceMonitor::get_pressure_level() {
    return classify(get_system_resources().memory_usage_ratio());
}

uint64_t ResourceMonitor::recommend_chunk_size(uint64_t baseline) {
    auto pressure = get_pressure_level();
    auto recommended = std::min(baseline, chunk_size_for_pressure(pressure));
    if (recommended != baseline) {
        LOG_DEBUG("Chunk size lowered from {} to {} (pressure: {})", baseline, recommended,
                  memory_pressure_to_string(pressure));
    }
    return recommended;
}

bool ResourceMonitor::should_cleanup() {
    auto pressure = get_pressure_level();
    return pressure == MemoryPressure::HIGH || pressure == MemoryPressure::CRITICAL;
}

CleanupResult ResourceMonitor::perform_cleanup() {
    CleanupResult result;
    result.pressure_before = get_pressure_level();

    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks.swap(cleanup_callbacks_);
    }

    for (auto& callback : callbacks) {
        try {
            callback();
            result.callbacks_run++;
        } catch (const std::exception& e) {
            LOG_WARN("Cleanup callback failed: {}", e.what());
        }
    }

    result.pressure_after = get_pressure_level();
    LOG_INFO("Memory cleanup ran {} callbacks, pressure {} -> {}", result.callbacks_run,
             memory_pressure_to_string(result.pressure_before),
             memory_pressure_to_string(result.pressure_after));
    return result;
}

void ResourceMonitor::register_cleanup_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    cleanup_callbacks_.push_back(std::move(callback));
}

size_t ResourceMonitor::pending_cleanup_callbacks() const {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    return cleanup_callbacks_.size();
}

MemoryPressure ResourceMonitor::classify(double usage_ratio) {
    if (usage_ratio > 0.9) return MemoryPressure::CRITICAL;
    if (usage_ratio > 0.7) return MemoryPressure::HIGH;
    if (usage_ratio > 0.5) return MemoryPressure::MEDIUM;
    return MemoryPressure::LOW;
}

uint64_t ResourceMonitor::chunk_size_for_pressure(MemoryPressure pressure) {
    switch (pressure) {
        case MemoryPressure::CRITICAL: return 1 * MB;
        case MemoryPressure::HIGH: return 2 * MB;
        case MemoryPressure::MEDIUM: return 5 * MB;
        case MemoryPressure::LOW: return 10 * MB;
    }
    return 5 * MB;
}

SystemResourceMonitor::SystemResourceMonitor(std::chrono::milliseconds check_interval)
    : check_interval_(check_interval)
    , last_check_() {
}

SystemResources SystemResourceMonitor::get_system_resources() {
    SystemResources resources;
    resources.cpu_cores = std::max(1u, std::thread::hardware_concurrency());

    uint64_t total = 0;
    uint64_t available = 0;
    if (read_meminfo(total, available)) {
        resources.total_memory_bytes = total;
        resources.available_memory_bytes = available;
    } else {
        // Unknown memory: assume plenty rather than throttle to a crawl
        resources.total_memory_bytes = 4096 * MB;
        resources.available_memory_bytes = 2048 * MB;
    }

    double load = 0.0;
    if (read_loadavg(load)) {
        resources.cpu_load_percent = std::min(100.0, load / resources.cpu_cores * 100.0);
    }

    return resources;
}

bool SystemResourceMonitor::should_cleanup() {
    {
        std::lock_guard<std::mutex> lock(check_mutex_);
        auto now = std::chrono::steady_clock::now();
        if (now - last_check_ < check_interval_) {
            return false;
        }
        last_check_ = now;
    }
    return ResourceMonitor::should_cleanup();
}

bool SystemResourceMonitor::read_meminfo(uint64_t& total_bytes, uint64_t& available_bytes) {
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo.is_open()) {
        return false;
    }

    bool have_total = false;
    bool have_available = false;
    std::string line;
    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value_kb = 0;
        if (!(iss >> key >> value_kb)) {
            continue;
        }

        if (key == "MemTotal:") {
            total_bytes = value_kb * 1024;
            have_total = true;
        } else if (key == "MemAvailable:") {
            available_bytes = value_kb * 1024;
            have_available = true;
        }
    }

    return have_total && have_available;
}

bool SystemResourceMonitor::read_loadavg(double& one_minute) {
    std::ifstream loadavg("/proc/loadavg");
    if (!loadavg.is_open()) {
        return false;
    }
    return static_cast<bool>(loadavg >> one_minute);
}

} // namespace chunkvault::transfer
