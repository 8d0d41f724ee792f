#pragma once

#include "transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace chunkvault::transfer {

struct SystemResources {
    uint32_t cpu_cores = 1;
    uint64_t total_memory_bytes = 0;
    uint64_t available_memory_bytes = 0;
    double cpu_load_percent = 0.0;

    double memory_usage_ratio() const;
};

struct CleanupResult {
    uint32_t callbacks_run = 0;
    MemoryPressure pressure_before = MemoryPressure::LOW;
    MemoryPressure pressure_after = MemoryPressure::LOW;
};

class ResourceMonitor {
public:
    virtual ~ResourceMonitor() = default;

    virtual SystemResources get_system_resources() = 0;

    virtual MemoryPressure get_pressure_level();

    // Never grows the baseline
    virtual uint64_t recommend_chunk_size(uint64_t baseline);

    virtual bool should_cleanup();
    virtual CleanupResult perform_cleanup();

    // Callbacks run once on the next cleanup, then are dropped
    void register_cleanup_callback(std::function<void()> callback);
    size_t pending_cleanup_callbacks() const;

    // >0.9 critical, >0.7 high, >0.5 medium
    static MemoryPressure classify(double usage_ratio);
    static uint64_t chunk_size_for_pressure(MemoryPressure pressure);

protected:
    mutable std::mutex callbacks_mutex_;
    std::vector<std::function<void()>> cleanup_callbacks_;
};

// Linux monitor backed by /proc/meminfo and /proc/loadavg
class SystemResourceMonitor : public ResourceMonitor {
public:
    explicit SystemResourceMonitor(std::chrono::milliseconds check_interval = std::chrono::milliseconds(2000));

    SystemResources get_system_resources() override;
    bool should_cleanup() override;

private:
    std::chrono::milliseconds check_interval_;
    std::chrono::steady_clock::time_point last_check_;
    std::mutex check_mutex_;

    static bool read_meminfo(uint64_t& total_bytes, uint64_t& available_bytes);
    static bool read_loadavg(double& one_minute);
};

} // namespace chunkvault::transfer
