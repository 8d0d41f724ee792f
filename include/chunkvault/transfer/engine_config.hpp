#pragma once

#include "chunkvault/storage/storage_config.hpp"
#include <chrono>
#include <cstdint>

namespace chunkvault::core {
class Config;
}

namespace chunkvault::transfer {

struct ChunkingConfig {
    uint64_t base_chunk_size = 5ULL * 1024 * 1024;
    uint64_t min_chunk_size = 1ULL * 1024 * 1024;
    uint64_t max_chunk_size = 10ULL * 1024 * 1024;
    uint32_t memory_threshold_percent = 25;
    bool network_adaptive = true;

    bool validate() const;
};

struct SchedulerConfig {
    uint32_t max_workers = 6;
    uint32_t max_retries = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    double retry_backoff_factor = 2.0;
    std::chrono::milliseconds retry_max_delay{30000};
    std::chrono::milliseconds tick_interval{1000};
    std::chrono::milliseconds resource_poll_interval{2000};
    bool adaptive = true;

    bool validate() const;
};

struct EngineConfig {
    ChunkingConfig chunking;
    SchedulerConfig scheduler;
    storage::StorageConfig storage;

    static EngineConfig from_config(const core::Config& config);
};

} // namespace chunkvault::transfer
