#include "chunkvault/transfer/engine_config.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/logger.hpp"

namespace chunkvault::transfer {

bool ChunkingConfig::validate() const {
    if (min_chunk_size == 0 || min_chunk_size > max_chunk_size) {
        return false;
    }
    if (base_chunk_size < min_chunk_size || base_chunk_size > max_chunk_size) {
        return false;
    }
    return memory_threshold_percent > 0 && memory_threshold_percent <= 100;
}

bool SchedulerConfig::validate() const {
    if (max_workers == 0 || max_workers > 64) {
        return false;
    }
    if (retry_backoff_factor < 1.0 || retry_base_delay.count() < 0 || retry_max_delay < retry_base_delay) {
        return false;
    }
    return tick_interval.count() > 0 && resource_poll_interval.count() > 0;
}

EngineConfig EngineConfig::from_config(const core::Config& config) {
    EngineConfig engine;

    auto& chunking = engine.chunking;
    chunking.base_chunk_size = config.get_uint64("chunking.base_chunk_size", chunking.base_chunk_size);
    chunking.min_chunk_size = config.get_uint64("chunking.min_chunk_size", chunking.min_chunk_size);
    chunking.max_chunk_size = config.get_uint64("chunking.max_chunk_size", chunking.max_chunk_size);
    chunking.memory_threshold_percent = static_cast<uint32_t>(
        config.get_int("chunking.memory_threshold_percent", chunking.memory_threshold_percent));
    chunking.network_adaptive = config.get_bool("chunking.network_adaptive", chunking.network_adaptive);

    if (!chunking.validate()) {
        LOG_WARN("Invalid chunking settings in configuration, using defaults");
        chunking = ChunkingConfig{};
    }

    auto& scheduler = engine.scheduler;
    scheduler.max_workers = static_cast<uint32_t>(config.get_int("scheduler.max_workers", scheduler.max_workers));
    scheduler.max_retries = static_cast<uint32_t>(config.get_int("scheduler.max_retries", scheduler.max_retries));
    scheduler.retry_base_delay = std::chrono::milliseconds(
        config.get_int("scheduler.retry_base_delay_ms", static_cast<int>(scheduler.retry_base_delay.count())));
    scheduler.retry_backoff_factor = config.get_double("scheduler.retry_backoff_factor", scheduler.retry_backoff_factor);
    scheduler.retry_max_delay = std::chrono::milliseconds(
        config.get_int("scheduler.retry_max_delay_ms", static_cast<int>(scheduler.retry_max_delay.count())));
    scheduler.tick_interval = std::chrono::milliseconds(
        config.get_int("scheduler.tick_interval_ms", static_cast<int>(scheduler.tick_interval.count())));
    scheduler.resource_poll_interval = std::chrono::milliseconds(
        config.get_int("scheduler.resource_poll_interval_ms", static_cast<int>(scheduler.resource_poll_interval.count())));
    scheduler.adaptive = config.get_bool("scheduler.adaptive", scheduler.adaptive);

    if (!scheduler.validate()) {
        LOG_WARN("Invalid scheduler settings in configuration, using defaults");
        scheduler = SchedulerConfig{};
    }

    engine.storage = storage::StorageConfig::from_config(config);
    return engine;
}

} // namespace chunkvault::transfer
