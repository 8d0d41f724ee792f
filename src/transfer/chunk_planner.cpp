#include "chunkvault/transfer/chunk_planner.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/storage/resume_manager.hpp"
#include <algorithm>

namespace chunkvault::transfer {

using core::ErrorCode;
using core::Result;

namespace {
constexpr double MB = 1024.0 * 1024.0;
constexpr uint64_t LARGE_FILE_THRESHOLD = 50ULL * 1024 * 1024;
}

ChunkPlanner::ChunkPlanner(ChunkingConfig config, std::shared_ptr<ResourceMonitor> monitor)
    : config_(config)
    , monitor_(std::move(monitor)) {
}

uint64_t ChunkPlanner::compute_chunk_size(uint64_t file_size, MemoryPressure pressure,
                                          std::optional<double> network_speed_bps) const {
    uint64_t chunk_size = config_.base_chunk_size;

    if (file_size > LARGE_FILE_THRESHOLD) {
        chunk_size = std::min(file_size / 8, config_.max_chunk_size);
    }

    if (config_.network_adaptive && network_speed_bps && *network_speed_bps > 0) {
        double speed_mbps = *network_speed_bps / MB;
        if (speed_mbps < 1.0) {
            chunk_size = std::max(chunk_size / 2, config_.min_chunk_size);
        } else if (speed_mbps > 10.0) {
            chunk_size = std::min(static_cast<uint64_t>(chunk_size * 1.5), config_.max_chunk_size);
        }
    }

    // One chunk is held roughly three times over: read buffer, hashing, upload
    if (monitor_) {
        auto available = monitor_->get_system_resources().available_memory_bytes;
        auto threshold = available / 100 * config_.memory_threshold_percent;
        if (chunk_size * 3 > threshold) {
            chunk_size = std::max(threshold / 3, config_.min_chunk_size);
        }
    }

    chunk_size = std::min(chunk_size, ResourceMonitor::chunk_size_for_pressure(pressure));
    if (monitor_) {
        chunk_size = monitor_->recommend_chunk_size(chunk_size);
    }

    chunk_size = std::clamp(chunk_size, config_.min_chunk_size, config_.max_chunk_size);
    return std::min(chunk_size, file_size);
}

Result ChunkPlanner::plan(const std::string& file_id, const std::string& file_name, uint64_t file_size,
                          MemoryPressure pressure, std::optional<double> network_speed_bps,
                          ChunkPlan& plan) const {
    if (file_size == 0) {
        return Result(ErrorCode::VALIDATION_ERROR, "Cannot chunk zero-byte file " + file_name);
    }
    if (file_id.empty()) {
        return Result(ErrorCode::VALIDATION_ERROR, "File id is required");
    }

    plan = ChunkPlan{};
    plan.file_id = file_id;
    plan.file_name = file_name;
    plan.file_size = file_size;
    plan.pressure = pressure;
    plan.chunk_size = compute_chunk_size(file_size, pressure, network_speed_bps);
    plan.descriptors = make_descriptors(file_id, file_name, file_size, plan.chunk_size);
    plan.total_chunks = static_cast<uint32_t>(plan.descriptors.size());
    plan.recommended_concurrency = recommended_concurrency(plan.total_chunks, pressure, network_speed_bps);
    if (network_speed_bps && *network_speed_bps > 0) {
        plan.estimated_upload_seconds = estimate_upload_seconds(file_size, *network_speed_bps);
    }

    LOG_INFO("Planned {}: {} in {} chunks of {} (pressure: {}, concurrency: {})", file_id,
             core::utils::StringUtils::format_bytes(file_size), plan.total_chunks,
             core::utils::StringUtils::format_bytes(plan.chunk_size),
             memory_pressure_to_string(pressure), plan.recommended_concurrency);
    return Result();
}

Result ChunkPlanner::plan_file(const storage::FileIdentity& identity, storage::ResumeManager& resume_manager,
                               std::optional<double> network_speed_bps, ChunkPlan& plan) const {
    auto pressure = monitor_ ? monitor_->get_pressure_level() : MemoryPressure::LOW;

    auto result = this->plan(identity.file_id, identity.file_name, identity.file_size, pressure,
                             network_speed_bps, plan);
    if (!result) {
        return result;
    }

    resume_manager.begin_tracking(make_initial_state(identity, plan));
    return Result();
}

std::vector<ChunkDescriptor> ChunkPlanner::make_descriptors(const std::string& file_id, const std::string& file_name,
                                                            uint64_t file_size, uint64_t chunk_size) {
    std::vector<ChunkDescriptor> descriptors;
    if (file_size == 0 || chunk_size == 0) {
        return descriptors;
    }

    auto total_chunks = static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
    descriptors.reserve(total_chunks);

    for (uint32_t i = 0; i < total_chunks; ++i) {
        ChunkDescriptor descriptor;
        descriptor.chunk_id = ChunkDescriptor::make_chunk_id(file_id, i);
        descriptor.file_id = file_id;
        descriptor.file_name = file_name;
        descriptor.chunk_index = i;
        descriptor.total_chunks = total_chunks;
        descriptor.start_byte = static_cast<uint64_t>(i) * chunk_size;
        descriptor.end_byte = std::min(descriptor.start_byte + chunk_size, file_size);
        descriptor.chunk_size = chunk_size;
        descriptor.is_last_chunk = (i + 1 == total_chunks);
        descriptors.push_back(std::move(descriptor));
    }

    return descriptors;
}

uint32_t ChunkPlanner::recommended_concurrency(uint32_t total_chunks, MemoryPressure pressure,
                                               std::optional<double> network_speed_bps) {
    uint32_t concurrency = std::min(std::max(2u, total_chunks / 4), 6u);

    if (network_speed_bps && *network_speed_bps > 0) {
        double speed_mbps = *network_speed_bps / MB;
        if (speed_mbps < 1.0) {
            concurrency = std::min(concurrency, 2u);
        } else if (speed_mbps > 10.0) {
            concurrency = std::min(concurrency + 2, 8u);
        }
    }

    if (pressure == MemoryPressure::HIGH) {
        concurrency = std::min(concurrency, 3u);
    } else if (pressure == MemoryPressure::CRITICAL) {
        concurrency = 1;
    }

    return concurrency;
}

double ChunkPlanner::estimate_upload_seconds(uint64_t file_size, double network_speed_bps, uint32_t parallelism) {
    if (network_speed_bps <= 0 || parallelism == 0) {
        return 0.0;
    }

    // 80% efficiency per stream, 20% protocol overhead
    double effective_speed = network_speed_bps * parallelism * 0.8;
    return static_cast<double>(file_size) / effective_speed * 1.2;
}

storage::FileProgressState ChunkPlanner::make_initial_state(const storage::FileIdentity& identity,
                                                           const ChunkPlan& plan) {
    storage::FileProgressState state;
    state.file_id = identity.file_id;
    state.file_name = identity.file_name;
    state.file_path = identity.file_path;
    state.file_size = identity.file_size;
    state.last_modified_ms = identity.last_modified_ms;
    state.chunk_size = plan.chunk_size;

    for (const auto& descriptor : plan.descriptors) {
        storage::ChunkState chunk;
        chunk.chunk_id = descriptor.chunk_id;
        chunk.chunk_index = descriptor.chunk_index;
        chunk.status = storage::ChunkStatus::PENDING;
        chunk.size = descriptor.actual_size();
        chunk.start_byte = descriptor.start_byte;
        chunk.end_byte = descriptor.end_byte;
        state.chunk_states[descriptor.chunk_id] = std::move(chunk);
    }

    state.upload_progress.start_time_ms = core::utils::TimeUtils::now_ms();
    state.recompute_counters();
    return state;
}

} // namespace chunkvault::transfer
