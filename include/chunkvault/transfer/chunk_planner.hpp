#pragma once

#include "engine_config.hpp"
#include "resource_monitor.hpp"
#include "transfer_types.hpp"
#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/file_progress.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::storage {
struct FileIdentity;
class ResumeManager;
}

namespace chunkvault::transfer {

struct ChunkPlan {
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t chunk_size = 0;
    uint32_t total_chunks = 0;
    std::vector<ChunkDescriptor> descriptors;
    MemoryPressure pressure = MemoryPressure::LOW;
    uint32_t recommended_concurrency = 1;
    double estimated_upload_seconds = 0.0;  // 0 when the network speed is unknown
};

class ChunkPlanner {
public:
    ChunkPlanner(ChunkingConfig config, std::shared_ptr<ResourceMonitor> monitor);

    core::Result plan(const std::string& file_id, const std::string& file_name, uint64_t file_size,
                      MemoryPressure pressure, std::optional<double> network_speed_bps,
                      ChunkPlan& plan) const;

    // Plans with the monitor's current pressure, then records the all-pending
    // state through the resume manager before anything is uploaded.
    core::Result plan_file(const storage::FileIdentity& identity, storage::ResumeManager& resume_manager,
                           std::optional<double> network_speed_bps, ChunkPlan& plan) const;

    uint64_t compute_chunk_size(uint64_t file_size, MemoryPressure pressure,
                                std::optional<double> network_speed_bps) const;

    static std::vector<ChunkDescriptor> make_descriptors(const std::string& file_id, const std::string& file_name,
                                                         uint64_t file_size, uint64_t chunk_size);

    static uint32_t recommended_concurrency(uint32_t total_chunks, MemoryPressure pressure,
                                            std::optional<double> network_speed_bps);

    static double estimate_upload_seconds(uint64_t file_size, double network_speed_bps, uint32_t parallelism = 1);

    static storage::FileProgressState make_initial_state(const storage::FileIdentity& identity, const ChunkPlan& plan);

    const ChunkingConfig& config() const { return config_; }

private:
    ChunkingConfig config_;
    std::shared_ptr<ResourceMonitor> monitor_;
};

} // namespace chunkvault::transfer
