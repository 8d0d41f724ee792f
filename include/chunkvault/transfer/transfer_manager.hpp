#pragma once

#include "chunk_planner.hpp"
#include "chunk_uploader.hpp"
#include "engine_config.hpp"
#include "progress_tracker.hpp"
#include "reassembly_service.hpp"
#include "resource_monitor.hpp"
#include "transfer_scheduler.hpp"
#include "transfer_types.hpp"
#include "chunkvault/core/result.hpp"
#include "chunkvault/storage/chunk_cache.hpp"
#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/storage/storage_backend.hpp"
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkvault::transfer {

struct UploadOptions {
    JobPriority priority = JobPriority::NORMAL;
    bool reassemble = true;
    bool resume = true;
    std::optional<double> network_speed_bps;
};

struct UploadOutcome {
    core::Result result;
    std::string file_id;
    uint32_t total_chunks = 0;
    uint32_t completed_chunks = 0;
    uint32_t resumed_chunks = 0;
    std::vector<std::string> failed_chunks;
    std::string final_path;  // set once reassembled

    // Last tracker view of the file; the tracker drops it when the upload ends
    std::optional<FileProgress> progress;

    bool success() const { return result.success(); }
};

// Upload coordinator: resume or plan, windowed submission to the scheduler,
// outcome collection and the hand-off to reassembly.
class TransferManager {
public:
    TransferManager(EngineConfig config,
                    std::shared_ptr<storage::StorageBackend> backend,
                    std::shared_ptr<storage::ChunkCache> cache,
                    std::shared_ptr<ResourceMonitor> monitor);
    ~TransferManager();

    bool start();
    void stop();

    UploadOutcome upload_file(const std::filesystem::path& path, const UploadOptions& options = {});

    // Plans without tracking anything
    core::Result plan_file(const std::filesystem::path& path, std::optional<double> network_speed_bps,
                           ChunkPlan& plan) const;

    // Abandons an in-flight upload and drops its persisted state
    bool cancel_upload(const std::string& file_id);

    ReassemblyResult reassemble(const std::string& file_id);

    std::optional<storage::FileProgressState> get_persisted_state(const std::string& file_id) const;
    std::vector<storage::FileProgressState> list_persisted_states() const;

    uint32_t get_active_upload_count() const;

    // Window of chunk payloads held in the scheduler per file
    uint32_t get_inflight_window() const;

    std::shared_ptr<ProgressTracker> tracker() const { return tracker_; }
    std::shared_ptr<TransferScheduler> scheduler() const { return scheduler_; }
    std::shared_ptr<storage::ResumeManager> resume_manager() const { return resume_manager_; }
    const EngineConfig& config() const { return config_; }

private:
    struct ActiveUpload {
        std::string file_id;
        uint32_t outstanding = 0;
        uint32_t completed = 0;
        std::vector<std::string> failed_chunks;
        std::optional<core::Result> first_error;
        bool cancelled = false;
        bool released = false;  // given up to a memory cleanup, resumable
        std::mutex mutex;
        std::condition_variable cv;
    };

    EngineConfig config_;
    std::shared_ptr<storage::StorageBackend> backend_;
    std::shared_ptr<ResourceMonitor> monitor_;
    std::shared_ptr<storage::ResumeManager> resume_manager_;
    std::shared_ptr<ProgressTracker> tracker_;
    std::shared_ptr<ChunkUploader> uploader_;
    std::shared_ptr<TransferScheduler> scheduler_;
    ChunkPlanner planner_;
    ReassemblyService reassembly_;

    std::unordered_map<std::string, std::shared_ptr<ActiveUpload>> active_uploads_;
    mutable std::mutex uploads_mutex_;

    core::Result prepare(const storage::FileIdentity& identity, const UploadOptions& options,
                         std::vector<ChunkDescriptor>& pending, UploadOutcome& outcome);
    void submit_all(const storage::FileIdentity& identity, const std::vector<ChunkDescriptor>& pending,
                    const UploadOptions& options, ActiveUpload& upload);
    void fail_chunk(ActiveUpload& upload, const ChunkDescriptor& descriptor, const core::Result& error);
    void on_job_complete(const ChunkJob& job, const ChunkUploadResult& result);
    std::shared_ptr<ActiveUpload> find_upload(const std::string& file_id) const;
    void finish_upload(const std::string& file_id, UploadOutcome& outcome);

    // Arms a resource cleanup callback that gives up the upload at critical pressure
    static void release_on_cleanup(std::weak_ptr<ResourceMonitor> weak_monitor,
                                   std::weak_ptr<ActiveUpload> weak_upload,
                                   std::weak_ptr<TransferScheduler> weak_scheduler,
                                   std::weak_ptr<storage::ResumeManager> weak_resume);
};

} // namespace chunkvault::transfer
