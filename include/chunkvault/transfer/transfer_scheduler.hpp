#pragma once

#include "engine_config.hpp"
#include "resource_monitor.hpp"
#include "transfer_types.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chunkvault::storage {
class ResumeManager;
}

namespace chunkvault::transfer {

class ProgressTracker;

struct ChunkJob {
    std::string job_id;
    ChunkDescriptor descriptor;
    std::shared_ptr<const std::vector<uint8_t>> bytes;
    JobPriority priority = JobPriority::NORMAL;
    uint32_t retry_count = 0;
    uint64_t sequence = 0;
    std::chrono::steady_clock::time_point submitted_at;
    std::shared_ptr<std::atomic<bool>> abandoned;
};

// Runs one attempt of a chunk job. Failures come back in the result, never as exceptions.
class ChunkJobExecutor {
public:
    virtual ~ChunkJobExecutor() = default;

    virtual ChunkUploadResult execute(const ChunkDescriptor& descriptor,
                                      const std::vector<uint8_t>& bytes,
                                      const std::atomic<bool>& abandoned) = 0;
};

// Called once per job with its final outcome. Not called for abandoned jobs.
using JobCompletionHandler = std::function<void(const ChunkJob&, const ChunkUploadResult&)>;

struct SchedulerStats {
    uint32_t active_workers = 0;
    uint32_t queue_depth = 0;
    uint32_t backoff_jobs = 0;
    uint32_t concurrency_limit = 0;
    uint64_t completed_jobs = 0;
    uint64_t failed_jobs = 0;
    uint64_t retried_jobs = 0;
    uint64_t cancelled_jobs = 0;
    double average_job_time_ms = 0.0;
};

class TransferScheduler {
public:
    TransferScheduler(SchedulerConfig config,
                      std::shared_ptr<ChunkJobExecutor> executor,
                      std::shared_ptr<ResourceMonitor> monitor,
                      std::shared_ptr<ProgressTracker> tracker = nullptr,
                      std::shared_ptr<storage::ResumeManager> resume_manager = nullptr);
    ~TransferScheduler();

    bool start();
    void stop();
    bool is_running() const { return running_; }

    // Returns an empty id if the chunk already has a queued, active or backing-off job
    std::string submit(const ChunkDescriptor& descriptor, std::vector<uint8_t> bytes,
                       JobPriority priority = JobPriority::NORMAL);

    // Drops queued and backing-off jobs of the file and abandons in-flight ones
    uint32_t cancel_file(const std::string& file_id);

    SchedulerStats get_stats() const;
    bool wait_until_idle(std::chrono::milliseconds timeout);

    void set_completion_handler(JobCompletionHandler handler);

    uint32_t compute_optimal_concurrency();
    std::chrono::milliseconds retry_delay(uint32_t retry_count) const;

    static uint32_t balanced_concurrency(const SystemResources& resources, MemoryPressure pressure,
                                         double error_rate, uint32_t max_workers);

    const SchedulerConfig& config() const { return config_; }

private:
    // Queue key: priority tier (highest first), then submission order
    using QueueKey = std::pair<int, uint64_t>;

    struct BackoffEntry {
        std::string file_id;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    SchedulerConfig config_;
    std::shared_ptr<ChunkJobExecutor> executor_;
    std::shared_ptr<ResourceMonitor> monitor_;
    std::shared_ptr<ProgressTracker> tracker_;
    std::shared_ptr<storage::ResumeManager> resume_manager_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> generation_{0};
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    boost::asio::steady_timer tick_timer_;
    std::unique_ptr<boost::asio::thread_pool> workers_;
    std::thread io_thread_;

    std::map<QueueKey, ChunkJob> queue_;
    std::unordered_set<std::string> known_chunks_;
    std::unordered_map<std::string, BackoffEntry> backoff_timers_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> file_flags_;
    uint32_t active_jobs_ = 0;
    uint32_t backoff_jobs_ = 0;
    uint32_t concurrency_limit_;
    uint64_t next_sequence_ = 1;

    uint64_t completed_jobs_ = 0;
    uint64_t failed_jobs_ = 0;
    uint64_t retried_jobs_ = 0;
    uint64_t cancelled_jobs_ = 0;
    uint64_t attempts_ = 0;
    uint64_t failed_attempts_ = 0;
    std::deque<double> job_times_ms_;
    std::chrono::steady_clock::time_point last_resource_poll_;

    JobCompletionHandler completion_handler_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;

    void schedule_tick();
    void on_tick();

    void dispatch_locked();
    void run_job(ChunkJob job);
    void on_job_finished(ChunkJob job, ChunkUploadResult result, double elapsed_ms);
    void schedule_retry_locked(ChunkJob job);

    void record_failure_status(const ChunkJob& job, ChunkStatus status, const std::string& error);
    bool is_idle_locked() const;

    static constexpr size_t JOB_TIME_SAMPLES = 100;
};

} // namespace chunkvault::transfer
