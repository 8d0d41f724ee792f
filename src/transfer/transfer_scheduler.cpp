#include "chunkvault/transfer/transfer_scheduler.hpp"
#include "chunkvault/transfer/progress_tracker.hpp"
#include "chunkvault/storage/resume_manager.hpp"
#include "chunkvault/core/logger.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace chunkvault::transfer {

using core::ErrorCode;
using core::Result;

TransferScheduler::TransferScheduler(SchedulerConfig config,
                                     std::shared_ptr<ChunkJobExecutor> executor,
                                     std::shared_ptr<ResourceMonitor> monitor,
                                     std::shared_ptr<ProgressTracker> tracker,
                                     std::shared_ptr<storage::ResumeManager> resume_manager)
    : config_(config)
    , executor_(std::move(executor))
    , monitor_(std::move(monitor))
    , tracker_(std::move(tracker))
    , resume_manager_(std::move(resume_manager))
    , running_(false)
    , io_context_()
    , tick_timer_(io_context_)
    , concurrency_limit_(config.max_workers) {
}

TransferScheduler::~TransferScheduler() {
    stop();
}

bool TransferScheduler::start() {
    if (running_) {
        LOG_WARN("Transfer scheduler already running");
        return false;
    }
    if (!executor_) {
        LOG_ERROR("Transfer scheduler has no job executor");
        return false;
    }

    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    workers_ = std::make_unique<boost::asio::thread_pool>(config_.max_workers);
    running_ = true;
    generation_++;

    compute_optimal_concurrency();
    schedule_tick();

    io_thread_ = std::thread([this]() {
        LOG_DEBUG("Scheduler timer loop started");

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Scheduler timer loop error: {}", e.what());
                if (!running_) break;

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }

        LOG_DEBUG("Scheduler timer loop stopped");
    });

    LOG_INFO("Transfer scheduler started with {} workers (concurrency {})", config_.max_workers,
             concurrency_limit_);
    return true;
}

void TransferScheduler::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping transfer scheduler");
    running_ = false;

    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    // Let in-flight attempts finish; their results find the scheduler stopped
    if (workers_) {
        workers_->join();
        workers_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Handlers still queued from this run must not touch the next one
        generation_++;

        for (auto& [file_id, flag] : file_flags_) {
            flag->store(true);
        }
        for (auto& [chunk_id, entry] : backoff_timers_) {
            entry.timer->cancel();
        }
        tick_timer_.cancel();

        file_flags_.clear();
        queue_.clear();
        backoff_timers_.clear();
        known_chunks_.clear();
        backoff_jobs_ = 0;
    }

    // Runs the aborted handlers now so they release their jobs
    io_context_.restart();
    io_context_.poll();

    idle_cv_.notify_all();
}

std::string TransferScheduler::submit(const ChunkDescriptor& descriptor, std::vector<uint8_t> bytes,
                                      JobPriority priority) {
    std::string job_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!running_) {
            LOG_WARN("Rejecting {}: scheduler not running", descriptor.chunk_id);
            return "";
        }
        if (known_chunks_.count(descriptor.chunk_id) > 0) {
            LOG_WARN("Rejecting duplicate submission for {}", descriptor.chunk_id);
            return "";
        }

        auto& flag = file_flags_[descriptor.file_id];
        if (!flag) {
            flag = std::make_shared<std::atomic<bool>>(false);
        }

        ChunkJob job;
        job.sequence = next_sequence_++;
        job.job_id = fmt::format("job_{}", job.sequence);
        job.descriptor = descriptor;
        job.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
        job.priority = priority;
        job.submitted_at = std::chrono::steady_clock::now();
        job.abandoned = flag;
        job_id = job.job_id;

        known_chunks_.insert(descriptor.chunk_id);
        queue_.emplace(QueueKey{-static_cast<int>(priority), job.sequence}, std::move(job));

        LOG_TRACE("Queued {} for {} ({})", job_id, descriptor.chunk_id, job_priority_to_string(priority));
        dispatch_locked();
    }
    return job_id;
}

uint32_t TransferScheduler::cancel_file(const std::string& file_id) {
    uint32_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto flag_it = file_flags_.find(file_id);
        if (flag_it != file_flags_.end()) {
            flag_it->second->store(true);
            file_flags_.erase(flag_it);
        }

        for (auto it = queue_.begin(); it != queue_.end();) {
            if (it->second.descriptor.file_id == file_id) {
                known_chunks_.erase(it->second.descriptor.chunk_id);
                it = queue_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }

        for (const auto& [chunk_id, entry] : backoff_timers_) {
            if (entry.file_id == file_id) {
                auto timer = entry.timer;
                boost::asio::post(io_context_, [timer]() { timer->cancel(); });
                removed++;
            }
        }

        cancelled_jobs_ += removed;
    }
    idle_cv_.notify_all();

    LOG_INFO("Cancelled {} pending jobs for {}", removed, file_id);
    return removed;
}

SchedulerStats TransferScheduler::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SchedulerStats stats;
    stats.active_workers = active_jobs_;
    stats.queue_depth = static_cast<uint32_t>(queue_.size());
    stats.backoff_jobs = backoff_jobs_;
    stats.concurrency_limit = concurrency_limit_;
    stats.completed_jobs = completed_jobs_;
    stats.failed_jobs = failed_jobs_;
    stats.retried_jobs = retried_jobs_;
    stats.cancelled_jobs = cancelled_jobs_;

    if (!job_times_ms_.empty()) {
        double total = 0.0;
        for (auto time_ms : job_times_ms_) {
            total += time_ms;
        }
        stats.average_job_time_ms = total / job_times_ms_.size();
    }
    return stats;
}

bool TransferScheduler::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return is_idle_locked(); });
}

bool TransferScheduler::is_idle_locked() const {
    return queue_.empty() && active_jobs_ == 0 && backoff_jobs_ == 0;
}

void TransferScheduler::set_completion_handler(JobCompletionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    completion_handler_ = std::move(handler);
}

uint32_t TransferScheduler::balanced_concurrency(const SystemResources& resources, MemoryPressure pressure,
                                                 double error_rate, uint32_t max_workers) {
    double base = std::floor(resources.cpu_cores * 0.75);
    if (error_rate > 0.1) {
        base *= 0.8;
    }
    auto estimate = static_cast<uint32_t>(base);

    auto memory_limit = static_cast<uint32_t>(resources.available_memory_bytes / (1024 * 1024) / 175);
    estimate = std::min(estimate, memory_limit);

    double load_factor = 1.0;
    if (resources.cpu_load_percent > 75.0) {
        load_factor = 0.7;
    } else if (resources.cpu_load_percent < 40.0) {
        load_factor = 1.2;
    }
    estimate = std::min(estimate, static_cast<uint32_t>(resources.cpu_cores * load_factor));
    estimate = std::max(estimate, 1u);

    if (pressure == MemoryPressure::HIGH) {
        estimate = std::min(estimate, 3u);
    } else if (pressure == MemoryPressure::CRITICAL) {
        estimate = 1;
    }

    return std::min(estimate, std::max(max_workers, 1u));
}

uint32_t TransferScheduler::compute_optimal_concurrency() {
    uint32_t limit = config_.max_workers;

    if (monitor_) {
        auto pressure = monitor_->get_pressure_level();

        if (config_.adaptive) {
            double error_rate = 0.0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (attempts_ > 0) {
                    error_rate = static_cast<double>(failed_attempts_) / attempts_;
                }
            }
            limit = balanced_concurrency(monitor_->get_system_resources(), pressure, error_rate,
                                         config_.max_workers);
        } else if (pressure == MemoryPressure::HIGH) {
            limit = std::min(limit, 3u);
        } else if (pressure == MemoryPressure::CRITICAL) {
            limit = 1;
        }

        if (tracker_) {
            tracker_->report_memory_pressure(pressure);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (limit != concurrency_limit_) {
        LOG_DEBUG("Concurrency limit {} -> {}", concurrency_limit_, limit);
    }
    concurrency_limit_ = limit;
    last_resource_poll_ = std::chrono::steady_clock::now();
    return limit;
}

std::chrono::milliseconds TransferScheduler::retry_delay(uint32_t retry_count) const {
    double delay = config_.retry_base_delay.count() * std::pow(config_.retry_backoff_factor, retry_count);
    delay = std::min(delay, static_cast<double>(config_.retry_max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

void TransferScheduler::schedule_tick() {
    tick_timer_.expires_after(config_.tick_interval);
    tick_timer_.async_wait([this, generation = generation_.load()](const boost::system::error_code& ec) {
        if (ec || !running_ || generation != generation_) {
            return;
        }
        on_tick();
        schedule_tick();
    });
}

void TransferScheduler::on_tick() {
    std::chrono::steady_clock::time_point last_poll;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_poll = last_resource_poll_;
    }

    if (std::chrono::steady_clock::now() - last_poll >= config_.resource_poll_interval) {
        compute_optimal_concurrency();
    }

    if (monitor_ && monitor_->should_cleanup()) {
        auto cleanup = monitor_->perform_cleanup();
        LOG_INFO("Resource cleanup ran {} callbacks (pressure {} -> {})", cleanup.callbacks_run,
                 memory_pressure_to_string(cleanup.pressure_before),
                 memory_pressure_to_string(cleanup.pressure_after));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    dispatch_locked();
}

void TransferScheduler::dispatch_locked() {
    if (!running_ || !workers_) {
        return;
    }

    while (active_jobs_ < concurrency_limit_ && !queue_.empty()) {
        auto node = queue_.extract(queue_.begin());
        ChunkJob job = std::move(node.mapped());

        if (job.abandoned->load()) {
            known_chunks_.erase(job.descriptor.chunk_id);
            cancelled_jobs_++;
            continue;
        }

        active_jobs_++;
        boost::asio::post(*workers_, [this, job = std::move(job)]() mutable {
            run_job(std::move(job));
        });
    }
}

void TransferScheduler::run_job(ChunkJob job) {
    auto started = std::chrono::steady_clock::now();
    ChunkUploadResult result;
    result.chunk_id = job.descriptor.chunk_id;

    if (job.abandoned->load()) {
        result.result = Result(ErrorCode::CANCELLED, "File transfer cancelled");
    } else {
        try {
            result = executor_->execute(job.descriptor, *job.bytes, *job.abandoned);
        } catch (const std::exception& e) {
            LOG_ERROR("Job {} for {} threw: {}", job.job_id, job.descriptor.chunk_id, e.what());
            result.chunk_id = job.descriptor.chunk_id;
            result.result = Result(ErrorCode::TRANSPORT_ERROR, e.what());
        }
    }

    auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    on_job_finished(std::move(job), std::move(result), elapsed_ms);
}

void TransferScheduler::on_job_finished(ChunkJob job, ChunkUploadResult result, double elapsed_ms) {
    bool abandoned = job.abandoned->load();
    bool retry = false;
    JobCompletionHandler handler;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        job_times_ms_.push_back(elapsed_ms);
        while (job_times_ms_.size() > JOB_TIME_SAMPLES) {
            job_times_ms_.pop_front();
        }

        if (!abandoned) {
            attempts_++;
            if (!result.success()) {
                failed_attempts_++;
            }
            retry = !result.success() && result.result.retryable() && job.retry_count < config_.max_retries;
            if (retry) {
                // Counted before the status write so the scheduler never looks idle in between
                backoff_jobs_++;
                retried_jobs_++;
            } else if (result.success()) {
                completed_jobs_++;
            } else {
                failed_jobs_++;
            }
            handler = completion_handler_;
        }
    }

    if (abandoned) {
        LOG_DEBUG("Discarding result of abandoned job {} for {}", job.job_id, job.descriptor.chunk_id);
    } else if (retry) {
        LOG_WARN("Chunk {} attempt {} failed, retrying: {}", job.descriptor.chunk_id, job.retry_count + 1,
                 result.result.message);
        record_failure_status(job, ChunkStatus::RETRYING, result.result.message);
    } else if (!result.success()) {
        if (result.result.retryable()) {
            result.result = Result(ErrorCode::EXHAUSTED_RETRIES,
                                   fmt::format("Chunk {} failed after {} attempts: {}", job.descriptor.chunk_id,
                                               job.retry_count + 1, result.result.message));
        }
        LOG_ERROR("Chunk {} failed: {}", job.descriptor.chunk_id, result.result.message);
        record_failure_status(job, ChunkStatus::FAILED, result.result.message);
    }

    if (!abandoned && !retry && handler) {
        try {
            handler(job, result);
        } catch (const std::exception& e) {
            LOG_ERROR("Completion handler failed for {}: {}", job.descriptor.chunk_id, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_jobs_--;

        if (abandoned) {
            known_chunks_.erase(job.descriptor.chunk_id);
            cancelled_jobs_++;
        } else if (retry) {
            schedule_retry_locked(std::move(job));
        } else {
            known_chunks_.erase(job.descriptor.chunk_id);
        }

        dispatch_locked();
    }
    idle_cv_.notify_all();
}

void TransferScheduler::schedule_retry_locked(ChunkJob job) {
    auto chunk_id = job.descriptor.chunk_id;

    if (!running_ || job.abandoned->load()) {
        backoff_jobs_--;
        known_chunks_.erase(chunk_id);
        cancelled_jobs_++;
        return;
    }

    auto delay = retry_delay(job.retry_count);
    job.retry_count++;

    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay);
    backoff_timers_[chunk_id] = BackoffEntry{job.descriptor.file_id, timer};

    LOG_DEBUG("Retrying {} in {}ms (retry {}/{})", chunk_id, delay.count(), job.retry_count, config_.max_retries);

    timer->async_wait([this, timer, chunk_id, generation = generation_.load(),
                       job = std::move(job)](const boost::system::error_code& ec) mutable {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_) {
                return;
            }
            backoff_timers_.erase(chunk_id);
            backoff_jobs_--;

            if (ec || !running_ || job.abandoned->load()) {
                known_chunks_.erase(chunk_id);
            } else {
                // Keeps its original sequence so it does not lose its place in the tier
                auto key = QueueKey{-static_cast<int>(job.priority), job.sequence};
                queue_.emplace(key, std::move(job));
                dispatch_locked();
            }
        }
        idle_cv_.notify_all();
    });
}

void TransferScheduler::record_failure_status(const ChunkJob& job, ChunkStatus status, const std::string& error) {
    const auto& descriptor = job.descriptor;

    if (tracker_) {
        if (status == ChunkStatus::RETRYING) {
            tracker_->mark_retrying(descriptor.file_id, descriptor.chunk_id, error);
        } else {
            tracker_->update_chunk_status(descriptor.file_id, descriptor.chunk_id, status, error);
        }
    }

    if (resume_manager_) {
        storage::TransitionDetails details;
        details.error_message = error;
        resume_manager_->record_transition(descriptor.file_id, descriptor.chunk_id, status, details);
    }
}

} // namespace chunkvault::transfer
