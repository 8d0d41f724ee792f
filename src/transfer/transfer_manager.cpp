#include "chunkvault/transfer/transfer_manager.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace chunkvault::transfer {

using core::ErrorCode;
using core::Result;

TransferManager::TransferManager(EngineConfig config,
                                 std::shared_ptr<storage::StorageBackend> backend,
                                 std::shared_ptr<storage::ChunkCache> cache,
                                 std::shared_ptr<ResourceMonitor> monitor)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , monitor_(std::move(monitor))
    , resume_manager_(std::make_shared<storage::ResumeManager>(std::move(cache)))
    , tracker_(std::make_shared<ProgressTracker>())
    , uploader_(std::make_shared<ChunkUploader>(backend_, resume_manager_, tracker_, config_.storage))
    , scheduler_(std::make_shared<TransferScheduler>(config_.scheduler, uploader_, monitor_, tracker_,
                                                     resume_manager_))
    , planner_(config_.chunking, monitor_)
    , reassembly_(backend_, resume_manager_, config_.storage) {

    scheduler_->set_completion_handler([this](const ChunkJob& job, const ChunkUploadResult& result) {
        on_job_complete(job, result);
    });
}

TransferManager::~TransferManager() {
    stop();
}

bool TransferManager::start() {
    if (scheduler_->is_running()) {
        return true;
    }
    return scheduler_->start();
}

void TransferManager::stop() {
    scheduler_->stop();

    std::lock_guard<std::mutex> lock(uploads_mutex_);
    for (auto& [file_id, upload] : active_uploads_) {
        std::lock_guard<std::mutex> upload_lock(upload->mutex);
        upload->cancelled = true;
        upload->cv.notify_all();
    }
}

uint32_t TransferManager::get_inflight_window() const {
    return std::max(config_.scheduler.max_workers * 2, 1u);
}

uint32_t TransferManager::get_active_upload_count() const {
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    return static_cast<uint32_t>(active_uploads_.size());
}

Result TransferManager::plan_file(const std::filesystem::path& path, std::optional<double> network_speed_bps,
                                  ChunkPlan& plan) const {
    auto identity = storage::FileIdentity::from_path(path);
    if (!identity) {
        return Result(ErrorCode::VALIDATION_ERROR, "Cannot read file " + path.string());
    }

    auto pressure = monitor_ ? monitor_->get_pressure_level() : MemoryPressure::LOW;
    return planner_.plan(identity->file_id, identity->file_name, identity->file_size, pressure,
                         network_speed_bps, plan);
}

UploadOutcome TransferManager::upload_file(const std::filesystem::path& path, const UploadOptions& options) {
    UploadOutcome outcome;

    auto identity = storage::FileIdentity::from_path(path);
    if (!identity) {
        outcome.result = Result(ErrorCode::VALIDATION_ERROR, "Cannot read file " + path.string());
        return outcome;
    }
    outcome.file_id = identity->file_id;

    if (!start()) {
        outcome.result = Result(ErrorCode::INVALID_STATE, "Transfer scheduler is not running");
        return outcome;
    }

    auto upload = std::make_shared<ActiveUpload>();
    upload->file_id = identity->file_id;
    {
        std::lock_guard<std::mutex> lock(uploads_mutex_);
        if (active_uploads_.count(identity->file_id) > 0) {
            outcome.result = Result(ErrorCode::INVALID_STATE, "Upload of " + identity->file_id + " already in progress");
            return outcome;
        }
        active_uploads_[identity->file_id] = upload;
    }

    std::vector<ChunkDescriptor> pending;
    outcome.result = prepare(*identity, options, pending, outcome);
    if (!outcome.result) {
        finish_upload(identity->file_id, outcome);
        return outcome;
    }

    LOG_INFO("Uploading {} ({}): {} chunks, {} already uploaded", identity->file_name, identity->file_id,
             outcome.total_chunks, outcome.resumed_chunks);

    release_on_cleanup(monitor_, upload, scheduler_, resume_manager_);
    submit_all(*identity, pending, options, *upload);

    bool cancelled = false;
    bool released = false;
    std::optional<Result> first_error;
    {
        std::unique_lock<std::mutex> lock(upload->mutex);
        upload->cv.wait(lock, [&upload]() { return upload->outstanding == 0 || upload->cancelled; });

        outcome.completed_chunks = outcome.resumed_chunks + upload->completed;
        outcome.failed_chunks = upload->failed_chunks;
        cancelled = upload->cancelled;
        released = upload->released;
        first_error = upload->first_error;
    }

    if (released) {
        outcome.result = Result(ErrorCode::CANCELLED,
                                "Upload of " + identity->file_id + " released under memory pressure, resume to continue");
        finish_upload(identity->file_id, outcome);
        return outcome;
    }

    if (cancelled) {
        outcome.result = Result(ErrorCode::CANCELLED, "Upload of " + identity->file_id + " was cancelled");
        finish_upload(identity->file_id, outcome);
        return outcome;
    }

    if (!outcome.failed_chunks.empty()) {
        // Keeps the persisted state so a later run resumes from the completed chunks
        resume_manager_->release(identity->file_id);

        auto code = first_error ? first_error->error : ErrorCode::EXHAUSTED_RETRIES;
        outcome.result = Result(code, fmt::format("Upload incomplete: {} chunks failed", outcome.failed_chunks.size()));
        LOG_ERROR("{}: {}", identity->file_id, outcome.result.message);
        finish_upload(identity->file_id, outcome);
        return outcome;
    }

    if (!options.reassemble) {
        resume_manager_->release(identity->file_id);
        LOG_INFO("All chunks of {} uploaded, reassembly deferred", identity->file_id);
        finish_upload(identity->file_id, outcome);
        return outcome;
    }

    auto reassembled = reassemble(identity->file_id);
    outcome.result = reassembled.result;
    outcome.final_path = reassembled.file_path;

    if (!outcome.result) {
        resume_manager_->release(identity->file_id);
    }
    finish_upload(identity->file_id, outcome);
    return outcome;
}

void TransferManager::finish_upload(const std::string& file_id, UploadOutcome& outcome) {
    outcome.progress = tracker_->get_file_progress(file_id);
    tracker_->cleanup_file(file_id);

    std::lock_guard<std::mutex> lock(uploads_mutex_);
    active_uploads_.erase(file_id);
}

void TransferManager::release_on_cleanup(std::weak_ptr<ResourceMonitor> weak_monitor,
                                         std::weak_ptr<ActiveUpload> weak_upload,
                                         std::weak_ptr<TransferScheduler> weak_scheduler,
                                         std::weak_ptr<storage::ResumeManager> weak_resume) {
    auto monitor = weak_monitor.lock();
    if (!monitor) {
        return;
    }

    // Holds no reference to the manager: the callback may outlive it
    monitor->register_cleanup_callback([weak_monitor, weak_upload, weak_scheduler, weak_resume]() {
        auto upload = weak_upload.lock();
        auto monitor = weak_monitor.lock();
        if (!upload || !monitor) {
            return;
        }

        // Below critical the reduced concurrency is enough; stay armed for the next cleanup
        if (monitor->get_pressure_level() != MemoryPressure::CRITICAL) {
            release_on_cleanup(weak_monitor, weak_upload, weak_scheduler, weak_resume);
            return;
        }

        std::lock_guard<std::mutex> lock(upload->mutex);
        if (upload->cancelled) {
            return;
        }
        upload->cancelled = true;
        upload->released = true;

        LOG_WARN("Releasing upload of {} under critical memory pressure", upload->file_id);

        if (auto scheduler = weak_scheduler.lock()) {
            scheduler->cancel_file(upload->file_id);
        }
        // Drops tracking only; the persisted progress stays for a later resume
        if (auto resume = weak_resume.lock()) {
            resume->release(upload->file_id);
        }
        upload->cv.notify_all();
    });
}

Result TransferManager::prepare(const storage::FileIdentity& identity, const UploadOptions& options,
                                std::vector<ChunkDescriptor>& pending, UploadOutcome& outcome) {
    std::optional<storage::FileProgressState> state;
    if (options.resume) {
        state = resume_manager_->try_resume(identity);
    } else {
        auto cleared = resume_manager_->clear(identity.file_id);
        if (!cleared) {
            LOG_WARN("Starting {} fresh without clearing old state: {}", identity.file_id, cleared.message);
        }
    }

    std::vector<ChunkDescriptor> descriptors;
    if (state) {
        auto rebuilt = storage::ResumeManager::rebuild_descriptors(*state, descriptors);
        if (!rebuilt) {
            return rebuilt;
        }
        resume_manager_->begin_tracking(*state);
    } else {
        ChunkPlan plan;
        auto planned = planner_.plan_file(identity, *resume_manager_, options.network_speed_bps, plan);
        if (!planned) {
            return planned;
        }
        descriptors = std::move(plan.descriptors);

        state = resume_manager_->get_state(identity.file_id);
        if (!state) {
            return Result(ErrorCode::INVALID_STATE, "Planned state for " + identity.file_id + " is not tracked");
        }
    }

    tracker_->initialize_file(*state);

    outcome.total_chunks = static_cast<uint32_t>(descriptors.size());
    for (auto& descriptor : descriptors) {
        const auto* chunk = state->find_chunk(descriptor.chunk_id);
        if (chunk && chunk->status == ChunkStatus::COMPLETED) {
            outcome.resumed_chunks++;
        } else {
            pending.push_back(std::move(descriptor));
        }
    }
    return Result();
}

void TransferManager::submit_all(const storage::FileIdentity& identity, const std::vector<ChunkDescriptor>& pending,
                                 const UploadOptions& options, ActiveUpload& upload) {
    auto window = get_inflight_window();

    for (const auto& descriptor : pending) {
        {
            std::unique_lock<std::mutex> lock(upload.mutex);
            upload.cv.wait(lock, [&upload, window]() { return upload.outstanding < window || upload.cancelled; });
            if (upload.cancelled) {
                return;
            }
        }

        auto bytes = core::utils::FileUtils::read_range(identity.file_path, descriptor.start_byte,
                                                        descriptor.actual_size());
        if (!bytes) {
            fail_chunk(upload, descriptor, Result(ErrorCode::STORAGE_ERROR,
                                                  "Cannot read bytes of " + descriptor.chunk_id));
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(upload.mutex);
            upload.outstanding++;
        }

        auto job_id = scheduler_->submit(descriptor, std::move(*bytes), options.priority);
        if (job_id.empty()) {
            {
                std::lock_guard<std::mutex> lock(upload.mutex);
                upload.outstanding--;
            }
            fail_chunk(upload, descriptor, Result(ErrorCode::INVALID_STATE,
                                                  "Scheduler rejected " + descriptor.chunk_id));
        }
    }
}

void TransferManager::fail_chunk(ActiveUpload& upload, const ChunkDescriptor& descriptor, const Result& error) {
    LOG_ERROR("Chunk {} not uploaded: {}", descriptor.chunk_id, error.message);

    tracker_->update_chunk_status(descriptor.file_id, descriptor.chunk_id, ChunkStatus::FAILED, error.message);

    storage::TransitionDetails details;
    details.error_message = error.message;
    resume_manager_->record_transition(descriptor.file_id, descriptor.chunk_id, ChunkStatus::FAILED, details);

    std::lock_guard<std::mutex> lock(upload.mutex);
    upload.failed_chunks.push_back(descriptor.chunk_id);
    if (!upload.first_error) {
        upload.first_error = error;
    }
    upload.cv.notify_all();
}

void TransferManager::on_job_complete(const ChunkJob& job, const ChunkUploadResult& result) {
    auto upload = find_upload(job.descriptor.file_id);
    if (!upload) {
        LOG_DEBUG("Result for {} arrived with no active upload", job.descriptor.chunk_id);
        return;
    }

    std::lock_guard<std::mutex> lock(upload->mutex);
    if (result.success()) {
        upload->completed++;
    } else {
        upload->failed_chunks.push_back(job.descriptor.chunk_id);
        if (!upload->first_error) {
            upload->first_error = result.result;
        }
    }

    if (upload->outstanding > 0) {
        upload->outstanding--;
    }
    upload->cv.notify_all();
}

std::shared_ptr<TransferManager::ActiveUpload> TransferManager::find_upload(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    auto it = active_uploads_.find(file_id);
    return it != active_uploads_.end() ? it->second : nullptr;
}

bool TransferManager::cancel_upload(const std::string& file_id) {
    bool had_state = resume_manager_->get_state(file_id).has_value();

    scheduler_->cancel_file(file_id);
    bool tracked = tracker_->cancel_file(file_id);

    bool active = false;
    if (auto upload = find_upload(file_id)) {
        std::lock_guard<std::mutex> lock(upload->mutex);
        upload->cancelled = true;
        upload->cv.notify_all();
        active = true;
    } else {
        // An active upload drops its own entry once it returns
        tracker_->cleanup_file(file_id);
    }

    auto cleared = resume_manager_->clear(file_id);
    if (!cleared) {
        LOG_WARN("Cancelled {} but its cached state remains: {}", file_id, cleared.message);
    }

    if (active || tracked || had_state) {
        LOG_INFO("Cancelled upload of {}", file_id);
        return true;
    }
    return false;
}

ReassemblyResult TransferManager::reassemble(const std::string& file_id) {
    ReassemblyResult outcome;

    ChunkReassemblyInfo info;
    outcome.result = resume_manager_->build_reassembly_info(file_id, info);
    if (!outcome.result) {
        return outcome;
    }

    if (reassembly_.get_checkpoint(file_id) > 0) {
        return reassembly_.resume_reassembly(info);
    }
    return reassembly_.reassemble(info);
}

std::optional<storage::FileProgressState> TransferManager::get_persisted_state(const std::string& file_id) const {
    return resume_manager_->get_state(file_id);
}

std::vector<storage::FileProgressState> TransferManager::list_persisted_states() const {
    return resume_manager_->list_states();
}

} // namespace chunkvault::transfer
