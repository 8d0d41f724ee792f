#include "chunkvault/transfer/progress_tracker.hpp"
#include "chunkvault/core/logger.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace chunkvault::transfer {

const char* file_status_to_string(FileStatus status) {
    switch (status) {
        case FileStatus::ANALYZING: return "analyzing";
        case FileStatus::UPLOADING: return "uploading";
        case FileStatus::COMPLETED: return "completed";
        case FileStatus::FAILED: return "failed";
        case FileStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* progress_event_type_to_string(ProgressEventType type) {
    switch (type) {
        case ProgressEventType::CHUNK_STARTED: return "chunk_started";
        case ProgressEventType::CHUNK_PROGRESS: return "chunk_progress";
        case ProgressEventType::CHUNK_COMPLETED: return "chunk_completed";
        case ProgressEventType::CHUNK_FAILED: return "chunk_failed";
        case ProgressEventType::CHUNK_RETRYING: return "chunk_retrying";
        case ProgressEventType::FILE_STARTED: return "file_started";
        case ProgressEventType::FILE_PROGRESS: return "file_progress";
        case ProgressEventType::FILE_COMPLETED: return "file_completed";
        case ProgressEventType::FILE_FAILED: return "file_failed";
        case ProgressEventType::FILE_CANCELLED: return "file_cancelled";
        case ProgressEventType::MEMORY_WARNING: return "memory_warning";
        case ProgressEventType::PERFORMANCE_WARNING: return "performance_warning";
    }
    return "unknown";
}

ProgressTracker::ProgressTracker(ClockFunction clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

ProgressTracker::Clock::time_point ProgressTracker::now() const {
    return clock_();
}

void ProgressTracker::initialize_file(const storage::FileProgressState& state) {
    std::vector<ProgressEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        FileData file;
        file.file_id = state.file_id;
        file.file_name = state.file_name;
        file.total_bytes = state.file_size;
        file.start_time = now();
        file.memory_pressure = memory_pressure_;

        for (const auto& [chunk_id, chunk_state] : state.chunk_states) {
            ChunkData data;
            data.progress.chunk_id = chunk_id;
            data.progress.file_id = state.file_id;
            data.progress.chunk_index = chunk_state.chunk_index;
            data.progress.total_bytes = chunk_state.size;

            if (chunk_state.status == ChunkStatus::COMPLETED) {
                data.progress.status = ChunkStatus::COMPLETED;
                data.progress.bytes_uploaded = chunk_state.size;
                data.progress.percentage = 100.0;
                data.restored = true;
            }

            file.order[chunk_state.chunk_index] = chunk_id;
            file.chunks.emplace(chunk_id, std::move(data));
        }

        auto& stored = files_[state.file_id] = std::move(file);
        events.push_back(make_event(ProgressEventType::FILE_STARTED, stored));
        append_file_events(stored, events);
        record(events);

        LOG_DEBUG("Tracking {} with {} chunks", state.file_id, stored.chunks.size());
    }
    notify(events);
}

bool ProgressTracker::update_chunk_status(const std::string& file_id, const std::string& chunk_id,
                                          ChunkStatus status, const std::string& error) {
    std::vector<ProgressEvent> events;
    bool applied = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto file_it = files_.find(file_id);
        if (file_it == files_.end() || file_it->second.cancelled) {
            LOG_DEBUG("Ignoring status update for untracked file {}", file_id);
            return false;
        }

        auto chunk_it = file_it->second.chunks.find(chunk_id);
        if (chunk_it == file_it->second.chunks.end()) {
            LOG_WARN("Status update for unknown chunk {} of {}", chunk_id, file_id);
            return false;
        }

        applied = apply_status(file_it->second, chunk_it->second, status, error, events);
        record(events);
    }
    notify(events);
    return applied;
}

bool ProgressTracker::mark_retrying(const std::string& file_id, const std::string& chunk_id,
                                    const std::string& error) {
    return update_chunk_status(file_id, chunk_id, ChunkStatus::RETRYING, error);
}

bool ProgressTracker::update_chunk_bytes(const std::string& file_id, const std::string& chunk_id,
                                         uint64_t bytes_uploaded) {
    std::vector<ProgressEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto file_it = files_.find(file_id);
        if (file_it == files_.end() || file_it->second.cancelled) {
            return false;
        }
        auto& file = file_it->second;

        auto chunk_it = file.chunks.find(chunk_id);
        if (chunk_it == file.chunks.end()) {
            return false;
        }
        auto& progress = chunk_it->second.progress;

        if (progress.status != ChunkStatus::UPLOADING) {
            LOG_DEBUG("Byte update for {} while {}", chunk_id, storage::chunk_status_to_string(progress.status));
            return false;
        }

        bytes_uploaded = std::min(bytes_uploaded, progress.total_bytes);
        if (bytes_uploaded < progress.bytes_uploaded) {
            LOG_WARN("Rejected byte count decrease for {}: {} -> {}", chunk_id, progress.bytes_uploaded,
                     bytes_uploaded);
            return false;
        }
        if (bytes_uploaded == progress.bytes_uploaded) {
            return true;
        }

        auto current = now();
        file.transfer_history.emplace_back(current, bytes_uploaded - progress.bytes_uploaded);
        cleanup_old_history(file);

        progress.bytes_uploaded = bytes_uploaded;
        progress.percentage = progress.total_bytes > 0
            ? static_cast<double>(bytes_uploaded) / progress.total_bytes * 100.0 : 100.0;

        auto elapsed = std::max<Clock::duration>(current - progress.start_time, MIN_SPEED_INTERVAL);
        progress.speed_bps = bytes_uploaded / std::chrono::duration<double>(elapsed).count();

        ProgressEvent event = make_event(ProgressEventType::CHUNK_PROGRESS, file);
        event.chunk = progress;
        events.push_back(std::move(event));
        append_file_events(file, events);
        record(events);
    }
    notify(events);
    return true;
}

bool ProgressTracker::is_valid_transition(ChunkStatus from, ChunkStatus to) {
    if (from == ChunkStatus::COMPLETED || to == ChunkStatus::PENDING) {
        return false;
    }

    switch (to) {
        case ChunkStatus::UPLOADING:
            return from == ChunkStatus::PENDING || from == ChunkStatus::RETRYING;
        case ChunkStatus::RETRYING:
            return from == ChunkStatus::UPLOADING || from == ChunkStatus::FAILED;
        case ChunkStatus::COMPLETED:
        case ChunkStatus::FAILED:
            return from == ChunkStatus::PENDING || from == ChunkStatus::UPLOADING || from == ChunkStatus::RETRYING;
        case ChunkStatus::PENDING:
            break;
    }
    return false;
}

bool ProgressTracker::apply_status(FileData& file, ChunkData& chunk, ChunkStatus status, const std::string& error,
                                   std::vector<ProgressEvent>& events) {
    auto& progress = chunk.progress;
    if (progress.status == status) {
        return true;
    }

    if (!is_valid_transition(progress.status, status)) {
        LOG_WARN("Rejected chunk transition {} -> {} for {}", storage::chunk_status_to_string(progress.status),
                 storage::chunk_status_to_string(status), progress.chunk_id);
        return false;
    }

    auto current = now();
    ProgressEventType type = ProgressEventType::CHUNK_STARTED;

    switch (status) {
        case ChunkStatus::UPLOADING:
            progress.bytes_uploaded = 0;
            progress.percentage = 0.0;
            progress.speed_bps = 0.0;
            progress.start_time = current;
            progress.error.clear();
            if (chunk.first_start == Clock::time_point{}) {
                chunk.first_start = current;
            }
            type = ProgressEventType::CHUNK_STARTED;
            break;

        case ChunkStatus::COMPLETED: {
            if (progress.total_bytes > progress.bytes_uploaded) {
                file.transfer_history.emplace_back(current, progress.total_bytes - progress.bytes_uploaded);
            }
            progress.bytes_uploaded = progress.total_bytes;
            progress.percentage = 100.0;
            progress.end_time = current;
            progress.error.clear();
            if (progress.start_time != Clock::time_point{}) {
                auto elapsed = std::max<Clock::duration>(current - progress.start_time, MIN_SPEED_INTERVAL);
                progress.speed_bps = progress.total_bytes / std::chrono::duration<double>(elapsed).count();
            }
            type = ProgressEventType::CHUNK_COMPLETED;
            break;
        }

        case ChunkStatus::FAILED:
            progress.error = error;
            progress.end_time = current;
            type = ProgressEventType::CHUNK_FAILED;
            break;

        case ChunkStatus::RETRYING:
            progress.error = error;
            progress.end_time = current;
            progress.retry_count++;
            type = ProgressEventType::CHUNK_RETRYING;
            break;

        case ChunkStatus::PENDING:
            return false;
    }

    progress.status = status;
    cleanup_old_history(file);

    ProgressEvent event = make_event(type, file);
    event.chunk = progress;
    event.message = progress.error;
    events.push_back(std::move(event));

    if ((status == ChunkStatus::FAILED || status == ChunkStatus::RETRYING) && !file.performance_warned) {
        auto stats = snapshot(file).performance;
        if (stats.success_rate < 90.0) {
            file.performance_warned = true;
            ProgressEvent warning = make_event(ProgressEventType::PERFORMANCE_WARNING, file);
            warning.message = fmt::format("Chunk success rate dropped to {:.1f}%", stats.success_rate);
            LOG_WARN("{}: {}", file.file_id, warning.message);
            events.push_back(std::move(warning));
        }
    }

    append_file_events(file, events);
    return true;
}

FileStatus ProgressTracker::derive_status(const FileData& file) {
    if (file.cancelled) {
        return FileStatus::CANCELLED;
    }

    size_t completed = 0;
    size_t failed = 0;
    bool started = false;
    for (const auto& [chunk_id, chunk] : file.chunks) {
        switch (chunk.progress.status) {
            case ChunkStatus::COMPLETED: completed++; break;
            case ChunkStatus::FAILED: failed++; break;
            default: break;
        }
        if (chunk.progress.status != ChunkStatus::PENDING) {
            started = true;
        }
    }

    auto total = file.chunks.size();
    if (total > 0 && completed == total) {
        return FileStatus::COMPLETED;
    }
    if (failed > 0 && completed + failed == total) {
        return FileStatus::FAILED;
    }
    return started ? FileStatus::UPLOADING : FileStatus::ANALYZING;
}

FileProgress ProgressTracker::snapshot(const FileData& file) const {
    FileProgress progress;
    progress.file_id = file.file_id;
    progress.file_name = file.file_name;
    progress.status = derive_status(file);
    progress.total_chunks = static_cast<uint32_t>(file.chunks.size());
    progress.total_bytes = file.total_bytes;
    progress.start_time = file.start_time;
    progress.end_time = file.end_time;
    progress.memory_pressure = file.memory_pressure;

    uint32_t timed_chunks = 0;
    double total_chunk_time_ms = 0.0;
    uint32_t transferred = 0;

    for (const auto& [chunk_id, chunk] : file.chunks) {
        const auto& chunk_progress = chunk.progress;
        progress.performance.total_retries += chunk_progress.retry_count;

        switch (chunk_progress.status) {
            case ChunkStatus::COMPLETED:
                progress.completed_chunks++;
                progress.bytes_uploaded += chunk_progress.total_bytes;
                if (!chunk.restored) {
                    transferred++;
                    if (chunk_progress.start_time != Clock::time_point{}) {
                        total_chunk_time_ms += std::chrono::duration<double, std::milli>(
                            chunk_progress.end_time - chunk_progress.start_time).count();
                        timed_chunks++;
                    }
                }
                break;
            case ChunkStatus::FAILED:
                progress.failed_chunks++;
                break;
            case ChunkStatus::RETRYING:
                progress.retrying_chunks++;
                break;
            case ChunkStatus::UPLOADING:
                progress.uploading_chunks++;
                progress.bytes_uploaded += chunk_progress.bytes_uploaded;
                break;
            case ChunkStatus::PENDING:
                progress.pending_chunks++;
                break;
        }
    }

    if (timed_chunks > 0) {
        progress.performance.average_chunk_time_ms = total_chunk_time_ms / timed_chunks;
    }

    // Every retry stands for one failed attempt
    auto attempts = transferred + progress.failed_chunks + progress.performance.total_retries;
    if (attempts > 0) {
        progress.performance.success_rate = static_cast<double>(transferred) / attempts * 100.0;
    }

    if (progress.total_bytes > 0) {
        progress.overall_percentage = static_cast<double>(progress.bytes_uploaded) / progress.total_bytes * 100.0;
    }

    progress.speed_bps = calculate_speed(file);
    if (progress.speed_bps > 0 && progress.bytes_uploaded < progress.total_bytes) {
        auto remaining = static_cast<double>(progress.total_bytes - progress.bytes_uploaded);
        progress.estimated_time_remaining = std::chrono::milliseconds(
            static_cast<int64_t>(remaining / progress.speed_bps * 1000.0));
    }

    return progress;
}

double ProgressTracker::calculate_speed(const FileData& file) const {
    auto reference = file.end_time != Clock::time_point{} ? file.end_time : now();
    auto window_start = reference - SPEED_WINDOW;

    uint64_t window_bytes = 0;
    for (const auto& [timestamp, bytes] : file.transfer_history) {
        if (timestamp >= window_start && timestamp <= reference) {
            window_bytes += bytes;
        }
    }
    if (window_bytes == 0) {
        return 0.0;
    }

    auto span = reference - std::max(window_start, file.start_time);
    if (span < MIN_SPEED_INTERVAL) {
        span = MIN_SPEED_INTERVAL;
    }
    return window_bytes / std::chrono::duration<double>(span).count();
}

void ProgressTracker::cleanup_old_history(FileData& file) const {
    auto cutoff = now() - SPEED_WINDOW;

    while (!file.transfer_history.empty() && file.transfer_history.front().first < cutoff) {
        file.transfer_history.pop_front();
    }
}

void ProgressTracker::append_file_events(FileData& file, std::vector<ProgressEvent>& events) {
    auto status = derive_status(file);
    bool changed = status != file.last_status;

    if (changed) {
        bool terminal = status == FileStatus::COMPLETED || status == FileStatus::FAILED;
        file.end_time = terminal ? now() : Clock::time_point{};
        file.last_status = status;
    }

    events.push_back(make_event(ProgressEventType::FILE_PROGRESS, file));

    if (changed && status == FileStatus::COMPLETED) {
        events.push_back(make_event(ProgressEventType::FILE_COMPLETED, file));
        LOG_INFO("All {} chunks of {} completed", file.chunks.size(), file.file_id);
    } else if (changed && status == FileStatus::FAILED) {
        ProgressEvent event = make_event(ProgressEventType::FILE_FAILED, file);
        event.message = fmt::format("{} chunks failed", event.file->failed_chunks);
        events.push_back(std::move(event));
        LOG_WARN("Upload of {} failed: {} chunks failed", file.file_id, events.back().file->failed_chunks);
    }
}

ProgressEvent ProgressTracker::make_event(ProgressEventType type, const FileData& file) const {
    ProgressEvent event;
    event.type = type;
    event.file_id = file.file_id;
    event.file = snapshot(file);
    event.timestamp = now();
    return event;
}

void ProgressTracker::record(std::vector<ProgressEvent>& events) {
    for (const auto& event : events) {
        history_.push_back(event);
    }
    while (history_.size() > MAX_EVENT_HISTORY) {
        history_.pop_front();
    }
}

void ProgressTracker::notify(const std::vector<ProgressEvent>& events) {
    if (events.empty()) {
        return;
    }

    std::vector<std::pair<SubscriptionId, ProgressObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    for (const auto& event : events) {
        for (const auto& [id, observer] : observers) {
            try {
                observer(event);
            } catch (const std::exception& e) {
                LOG_WARN("Progress observer {} failed on {}: {}", id, progress_event_type_to_string(event.type),
                         e.what());
            }
        }
    }
}

std::optional<FileProgress> ProgressTracker::get_file_progress(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return snapshot(it->second);
}

std::optional<ChunkProgress> ProgressTracker::get_chunk_progress(const std::string& file_id,
                                                                 const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto file_it = files_.find(file_id);
    if (file_it == files_.end()) {
        return std::nullopt;
    }
    auto chunk_it = file_it->second.chunks.find(chunk_id);
    if (chunk_it == file_it->second.chunks.end()) {
        return std::nullopt;
    }
    return chunk_it->second.progress;
}

void ProgressTracker::report_memory_pressure(MemoryPressure pressure) {
    std::vector<ProgressEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        bool changed = pressure != memory_pressure_;
        memory_pressure_ = pressure;

        for (auto& [file_id, file] : files_) {
            file.memory_pressure = pressure;
            if (changed && pressure >= MemoryPressure::HIGH && !file.cancelled) {
                ProgressEvent event = make_event(ProgressEventType::MEMORY_WARNING, file);
                event.message = fmt::format("Memory pressure is {}", memory_pressure_to_string(pressure));
                events.push_back(std::move(event));
            }
        }

        if (changed && pressure >= MemoryPressure::HIGH) {
            LOG_WARN("Memory pressure raised to {}", memory_pressure_to_string(pressure));
        }
        record(events);
    }
    notify(events);
}

bool ProgressTracker::cancel_file(const std::string& file_id) {
    std::vector<ProgressEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = files_.find(file_id);
        if (it == files_.end() || it->second.cancelled) {
            return false;
        }

        auto& file = it->second;
        file.cancelled = true;
        file.last_status = FileStatus::CANCELLED;
        file.end_time = now();
        events.push_back(make_event(ProgressEventType::FILE_CANCELLED, file));
        record(events);

        LOG_INFO("Cancelled progress tracking for {}", file_id);
    }
    notify(events);
    return true;
}

void ProgressTracker::cleanup_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.erase(file_id);
}

SubscriptionId ProgressTracker::subscribe(ProgressObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto id = next_subscription_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}

bool ProgressTracker::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    auto it = std::find_if(observers_.begin(), observers_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == observers_.end()) {
        return false;
    }
    observers_.erase(it);
    return true;
}

size_t ProgressTracker::observer_count() const {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return observers_.size();
}

std::vector<ProgressEvent> ProgressTracker::get_event_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ProgressEvent>(history_.begin(), history_.end());
}

ProgressSummary ProgressTracker::get_progress_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ProgressSummary summary;
    for (const auto& [file_id, file] : files_) {
        auto progress = snapshot(file);
        summary.total_files++;
        summary.total_bytes += progress.total_bytes;
        summary.bytes_uploaded += progress.bytes_uploaded;

        switch (progress.status) {
            case FileStatus::COMPLETED:
                summary.completed_files++;
                break;
            case FileStatus::FAILED:
                summary.failed_files++;
                break;
            case FileStatus::ANALYZING:
            case FileStatus::UPLOADING:
                summary.active_files++;
                summary.overall_speed_bps += progress.speed_bps;
                break;
            case FileStatus::CANCELLED:
                break;
        }
    }
    return summary;
}

} // namespace chunkvault::transfer
