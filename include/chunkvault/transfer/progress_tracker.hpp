#pragma once

#include "transfer_types.hpp"
#include "chunkvault/storage/file_progress.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkvault::transfer {

enum class FileStatus {
    ANALYZING,
    UPLOADING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class ProgressEventType {
    CHUNK_STARTED,
    CHUNK_PROGRESS,
    CHUNK_COMPLETED,
    CHUNK_FAILED,
    CHUNK_RETRYING,
    FILE_STARTED,
    FILE_PROGRESS,
    FILE_COMPLETED,
    FILE_FAILED,
    FILE_CANCELLED,
    MEMORY_WARNING,
    PERFORMANCE_WARNING
};

const char* file_status_to_string(FileStatus status);
const char* progress_event_type_to_string(ProgressEventType type);

struct ChunkProgress {
    std::string chunk_id;
    std::string file_id;
    uint32_t chunk_index = 0;
    ChunkStatus status = ChunkStatus::PENDING;
    double percentage = 0.0;
    uint64_t bytes_uploaded = 0;
    uint64_t total_bytes = 0;
    double speed_bps = 0.0;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    uint32_t retry_count = 0;
    std::string error;
};

struct PerformanceStats {
    double average_chunk_time_ms = 0.0;
    double success_rate = 100.0;
    uint32_t total_retries = 0;
};

struct FileProgress {
    std::string file_id;
    std::string file_name;
    FileStatus status = FileStatus::ANALYZING;
    double overall_percentage = 0.0;
    uint32_t total_chunks = 0;
    uint32_t completed_chunks = 0;
    uint32_t failed_chunks = 0;
    uint32_t retrying_chunks = 0;
    uint32_t uploading_chunks = 0;
    uint32_t pending_chunks = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t total_bytes = 0;
    double speed_bps = 0.0;
    std::chrono::milliseconds estimated_time_remaining{0};
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    PerformanceStats performance;
    MemoryPressure memory_pressure = MemoryPressure::LOW;
};

struct ProgressEvent {
    ProgressEventType type;
    std::string file_id;
    std::optional<FileProgress> file;
    std::optional<ChunkProgress> chunk;
    std::string message;
    std::chrono::steady_clock::time_point timestamp;
};

struct ProgressSummary {
    uint32_t total_files = 0;
    uint32_t active_files = 0;
    uint32_t completed_files = 0;
    uint32_t failed_files = 0;
    uint64_t total_bytes = 0;
    uint64_t bytes_uploaded = 0;
    double overall_speed_bps = 0.0;
};

using ProgressObserver = std::function<void(const ProgressEvent&)>;
using SubscriptionId = uint64_t;

// Per-file and per-chunk progress with derived speed/ETA. Observers are called
// outside the state lock; an observer that throws is logged and skipped.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    explicit ProgressTracker(ClockFunction clock = {});

    // Completed chunks in the state count as restored, not as transferred bytes
    void initialize_file(const storage::FileProgressState& state);

    bool update_chunk_status(const std::string& file_id, const std::string& chunk_id,
                             ChunkStatus status, const std::string& error = "");

    // failed -> retrying in one step
    bool mark_retrying(const std::string& file_id, const std::string& chunk_id, const std::string& error);

    // Non-decreasing within one upload attempt
    bool update_chunk_bytes(const std::string& file_id, const std::string& chunk_id, uint64_t bytes_uploaded);

    std::optional<FileProgress> get_file_progress(const std::string& file_id) const;
    std::optional<ChunkProgress> get_chunk_progress(const std::string& file_id, const std::string& chunk_id) const;

    void report_memory_pressure(MemoryPressure pressure);

    bool cancel_file(const std::string& file_id);
    void cleanup_file(const std::string& file_id);

    SubscriptionId subscribe(ProgressObserver observer);
    bool unsubscribe(SubscriptionId id);
    size_t observer_count() const;

    std::vector<ProgressEvent> get_event_history() const;
    ProgressSummary get_progress_summary() const;

    static constexpr size_t MAX_EVENT_HISTORY = 1000;
    static constexpr std::chrono::seconds SPEED_WINDOW{30};
    static constexpr std::chrono::milliseconds MIN_SPEED_INTERVAL{500};

private:
    struct ChunkData {
        ChunkProgress progress;
        bool restored = false;
        Clock::time_point first_start;
    };

    struct FileData {
        std::string file_id;
        std::string file_name;
        uint64_t total_bytes = 0;
        std::map<uint32_t, std::string> order;
        std::unordered_map<std::string, ChunkData> chunks;
        std::deque<std::pair<Clock::time_point, uint64_t>> transfer_history;
        Clock::time_point start_time;
        Clock::time_point end_time;
        FileStatus last_status = FileStatus::ANALYZING;
        MemoryPressure memory_pressure = MemoryPressure::LOW;
        bool cancelled = false;
        bool performance_warned = false;
    };

    ClockFunction clock_;
    std::unordered_map<std::string, FileData> files_;
    std::deque<ProgressEvent> history_;
    MemoryPressure memory_pressure_ = MemoryPressure::LOW;
    mutable std::mutex mutex_;

    std::vector<std::pair<SubscriptionId, ProgressObserver>> observers_;
    SubscriptionId next_subscription_id_ = 1;
    mutable std::mutex observers_mutex_;

    Clock::time_point now() const;

    static bool is_valid_transition(ChunkStatus from, ChunkStatus to);
    bool apply_status(FileData& file, ChunkData& chunk, ChunkStatus status, const std::string& error,
                      std::vector<ProgressEvent>& events);

    FileProgress snapshot(const FileData& file) const;
    static FileStatus derive_status(const FileData& file);
    double calculate_speed(const FileData& file) const;
    void cleanup_old_history(FileData& file) const;

    void append_file_events(FileData& file, std::vector<ProgressEvent>& events);
    ProgressEvent make_event(ProgressEventType type, const FileData& file) const;
    void record(std::vector<ProgressEvent>& events);
    void notify(const std::vector<ProgressEvent>& events);
};

} // namespace chunkvault::transfer
