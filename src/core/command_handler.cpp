#include "chunkvault/core/command_handler.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/storage/local_storage_backend.hpp"
#include "chunkvault/storage/sqlite_chunk_cache.hpp"
#include "chunkvault/transfer/engine_config.hpp"
#include "chunkvault/transfer/resource_monitor.hpp"
#include "chunkvault/transfer/transfer_manager.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace chunkvault::core {

using utils::StringUtils;

namespace {

struct Engine {
    transfer::EngineConfig config;
    std::unique_ptr<transfer::TransferManager> manager;
};

CommandResult open_engine(Engine& engine) {
    engine.config = transfer::EngineConfig::from_config(Config::instance());
    auto& storage_config = engine.config.storage;

    if (!storage_config.validate()) {
        return CommandResult::error("Invalid storage configuration");
    }
    if (!storage_config.create_directories()) {
        return CommandResult::error("Cannot create storage directories under " +
                                    storage_config.objects_directory.parent_path().string());
    }

    auto cache = std::make_shared<storage::SqliteChunkCache>(storage_config.database_path,
                                                             storage_config.store_chunk_payloads);
    if (!cache->initialize()) {
        return CommandResult::error("Failed to open cache database " + storage_config.database_path.string());
    }

    auto backend = std::make_shared<storage::LocalStorageBackend>(storage_config.objects_directory);
    auto monitor = std::make_shared<transfer::SystemResourceMonitor>(engine.config.scheduler.resource_poll_interval);

    engine.manager = std::make_unique<transfer::TransferManager>(engine.config, backend, cache, monitor);
    return CommandResult::ok();
}

void print_state(const storage::FileProgressState& state, bool with_chunks) {
    const auto& progress = state.upload_progress;
    double percent = progress.total_bytes > 0
        ? static_cast<double>(progress.bytes_uploaded) / progress.total_bytes * 100.0 : 0.0;

    std::cout << "  " << state.file_id << "\n";
    std::cout << "      File: " << state.file_name << " (" << StringUtils::format_bytes(state.file_size) << ")\n";
    std::cout << "      Chunks: " << progress.completed_chunks << "/" << progress.total_chunks << " completed";
    if (progress.failed_chunks > 0) {
        std::cout << ", " << progress.failed_chunks << " failed";
    }
    std::cout << " (" << std::fixed << std::setprecision(1) << percent << "%)\n";

    if (progress.last_update_ms > 0) {
        std::cout << "      Last update: " << utils::TimeUtils::format_timestamp_ms(progress.last_update_ms) << "\n";
    }

    if (!with_chunks) {
        return;
    }

    for (const auto& chunk : state.sorted_chunks()) {
        std::cout << "      [" << std::setw(4) << chunk.chunk_index << "] "
                  << std::left << std::setw(10) << storage::chunk_status_to_string(chunk.status) << std::right
                  << StringUtils::format_bytes(chunk.size);
        if (chunk.attempts > 0) {
            std::cout << ", " << chunk.attempts << " attempts";
        }
        if (!chunk.error_message.empty()) {
            std::cout << ", " << chunk.error_message;
        }
        std::cout << "\n";
    }
}

}

// PlanCommandHandler Implementation
CommandResult PlanCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        Engine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        transfer::ChunkPlan plan;
        auto result = engine.manager->plan_file(args[1], std::nullopt, plan);
        if (!result) {
            return CommandResult::error(result.message);
        }

        std::cout << "Chunk plan for " << plan.file_name << "\n";
        std::cout << "  File ID: " << plan.file_id << "\n";
        std::cout << "  Size: " << StringUtils::format_bytes(plan.file_size) << "\n";
        std::cout << "  Chunk size: " << StringUtils::format_bytes(plan.chunk_size) << "\n";
        std::cout << "  Chunks: " << plan.total_chunks << "\n";
        std::cout << "  Last chunk: " << StringUtils::format_bytes(plan.descriptors.back().actual_size()) << "\n";
        std::cout << "  Memory pressure: " << transfer::memory_pressure_to_string(plan.pressure) << "\n";
        std::cout << "  Recommended concurrency: " << plan.recommended_concurrency << "\n";

        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// UploadCommandHandler Implementation
UploadCommandHandler::UploadCommandHandler(CommandOptions options)
    : options_(options) {
}

CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    if (!std::filesystem::exists(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    try {
        Engine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        std::mutex output_mutex;
        auto subscription = engine.manager->tracker()->subscribe([&output_mutex](const transfer::ProgressEvent& event) {
            if (event.type != transfer::ProgressEventType::CHUNK_COMPLETED &&
                event.type != transfer::ProgressEventType::CHUNK_RETRYING &&
                event.type != transfer::ProgressEventType::MEMORY_WARNING) {
                return;
            }

            std::lock_guard<std::mutex> lock(output_mutex);
            const auto& file = *event.file;
            if (event.type == transfer::ProgressEventType::CHUNK_COMPLETED) {
                std::cout << "  [" << file.completed_chunks << "/" << file.total_chunks << "] "
                          << std::fixed << std::setprecision(1) << file.overall_percentage << "%  "
                          << StringUtils::format_bytes(static_cast<size_t>(file.speed_bps)) << "/s\n";
            } else if (event.type == transfer::ProgressEventType::CHUNK_RETRYING) {
                std::cout << "  retrying " << event.chunk->chunk_id << ": " << event.message << "\n";
            } else {
                std::cout << "  warning: " << event.message << "\n";
            }
        });

        transfer::UploadOptions upload_options;
        upload_options.priority = options_.priority;
        upload_options.reassemble = options_.reassemble;

        std::cout << "Uploading " << file_path.filename().string() << "\n";
        auto outcome = engine.manager->upload_file(file_path, upload_options);

        engine.manager->tracker()->unsubscribe(subscription);
        engine.manager->stop();

        if (!outcome.success()) {
            if (!outcome.failed_chunks.empty() || outcome.result.error == core::ErrorCode::CANCELLED) {
                std::cout << "Run the same command again to resume the remaining chunks.\n";
            }
            return CommandResult::error(outcome.result.message);
        }

        std::cout << "✓ Upload complete\n";
        std::cout << "  File ID: " << outcome.file_id << "\n";
        std::cout << "  Chunks: " << outcome.completed_chunks << "/" << outcome.total_chunks;
        if (outcome.resumed_chunks > 0) {
            std::cout << " (" << outcome.resumed_chunks << " resumed)";
        }
        std::cout << "\n";
        if (outcome.progress && outcome.progress->performance.total_retries > 0) {
            std::cout << "  Retries: " << outcome.progress->performance.total_retries << "\n";
        }

        if (!outcome.final_path.empty()) {
            std::cout << "  Stored as: " << engine.config.storage.bucket << "/" << outcome.final_path << "\n";
        } else {
            std::cout << "  Reassemble later with: chunkvault reassemble " << outcome.file_id << "\n";
        }

        return CommandResult::ok("Upload complete");
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// ReassembleCommandHandler Implementation
CommandResult ReassembleCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        Engine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        auto result = engine.manager->reassemble(args[1]);
        if (!result.success()) {
            return CommandResult::error(result.result.message);
        }

        std::cout << "✓ Reassembled " << args[1] << "\n";
        std::cout << "  Stored as: " << engine.config.storage.bucket << "/" << result.file_path << "\n";
        std::cout << "  Size: " << StringUtils::format_bytes(result.bytes_written) << "\n";
        std::cout << "  Chunks verified: " << result.chunks_verified << "\n";

        return CommandResult::ok("Reassembly complete");
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// StatusCommandHandler Implementation
CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    try {
        Engine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        if (args.size() >= 2) {
            auto state = engine.manager->get_persisted_state(args[1]);
            if (!state) {
                return CommandResult::error("No transfer state for " + args[1]);
            }
            std::cout << "Transfer status:\n";
            print_state(*state, true);
            return CommandResult::ok();
        }

        auto states = engine.manager->list_persisted_states();
        std::cout << "Transfers in progress: " << states.size() << "\n";
        for (const auto& state : states) {
            print_state(state, false);
        }

        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// CancelCommandHandler Implementation
CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        Engine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        if (!engine.manager->cancel_upload(args[1])) {
            return CommandResult::error("No transfer state for " + args[1]);
        }

        LOG_INFO("Transfer state of {} dropped", args[1]);
        std::cout << "✓ Cancelled " << args[1] << "\n";
        return CommandResult::ok("Cancelled");
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

} // namespace chunkvault::core
