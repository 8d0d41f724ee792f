#include "chunkvault/transfer/transfer_types.hpp"
#include "chunkvault/core/utils.hpp"

namespace chunkvault::transfer {

const char* memory_pressure_to_string(MemoryPressure pressure) {
    switch (pressure) {
        case MemoryPressure::LOW: return "low";
        case MemoryPressure::MEDIUM: return "medium";
        case MemoryPressure::HIGH: return "high";
        case MemoryPressure::CRITICAL: return "critical";
    }
    return "low";
}

const char* job_priority_to_string(JobPriority priority) {
    switch (priority) {
        case JobPriority::LOW: return "low";
        case JobPriority::NORMAL: return "normal";
        case JobPriority::HIGH: return "high";
        case JobPriority::URGENT: return "urgent";
    }
    return "normal";
}

bool job_priority_from_string(const std::string& value, JobPriority& out) {
    auto lower = core::utils::StringUtils::to_lower(value);
    if (lower == "low") {
        out = JobPriority::LOW;
    } else if (lower == "normal") {
        out = JobPriority::NORMAL;
    } else if (lower == "high") {
        out = JobPriority::HIGH;
    } else if (lower == "urgent") {
        out = JobPriority::URGENT;
    } else {
        return false;
    }
    return true;
}

std::string ChunkDescriptor::make_chunk_id(const std::string& file_id, uint32_t chunk_index) {
    return file_id + "_chunk_" + std::to_string(chunk_index);
}

} // namespace chunkvault::transfer
