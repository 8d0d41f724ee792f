#include "chunkvault/core/result.hpp"

namespace chunkvault::core {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::VALIDATION_ERROR: return "validation error";
        case ErrorCode::TRANSPORT_ERROR: return "transport error";
        case ErrorCode::INTEGRITY_ERROR: return "integrity error";
        case ErrorCode::RESUMABILITY_ERROR: return "resumability error";
        case ErrorCode::EXHAUSTED_RETRIES: return "exhausted retries";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::INVALID_STATE: return "invalid state";
        case ErrorCode::STORAGE_ERROR: return "storage error";
        case ErrorCode::NOT_FOUND: return "not found";
    }
    return "unknown error";
}

} // namespace chunkvault::core
