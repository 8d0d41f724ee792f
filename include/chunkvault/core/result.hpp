#pragma once

#include <string>

namespace chunkvault::core {

enum class ErrorCode {
    SUCCESS = 0,
    VALIDATION_ERROR,      // bad byte range, zero-length file, unsupported input
    TRANSPORT_ERROR,       // backend upload/download failure, retryable
    INTEGRITY_ERROR,       // checksum or size mismatch
    RESUMABILITY_ERROR,    // stale or unreadable cached state
    EXHAUSTED_RETRIES,
    CANCELLED,
    INVALID_STATE,
    STORAGE_ERROR,
    NOT_FOUND
};

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    bool retryable() const { return error == ErrorCode::TRANSPORT_ERROR; }
};

const char* error_code_to_string(ErrorCode code);

} // namespace chunkvault::core
