#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace splatlink::core {

// Error kinds shared by every pipeline stage
enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,
    NETWORK_ERROR,
    TIMEOUT,
    HTTP_STATUS,
    PROTOCOL_ERROR,
    MISSING_CHUNK,
    SIZE_MISMATCH,
    INVALID_ARGUMENT,
    INVALID_STATE
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;
    std::optional<std::uint32_t> chunk_index;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    static Result chunk_failure(ErrorCode err, std::uint32_t index, std::string msg) {
        Result result(err, std::move(msg));
        result.chunk_index = index;
        return result;
    }

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace splatlink::core
