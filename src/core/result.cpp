#include "splatlink/core/result.hpp"

namespace splatlink::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::FILE_READ_ERROR: return "file read error";
        case ErrorCode::FILE_WRITE_ERROR: return "file write error";
        case ErrorCode::NETWORK_ERROR: return "network error";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::HTTP_STATUS: return "http status";
        case ErrorCode::PROTOCOL_ERROR: return "protocol error";
        case ErrorCode::MISSING_CHUNK: return "missing chunk";
        case ErrorCode::SIZE_MISMATCH: return "size mismatch";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::INVALID_STATE: return "invalid state";
    }
    return "unknown";
}

}
