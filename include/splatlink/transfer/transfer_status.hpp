#pragma once

#include "splatlink/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

namespace splatlink::transfer {

namespace status {

struct Idle {};

struct SelectingFile {};

struct Uploading {
    double progress = 0.0;
};

struct Processing {
    std::string stage;
};

// progress = completed chunks / chunk count
struct Downloading {
    double progress = 0.0;
};

struct Completed {
    std::filesystem::path artifact_path;
    double total_time = 0.0; // seconds
    std::uint64_t artifact_size = 0;
    std::string artifact_digest; // BLAKE2b-256 hex
};

struct Error {
    std::string message;
    core::ErrorCode code = core::ErrorCode::INVALID_STATE;
};

} // namespace status

using TransferStatus = std::variant<status::Idle,
                                    status::SelectingFile,
                                    status::Uploading,
                                    status::Processing,
                                    status::Downloading,
                                    status::Completed,
                                    status::Error>;

// Idle, Completed and Error; the only states a new run may start from
bool is_terminal(const TransferStatus& status);

const char* status_name(const TransferStatus& status);

// Human readable line for a status display
std::string describe(const TransferStatus& status);

} // namespace splatlink::transfer
