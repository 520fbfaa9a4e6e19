#pragma once

#include "splatlink/core/config.hpp"
#include "splatlink/core/result.hpp"
#include "splatlink/transfer/chunk_downloader.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace splatlink::transfer {

struct PipelineConfig {
    std::string server_url = "http://127.0.0.1:8000";
    std::chrono::milliseconds upload_timeout{120000};
    DownloaderOptions download;

    // Fixed location the finished artifact is written to
    std::filesystem::path artifact_path = "assets/generated.ply";

    std::filesystem::path cache_directory = "cache/ply";
    std::chrono::seconds cache_max_age{86400};

    PipelineConfig() = default;

    static PipelineConfig from_config(const core::Config& config);

    core::Result validate() const;
};

} // namespace splatlink::transfer
