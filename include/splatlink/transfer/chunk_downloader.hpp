#pragma once

#include "splatlink/core/result.hpp"
#include "splatlink/network/http_client.hpp"
#include "splatlink/transfer/chunk_slot_table.hpp"
#include "splatlink/transfer/chunk_transfer_info.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace splatlink::transfer {

struct DownloaderOptions {
    std::chrono::milliseconds metadata_timeout{10000};
    std::chrono::milliseconds chunk_timeout{30000};

    // Cap on concurrent chunk requests; 0 runs one request per chunk
    std::uint32_t max_parallel_chunks = 0;
};

// Fetches a job's artifact as parallel chunk requests and reassembles it.
// All chunk requests are awaited even after one fails; there is no retry.
class ChunkDownloader {
public:
    using ProgressCallback = std::function<void(std::uint32_t completed_chunks, std::uint32_t total_chunks)>;

    explicit ChunkDownloader(std::shared_ptr<network::HttpClient> client,
                             DownloaderOptions options = {});

    core::Result fetch(const std::string& server_url,
                       const std::string& job_id,
                       std::vector<std::uint8_t>& output,
                       ProgressCallback on_progress = nullptr);

    core::Result fetch_info(const std::string& server_url,
                            const std::string& job_id,
                            ChunkTransferInfo& info);

    const DownloaderOptions& options() const { return options_; }

    // Number of worker threads used for a download of chunk_count chunks
    std::uint32_t worker_count(std::uint32_t chunk_count) const;

private:
    core::Result fetch_chunk(const std::string& server_url,
                             const std::string& job_id,
                             std::uint32_t chunk_index,
                             std::vector<std::uint8_t>& data);

    std::shared_ptr<network::HttpClient> client_;
    DownloaderOptions options_;
};

} // namespace splatlink::transfer
