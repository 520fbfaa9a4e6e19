#include "splatlink/transfer/chunk_downloader.hpp"
#include "splatlink/core/logger.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/network/remote_api.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <new>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace splatlink::transfer {

using core::utils::StringUtils;

ChunkDownloader::ChunkDownloader(std::shared_ptr<network::HttpClient> client, DownloaderOptions options)
    : client_(std::move(client))
    , options_(options) {
}

core::Result ChunkDownloader::fetch(const std::string& server_url,
                                    const std::string& job_id,
                                    std::vector<std::uint8_t>& output,
                                    ProgressCallback on_progress) {
    output.clear();
    auto start_time = std::chrono::steady_clock::now();

    ChunkTransferInfo info;
    auto result = fetch_info(server_url, job_id, info);
    if (!result) {
        return result;
    }

    LOG_INFO("Job {}: '{}' is {} in {} chunks", job_id, info.filename,
             StringUtils::format_bytes(info.total_size), info.chunk_count);

    std::unique_ptr<ChunkSlotTable> slots;
    std::uint32_t wanted = worker_count(info.chunk_count);
    std::vector<std::thread> workers;
    try {
        slots = std::make_unique<ChunkSlotTable>(info.chunk_count);
        workers.reserve(wanted);
    } catch (const std::bad_alloc&) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            "Cannot allocate " + std::to_string(info.chunk_count) + " chunk slots");
    } catch (const std::length_error&) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            "Cannot allocate " + std::to_string(info.chunk_count) + " chunk slots");
    }

    std::atomic<std::uint32_t> next_index{0};
    std::mutex progress_mutex;
    std::uint32_t reported = 0;

    // Each worker drains chunk indices until none are left. A failed chunk
    // only leaves its slot empty; the other workers carry on.
    auto worker = [&]() {
        for (;;) {
            std::uint32_t index = next_index.fetch_add(1);
            if (index >= info.chunk_count) {
                return;
            }

            try {
                std::vector<std::uint8_t> data;
                auto chunk_result = fetch_chunk(server_url, job_id, index, data);
                if (!chunk_result) {
                    LOG_ERROR("Chunk {} failed: {}", index, chunk_result.message);
                    continue;
                }

                size_t chunk_bytes = data.size();
                std::uint32_t filled = slots->store(index, std::move(data));
                LOG_DEBUG("Chunk {} done ({} bytes)", index, chunk_bytes);

                if (on_progress) {
                    std::lock_guard<std::mutex> lock(progress_mutex);
                    if (filled > reported) {
                        reported = filled;
                        on_progress(filled, info.chunk_count);
                    }
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Chunk {} worker error: {}", index, e.what());
            }
        }
    };

    for (std::uint32_t i = 0; i < wanted; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            LOG_WARN("Started only {} of {} chunk workers: {}", workers.size(), wanted, e.what());
            break;
        }
    }

    if (workers.empty()) {
        worker();
    }

    // Barrier: the slot table is read only after every worker has finished
    for (auto& thread : workers) {
        thread.join();
    }

    if (auto missing = slots->first_missing()) {
        return core::Result::chunk_failure(core::ErrorCode::MISSING_CHUNK, *missing,
                                           "Chunk " + std::to_string(*missing) + " failed to download");
    }

    output = slots->assemble();

    if (output.size() != info.total_size) {
        auto actual = output.size();
        output.clear();
        return core::Result(core::ErrorCode::SIZE_MISMATCH,
                            "File size mismatch: expected " + std::to_string(info.total_size) +
                            " bytes, got " + std::to_string(actual) + " bytes");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    auto bytes_per_second = elapsed.count() > 0 ? (output.size() * 1000) / elapsed.count() : output.size();

    LOG_INFO("Downloaded {} in {} ({}/s, {} workers)", StringUtils::format_bytes(output.size()),
             StringUtils::format_duration(elapsed), StringUtils::format_bytes(bytes_per_second),
             std::max<size_t>(workers.size(), 1));

    return core::Result();
}

core::Result ChunkDownloader::fetch_info(const std::string& server_url,
                                         const std::string& job_id,
                                         ChunkTransferInfo& info) {
    network::HttpResponse response;
    auto result = client_->get(network::api::download_info_url(server_url, job_id),
                               options_.metadata_timeout, response);
    if (!result) {
        return core::Result(result.error, "Failed to get download info: " + result.message);
    }

    if (!response.ok()) {
        return core::Result(core::ErrorCode::HTTP_STATUS,
                            "Download info request failed: HTTP " + std::to_string(response.status) +
                            " " + response.reason);
    }

    return ChunkTransferInfo::from_json(response.body_text(), info);
}

std::uint32_t ChunkDownloader::worker_count(std::uint32_t chunk_count) const {
    if (options_.max_parallel_chunks == 0) {
        return chunk_count;
    }
    return std::min(options_.max_parallel_chunks, chunk_count);
}

core::Result ChunkDownloader::fetch_chunk(const std::string& server_url,
                                          const std::string& job_id,
                                          std::uint32_t chunk_index,
                                          std::vector<std::uint8_t>& data) {
    network::HttpResponse response;
    auto result = client_->get(network::api::download_chunk_url(server_url, job_id, chunk_index),
                               options_.chunk_timeout, response);
    if (!result) {
        return core::Result::chunk_failure(result.error, chunk_index, result.message);
    }

    if (!response.ok()) {
        return core::Result::chunk_failure(core::ErrorCode::HTTP_STATUS, chunk_index,
                                           "HTTP " + std::to_string(response.status) + " " + response.reason);
    }

    data = std::move(response.body);
    return core::Result();
}

}
