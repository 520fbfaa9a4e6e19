#pragma once

#include "splatlink/core/result.hpp"
#include "splatlink/network/http_client.hpp"
#include "splatlink/transfer/file_picker.hpp"
#include "splatlink/transfer/pipeline_config.hpp"
#include "splatlink/transfer/transfer_status.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace splatlink::transfer {

// Drives one upload -> process -> download run at a time on a background
// thread and publishes its status. A run may only start from Idle, Completed
// or Error.
class TransferSession {
public:
    using StatusListener = std::function<void(const TransferStatus&)>;

    TransferSession(std::shared_ptr<network::HttpClient> client, PipelineConfig config);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Returns false, leaving the status untouched, while a run is in flight
    bool begin(const std::filesystem::path& image_path);

    // Same guard as begin(); the picker is consulted on the run's thread
    bool select_and_begin(std::shared_ptr<FilePicker> picker);

    TransferStatus status() const;
    bool is_running() const;

    // Called on the publishing thread after every transition. The listener
    // must not throw or call begin(), select_and_begin(), reset() or wait().
    void set_status_listener(StatusListener listener);

    void wait();

    // Moves a terminal status back to Idle
    bool reset();

    const PipelineConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    bool start(TransferStatus initial, std::function<void()> body);

    void run(const std::filesystem::path& image_path, Clock::time_point start_time);
    void run_with_picker(const std::shared_ptr<FilePicker>& picker);

    core::Result upload(const std::filesystem::path& image_path, std::string& job_id);
    core::Result persist(const std::vector<std::uint8_t>& artifact);

    void publish(TransferStatus next);
    void fail(const core::Result& result);

    std::shared_ptr<network::HttpClient> client_;
    PipelineConfig config_;

    mutable std::mutex status_mutex_;
    TransferStatus status_;
    StatusListener listener_;

    std::mutex worker_mutex_;
    std::thread worker_;
};

} // namespace splatlink::transfer
