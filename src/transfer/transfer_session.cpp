#include "splatlink/transfer/transfer_session.hpp"
#include "splatlink/core/logger.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/crypto/hash.hpp"
#include "splatlink/network/multipart.hpp"
#include "splatlink/network/remote_api.hpp"
#include "splatlink/transfer/chunk_downloader.hpp"
#include <system_error>

namespace splatlink::transfer {

using core::utils::FileUtils;
using core::utils::StringUtils;

TransferSession::TransferSession(std::shared_ptr<network::HttpClient> client, PipelineConfig config)
    : client_(std::move(client))
    , config_(std::move(config))
    , status_(status::Idle{}) {
}

TransferSession::~TransferSession() {
    wait();
}

bool TransferSession::begin(const std::filesystem::path& image_path) {
    auto start_time = Clock::now();
    return start(status::Uploading{0.0}, [this, image_path, start_time]() {
        run(image_path, start_time);
    });
}

bool TransferSession::select_and_begin(std::shared_ptr<FilePicker> picker) {
    if (!picker) {
        LOG_ERROR("select_and_begin called without a file picker");
        return false;
    }

    return start(status::SelectingFile{}, [this, picker]() {
        run_with_picker(picker);
    });
}

TransferStatus TransferSession::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

bool TransferSession::is_running() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return !is_terminal(status_);
}

void TransferSession::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    listener_ = std::move(listener);
}

void TransferSession::wait() {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool TransferSession::reset() {
    std::lock_guard<std::mutex> worker_lock(worker_mutex_);

    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (!is_terminal(status_)) {
            return false;
        }
    }

    // The worker may still be delivering its terminal status to the listener
    if (worker_.joinable()) {
        worker_.join();
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = status::Idle{};
        listener = listener_;
    }

    if (listener) {
        listener(status::Idle{});
    }
    return true;
}

bool TransferSession::start(TransferStatus initial, std::function<void()> body) {
    std::lock_guard<std::mutex> worker_lock(worker_mutex_);

    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (!is_terminal(status_)) {
            LOG_WARN("Transfer already in progress ({}), request ignored", status_name(status_));
            return false;
        }
        status_ = initial;
        listener = listener_;
    }

    // The previous run has already published its terminal status
    if (worker_.joinable()) {
        worker_.join();
    }

    LOG_DEBUG("Transfer status: {}", describe(initial));
    if (listener) {
        listener(initial);
    }

    try {
        worker_ = std::thread(std::move(body));
    } catch (const std::system_error& e) {
        fail(core::Result(core::ErrorCode::INVALID_STATE,
                          std::string("Failed to start transfer thread: ") + e.what()));
        return false;
    }

    return true;
}

void TransferSession::run_with_picker(const std::shared_ptr<FilePicker>& picker) {
    std::optional<std::filesystem::path> picked;
    try {
        picked = picker->pick_file();
    } catch (const std::exception& e) {
        fail(core::Result(core::ErrorCode::INVALID_STATE, std::string("File selection failed: ") + e.what()));
        return;
    }

    if (!picked) {
        LOG_INFO("File selection cancelled");
        publish(status::Idle{});
        return;
    }

    LOG_INFO("Selected {}", picked->string());
    auto start_time = Clock::now();
    publish(status::Uploading{0.0});
    run(*picked, start_time);
}

void TransferSession::run(const std::filesystem::path& image_path, Clock::time_point start_time) {
    try {
        std::string job_id;
        auto result = upload(image_path, job_id);
        if (!result) {
            fail(result);
            return;
        }

        LOG_INFO("Server accepted {} as job {}", image_path.filename().string(), job_id);
        publish(status::Processing{"Generating 3D gaussians on server (job " + job_id + ")..."});

        publish(status::Downloading{0.0});

        ChunkDownloader downloader(client_, config_.download);
        std::vector<std::uint8_t> artifact;
        result = downloader.fetch(config_.server_url, job_id, artifact,
            [this](std::uint32_t completed, std::uint32_t total) {
                publish(status::Downloading{static_cast<double>(completed) / total});
            });
        if (!result) {
            fail(core::Result(result.error, "Download failed: " + result.message));
            return;
        }

        result = persist(artifact);
        if (!result) {
            fail(result);
            return;
        }

        status::Completed completed;
        completed.artifact_path = config_.artifact_path;
        completed.total_time = std::chrono::duration<double>(Clock::now() - start_time).count();
        completed.artifact_size = artifact.size();
        completed.artifact_digest = crypto::hash_utils::digest_hex(artifact);

        LOG_INFO("Saved {} to {} in {:.2f}s (blake2b {})", StringUtils::format_bytes(completed.artifact_size),
                 completed.artifact_path.string(), completed.total_time, completed.artifact_digest);
        publish(std::move(completed));
    } catch (const std::exception& e) {
        fail(core::Result(core::ErrorCode::INVALID_STATE, std::string("Unexpected error: ") + e.what()));
    }
}

core::Result TransferSession::upload(const std::filesystem::path& image_path, std::string& job_id) {
    if (!FileUtils::is_file(image_path)) {
        return core::Result(core::ErrorCode::FILE_NOT_FOUND, "Image not found: " + image_path.string());
    }

    auto image = FileUtils::read_binary_file(image_path);
    if (!image) {
        return core::Result(core::ErrorCode::FILE_READ_ERROR, "Failed to read image: " + image_path.string());
    }

    LOG_INFO("Uploading {} ({})", image_path.filename().string(), StringUtils::format_bytes(image->size()));
    publish(status::Uploading{0.5});

    network::MultipartForm form;
    form.add_file(network::api::IMAGE_FIELD, image_path.filename().string(),
                  network::MultipartForm::content_type_for(image_path), std::move(*image));
    publish(status::Uploading{1.0});

    network::HttpResponse response;
    auto result = client_->post_multipart(network::api::predict_url(config_.server_url), form,
                                          config_.upload_timeout, response);
    if (!result) {
        return core::Result(result.error, "Upload failed: " + result.message);
    }

    if (!response.ok()) {
        return core::Result(core::ErrorCode::HTTP_STATUS,
                            "Server error: HTTP " + std::to_string(response.status) + " " + response.reason);
    }

    return network::api::parse_job_id(response.body_text(), job_id);
}

core::Result TransferSession::persist(const std::vector<std::uint8_t>& artifact) {
    auto parent = config_.artifact_path.parent_path();
    if (!parent.empty() && !FileUtils::create_directories(parent)) {
        return core::Result(core::ErrorCode::FILE_WRITE_ERROR,
                            "Failed to create directory " + parent.string());
    }

    if (!FileUtils::write_binary_file(config_.artifact_path, artifact)) {
        return core::Result(core::ErrorCode::FILE_WRITE_ERROR,
                            "Failed to save PLY file: " + config_.artifact_path.string());
    }

    return core::Result();
}

void TransferSession::publish(TransferStatus next) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = next;
        listener = listener_;
    }

    LOG_DEBUG("Transfer status: {}", describe(next));
    if (listener) {
        listener(next);
    }
}

void TransferSession::fail(const core::Result& result) {
    LOG_ERROR("Transfer failed [{}]: {}", core::error_code_name(result.error), result.message);
    publish(status::Error{result.message, result.error});
}

}
