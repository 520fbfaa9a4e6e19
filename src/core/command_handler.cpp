#include "splatlink/core/command_handler.hpp"
#include "splatlink/core/logger.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/crypto/hash.hpp"
#include "splatlink/network/beast_http_client.hpp"
#include "splatlink/storage/content_cache.hpp"
#include "splatlink/transfer/chunk_downloader.hpp"
#include "splatlink/transfer/transfer_session.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace splatlink::core {

using utils::FileUtils;
using utils::StringUtils;

namespace {

constexpr const char* RELOAD_PREFIX = "loaded_";

std::filesystem::path asset_directory_of(const std::filesystem::path& artifact_path) {
    auto parent = artifact_path.parent_path();
    return parent.empty() ? std::filesystem::path(".") : parent;
}

storage::ContentCache open_cache(const transfer::PipelineConfig& config) {
    return storage::ContentCache(config.cache_directory,
                                 std::chrono::duration_cast<std::chrono::milliseconds>(config.cache_max_age));
}

CommandResult finish_with_artifact(const std::filesystem::path& artifact, const std::filesystem::path& asset_directory) {
    std::filesystem::path copy_path;
    auto result = publish_reload_copy(artifact, asset_directory, copy_path);
    if (!result) {
        return CommandResult::error(result.message);
    }

    std::cout << "Artifact ready: " << copy_path.string() << "\n";
    return CommandResult::ok(copy_path.string());
}

}

// ConsoleFilePicker Implementation
ConsoleFilePicker::ConsoleFilePicker(std::istream& input, std::ostream& output)
    : input_(input)
    , output_(output) {
}

std::optional<std::filesystem::path> ConsoleFilePicker::pick_file() {
    for (;;) {
        output_ << "Image to upload (jpg, jpeg, png, bmp; empty to cancel): " << std::flush;

        std::string line;
        if (!std::getline(input_, line)) {
            return std::nullopt;
        }

        line = StringUtils::trim(line);
        if (line.empty()) {
            return std::nullopt;
        }

        auto path = FileUtils::expand_home(line);
        if (FileUtils::is_file(path)) {
            return path;
        }

        output_ << "No such file: " << path.string() << "\n";
    }
}

// FetchCommandHandler Implementation
FetchCommandHandler::FetchCommandHandler(const CommandLineParser& parser, transfer::PipelineConfig config)
    : parser_(parser)
    , config_(std::move(config)) {
}

CommandResult FetchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() > 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    if (auto valid = config_.validate(); !valid) {
        return CommandResult::error("Invalid configuration: " + valid.message);
    }

    std::filesystem::path image_path;
    if (args.size() == 2) {
        image_path = FileUtils::expand_home(args[1]);
    } else {
        ConsoleFilePicker picker(std::cin, std::cout);
        auto picked = picker.pick_file();
        if (!picked) {
            return CommandResult::ok("No file selected");
        }
        image_path = *picked;
    }

    return run_pipeline(image_path);
}

CommandResult FetchCommandHandler::run_pipeline(const std::filesystem::path& image_path) {
    auto cache = open_cache(config_);
    bool use_cache = !parser_.get_bool_option("no-cache");

    std::string cache_key;
    if (use_cache) {
        auto stats = cache.stats();
        LOG_INFO("Cache: {} entries, {:.2f} MB", stats.file_count, stats.total_size_mb());

        size_t removed = 0;
        if (auto swept = cache.sweep_expired(removed); !swept) {
            LOG_WARN("Cache sweep failed: {}", swept.message);
        } else if (removed > 0) {
            LOG_INFO("Removed {} expired cache entries", removed);
        }

        auto keyed = storage::ContentCache::key_for_source(image_path, cache_key);
        if (!keyed) {
            LOG_WARN("Cache lookup skipped: {}", keyed.message);
            cache_key.clear();
        } else if (cache.is_valid(cache_key)) {
            LOG_INFO("Cache hit for {} ({})", image_path.filename().string(), cache_key);
            std::cout << "Using cached artifact for " << image_path.filename().string() << "\n";
            return finish_with_artifact(cache.path_for(cache_key), asset_directory_of(config_.artifact_path));
        }
    }

    auto client = std::make_shared<network::BeastHttpClient>();
    transfer::TransferSession session(client, config_);

    if (!session.begin(image_path)) {
        return CommandResult::error("Could not start the transfer");
    }

    // Poll the published status, printing each distinct display line once
    std::string last_line;
    for (;;) {
        auto current = session.status();
        auto line = transfer::describe(current);
        if (line != last_line) {
            std::cout << line << "\n";
            last_line = line;
        }
        if (transfer::is_terminal(current)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    session.wait();

    auto final_status = session.status();
    if (auto* error = std::get_if<transfer::status::Error>(&final_status)) {
        return CommandResult::error(error->message);
    }

    auto* completed = std::get_if<transfer::status::Completed>(&final_status);
    if (!completed) {
        return CommandResult::error(std::string("Transfer ended in state ") + transfer::status_name(final_status));
    }

    std::cout << "  Size: " << StringUtils::format_bytes(completed->artifact_size) << "\n";
    std::cout << "  BLAKE2b: " << completed->artifact_digest << "\n";

    if (use_cache && !cache_key.empty()) {
        auto artifact = FileUtils::read_binary_file(completed->artifact_path);
        if (!artifact) {
            LOG_WARN("Could not read {} back for caching", completed->artifact_path.string());
        } else if (auto stored = cache.store(cache_key, *artifact); !stored) {
            LOG_WARN("Failed to cache artifact: {}", stored.message);
        } else {
            LOG_INFO("Cached artifact as {}", cache_key);
        }
    }

    session.reset();
    return finish_with_artifact(completed->artifact_path, asset_directory_of(completed->artifact_path));
}

// DownloadCommandHandler Implementation
DownloadCommandHandler::DownloadCommandHandler(const CommandLineParser& parser, transfer::PipelineConfig config)
    : parser_(parser)
    , config_(std::move(config)) {
}

CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    if (auto valid = config_.validate(); !valid) {
        return CommandResult::error("Invalid configuration: " + valid.message);
    }

    const std::string& job_id = args[1];
    auto client = std::make_shared<network::BeastHttpClient>();
    transfer::ChunkDownloader downloader(client, config_.download);

    if (parser_.get_bool_option("info")) {
        transfer::ChunkTransferInfo info;
        auto result = downloader.fetch_info(config_.server_url, job_id, info);
        if (!result) {
            return CommandResult::error(result.message);
        }

        std::cout << "Job " << job_id << ":\n";
        std::cout << "  File: " << info.filename << "\n";
        std::cout << "  Size: " << StringUtils::format_bytes(info.total_size) << " (" << info.total_size << " bytes)\n";
        std::cout << "  Chunks: " << info.chunk_count << " x " << StringUtils::format_bytes(info.chunk_size) << "\n";
        std::cout << "  Workers: " << downloader.worker_count(info.chunk_count) << "\n";
        return CommandResult::ok();
    }

    std::vector<std::uint8_t> artifact;
    auto result = downloader.fetch(config_.server_url, job_id, artifact,
        [](std::uint32_t completed, std::uint32_t total) {
            std::cout << "\rDownloading PLY... " << completed << "/" << total << std::flush;
        });
    std::cout << "\n";

    if (!result) {
        return CommandResult::error("Download failed: " + result.message);
    }

    auto parent = config_.artifact_path.parent_path();
    if (!parent.empty() && !FileUtils::create_directories(parent)) {
        return CommandResult::error("Failed to create directory " + parent.string());
    }
    if (!FileUtils::write_binary_file(config_.artifact_path, artifact)) {
        return CommandResult::error("Failed to save PLY file: " + config_.artifact_path.string());
    }

    std::cout << "Saved " << StringUtils::format_bytes(artifact.size()) << " to "
              << config_.artifact_path.string() << "\n";
    std::cout << "  BLAKE2b: " << crypto::hash_utils::digest_hex(artifact) << "\n";
    return CommandResult::ok(config_.artifact_path.string());
}

// CacheCommandHandler Implementation
CacheCommandHandler::CacheCommandHandler(transfer::PipelineConfig config)
    : config_(std::move(config)) {
}

CommandResult CacheCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto cache = open_cache(config_);
    const std::string& action = args[1];

    if (action == "stats") {
        auto stats = cache.stats();
        std::cout << "Cache directory: " << cache.root().string() << "\n";
        std::cout << "Entries: " << stats.file_count << "\n";
        std::cout << "Total size: " << StringUtils::format_bytes(stats.total_size_bytes) << "\n";
        std::cout << "Max age: " << StringUtils::format_duration(cache.max_age()) << "\n";
        return CommandResult::ok();
    }

    if (action == "sweep") {
        size_t removed = 0;
        auto result = cache.sweep_expired(removed);
        if (!result) {
            return CommandResult::error("Cache sweep failed: " + result.message);
        }
        std::cout << "Removed " << removed << " expired entries\n";
        return CommandResult::ok();
    }

    return CommandResult::error("Unknown cache action: " + action + "\nUsage: " + get_usage());
}

Result publish_reload_copy(const std::filesystem::path& artifact,
                           const std::filesystem::path& asset_directory,
                           std::filesystem::path& copy_path) {
    std::error_code ec;

    if (!FileUtils::create_directories(asset_directory)) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Failed to create directory " + asset_directory.string());
    }

    auto millis = utils::TimeUtils::unix_millis(utils::TimeUtils::now());
    auto target = asset_directory / (std::string(RELOAD_PREFIX) + std::to_string(millis) + ".ply");

    std::filesystem::copy_file(artifact, target, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result(ErrorCode::FILE_WRITE_ERROR,
                      "Failed to copy " + artifact.string() + " to " + target.string() + ": " + ec.message());
    }
    copy_path = target;

    // Older copies go only once the new one exists; the source itself stays
    for (std::filesystem::directory_iterator it(asset_directory, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        auto name = path.filename().string();
        if (!StringUtils::starts_with(name, RELOAD_PREFIX) || !StringUtils::ends_with(name, ".ply")) {
            continue;
        }

        std::error_code same_ec;
        if (std::filesystem::equivalent(path, target, same_ec) ||
            std::filesystem::equivalent(path, artifact, same_ec)) {
            continue;
        }

        std::error_code remove_ec;
        std::filesystem::remove(path, remove_ec);
        if (remove_ec) {
            LOG_WARN("Could not remove old copy {}: {}", path.string(), remove_ec.message());
        }
    }
    if (ec) {
        LOG_WARN("Could not list {}: {}", asset_directory.string(), ec.message());
    }

    return Result();
}

}
