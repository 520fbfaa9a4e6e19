#include "splatlink/transfer/pipeline_config.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/network/http_client.hpp"
#include <cstdint>

namespace splatlink::transfer {

PipelineConfig PipelineConfig::from_config(const core::Config& config) {
    PipelineConfig pipeline;

    pipeline.server_url = config.get_string("server.url", pipeline.server_url);
    pipeline.upload_timeout = std::chrono::milliseconds(
        config.get_as<std::int64_t>("upload.timeout_ms").value_or(pipeline.upload_timeout.count()));

    pipeline.download.metadata_timeout = std::chrono::milliseconds(
        config.get_as<std::int64_t>("download.metadata_timeout_ms").value_or(pipeline.download.metadata_timeout.count()));
    pipeline.download.chunk_timeout = std::chrono::milliseconds(
        config.get_as<std::int64_t>("download.chunk_timeout_ms").value_or(pipeline.download.chunk_timeout.count()));
    pipeline.download.max_parallel_chunks =
        config.get_as<std::uint32_t>("download.max_parallel_chunks").value_or(pipeline.download.max_parallel_chunks);

    pipeline.artifact_path = config.get_string("artifact.path", pipeline.artifact_path.string());
    pipeline.cache_directory = core::utils::FileUtils::expand_home(
        config.get_string("cache.directory", pipeline.cache_directory.string()));
    pipeline.cache_max_age = std::chrono::seconds(
        config.get_as<std::int64_t>("cache.max_age_seconds").value_or(pipeline.cache_max_age.count()));

    return pipeline;
}

core::Result PipelineConfig::validate() const {
    if (!network::Url::parse(server_url)) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "server.url must be an http://host[:port] address, got '" + server_url + "'");
    }

    if (upload_timeout.count() <= 0 || download.metadata_timeout.count() <= 0 ||
        download.chunk_timeout.count() <= 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Timeouts must be positive");
    }

    if (artifact_path.empty() || !artifact_path.has_filename()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "artifact.path must name a file");
    }

    if (cache_directory.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "cache.directory must not be empty");
    }

    if (cache_max_age.count() <= 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "cache.max_age_seconds must be positive");
    }

    return core::Result();
}

}
