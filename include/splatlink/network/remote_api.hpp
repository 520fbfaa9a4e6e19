#pragma once

#include "splatlink/core/result.hpp"
#include <cstdint>
#include <string>

// Endpoints of the remote processing server
namespace splatlink::network::api {

constexpr const char* PREDICT_PATH = "/api/predict";
constexpr const char* DOWNLOAD_INFO_PATH = "/api/download_info/";
constexpr const char* DOWNLOAD_CHUNK_PATH = "/api/download_chunk/";

// Multipart field carrying the source image
constexpr const char* IMAGE_FIELD = "image";

std::string predict_url(const std::string& server);
std::string download_info_url(const std::string& server, const std::string& job_id);
std::string download_chunk_url(const std::string& server, const std::string& job_id, std::uint32_t chunk_index);

// Decodes {"job_id": "..."} from a predict response
core::Result parse_job_id(const std::string& body, std::string& job_id);

} // namespace splatlink::network::api
