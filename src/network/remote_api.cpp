#include "splatlink/network/remote_api.hpp"
#include "splatlink/core/utils.hpp"
#include <nlohmann/json.hpp>

namespace splatlink::network::api {

namespace {

std::string base(const std::string& server) {
    std::string trimmed = server;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return trimmed;
}

}

std::string predict_url(const std::string& server) {
    return base(server) + PREDICT_PATH;
}

std::string download_info_url(const std::string& server, const std::string& job_id) {
    return base(server) + DOWNLOAD_INFO_PATH + core::utils::StringUtils::percent_encode(job_id);
}

std::string download_chunk_url(const std::string& server, const std::string& job_id, std::uint32_t chunk_index) {
    return base(server) + DOWNLOAD_CHUNK_PATH + core::utils::StringUtils::percent_encode(job_id) +
           "/" + std::to_string(chunk_index);
}

core::Result parse_job_id(const std::string& body, std::string& job_id) {
    try {
        auto json = nlohmann::json::parse(body);
        auto it = json.find("job_id");
        if (it == json.end() || !it->is_string()) {
            return core::Result(core::ErrorCode::PROTOCOL_ERROR, "Predict response has no string job_id");
        }

        job_id = it->get<std::string>();
        if (job_id.empty()) {
            return core::Result(core::ErrorCode::PROTOCOL_ERROR, "Predict response has an empty job_id");
        }
    } catch (const nlohmann::json::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            std::string("Malformed predict response: ") + e.what());
    }

    return core::Result();
}

}
