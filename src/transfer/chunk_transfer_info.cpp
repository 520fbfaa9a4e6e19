#include "splatlink/transfer/chunk_transfer_info.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>

namespace splatlink::transfer {

namespace {

core::Result read_unsigned(const nlohmann::json& json, const char* key, std::uint64_t& value) {
    auto it = json.find(key);
    if (it == json.end()) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, std::string("download_info is missing '") + key + "'");
    }
    if (!it->is_number_unsigned()) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            std::string("download_info field '") + key + "' is not a non-negative integer");
    }
    value = it->get<std::uint64_t>();
    return core::Result();
}

}

core::Result ChunkTransferInfo::from_json(const std::string& body, ChunkTransferInfo& info) {
    try {
        auto json = nlohmann::json::parse(body);
        if (!json.is_object()) {
            return core::Result(core::ErrorCode::PROTOCOL_ERROR, "download_info response is not a JSON object");
        }

        ChunkTransferInfo parsed;
        std::uint64_t chunk_count = 0;

        if (auto result = read_unsigned(json, "file_size", parsed.total_size); !result) return result;
        if (auto result = read_unsigned(json, "chunk_size", parsed.chunk_size); !result) return result;
        if (auto result = read_unsigned(json, "num_chunks", chunk_count); !result) return result;

        if (chunk_count > std::numeric_limits<std::uint32_t>::max()) {
            return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                                "download_info reports too many chunks: " + std::to_string(chunk_count));
        }
        // Only the single chunk of an empty file may carry no bytes
        if (chunk_count > std::max<std::uint64_t>(parsed.total_size, 1)) {
            return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                                "download_info reports " + std::to_string(chunk_count) + " chunks for " +
                                std::to_string(parsed.total_size) + " bytes");
        }
        parsed.chunk_count = static_cast<std::uint32_t>(chunk_count);

        auto filename = json.find("filename");
        if (filename == json.end() || !filename->is_string()) {
            return core::Result(core::ErrorCode::PROTOCOL_ERROR, "download_info is missing 'filename'");
        }
        parsed.filename = filename->get<std::string>();

        info = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            std::string("Malformed download_info response: ") + e.what());
    }

    return core::Result();
}

}
