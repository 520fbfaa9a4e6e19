#pragma once

#include "splatlink/core/result.hpp"
#include <cstdint>
#include <string>

namespace splatlink::transfer {

// Reply of the download_info endpoint. chunk_count is only bounded by
// total_size; it is not checked against total_size / chunk_size.
struct ChunkTransferInfo {
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t chunk_count = 0;
    std::string filename;

    static core::Result from_json(const std::string& body, ChunkTransferInfo& info);
};

} // namespace splatlink::transfer
