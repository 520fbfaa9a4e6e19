#pragma once

#include "splatlink/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace splatlink::storage {

struct CacheStats {
    size_t file_count = 0;
    std::uint64_t total_size_bytes = 0;

    double total_size_mb() const { return static_cast<double>(total_size_bytes) / 1'000'000.0; }
};

// Time-bounded store of downloaded artifacts, one "{name}.ply" file per entry.
// Entry age is the file's modification time; there is no index file.
//
// There is no in-process lock: concurrent store() and sweep_expired() calls
// on the same name race at the file-system level and the last writer wins.
class ContentCache {
public:
    static constexpr std::chrono::hours DEFAULT_MAX_AGE{24};
    static constexpr const char* FILE_SUFFIX = ".ply";

    explicit ContentCache(std::filesystem::path cache_root,
                          std::chrono::milliseconds max_age = DEFAULT_MAX_AGE);

    // Lookups fail closed: any I/O error reads as a miss
    bool is_valid(const std::string& name) const;
    std::optional<std::vector<std::uint8_t>> load(const std::string& name) const;

    core::Result store(const std::string& name, const std::vector<std::uint8_t>& data);
    core::Result sweep_expired(size_t& removed_count);

    CacheStats stats() const;

    std::filesystem::path path_for(const std::string& name) const;
    const std::filesystem::path& root() const { return cache_root_; }
    std::chrono::milliseconds max_age() const { return max_age_; }

    static bool is_valid_name(const std::string& name);

    // "{stem}-{16 hex chars of BLAKE2b(source)}", so distinct images sharing
    // a file name map to distinct entries
    static core::Result key_for_source(const std::filesystem::path& source, std::string& key);

private:
    std::filesystem::path cache_root_;
    std::chrono::milliseconds max_age_;

    bool is_expired(const std::filesystem::path& path, std::error_code& ec) const;
    static bool has_cache_suffix(const std::filesystem::path& path);
};

} // namespace splatlink::storage
