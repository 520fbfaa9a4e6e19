#include "splatlink/storage/content_cache.hpp"
#include "splatlink/core/logger.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/crypto/hash.hpp"

namespace splatlink::storage {

namespace {

constexpr size_t SOURCE_KEY_HEX_CHARS = 16;

}

ContentCache::ContentCache(std::filesystem::path cache_root, std::chrono::milliseconds max_age)
    : cache_root_(std::move(cache_root))
    , max_age_(max_age) {
    if (!core::utils::FileUtils::create_directories(cache_root_)) {
        LOG_WARN("Could not create cache directory {}", cache_root_.string());
    }
}

bool ContentCache::is_valid(const std::string& name) const {
    if (!is_valid_name(name)) {
        return false;
    }

    auto path = path_for(name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }

    bool expired = is_expired(path, ec);
    return !ec && !expired;
}

std::optional<std::vector<std::uint8_t>> ContentCache::load(const std::string& name) const {
    if (!is_valid(name)) {
        return std::nullopt;
    }

    auto data = core::utils::FileUtils::read_binary_file(path_for(name));
    if (data) {
        LOG_DEBUG("Cache hit for '{}' ({})", name, core::utils::StringUtils::format_bytes(data->size()));
    }
    return data;
}

core::Result ContentCache::store(const std::string& name, const std::vector<std::uint8_t>& data) {
    if (!is_valid_name(name)) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid cache entry name: '" + name + "'");
    }

    if (!core::utils::FileUtils::create_directories(cache_root_)) {
        return core::Result(core::ErrorCode::FILE_WRITE_ERROR,
                            "Cannot create cache directory " + cache_root_.string());
    }

    auto path = path_for(name);
    if (!core::utils::FileUtils::write_binary_file(path, data)) {
        return core::Result(core::ErrorCode::FILE_WRITE_ERROR, "Failed to write cache entry " + path.string());
    }

    LOG_INFO("Cached PLY: {} ({:.2f} MB)", path.string(), static_cast<double>(data.size()) / 1'000'000.0);
    return core::Result();
}

core::Result ContentCache::sweep_expired(size_t& removed_count) {
    removed_count = 0;

    std::error_code ec;
    std::filesystem::directory_iterator it(cache_root_, ec);
    if (ec) {
        return core::Result(core::ErrorCode::FILE_READ_ERROR,
                            "Cannot list cache directory " + cache_root_.string() + ": " + ec.message());
    }

    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return core::Result(core::ErrorCode::FILE_READ_ERROR,
                                "Error while listing cache directory: " + ec.message());
        }

        const auto& path = it->path();
        if (!has_cache_suffix(path)) {
            continue;
        }

        std::error_code meta_ec;
        bool expired = is_expired(path, meta_ec);
        if (meta_ec) {
            LOG_DEBUG("Skipping {}: {}", path.string(), meta_ec.message());
            continue;
        }
        if (!expired) {
            continue;
        }

        std::error_code remove_ec;
        std::filesystem::remove(path, remove_ec);
        if (remove_ec) {
            return core::Result(core::ErrorCode::FILE_WRITE_ERROR,
                                "Failed to remove expired entry " + path.string() + ": " + remove_ec.message());
        }

        removed_count++;
        LOG_INFO("Removed expired cache entry: {}", path.string());
    }

    if (ec) {
        return core::Result(core::ErrorCode::FILE_READ_ERROR,
                            "Error while listing cache directory: " + ec.message());
    }

    return core::Result();
}

CacheStats ContentCache::stats() const {
    CacheStats stats;

    std::error_code ec;
    std::filesystem::directory_iterator it(cache_root_, ec);
    if (ec) {
        return stats;
    }

    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            break;
        }

        const auto& path = it->path();
        if (!has_cache_suffix(path)) {
            continue;
        }

        std::error_code size_ec;
        auto size = std::filesystem::file_size(path, size_ec);
        if (size_ec) {
            continue;
        }

        stats.file_count++;
        stats.total_size_bytes += size;
    }

    return stats;
}

std::filesystem::path ContentCache::path_for(const std::string& name) const {
    return cache_root_ / (name + FILE_SUFFIX);
}

bool ContentCache::is_valid_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
}

core::Result ContentCache::key_for_source(const std::filesystem::path& source, std::string& key) {
    crypto::Blake2bHash digest;
    auto result = crypto::Blake2bHasher::hash_file(source, digest);
    if (!result) {
        return result;
    }

    auto stem = source.stem().string();
    if (!is_valid_name(stem)) {
        stem = "source";
    }

    key = stem + "-" + crypto::hash_utils::hash_to_hex(digest).substr(0, SOURCE_KEY_HEX_CHARS);
    return core::Result();
}

bool ContentCache::is_expired(const std::filesystem::path& path, std::error_code& ec) const {
    auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }

    auto age = std::filesystem::file_time_type::clock::now() - modified;
    // A modification time in the future counts as a fresh entry
    if (age < std::filesystem::file_time_type::duration::zero()) {
        return false;
    }

    return age >= max_age_;
}

bool ContentCache::has_cache_suffix(const std::filesystem::path& path) {
    return path.extension() == FILE_SUFFIX;
}

}
