#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace splatlink::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string percent_encode(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);

    static std::optional<std::vector<std::uint8_t>> read_binary_file(const std::filesystem::path& path);
    static bool write_binary_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

    static std::filesystem::path get_home_dir();
    // Expands a leading "~/" to the home directory
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::int64_t unix_millis(const std::chrono::system_clock::time_point& time);
};

} // namespace splatlink::core::utils
