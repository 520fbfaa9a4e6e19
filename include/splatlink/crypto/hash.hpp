#pragma once

#include "crypto_types.hpp"
#include "../core/result.hpp"
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace splatlink::crypto {

// Streaming BLAKE2b-256 (libsodium crypto_generichash)
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(Blake2bHash& output);

    static Blake2bHash hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, Blake2bHash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string hash_to_hex(const Blake2bHash& hash);

// Hex digest of an in-memory buffer
std::string digest_hex(const std::vector<std::uint8_t>& data);

}

} // namespace splatlink::crypto
