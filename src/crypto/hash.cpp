#include "splatlink/crypto/hash.hpp"
#include "splatlink/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace splatlink::crypto {

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Blake2bHasher::~Blake2bHasher() = default;

core::Result Blake2bHasher::initialize() {
    if (crypto_generichash_init(&impl_->state, nullptr, 0, BLAKE2B_HASH_SIZE) != 0) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Failed to initialize BLAKE2b hasher");
    }

    initialized_ = true;
    return core::Result();
}

core::Result Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Failed to update hash");
    }

    return core::Result();
}

core::Result Blake2bHasher::finalize(Blake2bHash& output) {
    if (!initialized_) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return core::Result();
}

Blake2bHash Blake2bHasher::hash(std::span<const std::uint8_t> data) {
    Blake2bHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

core::Result Blake2bHasher::hash_file(const std::filesystem::path& file_path, Blake2bHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return core::Result(core::ErrorCode::FILE_READ_ERROR,
                            "Cannot open file for hashing: " + file_path.string());
    }

    Blake2bHasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        return result;
    }

    constexpr size_t buffer_size = 65536; // 64KB buffer
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return core::Result(core::ErrorCode::FILE_READ_ERROR,
                            "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(output);
}

namespace hash_utils {

std::string hash_to_hex(const Blake2bHash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::string digest_hex(const std::vector<std::uint8_t>& data) {
    return hash_to_hex(Blake2bHasher::hash(std::span<const std::uint8_t>(data.data(), data.size())));
}

}

}
