#include "splatlink/crypto/random.hpp"
#include "splatlink/core/logger.hpp"
#include <sodium.h>
#include <vector>

namespace splatlink::crypto {

bool SecureRandom::initialize() {
    // sodium_init() returns 1 when the library was already initialized
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    return true;
}

std::string SecureRandom::generate_hex(size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    randombytes_buf(bytes.data(), bytes.size());

    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

}
