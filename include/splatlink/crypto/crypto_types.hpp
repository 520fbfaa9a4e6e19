#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace splatlink::crypto {

// BLAKE2b output length used for artifact digests and cache keys
constexpr size_t BLAKE2B_HASH_SIZE = 32;

// Multipart boundaries are built from this many random bytes
constexpr size_t BOUNDARY_RANDOM_BYTES = 16;

using Blake2bHash = std::array<std::uint8_t, BLAKE2B_HASH_SIZE>;

} // namespace splatlink::crypto
