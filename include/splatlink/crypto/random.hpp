#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace splatlink::crypto {

class SecureRandom {
public:
    // Calls sodium_init(); safe to call repeatedly from any thread
    static bool initialize();

    static std::string generate_hex(size_t byte_count);
};

}
