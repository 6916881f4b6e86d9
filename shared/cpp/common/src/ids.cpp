#include "../include/ids.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <cstdio>
#include <cstdint>

std::string generate_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    char buf[33];
    for (int i = 0; i < 16; ++i) {
        std::snprintf(buf + i * 2, 3, "%02x", bytes[i]);
    }
    return std::string(buf, 32);
}
