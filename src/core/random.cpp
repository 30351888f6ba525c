// POLITY - Secure Random Number Generation Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/core/random.h"

#include <stdexcept>

#include <openssl/rand.h>

namespace polity {

void GetRandBytes(uint8_t* buf, size_t len) {
    if (len == 0) {
        return;
    }
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("GetRandBytes: RAND_bytes failed");
    }
}

Hash256 GetRandHash256() {
    Hash256 hash;
    GetRandBytes(hash.data(), Hash256::SIZE);
    return hash;
}

} // namespace polity
