// POLITY - Secure Random Number Generation Header
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Cryptographically secure randomness backed by the OpenSSL DRBG.

#ifndef POLITY_CORE_RANDOM_H
#define POLITY_CORE_RANDOM_H

#include "polity/core/types.h"

#include <cstddef>
#include <cstdint>

namespace polity {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the DRBG cannot be seeded.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 256-bit hash
Hash256 GetRandHash256();

} // namespace polity

#endif // POLITY_CORE_RANDOM_H
