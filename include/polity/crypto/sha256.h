// POLITY - SHA256 Hash Function
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Incremental SHA-256 over the OpenSSL EVP digest interface.

#ifndef POLITY_CRYPTO_SHA256_H
#define POLITY_CRYPTO_SHA256_H

#include "polity/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace polity {

/// SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    
    /// Finalize the hash and write OUTPUT_SIZE bytes to output.
    /// The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace polity

#endif // POLITY_CRYPTO_SHA256_H
