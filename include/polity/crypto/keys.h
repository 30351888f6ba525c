// POLITY - secp256k1 Keys
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// secp256k1 key pairs used to authorize governance actions and votes.
// Signatures are DER-encoded ECDSA over a 32-byte digest.

#ifndef POLITY_CRYPTO_KEYS_H
#define POLITY_CRYPTO_KEYS_H

#include "polity/core/serialize.h"
#include "polity/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace polity {

// ============================================================================
// secp256k1 Constants
// ============================================================================

namespace secp256k1 {
    /// Private key size (32 bytes)
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    
    /// Uncompressed public key size (0x04 + X + Y)
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
    
    /// Compressed public key size (0x02/0x03 + X)
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    
    /// Upper bound on a DER-encoded ECDSA signature
    constexpr size_t MAX_SIGNATURE_SIZE = 72;
}

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A secp256k1 public key in compressed (33 byte) or uncompressed
 * (65 byte) SEC1 encoding.
 */
class PublicKey {
public:
    static constexpr size_t MAX_SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;
    
    /// Empty (invalid) key
    PublicKey() : size_(0) { data_.fill(0); }
    
    explicit PublicKey(const uint8_t* data, size_t len);
    
    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}
    
    /// True if the bytes decode to a point on the curve
    bool IsValid() const;
    
    bool IsCompressed() const { return size_ == COMPRESSED_SIZE; }
    
    size_t size() const { return size_; }
    const uint8_t* data() const { return data_.data(); }
    const uint8_t* begin() const { return data_.data(); }
    const uint8_t* end() const { return data_.data() + size_; }
    
    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(begin(), end());
    }
    
    /// Verify a DER-encoded ECDSA signature over hash
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;
    
    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }
    bool operator<(const PublicKey& other) const;
    
    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);
    
    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, static_cast<uint8_t>(size_));
        s.Write(data_.data(), size_);
    }
    
    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t len = 0;
        ::polity::Unserialize(s, len);
        if (len > MAX_SIZE) {
            throw std::ios_base::failure("PublicKey too large");
        }
        size_ = len;
        data_.fill(0);
        s.Read(data_.data(), len);
    }

private:
    std::array<uint8_t, MAX_SIZE> data_;
    uint8_t size_{0};
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key. Always 32 bytes in the range [1, n-1].
 * Key material is cleansed on destruction.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;
    
    PrivateKey() : valid_(false) { data_.fill(0); }
    
    explicit PrivateKey(const uint8_t* data);
    
    explicit PrivateKey(const std::array<uint8_t, SIZE>& data)
        : PrivateKey(data.data()) {}
    
    ~PrivateKey();
    
    PrivateKey(const PrivateKey& other);
    PrivateKey& operator=(const PrivateKey& other);
    
    /// Generate a fresh random key
    static PrivateKey Generate();
    
    bool IsValid() const { return valid_; }
    
    const uint8_t* data() const { return data_.data(); }
    
    /// Derive the compressed public key; empty key if invalid
    PublicKey GetPublicKey() const;
    
    /// DER-encoded ECDSA signature over hash; empty on failure
    std::vector<uint8_t> Sign(const Hash256& hash) const;
    
    std::string ToHex() const;
    static std::optional<PrivateKey> FromHex(const std::string& hex);

private:
    bool Validate() const;
    
    std::array<uint8_t, SIZE> data_;
    bool valid_;
};

} // namespace polity

#endif // POLITY_CRYPTO_KEYS_H
