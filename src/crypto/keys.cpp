// POLITY - secp256k1 Keys Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/crypto/keys.h"
#include "polity/core/hex.h"
#include "polity/core/random.h"

#include <algorithm>
#include <cstring>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

namespace polity {

namespace {

/// secp256k1 group order n, big-endian
const std::array<uint8_t, 32> CURVE_ORDER = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

/// Build an EC_KEY holding both halves of the key pair; caller frees
EC_KEY* MakeKeyPair(const uint8_t* secret) {
    EC_KEY* eckey = EC_KEY_new_by_curve_name(NID_secp256k1);
    if (!eckey) {
        return nullptr;
    }
    
    BIGNUM* priv = BN_bin2bn(secret, PrivateKey::SIZE, nullptr);
    if (!priv || !EC_KEY_set_private_key(eckey, priv)) {
        BN_free(priv);
        EC_KEY_free(eckey);
        return nullptr;
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(eckey);
    EC_POINT* pub = EC_POINT_new(group);
    if (!pub || !EC_POINT_mul(group, pub, priv, nullptr, nullptr, nullptr) ||
        !EC_KEY_set_public_key(eckey, pub)) {
        EC_POINT_free(pub);
        BN_clear_free(priv);
        EC_KEY_free(eckey);
        return nullptr;
    }
    
    EC_POINT_free(pub);
    BN_clear_free(priv);
    return eckey;
}

} // namespace

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) : size_(0) {
    data_.fill(0);
    if (data && (len == COMPRESSED_SIZE || len == MAX_SIZE)) {
        std::memcpy(data_.data(), data, len);
        size_ = static_cast<uint8_t>(len);
    }
}

bool PublicKey::IsValid() const {
    if (size_ == 0) {
        return false;
    }
    
    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) {
        return false;
    }
    EC_POINT* point = EC_POINT_new(group);
    bool ok = point && EC_POINT_oct2point(group, point, data_.data(), size_, nullptr) == 1;
    EC_POINT_free(point);
    EC_GROUP_free(group);
    return ok;
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (size_ == 0 || signature.empty() ||
        signature.size() > secp256k1::MAX_SIGNATURE_SIZE) {
        return false;
    }
    
    EC_KEY* eckey = EC_KEY_new_by_curve_name(NID_secp256k1);
    if (!eckey) {
        return false;
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(eckey);
    EC_POINT* point = EC_POINT_new(group);
    if (!point || !EC_POINT_oct2point(group, point, data_.data(), size_, nullptr) ||
        !EC_KEY_set_public_key(eckey, point)) {
        EC_POINT_free(point);
        EC_KEY_free(eckey);
        return false;
    }
    EC_POINT_free(point);
    
    int result = ECDSA_verify(0, hash.data(), static_cast<int>(Hash256::SIZE),
                              signature.data(), static_cast<int>(signature.size()),
                              eckey);
    EC_KEY_free(eckey);
    return result == 1;
}

bool PublicKey::operator==(const PublicKey& other) const {
    return size_ == other.size_ &&
           std::memcmp(data_.data(), other.data_.data(), size_) == 0;
}

bool PublicKey::operator<(const PublicKey& other) const {
    return std::lexicographical_compare(begin(), end(), other.begin(), other.end());
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex)) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    PublicKey key(bytes);
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) : valid_(false) {
    std::memcpy(data_.data(), data, SIZE);
    valid_ = Validate();
}

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(data_.data(), SIZE);
}

PrivateKey::PrivateKey(const PrivateKey& other)
    : data_(other.data_), valid_(other.valid_) {}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
    }
    return *this;
}

PrivateKey PrivateKey::Generate() {
    std::array<uint8_t, SIZE> secret;
    PrivateKey key;
    do {
        GetRandBytes(secret.data(), SIZE);
        key = PrivateKey(secret);
    } while (!key.IsValid());
    OPENSSL_cleanse(secret.data(), SIZE);
    return key;
}

bool PrivateKey::Validate() const {
    bool allZero = std::all_of(data_.begin(), data_.end(),
                               [](uint8_t b) { return b == 0; });
    if (allZero) {
        return false;
    }
    return std::lexicographical_compare(data_.begin(), data_.end(),
                                        CURVE_ORDER.begin(), CURVE_ORDER.end());
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    
    EC_KEY* eckey = MakeKeyPair(data_.data());
    if (!eckey) {
        return PublicKey();
    }
    
    std::array<uint8_t, PublicKey::COMPRESSED_SIZE> out;
    size_t len = EC_POINT_point2oct(EC_KEY_get0_group(eckey), EC_KEY_get0_public_key(eckey),
                                    POINT_CONVERSION_COMPRESSED, out.data(), out.size(),
                                    nullptr);
    EC_KEY_free(eckey);
    if (len != PublicKey::COMPRESSED_SIZE) {
        return PublicKey();
    }
    return PublicKey(out.data(), len);
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    
    EC_KEY* eckey = MakeKeyPair(data_.data());
    if (!eckey) {
        return {};
    }
    
    std::vector<uint8_t> signature(static_cast<size_t>(ECDSA_size(eckey)));
    unsigned int sigLen = static_cast<unsigned int>(signature.size());
    if (!ECDSA_sign(0, hash.data(), static_cast<int>(Hash256::SIZE),
                    signature.data(), &sigLen, eckey)) {
        EC_KEY_free(eckey);
        return {};
    }
    EC_KEY_free(eckey);
    signature.resize(sigLen);
    return signature;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2 || !IsValidHex(hex)) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    PrivateKey key(bytes.data());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

} // namespace polity
