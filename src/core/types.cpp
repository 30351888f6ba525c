// POLITY - Core Types Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/core/types.h"
#include "polity/core/hex.h"

#include <stdexcept>

namespace polity {

std::string Hash256::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

Hash256 Hash256::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Hash256::FromHex: expected 64 hex digits, got " +
                                    std::to_string(hex.length()));
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    return Hash256(bytes.data(), bytes.size());
}

} // namespace polity
