// POLITY - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Identifiers, keys and stored values cross the CLI boundary as lowercase hex.

#ifndef POLITY_CORE_HEX_H
#define POLITY_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace polity {

std::string BytesToHex(const uint8_t* data, size_t len);

inline std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

/// Decode hex of either case; throws std::invalid_argument on odd length or
/// a non-hex digit
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// True for non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace polity

#endif // POLITY_CORE_HEX_H
