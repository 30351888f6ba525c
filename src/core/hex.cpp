// POLITY - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/core/hex.h"

#include <cctype>
#include <stdexcept>

namespace polity {

namespace {

const char kDigits[] = "0123456789abcdef";

/// Value of one hex digit, or -1
int DigitValue(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isxdigit(u)) {
        return -1;
    }
    return std::isdigit(u) ? u - '0' : std::tolower(u) - 'a' + 10;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = kDigits[data[i] >> 4];
        out[2 * i + 1] = kDigits[data[i] & 0x0F];
    }
    return out;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.size() & 1) {
        throw std::invalid_argument("HexToBytes: odd number of digits (" +
                                    std::to_string(hex.size()) + ")");
    }
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = DigitValue(hex[2 * i]);
        int lo = DigitValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("HexToBytes: non-hex digit at offset " +
                                        std::to_string(hi < 0 ? 2 * i : 2 * i + 1));
        }
        out[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || (str.size() & 1)) {
        return false;
    }
    for (char c : str) {
        if (DigitValue(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace polity
