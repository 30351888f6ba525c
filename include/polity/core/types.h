// POLITY - Core Types Header
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Fundamental value types shared by every POLITY module.

#ifndef POLITY_CORE_TYPES_H
#define POLITY_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace polity {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/// Injectable time source; components default to GetTime
using ClockFn = std::function<Timestamp()>;

// ============================================================================
// Hash256
// ============================================================================

/// 256-bit digest. Bytes are stored and printed in digest order; identifiers
/// for actions, transitions and invites are all Hash256 values.
class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    Hash256() noexcept { data_.fill(0); }

    explicit Hash256(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Construct from raw bytes; short input is zero-padded
    Hash256(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }
    Byte operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    bool operator==(const Hash256& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Hash256& other) const noexcept { return data_ != other.data_; }
    bool operator<(const Hash256& other) const noexcept { return data_ < other.data_; }

    /// Lowercase hex of the digest bytes
    std::string ToHex() const;

    /// Parse from hex; throws std::invalid_argument on malformed input
    static Hash256 FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> data_;
};

} // namespace polity

#endif // POLITY_CORE_TYPES_H
