// POLITY - SHA256 Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>
#include "polity/crypto/sha256.h"
#include "polity/core/hex.h"
#include "polity/core/types.h"

#include <array>
#include <string>

namespace polity {
namespace test {

// ============================================================================
// Known Vectors (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(std::string()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(std::string("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    EXPECT_EQ(SHA256Hash(msg).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionAs) {
    SHA256 hasher;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.Write(reinterpret_cast<const Byte*>(chunk.data()), chunk.size());
    }
    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Finalize(out.data());
    EXPECT_EQ(BytesToHex(out.data(), out.size()),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string msg = "the quick brown fox jumps over the lazy dog";
    SHA256 hasher;
    for (char c : msg) {
        Byte b = static_cast<Byte>(c);
        hasher.Write(&b, 1);
    }
    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Finalize(out.data());
    EXPECT_EQ(Hash256(out), SHA256Hash(msg));
}

TEST(SHA256Test, FinalizeResets) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> first;
    std::array<Byte, SHA256::OUTPUT_SIZE> second;

    const Byte data[] = {'a', 'b', 'c'};
    hasher.Write(data, 3).Finalize(first.data());
    hasher.Write(data, 3).Finalize(second.data());
    EXPECT_EQ(first, second);
}

TEST(SHA256Test, ResetDiscardsInput) {
    SHA256 hasher;
    const Byte junk[] = {1, 2, 3};
    hasher.Write(junk, 3).Reset();

    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Finalize(out.data());
    EXPECT_EQ(Hash256(out), SHA256Hash(std::string()));
}

} // namespace test
} // namespace polity
