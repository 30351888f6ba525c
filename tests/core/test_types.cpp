// POLITY - Core Types Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>

#include "polity/core/hex.h"
#include "polity/core/status.h"
#include "polity/core/types.h"

#include <set>

namespace polity {
namespace {

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, EncodeDecode) {
    std::vector<uint8_t> bytes = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "0001abff");
    EXPECT_EQ(HexToBytes("0001ABff"), bytes);
}

TEST(HexTest, RejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0g"));
    EXPECT_TRUE(IsValidHex("00ff"));
}

// ============================================================================
// Hash256
// ============================================================================

TEST(Hash256Test, DefaultIsNull) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    EXPECT_EQ(hash.size(), 32u);
}

TEST(Hash256Test, HexRoundTrip) {
    std::string hex = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    Hash256 hash = Hash256::FromHex(hex);
    EXPECT_FALSE(hash.IsNull());
    EXPECT_EQ(hash[0], 0x00);
    EXPECT_EQ(hash[1], 0x11);
    EXPECT_EQ(hash.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("0011"), std::invalid_argument);
}

TEST(Hash256Test, Ordering) {
    Hash256 a = Hash256::FromHex(std::string(63, '0') + "1");
    Hash256 b = Hash256::FromHex(std::string(63, '0') + "2");
    EXPECT_TRUE(a < b);
    EXPECT_NE(a, b);
    std::set<Hash256> set{b, a, a};
    EXPECT_EQ(set.size(), 2u);
}

// ============================================================================
// Status
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, CodesAndMessages) {
    Status s = Status::TransitionInProgress("org 7");
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s.IsTransitionInProgress());
    EXPECT_EQ(s.message(), "org 7");
    EXPECT_EQ(s.ToString(), "TransitionInProgress: org 7");

    Status invite(Status::INVITE_EXPIRED, "late");
    EXPECT_EQ(invite.code(), Status::INVITE_EXPIRED);
    EXPECT_EQ(invite.ToString(), "InviteExpired: late");
}

TEST(StatusTest, CodeNames) {
    EXPECT_STREQ(Status::CodeName(Status::DEPTH_EXCEEDED), "DepthExceeded");
    EXPECT_STREQ(Status::CodeName(Status::ALREADY_MEMBER), "AlreadyMember");
    EXPECT_STREQ(Status::CodeName(Status::INDEX_FULL), "IndexFull");
}

} // namespace
} // namespace polity
