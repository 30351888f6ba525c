// POLITY - Serialization Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>

#include "polity/core/serialize.h"

#include <map>
#include <optional>

namespace polity {
namespace {

struct Sample {
    uint64_t id{0};
    std::string name;
    std::optional<uint64_t> parent;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, name);
        ::polity::Serialize(s, parent);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, name);
        ::polity::Unserialize(s, parent);
    }
};

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream ss;
    Serialize(ss, uint64_t{0x0102030405060708});
    ASSERT_EQ(ss.Data().size(), 8u);
    EXPECT_EQ(ss.Data()[0], 0x08);
    EXPECT_EQ(ss.Data()[7], 0x01);
}

TEST(SerializeTest, CompactSizeBoundaries) {
    DataStream small;
    WriteCompactSize(small, 252);
    EXPECT_EQ(small.Data().size(), 1u);

    DataStream medium;
    WriteCompactSize(medium, 253);
    EXPECT_EQ(medium.Data().size(), 3u);
    EXPECT_EQ(medium.Data()[0], 0xFD);
    EXPECT_EQ(ReadCompactSize(medium), 253u);

    DataStream large;
    WriteCompactSize(large, 0x10000);
    EXPECT_EQ(large.Data().size(), 5u);
}

TEST(SerializeTest, RejectsNonCanonicalCompactSize) {
    std::vector<uint8_t> bytes = {0xFD, 0x10, 0x00};
    DataStream ss(bytes);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(SerializeTest, RecordRoundTrip) {
    Sample in;
    in.id = 42;
    in.name = "council";
    in.parent = 7;

    Sample out;
    std::vector<uint8_t> bytes = SerializeToBytes(in);
    ASSERT_TRUE(DeserializeFromBytes(bytes.data(), bytes.size(), out));
    EXPECT_EQ(out.id, 42u);
    EXPECT_EQ(out.name, "council");
    ASSERT_TRUE(out.parent.has_value());
    EXPECT_EQ(*out.parent, 7u);
}

TEST(SerializeTest, DeserializeRejectsTruncatedAndTrailing) {
    Sample in;
    in.name = "abc";
    std::vector<uint8_t> bytes = SerializeToBytes(in);

    Sample out;
    EXPECT_FALSE(DeserializeFromBytes(bytes.data(), bytes.size() - 1, out));

    bytes.push_back(0x00);
    EXPECT_FALSE(DeserializeFromBytes(bytes.data(), bytes.size(), out));
}

TEST(SerializeTest, MapOfBytes) {
    std::map<std::string, std::vector<uint8_t>> in = {{"a", {1, 2}}, {"b", {}}};
    std::vector<uint8_t> bytes = SerializeToBytes(in);

    std::map<std::string, std::vector<uint8_t>> out;
    ASSERT_TRUE(DeserializeFromBytes(bytes.data(), bytes.size(), out));
    EXPECT_EQ(out, in);
}

} // namespace
} // namespace polity
