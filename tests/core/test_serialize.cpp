// STAKEVAULT - Serialization Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/core/hex.h>
#include <stakevault/core/serialize.h>
#include <stakevault/core/types.h>

#include <string>
#include <vector>

using namespace stakevault;

// ============================================================================
// DataStream
// ============================================================================

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());

    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    ds.Write(data.data(), data.size());
    EXPECT_EQ(ds.size(), 3u);

    uint8_t out[2];
    ds.Read(out, 2);
    EXPECT_EQ(out[0], 0x01);
    EXPECT_EQ(out[1], 0x02);
    EXPECT_EQ(ds.size(), 1u);
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds;
    ds << static_cast<uint8_t>(1);
    uint32_t value;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, IntegersAreLittleEndian) {
    DataStream ds;
    ds << static_cast<uint32_t>(0x01020304);
    EXPECT_EQ(BytesToHex(ds.data(), ds.size()), "04030201");

    uint32_t value = 0;
    ds >> value;
    EXPECT_EQ(value, 0x01020304u);
}

TEST(DataStreamTest, SignedTimestamp) {
    DataStream ds;
    int64_t in = -86400;
    ds << in;
    int64_t out = 0;
    ds >> out;
    EXPECT_EQ(out, in);
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(CompactSizeTest, Boundaries) {
    DataStream ds;
    WriteCompactSize(ds, 252);
    EXPECT_EQ(ds.size(), 1u);
    EXPECT_EQ(ReadCompactSize(ds), 252u);

    WriteCompactSize(ds, 253);
    EXPECT_EQ(ds.size(), 5u);
    EXPECT_EQ(ReadCompactSize(ds), 253u);
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ds;
    ser_writedata8(ds, 0xFE);
    ser_writedata32(ds, 10);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// Wide Integers and Containers
// ============================================================================

TEST(SerializeTest, Uint256IsBigEndian32Bytes) {
    DataStream ds;
    ds << uint256(1);
    EXPECT_EQ(ds.size(), 32u);
    EXPECT_EQ(BytesToHex(ds.data(), ds.size()), std::string(62, '0') + "01");

    uint256 out;
    ds >> out;
    EXPECT_EQ(out, uint256(1));
}

TEST(SerializeTest, NegativeInt256) {
    DataStream ds;
    ds << int256(-12345);
    int256 out;
    ds >> out;
    EXPECT_EQ(out, int256(-12345));
}

TEST(SerializeTest, VectorOfHashes) {
    std::vector<Hash256> in(3);
    in[1][0] = 0xaa;
    in[2][31] = 0xbb;

    DataStream ds;
    ds << in;
    EXPECT_EQ(ds.size(), 1u + 3 * 32);

    std::vector<Hash256> out;
    ds >> out;
    EXPECT_EQ(out, in);
}

TEST(SerializeTest, StringAndBytes) {
    DataStream ds;
    ds << std::string("QmHash") << std::vector<uint8_t>{1, 2, 3} << Address();

    std::string s;
    std::vector<uint8_t> bytes;
    Address addr;
    ds >> s >> bytes >> addr;
    EXPECT_EQ(s, "QmHash");
    EXPECT_EQ(bytes, (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_TRUE(addr.IsNull());
    EXPECT_TRUE(ds.empty());
}
