// STAKELEDGER - Serialization Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/core/serialize.h"
#include "stakeledger/core/types.h"
#include <limits>
#include <string>
#include <vector>

using namespace stakeledger;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());
    
    EXPECT_EQ(ds.size(), 4u);
    
    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds;
    ds << uint8_t(1);
    
    uint32_t value;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(DataStreamTest, ToVectorAndToStringReturnUnreadData) {
    DataStream ds;
    ds << uint8_t(0xAA) << uint8_t(0xBB) << uint8_t(0xCC);
    
    uint8_t first;
    ds >> first;
    EXPECT_EQ(first, 0xAA);
    EXPECT_EQ(ds.ToVector(), (std::vector<uint8_t>{0xBB, 0xCC}));
    EXPECT_EQ(ds.ToString(), std::string("\xBB\xCC"));
    EXPECT_EQ(ds.ToHex(), "bbcc");
}

// ============================================================================
// Integer Serialization Tests (Little-Endian)
// ============================================================================

TEST(SerializeTest, Uint32IsLittleEndian) {
    DataStream ds;
    ds << uint32_t(0x12345678);
    EXPECT_EQ(ds.ToHex(), "78563412");
}

TEST(SerializeTest, NegativeInt64) {
    DataStream ds;
    ds << int64_t(-2);
    EXPECT_EQ(ds.ToHex(), "feffffffffffffff");
    
    int64_t value = 0;
    ds >> value;
    EXPECT_EQ(value, -2);
}

TEST(SerializeTest, Int64Extremes) {
    DataStream ds;
    ds << std::numeric_limits<int64_t>::max() << std::numeric_limits<int64_t>::min();
    
    int64_t hi = 0, lo = 0;
    ds >> hi >> lo;
    EXPECT_EQ(hi, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(lo, std::numeric_limits<int64_t>::min());
}

TEST(SerializeTest, Bool) {
    DataStream ds;
    ds << true << false;
    EXPECT_EQ(ds.ToHex(), "0100");
    
    bool a = false, b = true;
    ds >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}

// ============================================================================
// Variable Length Tests
// ============================================================================

TEST(SerializeTest, StringHasCompactSizePrefix) {
    DataStream ds;
    ds << std::string("stake");
    EXPECT_EQ(ds.ToHex(), "057374616b65");
    
    std::string value;
    ds >> value;
    EXPECT_EQ(value, "stake");
}

TEST(SerializeTest, LongByteVectorUsesThreeByteSize) {
    std::vector<uint8_t> data(300, 0x5A);
    DataStream ds;
    ds << data;
    EXPECT_EQ(ds.size(), 303u);
    
    std::vector<uint8_t> result;
    ds >> result;
    EXPECT_EQ(result, data);
}

TEST(SerializeTest, NonCanonicalSizeRejected) {
    // 0xfd marker carrying a value that fits in one byte
    std::vector<uint8_t> bytes = {0xfd, 0x05, 0x00};
    DataStream ds(bytes);
    
    std::string value;
    EXPECT_THROW(ds >> value, std::ios_base::failure);
}

TEST(SerializeTest, Hash160IsRawBytes) {
    std::array<Byte, 20> raw{};
    raw[0] = 0x01;
    raw[19] = 0xff;
    Hash160 hash(raw);
    
    DataStream ds;
    ds << hash;
    EXPECT_EQ(ds.size(), Hash160::SIZE);
    
    Hash160 decoded;
    ds >> decoded;
    EXPECT_EQ(decoded, hash);
}
