// STAKELEDGER - Core Types Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/core/hex.h"
#include "stakeledger/core/types.h"

#include <unordered_set>

using namespace stakeledger;

// ============================================================================
// Hash Tests
// ============================================================================

TEST(Hash160Test, DefaultIsNull) {
    Hash160 hash;
    EXPECT_TRUE(hash.IsNull());
    EXPECT_EQ(hash.size(), 20u);
}

TEST(Hash160Test, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff01234567";
    Hash160 hash = Hash160::FromHex(hex);
    EXPECT_FALSE(hash.IsNull());
    EXPECT_EQ(hash[0], 0x00);
    EXPECT_EQ(hash[1], 0x11);
    EXPECT_EQ(hash.ToHex(), hex);
}

TEST(Hash160Test, FromHexInvalid) {
    EXPECT_THROW(Hash160::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex(std::string(40, 'z')), std::invalid_argument);
}

TEST(Hash160Test, ShortBytesAreZeroPadded) {
    Byte raw[3] = {1, 2, 3};
    Hash160 hash(raw, sizeof(raw));
    EXPECT_EQ(hash[2], 3);
    EXPECT_EQ(hash[3], 0);
    EXPECT_EQ(hash[19], 0);
}

TEST(Hash160Test, Ordering) {
    Hash160 a = Hash160::FromHex("0000000000000000000000000000000000000001");
    Hash160 b = Hash160::FromHex("0000000000000000000000000000000000000002");
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
}

TEST(Hash160Test, UsableAsUnorderedKey) {
    std::unordered_set<Address> set;
    set.insert(Hash160::FromHex("0101010101010101010101010101010101010101"));
    set.insert(Hash160::FromHex("0101010101010101010101010101010101010101"));
    set.insert(Hash160::FromHex("0202020202020202020202020202020202020202"));
    EXPECT_EQ(set.size(), 2u);
}

TEST(Hash256Test, SetNull) {
    Hash256 hash = Hash256::FromHex(std::string(64, 'f'));
    EXPECT_FALSE(hash.IsNull());
    hash.SetNull();
    EXPECT_TRUE(hash.IsNull());
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHexIsLowercase) {
    std::vector<uint8_t> data = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(BytesToHex(data), "deadbeef");
}

TEST(HexTest, HexToBytesAcceptsUppercase) {
    EXPECT_EQ(HexToBytes("DEADbeef"), (std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
}

TEST(HexTest, HexToBytesRejectsOddLength) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0g"));
    EXPECT_FALSE(IsValidHex("abc"));
}

// ============================================================================
// Time Tests
// ============================================================================

TEST(TimestampTest, GetTimeIsRecent) {
    // 2023-11-14 as a lower bound
    EXPECT_GT(GetTime(), 1700000000);
}
