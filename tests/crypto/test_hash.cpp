// STAKELEDGER - Hash Function Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/core/hex.h"
#include "stakeledger/crypto/hash.h"

#include <string>
#include <vector>

using namespace stakeledger;

namespace {

std::vector<Byte> Bytes(const std::string& str) {
    return std::vector<Byte>(str.begin(), str.end());
}

} // anonymous namespace

// ============================================================================
// SHA-256 Test Vectors
// ============================================================================

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(SHA256Hash(Bytes("")).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(Bytes("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ============================================================================
// HASH160
// ============================================================================

TEST(Hash160Test, EmptyInput) {
    EXPECT_EQ(ComputeHash160(Bytes("")).ToHex(), "b472a266d0bd89c13706a4132ccfb16f7c3b9fcb");
}

TEST(Hash160Test, GeneratorPublicKey) {
    std::vector<Byte> pub =
        HexToBytes("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    EXPECT_EQ(ComputeHash160(pub).ToHex(), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

// ============================================================================
// Call Digests
// ============================================================================

class CallDigestTest : public ::testing::Test {
protected:
    Hash160 alice_ = Hash160::FromHex("1111111111111111111111111111111111111111");
    Hash160 bob_ = Hash160::FromHex("2222222222222222222222222222222222222222");
};

TEST_F(CallDigestTest, Deterministic) {
    std::vector<Byte> payload = {1, 2, 3};
    EXPECT_EQ(MakeCallDigest("stake", alice_, payload),
              MakeCallDigest("stake", alice_, payload));
}

TEST_F(CallDigestTest, BindsMethodCallerAndPayload) {
    std::vector<Byte> payload = {1, 2, 3};
    Hash256 base = MakeCallDigest("stake", alice_, payload);
    
    EXPECT_NE(base, MakeCallDigest("unstake", alice_, payload));
    EXPECT_NE(base, MakeCallDigest("stake", bob_, payload));
    EXPECT_NE(base, MakeCallDigest("stake", alice_, {1, 2, 4}));
}

TEST_F(CallDigestTest, MethodBoundaryIsUnambiguous) {
    // Length prefixes keep "ab"+"c" and "a"+"bc" apart
    EXPECT_NE(MakeCallDigest("ab", alice_, {'c'}), MakeCallDigest("a", alice_, {'b', 'c'}));
}
