// ZKCOMPLY - Core Types Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>
#include "zkcomply/core/hex.h"
#include "zkcomply/core/random.h"
#include "zkcomply/core/types.h"

#include <stdexcept>

namespace zkcomply {
namespace test {

TEST(HexTest, RoundTrip) {
    std::vector<HexByte> bytes = {0x00, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "00abff");
    EXPECT_EQ(HexToBytes("00ABff"), bytes);
    EXPECT_TRUE(IsValidHex("00abff"));
    EXPECT_FALSE(IsValidHex("0g"));
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
}

TEST(Hash256Test, HexPrefixAccepted) {
    std::string hex(64, 'a');
    Hash256 a = Hash256::FromHex(hex);
    Hash256 b = Hash256::FromHex("0x" + hex);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.ToHex(), hex);
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
}

TEST(Hash256Test, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
}

TEST(RandomTest, BytesDiffer) {
    Hash256 a = GetRandHash256();
    Hash256 b = GetRandHash256();
    EXPECT_NE(a, b);
}

TEST(RandomTest, IntWithinRange) {
    for (int i = 0; i < 100; ++i) {
        EXPECT_LT(GetRandInt(10), 10u);
    }
}

} // namespace test
} // namespace zkcomply
