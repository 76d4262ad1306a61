// ZKCOMPLY - Keccak-256 Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>
#include "zkcomply/crypto/keccak.h"

#include <string>
#include <vector>

namespace zkcomply {
namespace test {

TEST(Keccak256Test, EmptyInput) {
    EXPECT_EQ(Keccak256Hash(std::string()).ToHex(),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, Abc) {
    EXPECT_EQ(Keccak256Hash(std::string("abc")).ToHex(),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, IncrementalMatchesOneShot) {
    std::string data(300, 'x');  // crosses the 136-byte rate twice
    Hash256 oneShot = Keccak256Hash(data);
    
    Keccak256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(data.data()), 100);
    hasher.Write(reinterpret_cast<const Byte*>(data.data()) + 100, 200);
    Hash256 incremental;
    hasher.Finalize(incremental.data());
    
    EXPECT_EQ(incremental, oneShot);
}

TEST(Keccak256Test, ResetStartsOver) {
    Keccak256 hasher;
    const Byte junk[] = {1, 2, 3};
    hasher.Write(junk, sizeof(junk));
    hasher.Reset();
    Hash256 out;
    hasher.Finalize(out.data());
    EXPECT_EQ(out, Keccak256Hash(std::vector<Byte>{}));
}

} // namespace test
} // namespace zkcomply
