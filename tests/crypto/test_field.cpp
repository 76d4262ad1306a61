// ZKCOMPLY - Field Arithmetic Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>
#include "zkcomply/crypto/field.h"

#include <string>

namespace zkcomply {
namespace test {

namespace {
const char* const SCALAR_MODULUS =
    "21888242871839275222246405745257275088548364400416034343698204186575808495617";
const char* const BASE_MODULUS =
    "21888242871839275222246405745257275088696311157297823662689037894645226208583";
}

// ============================================================================
// Uint256 Tests
// ============================================================================

TEST(Uint256Test, DefaultIsZero) {
    Uint256 a;
    EXPECT_TRUE(a.IsZero());
    EXPECT_EQ(a.ToDecimal(), "0");
}

TEST(Uint256Test, HexRoundTrip) {
    Uint256 a = Uint256::FromHex("0x01");
    EXPECT_EQ(a.limbs[0], 1ULL);
    EXPECT_EQ(a.ToHex(), "0000000000000000000000000000000000000000000000000000000000000001");
}

TEST(Uint256Test, DecimalParsing) {
    auto v = Uint256::FromDecimal("18446744073709551616");  // 2^64
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->limbs[0], 0ULL);
    EXPECT_EQ(v->limbs[1], 1ULL);
    EXPECT_EQ(v->ToDecimal(), "18446744073709551616");
    
    EXPECT_FALSE(Uint256::FromDecimal("").has_value());
    EXPECT_FALSE(Uint256::FromDecimal("12a").has_value());
    EXPECT_FALSE(Uint256::FromDecimal("-1").has_value());
}

TEST(Uint256Test, ModuliDecimal) {
    EXPECT_EQ(FieldElement::MODULUS.ToDecimal(), SCALAR_MODULUS);
    EXPECT_EQ(BN254_BASE_MODULUS.ToDecimal(), BASE_MODULUS);
    EXPECT_TRUE(FieldElement::MODULUS < BN254_BASE_MODULUS);
}

TEST(Uint256Test, ShiftAndOr) {
    Uint256 one(1);
    Uint256 v = (one << 200) | (one << 3);
    EXPECT_TRUE(v.TestBit(200));
    EXPECT_TRUE(v.TestBit(3));
    EXPECT_FALSE(v.TestBit(4));
    EXPECT_EQ((v >> 200).limbs[0], 1ULL);
}

TEST(Uint256Test, BigEndianBytes) {
    Uint256 v(0x0102);
    auto be = v.ToBigEndianBytes();
    EXPECT_EQ(be[30], 0x01);
    EXPECT_EQ(be[31], 0x02);
    EXPECT_EQ(Uint256::FromBigEndian(be.data(), be.size()), v);
}

// ============================================================================
// FieldElement Tests
// ============================================================================

TEST(FieldElementTest, CanonicalBoundary) {
    auto p = Uint256::FromDecimal(SCALAR_MODULUS);
    ASSERT_TRUE(p.has_value());
    EXPECT_FALSE(FieldElement::IsCanonical(*p));
    
    bool borrow = false;
    Uint256 pMinusOne = Uint256::Sub(*p, Uint256(1), borrow);
    EXPECT_TRUE(FieldElement::IsCanonical(pMinusOne));
    
    EXPECT_FALSE(FieldElement::FromDecimal(SCALAR_MODULUS).has_value());
    EXPECT_TRUE(FieldElement::FromDecimal(pMinusOne.ToDecimal()).has_value());
}

TEST(FieldElementTest, WrapsAtModulus) {
    auto pMinusOne = FieldElement::FromDecimal(
        "21888242871839275222246405745257275088548364400416034343698204186575808495616");
    ASSERT_TRUE(pMinusOne.has_value());
    EXPECT_TRUE((*pMinusOne + FieldElement::One()).IsZero());
    EXPECT_EQ(-FieldElement::One(), *pMinusOne);
}

TEST(FieldElementTest, Arithmetic) {
    FieldElement a(7);
    FieldElement b(5);
    EXPECT_EQ(a + b, FieldElement(12));
    EXPECT_EQ(a - b, FieldElement(2));
    EXPECT_EQ(a * b, FieldElement(35));
    EXPECT_EQ(a.Square(), FieldElement(49));
    EXPECT_EQ(a.Pow(Uint256(3)), FieldElement(343));
}

TEST(FieldElementTest, Inverse) {
    FieldElement a(123456789);
    EXPECT_EQ(a * a.Inverse(), FieldElement::One());
}

TEST(FieldElementTest, DecimalRoundTrip) {
    auto fe = FieldElement::FromDecimal("12345");
    ASSERT_TRUE(fe.has_value());
    EXPECT_EQ(*fe, FieldElement(12345));
    EXPECT_EQ(fe->ToDecimal(), "12345");
    EXPECT_EQ(fe->ToUint256(), Uint256(12345));
}

} // namespace test
} // namespace zkcomply
