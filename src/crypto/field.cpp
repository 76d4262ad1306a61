// ZKCOMPLY - Finite Field Arithmetic Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Implements Montgomery arithmetic over the BN254 scalar field

#include "zkcomply/crypto/field.h"
#include <cstring>
#include <stdexcept>

namespace zkcomply {

// ============================================================================
// BN254 Constants
// ============================================================================

// p = 21888242871839275222246405745257275088548364400416034343698204186575808495617
// In hex: 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
const Uint256 FieldElement::MODULUS{
    0x43e1f593f0000001ULL,  // limb 0 (least significant)
    0x2833e84879b97091ULL,  // limb 1
    0xb85045b68181585dULL,  // limb 2
    0x30644e72e131a029ULL   // limb 3 (most significant)
};

// R = 2^256 mod p
const Uint256 FieldElement::R{
    0xac96341c4ffffffbULL,
    0x36fc76959f60cd29ULL,
    0x666ea36f7879462eULL,
    0x0e0a77c19a07df2fULL
};

// R^2 mod p
const Uint256 FieldElement::R2{
    0x1bb8e645ae216da7ULL,
    0x53fe3ab1e35c59e3ULL,
    0x8c49833d53bb8085ULL,
    0x0216d0b17f4e44a5ULL
};

// -p^(-1) mod 2^64
const uint64_t FieldElement::INV = 0xc2e1f593efffffffULL;

// q = 0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47
const Uint256 BN254_BASE_MODULUS{
    0x3c208c16d87cfd47ULL,
    0x97816a916871ca8dULL,
    0xb85045b68181585dULL,
    0x30644e72e131a029ULL
};

namespace {

/// 10^19, the largest power of ten that fits a limb
constexpr uint64_t DECIMAL_CHUNK = 10000000000000000000ULL;
constexpr size_t DECIMAL_CHUNK_DIGITS = 19;

/// 2^256 has 78 decimal digits
constexpr size_t MAX_DECIMAL_DIGITS = 78;

} // anonymous namespace

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256::Uint256(const Byte* data, size_t len) : limbs{0, 0, 0, 0} {
    size_t n = std::min(len, size_t(32));
    for (size_t i = 0; i < n; ++i) {
        limbs[i / 8] |= static_cast<uint64_t>(data[i]) << (8 * (i % 8));
    }
}

Uint256 Uint256::FromBigEndian(const Byte* data, size_t len) {
    if (len > 32) {
        throw std::invalid_argument("Big-endian input longer than 32 bytes");
    }
    Byte le[32] = {0};
    for (size_t i = 0; i < len; ++i) {
        le[i] = data[len - 1 - i];
    }
    return Uint256(le, 32);
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = hex;
    
    // Remove 0x prefix if present
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.empty() || h.size() > 64) {
        throw std::invalid_argument("Invalid hex length for Uint256");
    }
    
    auto hexCharToNibble = [](char c) -> uint64_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };
    
    // Least significant nibble is the last character
    Uint256 result;
    for (size_t i = 0; i < h.size(); ++i) {
        size_t nibble = h.size() - 1 - i;
        result.limbs[nibble / 16] |= hexCharToNibble(h[i]) << (4 * (nibble % 16));
    }
    return result;
}

std::optional<Uint256> Uint256::FromDecimal(const std::string& dec) {
    if (dec.empty() || dec.size() > MAX_DECIMAL_DIGITS) {
        return std::nullopt;
    }
    
    Uint256 result;
    for (char c : dec) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t carry = static_cast<uint64_t>(c - '0');
        for (size_t i = 0; i < NUM_LIMBS; ++i) {
            __uint128_t acc = static_cast<__uint128_t>(result.limbs[i]) * 10 + carry;
            result.limbs[i] = static_cast<uint64_t>(acc);
            carry = static_cast<uint64_t>(acc >> 64);
        }
        if (carry != 0) {
            return std::nullopt;
        }
    }
    return result;
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(64);
    
    // Output from most significant limb to least
    for (int i = 3; i >= 0; --i) {
        for (int j = 60; j >= 0; j -= 4) {
            result.push_back(hexChars[(limbs[i] >> j) & 0x0F]);
        }
    }
    
    return result;
}

std::string Uint256::ToDecimal() const {
    if (IsZero()) {
        return "0";
    }
    
    Uint256 v = *this;
    std::string out;
    while (!v.IsZero()) {
        std::string chunk = std::to_string(v.DivModSmall(DECIMAL_CHUNK));
        if (!v.IsZero()) {
            chunk.insert(0, DECIMAL_CHUNK_DIGITS - chunk.size(), '0');
        }
        out.insert(0, chunk);
    }
    return out;
}

std::array<Byte, 32> Uint256::ToBytes() const {
    std::array<Byte, 32> result;
    for (size_t i = 0; i < 32; ++i) {
        result[i] = static_cast<Byte>(limbs[i / 8] >> (8 * (i % 8)));
    }
    return result;
}

std::array<Byte, 32> Uint256::ToBigEndianBytes() const {
    std::array<Byte, 32> le = ToBytes();
    std::array<Byte, 32> result;
    for (size_t i = 0; i < 32; ++i) {
        result[i] = le[31 - i];
    }
    return result;
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

bool Uint256::TestBit(size_t i) const {
    if (i >= 256) return false;
    return ((limbs[i / 64] >> (i % 64)) & 1) != 0;
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

Uint256 Uint256::operator|(const Uint256& other) const {
    return Uint256(limbs[0] | other.limbs[0], limbs[1] | other.limbs[1],
                   limbs[2] | other.limbs[2], limbs[3] | other.limbs[3]);
}

Uint256 Uint256::operator^(const Uint256& other) const {
    return Uint256(limbs[0] ^ other.limbs[0], limbs[1] ^ other.limbs[1],
                   limbs[2] ^ other.limbs[2], limbs[3] ^ other.limbs[3]);
}

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;
    
    for (int i = 0; i < 4; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) + 
                          static_cast<__uint128_t>(b.limbs[i]) + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }
    
    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;
    
    for (int i = 0; i < 4; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) - 
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>(diff >> 127) & 1;
    }
    
    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook 256x256 -> 512 with 64-bit limbs
    __uint128_t products[8] = {0};
    
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) * 
                               static_cast<__uint128_t>(b.limbs[j]);
            products[i + j] += prod & 0xFFFFFFFFFFFFFFFFULL;
            products[i + j + 1] += prod >> 64;
        }
    }
    
    uint64_t result[8];
    __uint128_t carry = 0;
    for (int i = 0; i < 8; ++i) {
        __uint128_t sum = products[i] + carry;
        result[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }
    
    high = Uint256(result[4], result[5], result[6], result[7]);
    return Uint256(result[0], result[1], result[2], result[3]);
}

uint64_t Uint256::DivModSmall(uint64_t divisor) {
    if (divisor == 0) {
        throw std::invalid_argument("Division by zero");
    }
    __uint128_t rem = 0;
    for (int i = 3; i >= 0; --i) {
        __uint128_t cur = (rem << 64) | limbs[i];
        limbs[i] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    return static_cast<uint64_t>(rem);
}

Uint256 Uint256::operator<<(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();
    
    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    
    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > limbShift) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    
    return result;
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift == 0) return *this;
    if (shift >= 256) return Uint256();
    
    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    
    for (int i = 0; i < 4 - limbShift; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    
    return result;
}

// ============================================================================
// FieldElement Implementation
// ============================================================================

FieldElement::FieldElement() : value() {}

FieldElement::FieldElement(const Uint256& val) {
    // val * R^2 * R^-1 = val * R, fully reduced for any 256-bit input
    value = MontMul(val, R2);
}

FieldElement::FieldElement(uint64_t val) {
    value = MontMul(Uint256(val), R2);
}

FieldElement FieldElement::Zero() {
    return FieldElement();
}

FieldElement FieldElement::One() {
    FieldElement fe;
    fe.value = R;  // R is the Montgomery form of 1
    return fe;
}

bool FieldElement::IsCanonical(const Uint256& val) {
    return val < MODULUS;
}

std::optional<FieldElement> FieldElement::FromDecimal(const std::string& dec) {
    auto parsed = Uint256::FromDecimal(dec);
    if (!parsed || !IsCanonical(*parsed)) {
        return std::nullopt;
    }
    return FieldElement(*parsed);
}

Uint256 FieldElement::ToUint256() const {
    return MontMul(value, Uint256(1));
}

std::string FieldElement::ToDecimal() const {
    return ToUint256().ToDecimal();
}

std::array<Byte, 32> FieldElement::ToBytes() const {
    return ToUint256().ToBytes();
}

FieldElement FieldElement::FromBytes(const Byte* data, size_t len) {
    return FieldElement(Uint256(data, len));
}

FieldElement FieldElement::FromHex(const std::string& hex) {
    return FieldElement(Uint256::FromHex(hex));
}

bool FieldElement::IsZero() const {
    return value.IsZero();
}

bool FieldElement::operator==(const FieldElement& other) const {
    return value == other.value;
}

bool FieldElement::operator!=(const FieldElement& other) const {
    return value != other.value;
}

Uint256 FieldElement::ModAdd(const Uint256& a, const Uint256& b) {
    bool carry;
    Uint256 sum = Uint256::Add(a, b, carry);
    
    if (carry || sum >= MODULUS) {
        bool borrow;
        sum = Uint256::Sub(sum, MODULUS, borrow);
    }
    
    return sum;
}

Uint256 FieldElement::ModSub(const Uint256& a, const Uint256& b) {
    bool borrow;
    Uint256 diff = Uint256::Sub(a, b, borrow);
    
    if (borrow) {
        bool carry;
        diff = Uint256::Add(diff, MODULUS, carry);
    }
    
    return diff;
}

Uint256 FieldElement::MontMul(const Uint256& a, const Uint256& b) {
    Uint256 hi;
    Uint256 lo = Uint256::Mul(a, b, hi);
    return MontReduce(lo, hi);
}

Uint256 FieldElement::MontReduce(const Uint256& lo, const Uint256& hi) {
    // Word-by-word Montgomery reduction of the 512-bit value (hi:lo)
    Uint256 result = lo;
    Uint256 high = hi;
    
    for (int i = 0; i < 4; ++i) {
        uint64_t m = result.limbs[0] * INV;
        
        __uint128_t carry = 0;
        for (int j = 0; j < 4; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(m) * MODULUS.limbs[j];
            __uint128_t sum = static_cast<__uint128_t>(result.limbs[j]) + prod + carry;
            result.limbs[j] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }
        
        for (int j = 0; j < 4 && carry; ++j) {
            __uint128_t sum = static_cast<__uint128_t>(high.limbs[j]) + carry;
            high.limbs[j] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }
        
        // Lowest limb is now zero; shift the window down one limb
        result.limbs[0] = result.limbs[1];
        result.limbs[1] = result.limbs[2];
        result.limbs[2] = result.limbs[3];
        result.limbs[3] = high.limbs[0];
        
        high.limbs[0] = high.limbs[1];
        high.limbs[1] = high.limbs[2];
        high.limbs[2] = high.limbs[3];
        high.limbs[3] = 0;
    }
    
    if (result >= MODULUS) {
        bool borrow;
        result = Uint256::Sub(result, MODULUS, borrow);
    }
    
    return result;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
    FieldElement result;
    result.value = ModAdd(value, other.value);
    return result;
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    FieldElement result;
    result.value = ModSub(value, other.value);
    return result;
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    FieldElement result;
    result.value = MontMul(value, other.value);
    return result;
}

FieldElement FieldElement::operator-() const {
    if (IsZero()) return *this;
    FieldElement result;
    bool borrow;
    result.value = Uint256::Sub(MODULUS, value, borrow);
    return result;
}

FieldElement& FieldElement::operator+=(const FieldElement& other) {
    value = ModAdd(value, other.value);
    return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& other) {
    value = ModSub(value, other.value);
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& other) {
    value = MontMul(value, other.value);
    return *this;
}

FieldElement FieldElement::Square() const {
    return (*this) * (*this);
}

FieldElement FieldElement::Pow(const Uint256& exp) const {
    FieldElement result = One();
    FieldElement base = *this;
    
    // Square-and-multiply from LSB
    for (size_t i = 0; i < 256; ++i) {
        if (exp.TestBit(i)) {
            result *= base;
        }
        base = base.Square();
    }
    
    return result;
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) return Zero();
    
    // Fermat: a^(p-2)
    bool borrow;
    Uint256 pMinus2 = Uint256::Sub(MODULUS, Uint256(2), borrow);
    return Pow(pMinus2);
}

FieldElement FieldElement::PoseidonSbox() const {
    FieldElement x2 = Square();
    FieldElement x4 = x2.Square();
    return x4 * (*this);
}

} // namespace zkcomply
