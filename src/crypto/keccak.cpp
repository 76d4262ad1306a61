// ZKCOMPLY - Keccak-256 Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Keccak-f[1600] sponge with 1088-bit rate and 0x01 multi-rate padding.
// Reference: https://keccak.team/keccak_specs_summary.html

#include "zkcomply/crypto/keccak.h"
#include <cstring>

namespace zkcomply {

// ============================================================================
// Keccak Constants
// ============================================================================

namespace {

constexpr uint64_t ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

/// Rho rotation offsets in pi traversal order
constexpr int ROTATIONS[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

/// Pi lane traversal order
constexpr int PI_LANES[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

inline uint64_t Rotl64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

} // anonymous namespace

// ============================================================================
// Keccak256 Implementation
// ============================================================================

Keccak256::Keccak256() {
    Reset();
}

Keccak256& Keccak256::Reset() {
    std::memset(state_, 0, sizeof(state_));
    offset_ = 0;
    return *this;
}

void Keccak256::XorByte(size_t pos, Byte value) {
    // Lanes are little-endian
    state_[pos / 8] ^= static_cast<uint64_t>(value) << (8 * (pos % 8));
}

void Keccak256::Permute() {
    uint64_t bc[5];
    
    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = state_[i] ^ state_[i + 5] ^ state_[i + 10] ^
                    state_[i + 15] ^ state_[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ Rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                state_[j + i] ^= t;
            }
        }
        
        // Rho and Pi
        uint64_t carry = state_[1];
        for (int i = 0; i < 24; ++i) {
            int lane = PI_LANES[i];
            uint64_t tmp = state_[lane];
            state_[lane] = Rotl64(carry, ROTATIONS[i]);
            carry = tmp;
        }
        
        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = state_[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                state_[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }
        
        // Iota
        state_[0] ^= ROUND_CONSTANTS[round];
    }
}

Keccak256& Keccak256::Write(const Byte* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        XorByte(offset_++, data[i]);
        if (offset_ == RATE) {
            Permute();
            offset_ = 0;
        }
    }
    return *this;
}

void Keccak256::Finalize(Byte hash[OUTPUT_SIZE]) {
    XorByte(offset_, 0x01);
    XorByte(RATE - 1, 0x80);
    Permute();
    
    for (size_t i = 0; i < OUTPUT_SIZE; ++i) {
        hash[i] = static_cast<Byte>(state_[i / 8] >> (8 * (i % 8)));
    }
    Reset();
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Keccak256 hasher;
    hasher.Write(data, len);
    hasher.Finalize(result.data());
    return result;
}

} // namespace zkcomply
