// ZKCOMPLY - Secure Random Number Generation Header
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Cryptographically secure randomness for salts and test fixtures,
// backed by the OpenSSL CSPRNG.

#ifndef ZKCOMPLY_CORE_RANDOM_H
#define ZKCOMPLY_CORE_RANDOM_H

#include "zkcomply/core/types.h"
#include <cstdint>
#include <cstddef>

namespace zkcomply {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the generator cannot be seeded.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max)
/// Uses rejection sampling to avoid modulo bias
uint64_t GetRandInt(uint64_t max);

/// Generate random 256-bit hash
Hash256 GetRandHash256();

} // namespace zkcomply

#endif // ZKCOMPLY_CORE_RANDOM_H
