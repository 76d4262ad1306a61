// ZKCOMPLY - Keccak-256 Hash Function
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Keccak-256 as used by the EVM (original Keccak padding, not FIPS-202
// SHA3-256). Used for off-circuit bookkeeping: proof hashes, snapshot
// fingerprints and identity derivation.

#ifndef ZKCOMPLY_CRYPTO_KECCAK_H
#define ZKCOMPLY_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "zkcomply/core/types.h"

namespace zkcomply {

/// Keccak-256 hasher class with incremental interface
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;
    
    Keccak256();
    
    /// Absorb data
    Keccak256& Write(const Byte* data, size_t len);
    
    /// Pad, squeeze and write OUTPUT_SIZE bytes to hash
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    Keccak256& Reset();

private:
    /// Sponge state as 25 lanes
    uint64_t state_[25];
    
    /// Bytes absorbed into the current block
    size_t offset_;
    
    /// XOR one byte into the state at the given block offset
    void XorByte(size_t pos, Byte value);
    
    /// Keccak-f[1600] permutation
    void Permute();
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

inline Hash256 Keccak256Hash(const std::string& data) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace zkcomply

#endif // ZKCOMPLY_CRYPTO_KECCAK_H
