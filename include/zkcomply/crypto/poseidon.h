// ZKCOMPLY - Poseidon Hash Function
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field, laid out
// the way circomlib's Poseidon template is: for n inputs the state width is
// t = n + 1, the state starts as [0, in_1, ..., in_n] and the digest is
// state[0] after the permutation.
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458

#ifndef ZKCOMPLY_CRYPTO_POSEIDON_H
#define ZKCOMPLY_CRYPTO_POSEIDON_H

#include <cstdint>
#include <vector>
#include "zkcomply/crypto/field.h"

namespace zkcomply {

// ============================================================================
// Poseidon Configuration
// ============================================================================

/// Poseidon permutation parameters for one state width
struct PoseidonConfig {
    /// State width (t)
    size_t width;
    
    /// Number of full rounds (R_F)
    size_t fullRounds;
    
    /// Number of partial rounds (R_P)
    size_t partialRounds;
    
    /// Number of hash inputs absorbed by one permutation
    size_t inputs() const { return width - 1; }
    
    /// Total rounds
    size_t totalRounds() const { return fullRounds + partialRounds; }
    
    /// Standard x^5 / 128-bit configuration for n inputs (1 <= n <= 16)
    static PoseidonConfig ForInputs(size_t numInputs);
};

// ============================================================================
// Poseidon Parameters
// ============================================================================

/// Round constants and MDS matrix for one width, generated with the
/// reference Grain LFSR. Instances are built once and shared.
class PoseidonParameters {
public:
    /// Shared parameters for the given number of inputs (thread-safe)
    static const PoseidonParameters& ForInputs(size_t numInputs);
    
    const PoseidonConfig& Config() const { return config_; }
    
    /// Round constant for element i of round r
    const FieldElement& RoundConstant(size_t round, size_t i) const {
        return roundConstants_[round * config_.width + i];
    }
    
    /// MDS matrix entry
    const FieldElement& Mds(size_t row, size_t col) const {
        return mds_[row][col];
    }
    
    explicit PoseidonParameters(const PoseidonConfig& config);

private:
    PoseidonConfig config_;
    std::vector<FieldElement> roundConstants_;
    std::vector<std::vector<FieldElement>> mds_;
};

// ============================================================================
// Poseidon Hash Class
// ============================================================================

/// Fixed-arity Poseidon hasher
class Poseidon {
public:
    /// Largest supported arity
    static constexpr size_t MAX_INPUTS = 16;
    
    /// Create a hasher for exactly numInputs inputs.
    /// Throws std::invalid_argument outside [1, MAX_INPUTS].
    explicit Poseidon(size_t numInputs);
    
    /// Hash exactly Config().inputs() elements
    FieldElement Digest(const std::vector<FieldElement>& inputs);
    
    const PoseidonConfig& Config() const { return params_.Config(); }
    
    /// Hash a vector of 1..16 field elements to a single field element
    static FieldElement Hash(const std::vector<FieldElement>& inputs);
    
    /// Hash two field elements (2-to-1 compression used by Merkle trees)
    static FieldElement Hash2(const FieldElement& left, const FieldElement& right);

private:
    const PoseidonParameters& params_;
    
    /// Permutation state
    std::vector<FieldElement> state_;
    
    /// Apply the Poseidon permutation to the state
    void Permute();
    
    /// Apply full round (S-box on all elements)
    void FullRound(size_t roundIdx);
    
    /// Apply partial round (S-box on first element only)
    void PartialRound(size_t roundIdx);
    
    /// Add round constants to state
    void AddRoundConstants(size_t roundIdx);
    
    /// Apply MDS matrix multiplication
    void MixColumns();
};

} // namespace zkcomply

#endif // ZKCOMPLY_CRYPTO_POSEIDON_H
