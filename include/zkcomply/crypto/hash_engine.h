// ZKCOMPLY - Hash Engine
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Single entry point for every hash the compliance pipeline computes.
// Circuit-visible values (leaves, Merkle nodes, nullifiers, commitments)
// use Poseidon so the circuits can recompute them; bookkeeping digests
// (proof hashes, snapshot fingerprints, identity derivation) use Keccak-256.

#ifndef ZKCOMPLY_CRYPTO_HASH_ENGINE_H
#define ZKCOMPLY_CRYPTO_HASH_ENGINE_H

#include <string>
#include <vector>
#include "zkcomply/core/types.h"
#include "zkcomply/crypto/field.h"

namespace zkcomply {

class HashEngine {
public:
    /// Poseidon over 1..16 elements (throws std::invalid_argument otherwise)
    static FieldElement Hash(const std::vector<FieldElement>& inputs);
    
    /// Merkle leaf of an identity: H(identity)
    static FieldElement HashLeaf(const FieldElement& identity);
    
    /// Merkle inner node: H(left, right)
    static FieldElement HashPair(const FieldElement& left, const FieldElement& right);
    
    /// Commitment to hidden values: H(values..., salt)
    static FieldElement Commit(const std::vector<FieldElement>& values,
                               const FieldElement& salt);
    
    /// Fresh uniformly random salt
    static FieldElement GenerateSalt();
    
    /// Identity of an external address or credential: keccak256(data) mod p
    static FieldElement DeriveIdentity(const Byte* data, size_t len);
    static FieldElement DeriveIdentity(const std::string& credential);
    
    /// Keccak-256 digest for off-circuit bookkeeping
    static Hash256 Keccak(const Byte* data, size_t len);
    static Hash256 Keccak(const std::vector<Byte>& data);
    
    /// Keccak-256 over the 32-byte big-endian encodings of field elements
    static Hash256 Fingerprint(const std::vector<FieldElement>& elements);
};

} // namespace zkcomply

#endif // ZKCOMPLY_CRYPTO_HASH_ENGINE_H
