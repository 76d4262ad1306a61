// ZKCOMPLY - Groth16 Verification Keys
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#ifndef ZKCOMPLY_VERIFIER_VERIFICATION_KEY_H
#define ZKCOMPLY_VERIFIER_VERIFICATION_KEY_H

#include <map>
#include <string>
#include <vector>

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/crypto/field.h"
#include "zkcomply/util/json.h"

namespace zkcomply {
namespace verifier {

/// Affine G1 point; (0, 0) encodes infinity
struct G1Affine {
    Uint256 x;
    Uint256 y;
};

/// Affine G2 point over Fp2 = c0 + c1*u
struct G2Affine {
    Uint256 x0, x1;
    Uint256 y0, y1;
};

/**
 * Groth16 verification key in snarkjs layout.
 *
 * ic[0] is the constant term; ic[i+1] pairs with public signal i.
 */
struct VerificationKey {
    size_t nPublic{0};
    G1Affine alpha;
    G2Affine beta;
    G2Affine gamma;
    G2Affine delta;
    std::vector<G1Affine> ic;
    
    /**
     * Parse snarkjs vkey JSON (protocol groth16, curve bn128).
     * @throws ComplianceError(MalformedVerificationKey)
     */
    static VerificationKey FromJSON(const util::JSONValue& json);
    
    /// Inverse of FromJSON, projective "1" coordinates included
    util::JSONValue ToJSON() const;
};

/**
 * Load and check the key of one circuit: IC.size() - 1 must equal nPublic
 * and the circuit's public signal count.
 *
 * @throws ComplianceError(CircuitArtifactMissing) if the file is absent
 * @throws ComplianceError(MalformedVerificationKey) otherwise on failure
 */
VerificationKey LoadVerificationKey(const compliance::ArtifactStore& store,
                                    compliance::ProofType type);

/// Keys for every circuit whose _vkey.json exists
std::map<compliance::ProofType, VerificationKey>
LoadVerificationKeys(const compliance::ArtifactStore& store);

} // namespace verifier
} // namespace zkcomply

#endif // ZKCOMPLY_VERIFIER_VERIFICATION_KEY_H
