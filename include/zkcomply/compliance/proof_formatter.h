// ZKCOMPLY - Proof Formatter
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Converts prover output into the calldata layout expected by Solidity
// Groth16 verifiers and into a portable JSON export.

#ifndef ZKCOMPLY_COMPLIANCE_PROOF_FORMATTER_H
#define ZKCOMPLY_COMPLIANCE_PROOF_FORMATTER_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/compliance/proof_generator.h"
#include "zkcomply/core/types.h"
#include "zkcomply/crypto/field.h"
#include "zkcomply/util/json.h"

namespace zkcomply {
namespace compliance {

/// Export format version written and accepted by ProofFormatter
constexpr const char* PROOF_EXPORT_VERSION = "1.0";

/**
 * Groth16 proof in verifier calldata order.
 *
 * b holds the G2 coordinates with each Fp2 pair as (c1, c0), the order
 * the EVM pairing precompile consumes. Values are kept unreduced so that
 * out-of-range input stays detectable.
 */
struct OnChainProof {
    std::array<Uint256, 2> a;
    std::array<std::array<Uint256, 2>, 2> b;
    std::array<Uint256, 2> c;
    std::vector<Uint256> publicSignals;
    
    bool operator==(const OnChainProof& other) const;
    bool operator!=(const OnChainProof& other) const { return !(*this == other); }
};

/// Outcome of a structural check
struct ValidationResult {
    bool valid{false};
    std::string error;
    
    static ValidationResult Ok() { return {true, ""}; }
    static ValidationResult Fail(const std::string& msg) { return {false, msg}; }
    
    explicit operator bool() const { return valid; }
};

/// Proof recovered from an export
struct ImportedProof {
    ProofType type{ProofType::Whitelist};
    OnChainProof proof;
    Hash256 hash;
};

class ProofFormatter {
public:
    /// Shape (3, 3x2, 3) and coordinate range (< q) of a prover proof
    static ValidationResult ValidateStructure(const RawProof& raw);
    
    /**
     * Reorder prover output for on-chain verification.
     * @throws ComplianceError(InvalidInput) if ValidateStructure fails
     */
    static OnChainProof Format(const RawProof& raw, const std::vector<FieldElement>& signals);
    static OnChainProof Format(const GeneratedProof& generated);
    
    /// Same count and values, every signal canonical (< r)
    static ValidationResult ValidatePublicSignals(const std::vector<Uint256>& signals,
                                                  const std::vector<FieldElement>& expected);
    
    /// Signal count for the circuit, coordinates < q, signals < r
    static ValidationResult ValidateForCircuit(const OnChainProof& proof, ProofType type);
    
    /// Solidity ABI encoding of (uint256[2], uint256[2][2], uint256[2], uint256[])
    static std::vector<Byte> EncodeABI(const OnChainProof& proof);
    
    /// Keccak-256 of EncodeABI(proof)
    static Hash256 ProofHash(const OnChainProof& proof);
    
    /// {version, type, proof{a,b,c}, publicSignals, hash}
    static util::JSONValue Export(const OnChainProof& proof, ProofType type);
    
    /// nullopt on unknown version, bad shape or hash mismatch
    static std::optional<ImportedProof> Import(const util::JSONValue& json);
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_PROOF_FORMATTER_H
