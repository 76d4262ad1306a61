// ZKCOMPLY - Proof Input Assembler
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Builds the exact input object each compliance circuit expects, after
// running the domain checks that can be decided without the circuit.
// Pre-check failures are raised here, before any artifact is touched.

#ifndef ZKCOMPLY_COMPLIANCE_INPUT_ASSEMBLER_H
#define ZKCOMPLY_COMPLIANCE_INPUT_ASSEMBLER_H

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/compliance/claims.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/compliance/merkle_tree.h"
#include "zkcomply/crypto/field.h"
#include "zkcomply/util/json.h"

namespace zkcomply {
namespace compliance {

/// Jurisdiction codes index bits of a field element, so they stay below 253
constexpr uint32_t MAX_JURISDICTION_CODE = 252;

/// Multiplier between the caller-facing minimum level and the circuit threshold
constexpr uint64_t COMPLIANCE_LEVEL_SCALE = 100;

// ============================================================================
// Witness Record
// ============================================================================

/// A condition only the circuit can decide, surfaced if proving fails
struct DeferredCheck {
    ErrorCode code;
    std::string reason;
};

/**
 * Everything the generator needs for one proof request.
 *
 * Contains private values; never log or persist it.
 */
struct WitnessRecord {
    ProofType type{ProofType::Whitelist};
    
    /// Circuit input object: signal name -> decimal string or array of them
    util::JSONValue inputs;
    
    /// Public signals the circuit must output, in calling-convention order
    std::vector<FieldElement> publicSignals;
    
    std::optional<DeferredCheck> deferredCheck;
    
    /// Nullifier for whitelist and blacklist proofs
    std::optional<FieldElement> nullifier;
    
    /// Commitment for jurisdiction, accreditation and aggregation proofs
    std::optional<FieldElement> commitment;
    
    /// Salt opening the commitment
    std::optional<FieldElement> salt;
};

// ============================================================================
// Request Types
// ============================================================================

struct ComplianceScores {
    uint32_t kyc{0};
    uint32_t aml{0};
    uint32_t jurisdiction{0};
    uint32_t accreditation{0};
};

struct ScoreWeights {
    uint32_t kyc{0};
    uint32_t aml{0};
    uint32_t jurisdiction{0};
    uint32_t accreditation{0};
};

/// Σ score_i × weight_i, exact
Uint256 WeightedComplianceSum(const ComplianceScores& scores,
                              const ScoreWeights& weights);

/// Σ 2^code over the allowed codes
/// @throws ComplianceError(InvalidInput) for a code above MAX_JURISDICTION_CODE
Uint256 JurisdictionMask(const std::vector<uint32_t>& allowed);

// ============================================================================
// Proof Input Assembler
// ============================================================================

class ProofInputAssembler {
public:
    /// Assembler without a claims gate
    ProofInputAssembler() = default;
    
    /**
     * Assembler that requires every topic in requiredTopics to have a valid
     * claim before whitelist or blacklist assembly.
     */
    ProofInputAssembler(std::shared_ptr<const ClaimRegistry> claims,
                        std::vector<uint64_t> requiredTopics);
    
    /// @throws ComplianceError(IdentityNotInSet) if the identity is not a leaf
    WitnessRecord AssembleWhitelist(const FieldElement& identity,
                                    const MerkleTree& whitelist) const;
    
    /**
     * Non-membership witness, path anchored at leaf 0.
     * @throws ComplianceError(IdentityBlacklisted) if the identity is a leaf
     */
    WitnessRecord AssembleBlacklist(const FieldElement& identity,
                                    const MerkleTree& blacklist,
                                    const FieldElement& challenge) const;
    
    /// @throws ComplianceError(JurisdictionNotAllowed) or (InvalidInput)
    WitnessRecord AssembleJurisdiction(uint32_t jurisdictionCode,
                                       const std::vector<uint32_t>& allowedJurisdictions,
                                       const std::optional<FieldElement>& salt = std::nullopt) const;
    
    /**
     * The issuer attestation is verified only inside the circuit; a proving
     * failure is reported as AttestationRejected.
     * @throws ComplianceError(AccreditationBelowMinimum)
     */
    WitnessRecord AssembleAccreditation(uint32_t level,
                                        uint32_t minimumLevel,
                                        const std::array<FieldElement, 2>& issuerSignature,
                                        const std::array<FieldElement, 2>& issuerPublicKey,
                                        const std::optional<FieldElement>& salt = std::nullopt) const;
    
    /// @throws InsufficientScoreError when Σ score×weight < minimumLevel × 100
    WitnessRecord AssembleAggregation(const ComplianceScores& scores,
                                      const ScoreWeights& weights,
                                      uint32_t minimumComplianceLevel,
                                      const std::optional<FieldElement>& salt = std::nullopt) const;

private:
    void CheckClaims(const FieldElement& identity) const;
    
    std::shared_ptr<const ClaimRegistry> claims_;
    std::vector<uint64_t> requiredTopics_;
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_INPUT_ASSEMBLER_H
