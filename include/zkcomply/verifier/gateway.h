// ZKCOMPLY - Verification Gateway
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Single entry point for deciding compliance proofs. The verification
// mode is chosen when the gateway is built and cannot change afterwards.

#ifndef ZKCOMPLY_VERIFIER_GATEWAY_H
#define ZKCOMPLY_VERIFIER_GATEWAY_H

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/compliance/config.h"
#include "zkcomply/compliance/proof_formatter.h"
#include "zkcomply/verifier/verification_key.h"

namespace zkcomply {
namespace verifier {

using compliance::OnChainProof;
using compliance::ProofType;
using compliance::VerifierMode;

/**
 * Proof data that cannot be interpreted at all: a coordinate >= q or a
 * public signal >= r. Distinct from a proof that is merely invalid.
 */
class MalformedProofInput : public std::runtime_error {
public:
    explicit MalformedProofInput(const std::string& msg) : std::runtime_error(msg) {}
};

/// Throws MalformedProofInput for out-of-range coordinates or signals
void CheckProofRanges(const OnChainProof& proof);

/// Select the BN254 (alt_bn128) pairing in mcl; safe to call repeatedly
void InitPairing();

// ============================================================================
// Verifiers
// ============================================================================

class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;
    
    /**
     * @return false for a wrong signal count, off-curve points or a failed check
     * @throws MalformedProofInput for out-of-range values
     */
    virtual bool Verify(ProofType type, const OnChainProof& proof) const = 0;
    
    virtual VerifierMode Mode() const = 0;
};

/// Accepts any well-formed, non-zero proof with the circuit's signal count
class MockVerifier : public ProofVerifier {
public:
    bool Verify(ProofType type, const OnChainProof& proof) const override;
    VerifierMode Mode() const override { return VerifierMode::Mock; }
};

/**
 * Groth16 verifier over BN254:
 *   e(-A, B) * e(alpha, beta) * e(vk_x, gamma) * e(C, delta) == 1
 * with vk_x = IC[0] + sum(s_i * IC[i+1]).
 */
class RealVerifier : public ProofVerifier {
public:
    /**
     * @throws ComplianceError(MalformedVerificationKey) if a key does not
     *         match its circuit's signal layout or holds invalid points
     */
    explicit RealVerifier(const std::map<ProofType, VerificationKey>& keys);
    ~RealVerifier() override;
    
    /// @throws ComplianceError(CircuitArtifactMissing) if no key was loaded for type
    bool Verify(ProofType type, const OnChainProof& proof) const override;
    VerifierMode Mode() const override { return VerifierMode::Real; }
    
    bool HasKey(ProofType type) const { return keys_.count(type) > 0; }

private:
    struct PreparedKey;
    std::map<ProofType, std::unique_ptr<const PreparedKey>> keys_;
};

// ============================================================================
// Gateway
// ============================================================================

class VerificationGateway {
public:
    using G1Coords = std::array<Uint256, 2>;
    using G2Coords = std::array<std::array<Uint256, 2>, 2>;
    
    explicit VerificationGateway(std::unique_ptr<ProofVerifier> verifier);
    
    VerificationGateway(const VerificationGateway&) = delete;
    VerificationGateway& operator=(const VerificationGateway&) = delete;
    
    static std::unique_ptr<VerificationGateway> CreateMock();
    static std::unique_ptr<VerificationGateway> CreateReal(
        const std::map<ProofType, VerificationKey>& keys);
    
    bool VerifyWhitelist(const G1Coords& a, const G2Coords& b, const G1Coords& c,
                         const std::vector<Uint256>& signals);
    bool VerifyBlacklist(const G1Coords& a, const G2Coords& b, const G1Coords& c,
                         const std::vector<Uint256>& signals);
    bool VerifyJurisdiction(const G1Coords& a, const G2Coords& b, const G1Coords& c,
                            const std::vector<Uint256>& signals);
    bool VerifyAccreditation(const G1Coords& a, const G2Coords& b, const G1Coords& c,
                             const std::vector<Uint256>& signals);
    bool VerifyAggregation(const G1Coords& a, const G2Coords& b, const G1Coords& c,
                           const std::vector<Uint256>& signals);
    
    /// @throws MalformedProofInput (counted as rejected)
    bool Verify(ProofType type, const OnChainProof& proof);
    
    /// Malformed items are reported as false
    std::vector<bool> VerifyBatch(const std::vector<std::pair<ProofType, OnChainProof>>& items);
    
    VerifierMode Mode() const { return verifier_->Mode(); }
    uint64_t AcceptedCount() const { return accepted_.load(); }
    uint64_t RejectedCount() const { return rejected_.load(); }

private:
    bool VerifyParts(ProofType type, const G1Coords& a, const G2Coords& b,
                     const G1Coords& c, const std::vector<Uint256>& signals);
    
    std::unique_ptr<ProofVerifier> verifier_;
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
};

/**
 * Build the gateway for config.verifierMode. Real mode loads every
 * circuit's verification key from config.artifactsDir.
 */
std::unique_ptr<VerificationGateway> CreateGateway(const compliance::ComplianceConfig& config);

} // namespace verifier
} // namespace zkcomply

#endif // ZKCOMPLY_VERIFIER_GATEWAY_H
