// ZKCOMPLY - Circuit Catalogue
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// The five compliance circuits, their public-signal layouts and the
// on-disk artifacts compiled for them:
//   <root>/<name>/<name>_cpp/<name>    witness calculator (circom C++)
//   <root>/<name>/<name>.zkey          Groth16 proving key
//   <root>/<name>/<name>_vkey.json     verification key

#ifndef ZKCOMPLY_COMPLIANCE_CIRCUIT_H
#define ZKCOMPLY_COMPLIANCE_CIRCUIT_H

#include <optional>
#include <string>
#include <vector>

namespace zkcomply {
namespace compliance {

// ============================================================================
// Proof Types
// ============================================================================

enum class ProofType {
    Whitelist,
    Blacklist,
    Jurisdiction,
    Accreditation,
    Aggregation
};

/// Short name, e.g. "whitelist"
const char* ProofTypeName(ProofType type);

/// Inverse of ProofTypeName
std::optional<ProofType> ProofTypeFromString(const std::string& name);

/// All proof types in declaration order
const std::vector<ProofType>& AllProofTypes();

// ============================================================================
// Circuit Specification
// ============================================================================

struct CircuitSpec {
    ProofType type;
    /// Artifact base name, e.g. "whitelist_membership"
    const char* circuitName;
    /// Names of the public signals in calling-convention order
    std::vector<const char*> publicSignals;
    
    size_t PublicSignalCount() const { return publicSignals.size(); }
};

const CircuitSpec& GetCircuitSpec(ProofType type);

// ============================================================================
// Artifact Store
// ============================================================================

struct CircuitArtifacts {
    std::string witnessCalculator;
    std::string provingKey;
    std::string verificationKey;
};

/**
 * Resolves circuit artifacts under a root directory.
 */
class ArtifactStore {
public:
    explicit ArtifactStore(std::string root);
    
    const std::string& Root() const { return root_; }
    
    /// Conventional paths, without touching the filesystem
    CircuitArtifacts PathsFor(ProofType type) const;
    
    /**
     * Paths after checking the witness calculator is an executable file and
     * the proving key exists.
     * @throws ComplianceError(CircuitArtifactMissing)
     */
    CircuitArtifacts Locate(ProofType type) const;
    
    bool HasVerificationKey(ProofType type) const;

private:
    std::string root_;
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_CIRCUIT_H
