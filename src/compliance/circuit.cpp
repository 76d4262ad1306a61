// ZKCOMPLY - Circuit Catalogue Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/util/logging.h"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace zkcomply {
namespace compliance {

namespace fs = std::filesystem;

// ============================================================================
// Proof Types
// ============================================================================

const char* ProofTypeName(ProofType type) {
    switch (type) {
        case ProofType::Whitelist:     return "whitelist";
        case ProofType::Blacklist:     return "blacklist";
        case ProofType::Jurisdiction:  return "jurisdiction";
        case ProofType::Accreditation: return "accreditation";
        case ProofType::Aggregation:   return "aggregation";
    }
    return "unknown";
}

std::optional<ProofType> ProofTypeFromString(const std::string& name) {
    for (ProofType type : AllProofTypes()) {
        if (name == ProofTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const std::vector<ProofType>& AllProofTypes() {
    static const std::vector<ProofType> types = {
        ProofType::Whitelist,
        ProofType::Blacklist,
        ProofType::Jurisdiction,
        ProofType::Accreditation,
        ProofType::Aggregation,
    };
    return types;
}

// ============================================================================
// Circuit Specification
// ============================================================================

const CircuitSpec& GetCircuitSpec(ProofType type) {
    static const CircuitSpec whitelist{
        ProofType::Whitelist, "whitelist_membership",
        {"nullifierHash"}};
    static const CircuitSpec blacklist{
        ProofType::Blacklist, "blacklist_membership",
        {"blacklistRoot", "nullifierHash", "challengeHash"}};
    static const CircuitSpec jurisdiction{
        ProofType::Jurisdiction, "jurisdiction_proof",
        {"allowedJurisdictionsMask"}};
    static const CircuitSpec accreditation{
        ProofType::Accreditation, "accreditation_proof",
        {"minimumAccreditation"}};
    static const CircuitSpec aggregation{
        ProofType::Aggregation, "compliance_aggregation",
        {"minimumComplianceLevel", "commitmentHash", "weightKyc", "weightAml",
         "weightJurisdiction", "weightAccreditation"}};
    
    switch (type) {
        case ProofType::Whitelist:     return whitelist;
        case ProofType::Blacklist:     return blacklist;
        case ProofType::Jurisdiction:  return jurisdiction;
        case ProofType::Accreditation: return accreditation;
        case ProofType::Aggregation:   return aggregation;
    }
    throw std::invalid_argument("unknown proof type");
}

// ============================================================================
// Artifact Store
// ============================================================================

ArtifactStore::ArtifactStore(std::string root) : root_(std::move(root)) {}

CircuitArtifacts ArtifactStore::PathsFor(ProofType type) const {
    const std::string name = GetCircuitSpec(type).circuitName;
    fs::path dir = fs::path(root_) / name;
    
    CircuitArtifacts artifacts;
    artifacts.witnessCalculator = (dir / (name + "_cpp") / name).string();
    artifacts.provingKey = (dir / (name + ".zkey")).string();
    artifacts.verificationKey = (dir / (name + "_vkey.json")).string();
    return artifacts;
}

CircuitArtifacts ArtifactStore::Locate(ProofType type) const {
    CircuitArtifacts artifacts = PathsFor(type);
    const char* name = GetCircuitSpec(type).circuitName;
    std::error_code ec;
    
    if (!fs::is_regular_file(artifacts.witnessCalculator, ec) ||
        access(artifacts.witnessCalculator.c_str(), X_OK) != 0) {
        LOG_ERROR(util::LogCategory::PROVER)
            << "Witness calculator missing for " << name;
        throw ComplianceError(ErrorCode::CircuitArtifactMissing,
                              std::string("witness calculator not found or not executable: ") +
                              artifacts.witnessCalculator);
    }
    
    if (!fs::is_regular_file(artifacts.provingKey, ec)) {
        LOG_ERROR(util::LogCategory::PROVER)
            << "Proving key missing for " << name;
        throw ComplianceError(ErrorCode::CircuitArtifactMissing,
                              std::string("proving key not found: ") + artifacts.provingKey);
    }
    
    return artifacts;
}

bool ArtifactStore::HasVerificationKey(ProofType type) const {
    std::error_code ec;
    return fs::is_regular_file(PathsFor(type).verificationKey, ec);
}

} // namespace compliance
} // namespace zkcomply
