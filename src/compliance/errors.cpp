// ZKCOMPLY - Compliance Errors Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/errors.h"

namespace zkcomply {
namespace compliance {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::IdentityNotInSet:            return "IdentityNotInSet";
        case ErrorCode::IdentityBlacklisted:         return "IdentityBlacklisted";
        case ErrorCode::JurisdictionNotAllowed:      return "JurisdictionNotAllowed";
        case ErrorCode::AccreditationBelowMinimum:   return "AccreditationBelowMinimum";
        case ErrorCode::InsufficientComplianceScore: return "InsufficientComplianceScore";
        case ErrorCode::ClaimNotFound:               return "ClaimNotFound";
        case ErrorCode::EmptyIdentitySet:            return "EmptyIdentitySet";
        case ErrorCode::TreeCapacityExceeded:        return "TreeCapacityExceeded";
        case ErrorCode::LeafIndexOutOfRange:         return "LeafIndexOutOfRange";
        case ErrorCode::InvalidInput:                return "InvalidInput";
        case ErrorCode::CircuitArtifactMissing:      return "CircuitArtifactMissing";
        case ErrorCode::MalformedVerificationKey:    return "MalformedVerificationKey";
        case ErrorCode::InvalidConfiguration:        return "InvalidConfiguration";
        case ErrorCode::ProofGenerationFailed:       return "ProofGenerationFailed";
        case ErrorCode::ProofGenerationTimeout:      return "ProofGenerationTimeout";
        case ErrorCode::AttestationRejected:         return "AttestationRejected";
    }
    return "Unknown";
}

const char* ErrorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Precheck:      return "precheck";
        case ErrorCategory::Input:         return "input";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Generation:    return "generation";
    }
    return "unknown";
}

ErrorCategory CategoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::IdentityNotInSet:
        case ErrorCode::IdentityBlacklisted:
        case ErrorCode::JurisdictionNotAllowed:
        case ErrorCode::AccreditationBelowMinimum:
        case ErrorCode::InsufficientComplianceScore:
        case ErrorCode::ClaimNotFound:
            return ErrorCategory::Precheck;
        case ErrorCode::EmptyIdentitySet:
        case ErrorCode::TreeCapacityExceeded:
        case ErrorCode::LeafIndexOutOfRange:
        case ErrorCode::InvalidInput:
            return ErrorCategory::Input;
        case ErrorCode::CircuitArtifactMissing:
        case ErrorCode::MalformedVerificationKey:
        case ErrorCode::InvalidConfiguration:
            return ErrorCategory::Configuration;
        case ErrorCode::ProofGenerationFailed:
        case ErrorCode::ProofGenerationTimeout:
        case ErrorCode::AttestationRejected:
            return ErrorCategory::Generation;
    }
    return ErrorCategory::Generation;
}

ComplianceError::ComplianceError(ErrorCode code, const std::string& reason)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + reason)
    , code_(code)
    , reason_(reason) {}

InsufficientScoreError::InsufficientScoreError(uint64_t weightedSum,
                                               uint64_t requiredMinimum)
    : ComplianceError(ErrorCode::InsufficientComplianceScore,
                      "weighted score " + std::to_string(weightedSum) +
                      " is below required minimum " + std::to_string(requiredMinimum))
    , weightedSum_(weightedSum)
    , requiredMinimum_(requiredMinimum) {}

} // namespace compliance
} // namespace zkcomply
