// ZKCOMPLY - Compliance Errors
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Structured failures raised while building trees, assembling witnesses
// and generating proofs. Verification outcomes are never reported through
// these types: a rejected proof is a plain `false`.

#ifndef ZKCOMPLY_COMPLIANCE_ERRORS_H
#define ZKCOMPLY_COMPLIANCE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zkcomply {
namespace compliance {

// ============================================================================
// Error Codes
// ============================================================================

/// Failure classes, used to decide whether a retry can help
enum class ErrorCategory {
    /// Domain check failed before any cryptographic work
    Precheck,
    /// Caller supplied structurally invalid input
    Input,
    /// Missing or malformed artifacts or settings; operator must intervene
    Configuration,
    /// Witness or prover failure
    Generation
};

enum class ErrorCode {
    // Pre-check failures
    IdentityNotInSet,
    IdentityBlacklisted,
    JurisdictionNotAllowed,
    AccreditationBelowMinimum,
    InsufficientComplianceScore,
    ClaimNotFound,
    
    // Input failures
    EmptyIdentitySet,
    TreeCapacityExceeded,
    LeafIndexOutOfRange,
    InvalidInput,
    
    // Configuration failures
    CircuitArtifactMissing,
    MalformedVerificationKey,
    InvalidConfiguration,
    
    // Generation failures
    ProofGenerationFailed,
    ProofGenerationTimeout,
    AttestationRejected
};

/// Stable identifier, e.g. "IdentityNotInSet"
const char* ErrorCodeName(ErrorCode code);

const char* ErrorCategoryName(ErrorCategory category);

/// Category a code belongs to
ErrorCategory CategoryOf(ErrorCode code);

// ============================================================================
// Exceptions
// ============================================================================

/**
 * Base exception for compliance pipeline failures.
 *
 * what() returns "<CodeName>: <reason>".
 */
class ComplianceError : public std::runtime_error {
public:
    ComplianceError(ErrorCode code, const std::string& reason);
    
    ErrorCode Code() const { return code_; }
    ErrorCategory Category() const { return CategoryOf(code_); }
    
    /// Human-readable reason without the code prefix
    const std::string& Reason() const { return reason_; }
    
    /// Only generation failures can succeed on a later attempt
    bool IsRetryable() const { return Category() == ErrorCategory::Generation; }

private:
    ErrorCode code_;
    std::string reason_;
};

/**
 * Aggregation pre-check failure carrying the scaled values that were compared.
 */
class InsufficientScoreError : public ComplianceError {
public:
    InsufficientScoreError(uint64_t weightedSum, uint64_t requiredMinimum);
    
    uint64_t WeightedSum() const { return weightedSum_; }
    uint64_t RequiredMinimum() const { return requiredMinimum_; }

private:
    uint64_t weightedSum_;
    uint64_t requiredMinimum_;
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_ERRORS_H
