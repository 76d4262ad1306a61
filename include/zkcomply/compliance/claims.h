// ZKCOMPLY - Identity Claims
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Per-identity claims (topic, issuer, expiry) consulted before proof
// assembly. A required topic with no unexpired claim is a hard failure:
// there is no fallback that treats a missing claim as satisfied.

#ifndef ZKCOMPLY_COMPLIANCE_CLAIMS_H
#define ZKCOMPLY_COMPLIANCE_CLAIMS_H

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "zkcomply/core/types.h"
#include "zkcomply/crypto/field.h"

namespace zkcomply {
namespace compliance {

/// Well-known claim topics
namespace ClaimTopic {
    constexpr uint64_t KYC = 1;
    constexpr uint64_t AML = 2;
    constexpr uint64_t ACCREDITATION = 3;
    constexpr uint64_t JURISDICTION = 4;
}

struct Claim {
    uint64_t topic{0};
    std::string issuer;
    /// Unix seconds; 0 means the claim never expires
    Timestamp expiresAt{0};
    
    bool IsValidAt(Timestamp now) const {
        return expiresAt == 0 || now < expiresAt;
    }
};

/**
 * Thread-safe store of claims keyed by identity.
 * Each identity's claims form an append-only ordered sequence.
 */
class ClaimRegistry {
public:
    void AddClaim(const FieldElement& identity, Claim claim);
    
    /// Remove claims for a topic from one issuer; returns how many were removed
    size_t RevokeClaim(const FieldElement& identity, uint64_t topic,
                       const std::string& issuer);
    
    std::vector<Claim> GetClaims(const FieldElement& identity) const;
    
    /// First claim for the topic that is still valid at `now`
    std::optional<Claim> FindValidClaim(const FieldElement& identity, uint64_t topic,
                                        Timestamp now) const;
    
    /**
     * Check every topic has a valid claim.
     * @throws ComplianceError(ClaimNotFound) naming the first missing topic
     */
    void Require(const FieldElement& identity, const std::vector<uint64_t>& topics,
                 Timestamp now) const;
    
    size_t IdentityCount() const;

private:
    mutable std::mutex mutex_;
    std::map<FieldElement, std::vector<Claim>> claims_;
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_CLAIMS_H
