// ZKCOMPLY - Nullifiers
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Nullifiers bind a hidden identity to one tree root (and, for blacklist
// checks, one verifier challenge). They are deterministic so consumers can
// refuse a second use, while revealing nothing about the identity.
//
//   whitelist:  N = H(identity, root)
//   blacklist:  N = H(identity, root, challenge)

#ifndef ZKCOMPLY_COMPLIANCE_NULLIFIER_H
#define ZKCOMPLY_COMPLIANCE_NULLIFIER_H

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/crypto/field.h"

namespace zkcomply {
namespace compliance {

// ============================================================================
// Nullifier Deriver
// ============================================================================

class NullifierDeriver {
public:
    static FieldElement ForWhitelist(const FieldElement& identity,
                                     const FieldElement& root);
    
    static FieldElement ForBlacklist(const FieldElement& identity,
                                     const FieldElement& root,
                                     const FieldElement& challenge);
    
    /**
     * Dispatch on proof type.
     * @throws std::invalid_argument for blacklist without a challenge, or for
     *         proof types whose circuits carry no nullifier
     */
    static FieldElement Derive(ProofType type,
                               const FieldElement& identity,
                               const FieldElement& root,
                               const std::optional<FieldElement>& challenge = std::nullopt);
};

// ============================================================================
// Nullifier Registry
// ============================================================================

/**
 * Used-nullifier set for consumers enforcing at-most-one use.
 * Nullifiers are scoped by the tree root they were derived against.
 */
class NullifierRegistry {
public:
    enum class AddResult {
        Success,      ///< Nullifier recorded
        AlreadyUsed,  ///< Seen before in this scope (replay)
        SetFull       ///< Scope reached its capacity
    };
    
    /// @param maxPerScope 0 means unlimited
    explicit NullifierRegistry(uint64_t maxPerScope = 0);
    
    AddResult Add(const FieldElement& scope, const FieldElement& nullifier);
    
    bool Contains(const FieldElement& scope, const FieldElement& nullifier) const;
    
    uint64_t Count(const FieldElement& scope) const;
    
    uint64_t TotalCount() const;
    
    /// Drop every nullifier recorded under a scope; returns how many were removed
    uint64_t ClearScope(const FieldElement& scope);

private:
    uint64_t maxPerScope_;
    mutable std::mutex mutex_;
    std::map<FieldElement, std::set<FieldElement>> used_;
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_NULLIFIER_H
