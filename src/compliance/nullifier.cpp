// ZKCOMPLY - Nullifiers Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/nullifier.h"
#include "zkcomply/crypto/hash_engine.h"
#include "zkcomply/util/logging.h"

#include <stdexcept>

namespace zkcomply {
namespace compliance {

// ============================================================================
// NullifierDeriver Implementation
// ============================================================================

FieldElement NullifierDeriver::ForWhitelist(const FieldElement& identity,
                                            const FieldElement& root) {
    return HashEngine::Hash({identity, root});
}

FieldElement NullifierDeriver::ForBlacklist(const FieldElement& identity,
                                            const FieldElement& root,
                                            const FieldElement& challenge) {
    return HashEngine::Hash({identity, root, challenge});
}

FieldElement NullifierDeriver::Derive(ProofType type,
                                      const FieldElement& identity,
                                      const FieldElement& root,
                                      const std::optional<FieldElement>& challenge) {
    switch (type) {
        case ProofType::Whitelist:
            return ForWhitelist(identity, root);
        case ProofType::Blacklist:
            if (!challenge) {
                throw std::invalid_argument("blacklist nullifier requires a challenge");
            }
            return ForBlacklist(identity, root, *challenge);
        default:
            break;
    }
    throw std::invalid_argument(std::string("proof type has no nullifier: ") +
                                ProofTypeName(type));
}

// ============================================================================
// NullifierRegistry Implementation
// ============================================================================

NullifierRegistry::NullifierRegistry(uint64_t maxPerScope)
    : maxPerScope_(maxPerScope) {}

NullifierRegistry::AddResult NullifierRegistry::Add(const FieldElement& scope,
                                                    const FieldElement& nullifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto& scopeSet = used_[scope];
    if (scopeSet.count(nullifier) > 0) {
        LOG_WARN(util::LogCategory::NULLIFIER)
            << "Replayed nullifier under root " << scope.ToDecimal();
        return AddResult::AlreadyUsed;
    }
    if (maxPerScope_ > 0 && scopeSet.size() >= maxPerScope_) {
        return AddResult::SetFull;
    }
    
    scopeSet.insert(nullifier);
    return AddResult::Success;
}

bool NullifierRegistry::Contains(const FieldElement& scope,
                                 const FieldElement& nullifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = used_.find(scope);
    return it != used_.end() && it->second.count(nullifier) > 0;
}

uint64_t NullifierRegistry::Count(const FieldElement& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = used_.find(scope);
    return it == used_.end() ? 0 : it->second.size();
}

uint64_t NullifierRegistry::TotalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& [scope, set] : used_) {
        total += set.size();
    }
    return total;
}

uint64_t NullifierRegistry::ClearScope(const FieldElement& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = used_.find(scope);
    if (it == used_.end()) {
        return 0;
    }
    uint64_t removed = it->second.size();
    used_.erase(it);
    return removed;
}

} // namespace compliance
} // namespace zkcomply
