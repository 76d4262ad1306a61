// ZKCOMPLY - Identity Claims Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/claims.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/util/logging.h"

#include <algorithm>

namespace zkcomply {
namespace compliance {

void ClaimRegistry::AddClaim(const FieldElement& identity, Claim claim) {
    std::lock_guard<std::mutex> lock(mutex_);
    claims_[identity].push_back(std::move(claim));
}

size_t ClaimRegistry::RevokeClaim(const FieldElement& identity, uint64_t topic,
                                  const std::string& issuer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(identity);
    if (it == claims_.end()) {
        return 0;
    }
    auto& list = it->second;
    size_t before = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const Claim& c) {
                                  return c.topic == topic && c.issuer == issuer;
                              }),
               list.end());
    size_t removed = before - list.size();
    if (list.empty()) {
        claims_.erase(it);
    }
    return removed;
}

std::vector<Claim> ClaimRegistry::GetClaims(const FieldElement& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(identity);
    if (it == claims_.end()) {
        return {};
    }
    return it->second;
}

std::optional<Claim> ClaimRegistry::FindValidClaim(const FieldElement& identity,
                                                   uint64_t topic,
                                                   Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(identity);
    if (it == claims_.end()) {
        return std::nullopt;
    }
    for (const auto& claim : it->second) {
        if (claim.topic == topic && claim.IsValidAt(now)) {
            return claim;
        }
    }
    return std::nullopt;
}

void ClaimRegistry::Require(const FieldElement& identity,
                            const std::vector<uint64_t>& topics,
                            Timestamp now) const {
    for (uint64_t topic : topics) {
        if (!FindValidClaim(identity, topic, now)) {
            LOG_INFO(util::LogCategory::ASSEMBLER)
                << "Required claim topic " << topic << " missing";
            throw ComplianceError(ErrorCode::ClaimNotFound,
                                  "no valid claim for topic " + std::to_string(topic));
        }
    }
}

size_t ClaimRegistry::IdentityCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claims_.size();
}

} // namespace compliance
} // namespace zkcomply
