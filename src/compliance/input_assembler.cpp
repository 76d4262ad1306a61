// ZKCOMPLY - Proof Input Assembler Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/input_assembler.h"
#include "zkcomply/compliance/nullifier.h"
#include "zkcomply/crypto/hash_engine.h"
#include "zkcomply/util/logging.h"

#include <set>

namespace zkcomply {
namespace compliance {

namespace {

util::JSONValue Dec(const FieldElement& fe) {
    return util::JSONValue(fe.ToDecimal());
}

util::JSONValue Dec(uint64_t value) {
    return util::JSONValue(std::to_string(value));
}

void AddPath(util::JSONValue& inputs, const MerkleProof& proof) {
    util::JSONValue::Array elements;
    util::JSONValue::Array indices;
    for (size_t i = 0; i < proof.Depth(); ++i) {
        elements.push_back(Dec(proof.pathElements[i]));
        indices.push_back(Dec(static_cast<uint64_t>(proof.pathIndices[i])));
    }
    inputs["pathElements"] = std::move(elements);
    inputs["pathIndices"] = std::move(indices);
}

void LogAssembled(const WitnessRecord& record) {
    LOG_DEBUG(util::LogCategory::ASSEMBLER)
        << "Assembled " << ProofTypeName(record.type) << " witness with "
        << record.publicSignals.size() << " public signal(s)";
}

[[noreturn]] void FailPrecheck(ErrorCode code, ProofType type, const std::string& reason) {
    LOG_INFO(util::LogCategory::ASSEMBLER)
        << ProofTypeName(type) << " pre-check failed: " << ErrorCodeName(code);
    throw ComplianceError(code, reason);
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

Uint256 WeightedComplianceSum(const ComplianceScores& scores,
                              const ScoreWeights& weights) {
    // Each 32x32-bit product fits in 64 bits; the four-term sum may not
    const uint64_t products[] = {
        uint64_t(scores.kyc) * weights.kyc,
        uint64_t(scores.aml) * weights.aml,
        uint64_t(scores.jurisdiction) * weights.jurisdiction,
        uint64_t(scores.accreditation) * weights.accreditation,
    };
    Uint256 sum;
    bool carry = false;
    for (uint64_t p : products) {
        sum = Uint256::Add(sum, Uint256(p), carry);
    }
    return sum;
}

Uint256 JurisdictionMask(const std::vector<uint32_t>& allowed) {
    Uint256 mask;
    for (uint32_t code : allowed) {
        if (code > MAX_JURISDICTION_CODE) {
            throw ComplianceError(ErrorCode::InvalidInput,
                                  "jurisdiction code " + std::to_string(code) +
                                  " exceeds " + std::to_string(MAX_JURISDICTION_CODE));
        }
        mask = mask | (Uint256(1) << static_cast<int>(code));
    }
    return mask;
}

// ============================================================================
// ProofInputAssembler Implementation
// ============================================================================

ProofInputAssembler::ProofInputAssembler(std::shared_ptr<const ClaimRegistry> claims,
                                         std::vector<uint64_t> requiredTopics)
    : claims_(std::move(claims))
    , requiredTopics_(std::move(requiredTopics)) {}

void ProofInputAssembler::CheckClaims(const FieldElement& identity) const {
    if (requiredTopics_.empty()) {
        return;
    }
    if (!claims_) {
        throw ComplianceError(ErrorCode::ClaimNotFound,
                              "claim topics required but no claim registry configured");
    }
    claims_->Require(identity, requiredTopics_, GetTime());
}

WitnessRecord ProofInputAssembler::AssembleWhitelist(const FieldElement& identity,
                                                     const MerkleTree& whitelist) const {
    CheckClaims(identity);
    
    auto index = whitelist.FindIdentity(identity);
    if (!index) {
        FailPrecheck(ErrorCode::IdentityNotInSet, ProofType::Whitelist,
                     "identity is not a member of the whitelist snapshot");
    }
    
    MerkleProof path = whitelist.Prove(*index);
    FieldElement nullifier = NullifierDeriver::ForWhitelist(identity, whitelist.Root());
    
    WitnessRecord record;
    record.type = ProofType::Whitelist;
    record.inputs["identity"] = Dec(identity);
    AddPath(record.inputs, path);
    record.inputs["merkleRoot"] = Dec(whitelist.Root());
    record.inputs["nullifierHash"] = Dec(nullifier);
    record.publicSignals = {nullifier};
    record.nullifier = nullifier;
    
    LogAssembled(record);
    return record;
}

WitnessRecord ProofInputAssembler::AssembleBlacklist(const FieldElement& identity,
                                                     const MerkleTree& blacklist,
                                                     const FieldElement& challenge) const {
    CheckClaims(identity);
    
    if (blacklist.FindIdentity(identity)) {
        FailPrecheck(ErrorCode::IdentityBlacklisted, ProofType::Blacklist,
                     "identity is present in the blacklist snapshot");
    }
    
    // Any fixed position works; the circuit asserts the leaf there differs
    MerkleProof path = blacklist.Prove(0);
    FieldElement nullifier =
        NullifierDeriver::ForBlacklist(identity, blacklist.Root(), challenge);
    
    WitnessRecord record;
    record.type = ProofType::Blacklist;
    record.inputs["identity"] = Dec(identity);
    AddPath(record.inputs, path);
    record.inputs["siblingHash"] = Dec(path.pathElements.front());
    record.inputs["blacklistRoot"] = Dec(blacklist.Root());
    record.inputs["nullifierHash"] = Dec(nullifier);
    record.inputs["challengeHash"] = Dec(challenge);
    record.publicSignals = {blacklist.Root(), nullifier, challenge};
    record.nullifier = nullifier;
    
    LogAssembled(record);
    return record;
}

WitnessRecord ProofInputAssembler::AssembleJurisdiction(
        uint32_t jurisdictionCode,
        const std::vector<uint32_t>& allowedJurisdictions,
        const std::optional<FieldElement>& salt) const {
    if (jurisdictionCode > MAX_JURISDICTION_CODE) {
        throw ComplianceError(ErrorCode::InvalidInput,
                              "jurisdiction code " + std::to_string(jurisdictionCode) +
                              " exceeds " + std::to_string(MAX_JURISDICTION_CODE));
    }
    FieldElement mask(JurisdictionMask(allowedJurisdictions));
    
    std::set<uint32_t> allowed(allowedJurisdictions.begin(), allowedJurisdictions.end());
    if (allowed.count(jurisdictionCode) == 0) {
        FailPrecheck(ErrorCode::JurisdictionNotAllowed, ProofType::Jurisdiction,
                     "jurisdiction is not in the allowed set");
    }
    
    FieldElement userSalt = salt ? *salt : HashEngine::GenerateSalt();
    FieldElement code(static_cast<uint64_t>(jurisdictionCode));
    FieldElement commitment = HashEngine::Commit({code}, userSalt);
    
    WitnessRecord record;
    record.type = ProofType::Jurisdiction;
    record.inputs["userJurisdiction"] = Dec(code);
    record.inputs["userSalt"] = Dec(userSalt);
    record.inputs["allowedJurisdictionsMask"] = Dec(mask);
    record.inputs["commitmentHash"] = Dec(commitment);
    record.publicSignals = {mask};
    record.commitment = commitment;
    record.salt = userSalt;
    
    LogAssembled(record);
    return record;
}

WitnessRecord ProofInputAssembler::AssembleAccreditation(
        uint32_t level,
        uint32_t minimumLevel,
        const std::array<FieldElement, 2>& issuerSignature,
        const std::array<FieldElement, 2>& issuerPublicKey,
        const std::optional<FieldElement>& salt) const {
    if (level < minimumLevel) {
        FailPrecheck(ErrorCode::AccreditationBelowMinimum, ProofType::Accreditation,
                     "accreditation level is below the required minimum " +
                     std::to_string(minimumLevel));
    }
    
    FieldElement userSalt = salt ? *salt : HashEngine::GenerateSalt();
    FieldElement userLevel(static_cast<uint64_t>(level));
    FieldElement minimum(static_cast<uint64_t>(minimumLevel));
    FieldElement commitment = HashEngine::Commit({userLevel}, userSalt);
    
    WitnessRecord record;
    record.type = ProofType::Accreditation;
    record.inputs["userAccreditation"] = Dec(userLevel);
    record.inputs["userSalt"] = Dec(userSalt);
    record.inputs["issuerSignature"] =
        util::JSONValue::Array{Dec(issuerSignature[0]), Dec(issuerSignature[1])};
    record.inputs["minimumAccreditation"] = Dec(minimum);
    record.inputs["commitmentHash"] = Dec(commitment);
    record.inputs["issuerPublicKey"] =
        util::JSONValue::Array{Dec(issuerPublicKey[0]), Dec(issuerPublicKey[1])};
    record.publicSignals = {minimum};
    record.deferredCheck = DeferredCheck{
        ErrorCode::AttestationRejected,
        "issuer attestation did not verify against the issuer public key"};
    record.commitment = commitment;
    record.salt = userSalt;
    
    LogAssembled(record);
    return record;
}

WitnessRecord ProofInputAssembler::AssembleAggregation(
        const ComplianceScores& scores,
        const ScoreWeights& weights,
        uint32_t minimumComplianceLevel,
        const std::optional<FieldElement>& salt) const {
    Uint256 sum = WeightedComplianceSum(scores, weights);
    uint64_t threshold = uint64_t(minimumComplianceLevel) * COMPLIANCE_LEVEL_SCALE;
    if (sum < Uint256(threshold)) {
        LOG_INFO(util::LogCategory::ASSEMBLER)
            << "aggregation pre-check failed: "
            << ErrorCodeName(ErrorCode::InsufficientComplianceScore);
        // sum < threshold < 2^64 here
        throw InsufficientScoreError(sum.limbs[0], threshold);
    }
    
    FieldElement userSalt = salt ? *salt : HashEngine::GenerateSalt();
    FieldElement kyc(static_cast<uint64_t>(scores.kyc));
    FieldElement aml(static_cast<uint64_t>(scores.aml));
    FieldElement jur(static_cast<uint64_t>(scores.jurisdiction));
    FieldElement acc(static_cast<uint64_t>(scores.accreditation));
    FieldElement commitment = HashEngine::Commit({kyc, aml, jur, acc}, userSalt);
    
    FieldElement level(static_cast<uint64_t>(minimumComplianceLevel));
    FieldElement wKyc(static_cast<uint64_t>(weights.kyc));
    FieldElement wAml(static_cast<uint64_t>(weights.aml));
    FieldElement wJur(static_cast<uint64_t>(weights.jurisdiction));
    FieldElement wAcc(static_cast<uint64_t>(weights.accreditation));
    
    WitnessRecord record;
    record.type = ProofType::Aggregation;
    record.inputs["kycScore"] = Dec(kyc);
    record.inputs["amlScore"] = Dec(aml);
    record.inputs["jurisdictionScore"] = Dec(jur);
    record.inputs["accreditationScore"] = Dec(acc);
    record.inputs["userSalt"] = Dec(userSalt);
    record.inputs["minimumComplianceLevel"] = Dec(level);
    record.inputs["commitmentHash"] = Dec(commitment);
    record.inputs["weightKyc"] = Dec(wKyc);
    record.inputs["weightAml"] = Dec(wAml);
    record.inputs["weightJurisdiction"] = Dec(wJur);
    record.inputs["weightAccreditation"] = Dec(wAcc);
    record.publicSignals = {level, commitment, wKyc, wAml, wJur, wAcc};
    record.commitment = commitment;
    record.salt = userSalt;
    
    LogAssembled(record);
    return record;
}

} // namespace compliance
} // namespace zkcomply
