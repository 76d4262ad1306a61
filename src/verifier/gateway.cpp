// ZKCOMPLY - Verification Gateway Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/verifier/gateway.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/util/logging.h"

#include <mcl/bn.hpp>

#include <mutex>

namespace zkcomply {
namespace verifier {

using compliance::ComplianceError;
using compliance::ErrorCode;
using mcl::bn::Fp;
using mcl::bn::Fp2;
using mcl::bn::Fp12;
using mcl::bn::Fr;
using mcl::bn::G1;
using mcl::bn::G2;

namespace {

bool SetFp(Fp& out, const Uint256& v) {
    bool ok = false;
    out.setStr(&ok, v.ToDecimal().c_str(), 10);
    return ok;
}

bool SetFr(Fr& out, const Uint256& v) {
    bool ok = false;
    out.setStr(&ok, v.ToDecimal().c_str(), 10);
    return ok;
}

/// (0, 0) is the point at infinity; anything else must lie on the curve
bool ToG1(G1& out, const Uint256& x, const Uint256& y) {
    if (x.IsZero() && y.IsZero()) {
        out.clear();
        return true;
    }
    Fp fx, fy;
    if (!SetFp(fx, x) || !SetFp(fy, y)) {
        return false;
    }
    bool ok = false;
    out.set(&ok, fx, fy);
    return ok;
}

/// Coordinates in (c0, c1) order; subgroup membership is checked
bool ToG2(G2& out, const Uint256& x0, const Uint256& x1,
          const Uint256& y0, const Uint256& y1) {
    if (x0.IsZero() && x1.IsZero() && y0.IsZero() && y1.IsZero()) {
        out.clear();
        return true;
    }
    Fp2 fx, fy;
    if (!SetFp(fx.a, x0) || !SetFp(fx.b, x1) || !SetFp(fy.a, y0) || !SetFp(fy.b, y1)) {
        return false;
    }
    bool ok = false;
    out.set(&ok, fx, fy);
    return ok;
}

bool ToG2(G2& out, const G2Affine& p) {
    return ToG2(out, p.x0, p.x1, p.y0, p.y1);
}

bool IsAllZero(const OnChainProof& proof) {
    for (const auto& v : proof.a) {
        if (!v.IsZero()) return false;
    }
    for (const auto& row : proof.b) {
        for (const auto& v : row) {
            if (!v.IsZero()) return false;
        }
    }
    for (const auto& v : proof.c) {
        if (!v.IsZero()) return false;
    }
    return true;
}

} // anonymous namespace

void InitPairing() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        mcl::bn::initPairing(mcl::BN_SNARK1);
        mcl::bn::verifyOrderG2(true);
        LOG_DEBUG(util::LogCategory::VERIFIER) << "Initialised BN254 pairing";
    });
}

void CheckProofRanges(const OnChainProof& proof) {
    auto checkCoord = [](const Uint256& v, const char* name) {
        if (v >= BN254_BASE_MODULUS) {
            throw MalformedProofInput(std::string(name) + " coordinate is not below the base field modulus");
        }
    };
    for (const auto& v : proof.a) checkCoord(v, "a");
    for (const auto& row : proof.b) {
        for (const auto& v : row) checkCoord(v, "b");
    }
    for (const auto& v : proof.c) checkCoord(v, "c");
    
    for (size_t i = 0; i < proof.publicSignals.size(); ++i) {
        if (!FieldElement::IsCanonical(proof.publicSignals[i])) {
            throw MalformedProofInput("public signal " + std::to_string(i) +
                                      " is not below the scalar field modulus");
        }
    }
}

// ============================================================================
// MockVerifier
// ============================================================================

bool MockVerifier::Verify(ProofType type, const OnChainProof& proof) const {
    CheckProofRanges(proof);
    if (proof.publicSignals.size() != compliance::GetCircuitSpec(type).PublicSignalCount()) {
        return false;
    }
    return !IsAllZero(proof);
}

// ============================================================================
// RealVerifier
// ============================================================================

struct RealVerifier::PreparedKey {
    size_t nPublic{0};
    G1 alpha;
    G2 beta;
    G2 gamma;
    G2 delta;
    std::vector<G1> ic;
};

RealVerifier::RealVerifier(const std::map<ProofType, VerificationKey>& keys) {
    InitPairing();
    
    for (const auto& [type, vk] : keys) {
        const auto& spec = compliance::GetCircuitSpec(type);
        std::string name = spec.circuitName;
        if (vk.nPublic != spec.PublicSignalCount() || vk.ic.size() != vk.nPublic + 1) {
            throw ComplianceError(ErrorCode::MalformedVerificationKey,
                                  name + " key does not match the circuit's public signals");
        }
        
        auto prepared = std::make_unique<PreparedKey>();
        prepared->nPublic = vk.nPublic;
        bool ok = ToG1(prepared->alpha, vk.alpha.x, vk.alpha.y) &&
                  ToG2(prepared->beta, vk.beta) &&
                  ToG2(prepared->gamma, vk.gamma) &&
                  ToG2(prepared->delta, vk.delta);
        prepared->ic.resize(vk.ic.size());
        for (size_t i = 0; ok && i < vk.ic.size(); ++i) {
            ok = ToG1(prepared->ic[i], vk.ic[i].x, vk.ic[i].y);
        }
        if (!ok) {
            throw ComplianceError(ErrorCode::MalformedVerificationKey,
                                  name + " key contains a point off the curve");
        }
        keys_.emplace(type, std::move(prepared));
    }
}

RealVerifier::~RealVerifier() = default;

bool RealVerifier::Verify(ProofType type, const OnChainProof& proof) const {
    CheckProofRanges(proof);
    
    auto it = keys_.find(type);
    if (it == keys_.end()) {
        throw ComplianceError(ErrorCode::CircuitArtifactMissing,
                              std::string("no verification key for ") +
                              compliance::GetCircuitSpec(type).circuitName);
    }
    const PreparedKey& key = *it->second;
    
    if (proof.publicSignals.size() != key.nPublic) {
        return false;
    }
    
    // Calldata carries b as (c1, c0) pairs
    G1 a, c;
    G2 b;
    if (!ToG1(a, proof.a[0], proof.a[1]) ||
        !ToG1(c, proof.c[0], proof.c[1]) ||
        !ToG2(b, proof.b[0][1], proof.b[0][0], proof.b[1][1], proof.b[1][0])) {
        LOG_DEBUG(util::LogCategory::VERIFIER) << "Proof point not on curve";
        return false;
    }
    
    G1 vkX = key.ic[0];
    for (size_t i = 0; i < key.nPublic; ++i) {
        Fr s;
        if (!SetFr(s, proof.publicSignals[i])) {
            return false;
        }
        G1 term;
        G1::mul(term, key.ic[i + 1], s);
        G1::add(vkX, vkX, term);
    }
    
    G1 negA;
    G1::neg(negA, a);
    
    const G1 ps[4] = {negA, key.alpha, vkX, c};
    const G2 qs[4] = {b, key.beta, key.gamma, key.delta};
    Fp12 f;
    mcl::bn::millerLoopVec(f, ps, qs, 4);
    mcl::bn::finalExp(f, f);
    return f.isOne();
}

// ============================================================================
// VerificationGateway
// ============================================================================

VerificationGateway::VerificationGateway(std::unique_ptr<ProofVerifier> verifier)
    : verifier_(std::move(verifier)) {
    if (!verifier_) {
        throw std::invalid_argument("VerificationGateway requires a verifier");
    }
    LOG_INFO(util::LogCategory::VERIFIER) << "Verification gateway in "
                                          << compliance::VerifierModeName(verifier_->Mode())
                                          << " mode";
}

std::unique_ptr<VerificationGateway> VerificationGateway::CreateMock() {
    return std::make_unique<VerificationGateway>(std::make_unique<MockVerifier>());
}

std::unique_ptr<VerificationGateway> VerificationGateway::CreateReal(
    const std::map<ProofType, VerificationKey>& keys) {
    return std::make_unique<VerificationGateway>(std::make_unique<RealVerifier>(keys));
}

bool VerificationGateway::VerifyParts(ProofType type, const G1Coords& a, const G2Coords& b,
                                      const G1Coords& c, const std::vector<Uint256>& signals) {
    OnChainProof proof;
    proof.a = a;
    proof.b = b;
    proof.c = c;
    proof.publicSignals = signals;
    return Verify(type, proof);
}

bool VerificationGateway::VerifyWhitelist(const G1Coords& a, const G2Coords& b,
                                          const G1Coords& c, const std::vector<Uint256>& signals) {
    return VerifyParts(ProofType::Whitelist, a, b, c, signals);
}

bool VerificationGateway::VerifyBlacklist(const G1Coords& a, const G2Coords& b,
                                          const G1Coords& c, const std::vector<Uint256>& signals) {
    return VerifyParts(ProofType::Blacklist, a, b, c, signals);
}

bool VerificationGateway::VerifyJurisdiction(const G1Coords& a, const G2Coords& b,
                                             const G1Coords& c, const std::vector<Uint256>& signals) {
    return VerifyParts(ProofType::Jurisdiction, a, b, c, signals);
}

bool VerificationGateway::VerifyAccreditation(const G1Coords& a, const G2Coords& b,
                                              const G1Coords& c, const std::vector<Uint256>& signals) {
    return VerifyParts(ProofType::Accreditation, a, b, c, signals);
}

bool VerificationGateway::VerifyAggregation(const G1Coords& a, const G2Coords& b,
                                            const G1Coords& c, const std::vector<Uint256>& signals) {
    return VerifyParts(ProofType::Aggregation, a, b, c, signals);
}

bool VerificationGateway::Verify(ProofType type, const OnChainProof& proof) {
    bool ok = false;
    try {
        ok = verifier_->Verify(type, proof);
    } catch (const MalformedProofInput& e) {
        rejected_.fetch_add(1);
        LOG_WARN(util::LogCategory::VERIFIER) << "Malformed " << compliance::ProofTypeName(type)
                                              << " proof: " << e.what();
        throw;
    }
    
    if (ok) {
        accepted_.fetch_add(1);
    } else {
        rejected_.fetch_add(1);
    }
    LOG_DEBUG(util::LogCategory::VERIFIER) << compliance::ProofTypeName(type) << " proof "
                                           << (ok ? "accepted" : "rejected");
    return ok;
}

std::vector<bool> VerificationGateway::VerifyBatch(
    const std::vector<std::pair<ProofType, OnChainProof>>& items) {
    std::vector<bool> results;
    results.reserve(items.size());
    for (const auto& [type, proof] : items) {
        try {
            results.push_back(Verify(type, proof));
        } catch (const MalformedProofInput&) {
            results.push_back(false);
        }
    }
    return results;
}

std::unique_ptr<VerificationGateway> CreateGateway(const compliance::ComplianceConfig& config) {
    if (config.verifierMode == VerifierMode::Mock) {
        LOG_WARN(util::LogCategory::VERIFIER) << "Mock verification enabled; proofs are not checked";
        return VerificationGateway::CreateMock();
    }
    
    compliance::ArtifactStore store(config.artifactsDir);
    std::map<ProofType, VerificationKey> keys;
    for (ProofType type : compliance::AllProofTypes()) {
        keys.emplace(type, LoadVerificationKey(store, type));
    }
    return VerificationGateway::CreateReal(keys);
}

} // namespace verifier
} // namespace zkcomply
