// ZKCOMPLY - Verification Gateway Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcomply/compliance/errors.h"
#include "zkcomply/verifier/gateway.h"

#include <mcl/bn.hpp>

#include <cstdlib>
#include <filesystem>

namespace zkcomply {
namespace verifier {
namespace test {

namespace fs = std::filesystem;
using compliance::ComplianceError;
using compliance::ErrorCode;
using mcl::bn::Fr;
using mcl::bn::G1;
using mcl::bn::G2;

namespace {

Uint256 FromMcl(const mcl::bn::Fp& v) {
    auto parsed = Uint256::FromDecimal(v.getStr(10));
    EXPECT_TRUE(parsed.has_value());
    return parsed.value_or(Uint256());
}

G1Affine ToAffine(G1 p) {
    p.normalize();
    return G1Affine{FromMcl(p.x), FromMcl(p.y)};
}

G2Affine ToAffine(G2 p) {
    p.normalize();
    return G2Affine{FromMcl(p.x.a), FromMcl(p.x.b), FromMcl(p.y.a), FromMcl(p.y.b)};
}

Fr Scalar(const std::string& label) {
    Fr v;
    v.setHashOf(label);
    return v;
}

/**
 * Groth16 key built from known exponents, so valid proofs for any public
 * signals can be produced without a circuit:
 *   C = g1 * (ab - alpha*beta - x*gamma) / delta
 */
class TrapdoorKey {
public:
    explicit TrapdoorKey(size_t nPublic, const std::string& seed = "zkcomply") {
        InitPairing();
        mcl::bn::hashAndMapToG1(g1_, "g1", 2);
        mcl::bn::hashAndMapToG2(g2_, "g2", 2);
        alpha_ = Scalar(seed + "alpha");
        beta_ = Scalar(seed + "beta");
        gamma_ = Scalar(seed + "gamma");
        delta_ = Scalar(seed + "delta");
        for (size_t i = 0; i <= nPublic; ++i) {
            ic_.push_back(Scalar(seed + "ic" + std::to_string(i)));
        }
        
        G1 g1p;
        G2 g2p;
        key_.nPublic = nPublic;
        G1::mul(g1p, g1_, alpha_);
        key_.alpha = ToAffine(g1p);
        G2::mul(g2p, g2_, beta_);
        key_.beta = ToAffine(g2p);
        G2::mul(g2p, g2_, gamma_);
        key_.gamma = ToAffine(g2p);
        G2::mul(g2p, g2_, delta_);
        key_.delta = ToAffine(g2p);
        for (const Fr& k : ic_) {
            G1::mul(g1p, g1_, k);
            key_.ic.push_back(ToAffine(g1p));
        }
    }
    
    const VerificationKey& Key() const { return key_; }
    
    OnChainProof Prove(const std::vector<uint64_t>& signals, const std::string& nonce = "r") const {
        G1 pa, pc;
        G2 pb;
        Points(signals, nonce, pa, pb, pc);
        G1Affine A = ToAffine(pa);
        G2Affine B = ToAffine(pb);
        G1Affine C = ToAffine(pc);
        
        OnChainProof proof;
        proof.a = {A.x, A.y};
        proof.b[0] = {B.x1, B.x0};
        proof.b[1] = {B.y1, B.y0};
        proof.c = {C.x, C.y};
        for (uint64_t s : signals) {
            proof.publicSignals.push_back(Uint256(s));
        }
        return proof;
    }
    
    /// Same proof as Prove(), written the way snarkjs writes proof.json
    compliance::RawProof ProveRaw(const std::vector<uint64_t>& signals,
                                  const std::string& nonce = "r") const {
        G1 pa, pc;
        G2 pb;
        Points(signals, nonce, pa, pb, pc);
        pa.normalize();
        pb.normalize();
        pc.normalize();
        
        compliance::RawProof raw;
        raw.piA = {pa.x.getStr(10), pa.y.getStr(10), "1"};
        raw.piB = {{pb.x.a.getStr(10), pb.x.b.getStr(10)},
                   {pb.y.a.getStr(10), pb.y.b.getStr(10)},
                   {"1", "0"}};
        raw.piC = {pc.x.getStr(10), pc.y.getStr(10), "1"};
        return raw;
    }

private:
    void Points(const std::vector<uint64_t>& signals, const std::string& nonce,
                G1& pa, G2& pb, G1& pc) const {
        Fr a = Scalar(nonce + "a");
        Fr b = Scalar(nonce + "b");
        
        Fr x = ic_[0];
        for (size_t i = 0; i < signals.size() && i + 1 < ic_.size(); ++i) {
            Fr term;
            Fr::mul(term, ic_[i + 1], Fr(static_cast<int64_t>(signals[i])));
            Fr::add(x, x, term);
        }
        
        Fr ab, albe, xg, c;
        Fr::mul(ab, a, b);
        Fr::mul(albe, alpha_, beta_);
        Fr::mul(xg, x, gamma_);
        Fr::sub(c, ab, albe);
        Fr::sub(c, c, xg);
        Fr::div(c, c, delta_);
        
        G1::mul(pa, g1_, a);
        G2::mul(pb, g2_, b);
        G1::mul(pc, g1_, c);
    }
    
    G1 g1_;
    G2 g2_;
    Fr alpha_, beta_, gamma_, delta_;
    std::vector<Fr> ic_;
    VerificationKey key_;
};

OnChainProof NonZeroProof(size_t signals) {
    OnChainProof proof;
    proof.a = {Uint256(1), Uint256(2)};
    proof.b[0] = {Uint256(3), Uint256(4)};
    proof.b[1] = {Uint256(5), Uint256(6)};
    proof.c = {Uint256(7), Uint256(8)};
    for (size_t i = 0; i < signals; ++i) {
        proof.publicSignals.push_back(Uint256(i + 1));
    }
    return proof;
}

} // namespace

// ============================================================================
// Range checks
// ============================================================================

TEST(ProofRangeTest, CoordinatesBelowBaseModulus) {
    OnChainProof proof = NonZeroProof(1);
    EXPECT_NO_THROW(CheckProofRanges(proof));
    
    proof.b[1][1] = BN254_BASE_MODULUS;
    EXPECT_THROW(CheckProofRanges(proof), MalformedProofInput);
}

TEST(ProofRangeTest, SignalsBelowScalarModulus) {
    OnChainProof proof = NonZeroProof(1);
    proof.publicSignals[0] = FieldElement::MODULUS;
    EXPECT_THROW(CheckProofRanges(proof), MalformedProofInput);
    
    bool borrow = false;
    proof.publicSignals[0] = Uint256::Sub(FieldElement::MODULUS, Uint256(1), borrow);
    EXPECT_NO_THROW(CheckProofRanges(proof));
}

// ============================================================================
// Mock mode
// ============================================================================

TEST(MockGatewayTest, AcceptsWellFormedProofs) {
    auto gateway = VerificationGateway::CreateMock();
    EXPECT_EQ(gateway->Mode(), VerifierMode::Mock);
    
    OnChainProof proof = NonZeroProof(1);
    EXPECT_TRUE(gateway->VerifyWhitelist(proof.a, proof.b, proof.c, proof.publicSignals));
    
    OnChainProof agg = NonZeroProof(6);
    EXPECT_TRUE(gateway->VerifyAggregation(agg.a, agg.b, agg.c, agg.publicSignals));
    EXPECT_EQ(gateway->AcceptedCount(), 2u);
}

TEST(MockGatewayTest, RejectsWrongSignalCount) {
    auto gateway = VerificationGateway::CreateMock();
    OnChainProof proof = NonZeroProof(1);
    EXPECT_FALSE(gateway->VerifyBlacklist(proof.a, proof.b, proof.c, proof.publicSignals));
    EXPECT_FALSE(gateway->VerifyJurisdiction(proof.a, proof.b, proof.c, {}));
    EXPECT_EQ(gateway->RejectedCount(), 2u);
}

TEST(MockGatewayTest, RejectsAllZeroProof) {
    auto gateway = VerificationGateway::CreateMock();
    OnChainProof proof;
    proof.publicSignals = {Uint256(1)};
    EXPECT_FALSE(gateway->VerifyAccreditation(proof.a, proof.b, proof.c, proof.publicSignals));
}

TEST(MockGatewayTest, MalformedInputThrowsAndCounts) {
    auto gateway = VerificationGateway::CreateMock();
    OnChainProof proof = NonZeroProof(1);
    proof.a[0] = BN254_BASE_MODULUS;
    EXPECT_THROW(gateway->Verify(ProofType::Whitelist, proof), MalformedProofInput);
    EXPECT_EQ(gateway->RejectedCount(), 1u);
    EXPECT_EQ(gateway->AcceptedCount(), 0u);
}

TEST(MockGatewayTest, BatchReportsMalformedAsFalse) {
    auto gateway = VerificationGateway::CreateMock();
    OnChainProof good = NonZeroProof(1);
    OnChainProof bad = good;
    bad.publicSignals[0] = FieldElement::MODULUS;
    
    auto results = gateway->VerifyBatch({
        {ProofType::Whitelist, good},
        {ProofType::Whitelist, bad},
        {ProofType::Blacklist, NonZeroProof(3)},
    });
    std::vector<bool> expected = {true, false, true};
    EXPECT_EQ(results, expected);
}

TEST(GatewayTest, NullVerifierRejected) {
    EXPECT_THROW(VerificationGateway(nullptr), std::invalid_argument);
}

// ============================================================================
// Real mode
// ============================================================================

class RealGatewayTest : public ::testing::Test {
protected:
    RealGatewayTest() : whitelist_(1), aggregation_(6, "agg") {}
    
    std::unique_ptr<VerificationGateway> Gateway() const {
        return VerificationGateway::CreateReal({
            {ProofType::Whitelist, whitelist_.Key()},
            {ProofType::Aggregation, aggregation_.Key()},
        });
    }
    
    TrapdoorKey whitelist_;
    TrapdoorKey aggregation_;
};

TEST_F(RealGatewayTest, AcceptsValidProof) {
    auto gateway = Gateway();
    EXPECT_EQ(gateway->Mode(), VerifierMode::Real);
    
    OnChainProof proof = whitelist_.Prove({424242});
    EXPECT_TRUE(gateway->VerifyWhitelist(proof.a, proof.b, proof.c, proof.publicSignals));
    
    OnChainProof agg = aggregation_.Prove({50, 12345, 30, 30, 20, 20});
    EXPECT_TRUE(gateway->VerifyAggregation(agg.a, agg.b, agg.c, agg.publicSignals));
    EXPECT_EQ(gateway->AcceptedCount(), 2u);
}

TEST_F(RealGatewayTest, FormattedSnarkjsProofVerifies) {
    auto gateway = Gateway();
    compliance::RawProof raw = whitelist_.ProveRaw({424242});
    OnChainProof proof = compliance::ProofFormatter::Format(raw, {FieldElement(424242)});
    EXPECT_TRUE(gateway->VerifyWhitelist(proof.a, proof.b, proof.c, proof.publicSignals));
    
    OnChainProof direct = whitelist_.Prove({424242});
    EXPECT_EQ(proof.b, direct.b);
    
    proof.b[1][0] = proof.b[1][0] ^ Uint256(1);
    EXPECT_FALSE(gateway->VerifyWhitelist(proof.a, proof.b, proof.c, proof.publicSignals));
}

TEST_F(RealGatewayTest, RejectsChangedSignal) {
    auto gateway = Gateway();
    OnChainProof proof = whitelist_.Prove({424242});
    proof.publicSignals[0] = Uint256(424243);
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, RejectsProofForOtherSignals) {
    auto gateway = Gateway();
    OnChainProof proof = whitelist_.Prove({1});
    OnChainProof other = whitelist_.Prove({2}, "s");
    proof.c = other.c;
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, RejectsFlippedCoordinate) {
    auto gateway = Gateway();
    OnChainProof proof = whitelist_.Prove({7});
    proof.c[1] = proof.c[1] ^ Uint256(1);
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, RejectsUnswappedG2) {
    auto gateway = Gateway();
    OnChainProof proof = whitelist_.Prove({7});
    std::swap(proof.b[0][0], proof.b[0][1]);
    std::swap(proof.b[1][0], proof.b[1][1]);
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, RejectsOffCurvePoint) {
    auto gateway = Gateway();
    OnChainProof proof = whitelist_.Prove({7});
    proof.a = {Uint256(1), Uint256(1)};
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, RejectsWrongSignalCount) {
    auto gateway = Gateway();
    OnChainProof proof = whitelist_.Prove({7});
    proof.publicSignals.push_back(Uint256(8));
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, RejectsProofUnderOtherKey) {
    TrapdoorKey other(1, "other");
    auto gateway = Gateway();
    OnChainProof proof = other.Prove({7});
    EXPECT_FALSE(gateway->Verify(ProofType::Whitelist, proof));
}

TEST_F(RealGatewayTest, MissingKeyForType) {
    auto gateway = Gateway();
    OnChainProof proof = NonZeroProof(1);
    try {
        gateway->Verify(ProofType::Jurisdiction, proof);
        FAIL() << "expected CircuitArtifactMissing";
    } catch (const ComplianceError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::CircuitArtifactMissing);
    }
}

TEST_F(RealGatewayTest, KeyMustMatchCircuit) {
    try {
        VerificationGateway::CreateReal({{ProofType::Blacklist, whitelist_.Key()}});
        FAIL() << "expected MalformedVerificationKey";
    } catch (const ComplianceError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::MalformedVerificationKey);
    }
}

TEST_F(RealGatewayTest, KeyPointsMustBeOnCurve) {
    VerificationKey key = whitelist_.Key();
    key.alpha = G1Affine{Uint256(1), Uint256(1)};
    try {
        RealVerifier verifier({{ProofType::Whitelist, key}});
        FAIL() << "expected MalformedVerificationKey";
    } catch (const ComplianceError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::MalformedVerificationKey);
    }
}

TEST_F(RealGatewayTest, KeySurvivesJsonExport) {
    VerificationKey key = VerificationKey::FromJSON(whitelist_.Key().ToJSON());
    RealVerifier verifier({{ProofType::Whitelist, key}});
    EXPECT_TRUE(verifier.HasKey(ProofType::Whitelist));
    EXPECT_TRUE(verifier.Verify(ProofType::Whitelist, whitelist_.Prove({99})));
}

TEST_F(RealGatewayTest, BatchVerification) {
    auto gateway = Gateway();
    OnChainProof good = whitelist_.Prove({1});
    OnChainProof bad = good;
    bad.publicSignals[0] = Uint256(2);
    auto results = gateway->VerifyBatch({{ProofType::Whitelist, good},
                                         {ProofType::Whitelist, bad}});
    std::vector<bool> expected = {true, false};
    EXPECT_EQ(results, expected);
    EXPECT_EQ(gateway->AcceptedCount(), 1u);
    EXPECT_EQ(gateway->RejectedCount(), 1u);
}

// ============================================================================
// Factory
// ============================================================================

class GatewayFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string pattern = (fs::temp_directory_path() / "zkcomply-gw-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        ASSERT_NE(::mkdtemp(buf.data()), nullptr);
        root_ = buf.data();
        config_.artifactsDir = root_.string();
    }
    
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    
    void InstallKey(ProofType type, const VerificationKey& key) {
        compliance::ArtifactStore store(root_.string());
        fs::path path = store.PathsFor(type).verificationKey;
        fs::create_directories(path.parent_path());
        ASSERT_TRUE(util::SaveJSONFile(path.string(), key.ToJSON()));
    }
    
    fs::path root_;
    compliance::ComplianceConfig config_;
};

TEST_F(GatewayFactoryTest, MockMode) {
    config_.verifierMode = VerifierMode::Mock;
    auto gateway = CreateGateway(config_);
    EXPECT_EQ(gateway->Mode(), VerifierMode::Mock);
}

TEST_F(GatewayFactoryTest, RealModeNeedsEveryKey) {
    config_.verifierMode = VerifierMode::Real;
    InstallKey(ProofType::Whitelist, TrapdoorKey(1).Key());
    try {
        CreateGateway(config_);
        FAIL() << "expected CircuitArtifactMissing";
    } catch (const ComplianceError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::CircuitArtifactMissing);
    }
}

TEST_F(GatewayFactoryTest, RealModeLoadsKeys) {
    config_.verifierMode = VerifierMode::Real;
    TrapdoorKey whitelist(1);
    InstallKey(ProofType::Whitelist, whitelist.Key());
    InstallKey(ProofType::Blacklist, TrapdoorKey(3, "bl").Key());
    InstallKey(ProofType::Jurisdiction, TrapdoorKey(1, "jur").Key());
    InstallKey(ProofType::Accreditation, TrapdoorKey(1, "acc").Key());
    InstallKey(ProofType::Aggregation, TrapdoorKey(6, "agg").Key());
    
    auto gateway = CreateGateway(config_);
    EXPECT_EQ(gateway->Mode(), VerifierMode::Real);
    EXPECT_TRUE(gateway->Verify(ProofType::Whitelist, whitelist.Prove({5})));
}

} // namespace test
} // namespace verifier
} // namespace zkcomply
