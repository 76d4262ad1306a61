// ZKCOMPLY - Proof Formatter Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/proof_formatter.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/crypto/hash_engine.h"
#include "zkcomply/util/logging.h"

namespace zkcomply {
namespace compliance {

namespace {

/// Words in the static head of the ABI tuple: 2 + 4 + 2 + offset
constexpr size_t ABI_HEAD_WORDS = 9;
constexpr size_t ABI_WORD_SIZE = 32;

std::optional<Uint256> ParseCoordinate(const std::string& dec) {
    auto v = Uint256::FromDecimal(dec);
    if (!v || *v >= BN254_BASE_MODULUS) {
        return std::nullopt;
    }
    return v;
}

Uint256 MustParse(const std::string& dec) {
    auto v = ParseCoordinate(dec);
    if (!v) {
        throw ComplianceError(ErrorCode::InvalidInput, "invalid proof coordinate");
    }
    return *v;
}

void AppendWord(std::vector<Byte>& out, const Uint256& v) {
    auto bytes = v.ToBigEndianBytes();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

util::JSONValue DecimalArray(const Uint256* values, size_t count) {
    util::JSONValue::Array arr;
    for (size_t i = 0; i < count; ++i) {
        arr.push_back(util::JSONValue(values[i].ToDecimal()));
    }
    return util::JSONValue(std::move(arr));
}

bool ReadDecimals(const util::JSONValue& json, size_t count, Uint256* out) {
    if (!json.IsArray() || json.Size() != count) {
        return false;
    }
    for (size_t i = 0; i < count; ++i) {
        if (!json[i].IsString()) {
            return false;
        }
        auto v = Uint256::FromDecimal(json[i].GetString());
        if (!v) {
            return false;
        }
        out[i] = *v;
    }
    return true;
}

} // anonymous namespace

bool OnChainProof::operator==(const OnChainProof& other) const {
    return a == other.a && b == other.b && c == other.c &&
           publicSignals == other.publicSignals;
}

// ============================================================================
// Validation
// ============================================================================

ValidationResult ProofFormatter::ValidateStructure(const RawProof& raw) {
    if (raw.piA.size() != 3) {
        return ValidationResult::Fail("pi_a must have 3 elements");
    }
    if (raw.piC.size() != 3) {
        return ValidationResult::Fail("pi_c must have 3 elements");
    }
    if (raw.piB.size() != 3) {
        return ValidationResult::Fail("pi_b must have 3 rows");
    }
    for (const auto& row : raw.piB) {
        if (row.size() != 2) {
            return ValidationResult::Fail("pi_b rows must have 2 elements");
        }
        for (const auto& v : row) {
            if (!ParseCoordinate(v)) {
                return ValidationResult::Fail("pi_b coordinate out of range");
            }
        }
    }
    for (const auto& v : raw.piA) {
        if (!ParseCoordinate(v)) {
            return ValidationResult::Fail("pi_a coordinate out of range");
        }
    }
    for (const auto& v : raw.piC) {
        if (!ParseCoordinate(v)) {
            return ValidationResult::Fail("pi_c coordinate out of range");
        }
    }
    return ValidationResult::Ok();
}

ValidationResult ProofFormatter::ValidatePublicSignals(const std::vector<Uint256>& signals,
                                                       const std::vector<FieldElement>& expected) {
    if (signals.size() != expected.size()) {
        return ValidationResult::Fail("expected " + std::to_string(expected.size()) +
                                      " public signals, got " + std::to_string(signals.size()));
    }
    for (size_t i = 0; i < signals.size(); ++i) {
        if (!FieldElement::IsCanonical(signals[i])) {
            return ValidationResult::Fail("public signal " + std::to_string(i) +
                                          " is not a field element");
        }
        if (signals[i] != expected[i].ToUint256()) {
            return ValidationResult::Fail("public signal " + std::to_string(i) + " mismatch");
        }
    }
    return ValidationResult::Ok();
}

ValidationResult ProofFormatter::ValidateForCircuit(const OnChainProof& proof, ProofType type) {
    const CircuitSpec& spec = GetCircuitSpec(type);
    if (proof.publicSignals.size() != spec.PublicSignalCount()) {
        return ValidationResult::Fail(std::string(spec.circuitName) + " expects " +
                                      std::to_string(spec.PublicSignalCount()) +
                                      " public signals");
    }
    for (const auto& v : proof.a) {
        if (v >= BN254_BASE_MODULUS) return ValidationResult::Fail("a coordinate out of range");
    }
    for (const auto& row : proof.b) {
        for (const auto& v : row) {
            if (v >= BN254_BASE_MODULUS) return ValidationResult::Fail("b coordinate out of range");
        }
    }
    for (const auto& v : proof.c) {
        if (v >= BN254_BASE_MODULUS) return ValidationResult::Fail("c coordinate out of range");
    }
    for (const auto& s : proof.publicSignals) {
        if (!FieldElement::IsCanonical(s)) {
            return ValidationResult::Fail("public signal is not a field element");
        }
    }
    return ValidationResult::Ok();
}

// ============================================================================
// Formatting
// ============================================================================

OnChainProof ProofFormatter::Format(const RawProof& raw, const std::vector<FieldElement>& signals) {
    ValidationResult check = ValidateStructure(raw);
    if (!check) {
        LOG_WARN(util::LogCategory::FORMATTER) << "Rejected prover output: " << check.error;
        throw ComplianceError(ErrorCode::InvalidInput, check.error);
    }
    
    OnChainProof out;
    out.a = {MustParse(raw.piA[0]), MustParse(raw.piA[1])};
    // Fp2 coordinates are swapped into (c1, c0) order
    out.b[0] = {MustParse(raw.piB[0][1]), MustParse(raw.piB[0][0])};
    out.b[1] = {MustParse(raw.piB[1][1]), MustParse(raw.piB[1][0])};
    out.c = {MustParse(raw.piC[0]), MustParse(raw.piC[1])};
    
    out.publicSignals.reserve(signals.size());
    for (const auto& s : signals) {
        out.publicSignals.push_back(s.ToUint256());
    }
    return out;
}

OnChainProof ProofFormatter::Format(const GeneratedProof& generated) {
    return Format(generated.proof, generated.publicSignals);
}

std::vector<Byte> ProofFormatter::EncodeABI(const OnChainProof& proof) {
    std::vector<Byte> out;
    out.reserve((ABI_HEAD_WORDS + 1 + proof.publicSignals.size()) * ABI_WORD_SIZE);
    
    AppendWord(out, proof.a[0]);
    AppendWord(out, proof.a[1]);
    AppendWord(out, proof.b[0][0]);
    AppendWord(out, proof.b[0][1]);
    AppendWord(out, proof.b[1][0]);
    AppendWord(out, proof.b[1][1]);
    AppendWord(out, proof.c[0]);
    AppendWord(out, proof.c[1]);
    
    // Dynamic tail: offset from the start of the tuple, then length and items
    AppendWord(out, Uint256(static_cast<uint64_t>(ABI_HEAD_WORDS * ABI_WORD_SIZE)));
    AppendWord(out, Uint256(static_cast<uint64_t>(proof.publicSignals.size())));
    for (const auto& s : proof.publicSignals) {
        AppendWord(out, s);
    }
    return out;
}

Hash256 ProofFormatter::ProofHash(const OnChainProof& proof) {
    return HashEngine::Keccak(EncodeABI(proof));
}

// ============================================================================
// Export / Import
// ============================================================================

util::JSONValue ProofFormatter::Export(const OnChainProof& proof, ProofType type) {
    util::JSONValue body(util::JSONValue::Object{});
    body["a"] = DecimalArray(proof.a.data(), 2);
    util::JSONValue::Array b;
    b.push_back(DecimalArray(proof.b[0].data(), 2));
    b.push_back(DecimalArray(proof.b[1].data(), 2));
    body["b"] = util::JSONValue(std::move(b));
    body["c"] = DecimalArray(proof.c.data(), 2);
    
    util::JSONValue json(util::JSONValue::Object{});
    json["version"] = PROOF_EXPORT_VERSION;
    json["type"] = ProofTypeName(type);
    json["proof"] = std::move(body);
    json["publicSignals"] = DecimalArray(proof.publicSignals.data(), proof.publicSignals.size());
    json["hash"] = "0x" + ProofHash(proof).ToHex();
    return json;
}

std::optional<ImportedProof> ProofFormatter::Import(const util::JSONValue& json) {
    if (!json.IsObject()) {
        return std::nullopt;
    }
    if (json["version"].GetString() != PROOF_EXPORT_VERSION) {
        LOG_DEBUG(util::LogCategory::FORMATTER) << "Unsupported export version";
        return std::nullopt;
    }
    auto type = ProofTypeFromString(json["type"].GetString());
    if (!type) {
        return std::nullopt;
    }
    
    ImportedProof out;
    out.type = *type;
    const util::JSONValue& body = json["proof"];
    const util::JSONValue& b = body["b"];
    if (!ReadDecimals(body["a"], 2, out.proof.a.data()) ||
        !ReadDecimals(body["c"], 2, out.proof.c.data()) ||
        !b.IsArray() || b.Size() != 2 ||
        !ReadDecimals(b[0], 2, out.proof.b[0].data()) ||
        !ReadDecimals(b[1], 2, out.proof.b[1].data())) {
        return std::nullopt;
    }
    
    const util::JSONValue& signals = json["publicSignals"];
    if (!signals.IsArray()) {
        return std::nullopt;
    }
    out.proof.publicSignals.resize(signals.Size());
    if (!ReadDecimals(signals, signals.Size(), out.proof.publicSignals.data())) {
        return std::nullopt;
    }
    
    if (!json["hash"].IsString()) {
        return std::nullopt;
    }
    try {
        out.hash = Hash256::FromHex(json["hash"].GetString());
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (out.hash != ProofHash(out.proof)) {
        LOG_WARN(util::LogCategory::FORMATTER) << "Imported proof hash mismatch";
        return std::nullopt;
    }
    return out;
}

} // namespace compliance
} // namespace zkcomply
