// ZKCOMPLY - Groth16 Verification Keys Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/verifier/verification_key.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/util/logging.h"

#include <filesystem>

namespace zkcomply {
namespace verifier {

using compliance::ComplianceError;
using compliance::ErrorCode;

namespace {

[[noreturn]] void Malformed(const std::string& reason) {
    throw ComplianceError(ErrorCode::MalformedVerificationKey, reason);
}

Uint256 ReadCoordinate(const util::JSONValue& json, const std::string& field) {
    if (!json.IsString()) {
        Malformed(field + " coordinate must be a decimal string");
    }
    auto v = Uint256::FromDecimal(json.GetString());
    if (!v || *v >= BN254_BASE_MODULUS) {
        Malformed(field + " coordinate out of range");
    }
    return *v;
}

G1Affine ReadG1(const util::JSONValue& json, const std::string& field) {
    if (!json.IsArray() || json.Size() != 3) {
        Malformed(field + " must be [x, y, z]");
    }
    G1Affine p;
    p.x = ReadCoordinate(json[0], field);
    p.y = ReadCoordinate(json[1], field);
    if (ReadCoordinate(json[2], field).IsZero()) {
        p = G1Affine{};
    }
    return p;
}

G2Affine ReadG2(const util::JSONValue& json, const std::string& field) {
    if (!json.IsArray() || json.Size() != 3) {
        Malformed(field + " must be [x, y, z]");
    }
    for (size_t i = 0; i < 3; ++i) {
        if (!json[i].IsArray() || json[i].Size() != 2) {
            Malformed(field + " coordinates must be Fp2 pairs");
        }
    }
    G2Affine p;
    p.x0 = ReadCoordinate(json[0][0], field);
    p.x1 = ReadCoordinate(json[0][1], field);
    p.y0 = ReadCoordinate(json[1][0], field);
    p.y1 = ReadCoordinate(json[1][1], field);
    return p;
}

util::JSONValue WriteG1(const G1Affine& p) {
    bool infinity = p.x.IsZero() && p.y.IsZero();
    return util::JSONValue(util::JSONValue::Array{
        p.x.ToDecimal(), infinity ? "1" : p.y.ToDecimal(), infinity ? "0" : "1"});
}

util::JSONValue WriteG2(const G2Affine& p) {
    using Array = util::JSONValue::Array;
    return util::JSONValue(Array{
        util::JSONValue(Array{p.x0.ToDecimal(), p.x1.ToDecimal()}),
        util::JSONValue(Array{p.y0.ToDecimal(), p.y1.ToDecimal()}),
        util::JSONValue(Array{"1", "0"})});
}

} // anonymous namespace

VerificationKey VerificationKey::FromJSON(const util::JSONValue& json) {
    if (!json.IsObject()) {
        Malformed("verification key must be a JSON object");
    }
    if (json["protocol"].GetString() != "groth16") {
        Malformed("unsupported protocol '" + json["protocol"].GetString() + "'");
    }
    if (json["curve"].GetString() != "bn128") {
        Malformed("unsupported curve '" + json["curve"].GetString() + "'");
    }
    if (!json["nPublic"].IsInt() || json["nPublic"].GetInt() < 0) {
        Malformed("nPublic must be a non-negative integer");
    }
    
    VerificationKey vk;
    vk.nPublic = static_cast<size_t>(json["nPublic"].GetInt());
    vk.alpha = ReadG1(json["vk_alpha_1"], "vk_alpha_1");
    vk.beta = ReadG2(json["vk_beta_2"], "vk_beta_2");
    vk.gamma = ReadG2(json["vk_gamma_2"], "vk_gamma_2");
    vk.delta = ReadG2(json["vk_delta_2"], "vk_delta_2");
    
    const util::JSONValue& ic = json["IC"];
    if (!ic.IsArray()) {
        Malformed("IC must be an array");
    }
    for (size_t i = 0; i < ic.Size(); ++i) {
        vk.ic.push_back(ReadG1(ic[i], "IC[" + std::to_string(i) + "]"));
    }
    if (vk.ic.size() != vk.nPublic + 1) {
        Malformed("IC has " + std::to_string(vk.ic.size()) + " points for nPublic " +
                  std::to_string(vk.nPublic));
    }
    return vk;
}

util::JSONValue VerificationKey::ToJSON() const {
    util::JSONValue json(util::JSONValue::Object{});
    json["protocol"] = "groth16";
    json["curve"] = "bn128";
    json["nPublic"] = static_cast<uint64_t>(nPublic);
    json["vk_alpha_1"] = WriteG1(alpha);
    json["vk_beta_2"] = WriteG2(beta);
    json["vk_gamma_2"] = WriteG2(gamma);
    json["vk_delta_2"] = WriteG2(delta);
    util::JSONValue::Array points;
    for (const auto& p : ic) {
        points.push_back(WriteG1(p));
    }
    json["IC"] = util::JSONValue(std::move(points));
    return json;
}

VerificationKey LoadVerificationKey(const compliance::ArtifactStore& store,
                                    compliance::ProofType type) {
    const auto& spec = compliance::GetCircuitSpec(type);
    std::string path = store.PathsFor(type).verificationKey;
    
    if (!std::filesystem::is_regular_file(path)) {
        throw ComplianceError(ErrorCode::CircuitArtifactMissing,
                              "verification key not found: " + path);
    }
    auto json = util::LoadJSONFile(path);
    if (!json) {
        Malformed(path + " is not valid JSON");
    }
    
    VerificationKey vk = VerificationKey::FromJSON(*json);
    if (vk.nPublic != spec.PublicSignalCount()) {
        Malformed(std::string(spec.circuitName) + " key declares " +
                  std::to_string(vk.nPublic) + " public signals, circuit has " +
                  std::to_string(spec.PublicSignalCount()));
    }
    
    LOG_DEBUG(util::LogCategory::VERIFIER) << "Loaded verification key for "
                                           << spec.circuitName;
    return vk;
}

std::map<compliance::ProofType, VerificationKey>
LoadVerificationKeys(const compliance::ArtifactStore& store) {
    std::map<compliance::ProofType, VerificationKey> keys;
    for (compliance::ProofType type : compliance::AllProofTypes()) {
        if (store.HasVerificationKey(type)) {
            keys.emplace(type, LoadVerificationKey(store, type));
        }
    }
    LOG_INFO(util::LogCategory::VERIFIER) << "Loaded " << keys.size() << " verification key(s)";
    return keys;
}

} // namespace verifier
} // namespace zkcomply
