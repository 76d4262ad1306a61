// ZKCOMPLY - Hash Engine Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/crypto/hash_engine.h"
#include "zkcomply/crypto/keccak.h"
#include "zkcomply/crypto/poseidon.h"
#include "zkcomply/core/random.h"

#include <array>
#include <stdexcept>

namespace zkcomply {

FieldElement HashEngine::Hash(const std::vector<FieldElement>& inputs) {
    return Poseidon::Hash(inputs);
}

FieldElement HashEngine::HashLeaf(const FieldElement& identity) {
    return Poseidon::Hash({identity});
}

FieldElement HashEngine::HashPair(const FieldElement& left, const FieldElement& right) {
    return Poseidon::Hash2(left, right);
}

FieldElement HashEngine::Commit(const std::vector<FieldElement>& values,
                                const FieldElement& salt) {
    if (values.empty()) {
        throw std::invalid_argument("Commitment requires at least one value");
    }
    std::vector<FieldElement> inputs(values);
    inputs.push_back(salt);
    return Poseidon::Hash(inputs);
}

FieldElement HashEngine::GenerateSalt() {
    // 248 random bits are always below p, so no reduction bias
    std::array<Byte, 32> bytes{};
    GetRandBytes(bytes.data(), 31);
    return FieldElement::FromBytes(bytes.data(), bytes.size());
}

FieldElement HashEngine::DeriveIdentity(const Byte* data, size_t len) {
    Hash256 digest = Keccak256Hash(data, len);
    return FieldElement(Uint256::FromBigEndian(digest.data(), digest.size()));
}

FieldElement HashEngine::DeriveIdentity(const std::string& credential) {
    return DeriveIdentity(reinterpret_cast<const Byte*>(credential.data()),
                          credential.size());
}

Hash256 HashEngine::Keccak(const Byte* data, size_t len) {
    return Keccak256Hash(data, len);
}

Hash256 HashEngine::Keccak(const std::vector<Byte>& data) {
    return Keccak256Hash(data);
}

Hash256 HashEngine::Fingerprint(const std::vector<FieldElement>& elements) {
    Keccak256 hasher;
    for (const auto& element : elements) {
        auto word = element.ToUint256().ToBigEndianBytes();
        hasher.Write(word.data(), word.size());
    }
    Hash256 result;
    hasher.Finalize(result.data());
    return result;
}

} // namespace zkcomply
