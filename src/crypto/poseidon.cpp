// ZKCOMPLY - Poseidon Hash Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field

#include "zkcomply/crypto/poseidon.h"
#include "zkcomply/util/logging.h"

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace zkcomply {

namespace {

/// Partial rounds indexed by t - 2, for t = 2..17
constexpr size_t PARTIAL_ROUNDS[Poseidon::MAX_INPUTS] = {
    56, 57, 56, 60, 60, 63, 64, 63, 60, 66, 60, 65, 70, 60, 64, 68
};

constexpr size_t FULL_ROUNDS = 8;

/// Bit length of the scalar field prime
constexpr size_t FIELD_BITS = 254;

// ============================================================================
// Grain LFSR
// ============================================================================

/// The 80-bit self-shrinking Grain LFSR used by the Poseidon reference
/// parameter script to derive round constants and the MDS matrix.
class GrainLfsr {
public:
    explicit GrainLfsr(const PoseidonConfig& config) {
        size_t pos = 0;
        auto push = [&](uint64_t value, size_t bits) {
            for (size_t i = bits; i-- > 0;) {
                state_[pos++] = ((value >> i) & 1) != 0;
            }
        };
        push(1, 2);                      // prime field
        push(0, 4);                      // x^alpha s-box
        push(FIELD_BITS, 12);
        push(config.width, 12);
        push(config.fullRounds, 10);
        push(config.partialRounds, 10);
        push(0x3FFFFFFF, 30);
        
        for (int i = 0; i < 160; ++i) {
            NextRawBit();
        }
    }
    
    /// Next filtered bit: pairs are drawn and the second bit is emitted
    /// only when the first one is set.
    bool NextBit() {
        bool first = NextRawBit();
        bool second = NextRawBit();
        while (!first) {
            first = NextRawBit();
            second = NextRawBit();
        }
        return second;
    }
    
    /// FIELD_BITS filtered bits, most significant first
    Uint256 NextValue() {
        Uint256 v;
        for (size_t i = 0; i < FIELD_BITS; ++i) {
            v = v << 1;
            if (NextBit()) {
                v.limbs[0] |= 1;
            }
        }
        return v;
    }
    
    /// Uniform canonical field element by rejection sampling
    FieldElement NextFieldElement() {
        Uint256 v = NextValue();
        while (!FieldElement::IsCanonical(v)) {
            v = NextValue();
        }
        return FieldElement(v);
    }

private:
    std::array<bool, 80> state_{};
    size_t head_{0};
    
    bool At(size_t i) const { return state_[(head_ + i) % 80]; }
    
    bool NextRawBit() {
        bool bit = At(62) ^ At(51) ^ At(38) ^ At(23) ^ At(13) ^ At(0);
        state_[head_] = bit;
        head_ = (head_ + 1) % 80;
        return bit;
    }
};

} // anonymous namespace

// ============================================================================
// Configuration
// ============================================================================

PoseidonConfig PoseidonConfig::ForInputs(size_t numInputs) {
    if (numInputs == 0 || numInputs > Poseidon::MAX_INPUTS) {
        throw std::invalid_argument("Poseidon supports 1 to 16 inputs, got " +
                                    std::to_string(numInputs));
    }
    return PoseidonConfig{numInputs + 1, FULL_ROUNDS, PARTIAL_ROUNDS[numInputs - 1]};
}

// ============================================================================
// Parameters
// ============================================================================

PoseidonParameters::PoseidonParameters(const PoseidonConfig& config)
    : config_(config) {
    GrainLfsr grain(config_);
    
    // Round constants come first in the Grain stream
    size_t count = config_.width * config_.totalRounds();
    roundConstants_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        roundConstants_.push_back(grain.NextFieldElement());
    }
    
    // Cauchy matrix M[i][j] = 1 / (x_i + y_j) over 2t distinct samples
    const size_t t = config_.width;
    while (true) {
        std::vector<FieldElement> samples;
        std::set<FieldElement> seen;
        while (seen.size() != 2 * t) {
            samples.clear();
            seen.clear();
            for (size_t i = 0; i < 2 * t; ++i) {
                FieldElement fe(grain.NextValue());
                samples.push_back(fe);
                seen.insert(fe);
            }
        }
        
        bool usable = true;
        mds_.assign(t, std::vector<FieldElement>(t));
        for (size_t i = 0; i < t && usable; ++i) {
            for (size_t j = 0; j < t; ++j) {
                FieldElement sum = samples[i] + samples[t + j];
                if (sum.IsZero()) {
                    usable = false;
                    break;
                }
                mds_[i][j] = sum.Inverse();
            }
        }
        if (usable) {
            break;
        }
    }
}

const PoseidonParameters& PoseidonParameters::ForInputs(size_t numInputs) {
    static std::mutex mutex;
    static std::map<size_t, std::unique_ptr<PoseidonParameters>> cache;
    
    PoseidonConfig config = PoseidonConfig::ForInputs(numInputs);
    
    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(numInputs);
    if (it == cache.end()) {
        it = cache.emplace(numInputs, std::make_unique<PoseidonParameters>(config)).first;
        LOG_DEBUG(util::LogCategory::HASH) << "Derived Poseidon parameters for t="
                                           << config.width;
    }
    return *it->second;
}

// ============================================================================
// Poseidon Implementation
// ============================================================================

Poseidon::Poseidon(size_t numInputs)
    : params_(PoseidonParameters::ForInputs(numInputs))
    , state_(params_.Config().width, FieldElement::Zero()) {}

void Poseidon::AddRoundConstants(size_t roundIdx) {
    for (size_t i = 0; i < state_.size(); ++i) {
        state_[i] += params_.RoundConstant(roundIdx, i);
    }
}

void Poseidon::MixColumns() {
    const size_t t = state_.size();
    std::vector<FieldElement> newState(t, FieldElement::Zero());
    
    for (size_t i = 0; i < t; ++i) {
        for (size_t j = 0; j < t; ++j) {
            newState[i] += params_.Mds(i, j) * state_[j];
        }
    }
    
    state_ = std::move(newState);
}

void Poseidon::FullRound(size_t roundIdx) {
    AddRoundConstants(roundIdx);
    for (auto& element : state_) {
        element = element.PoseidonSbox();
    }
    MixColumns();
}

void Poseidon::PartialRound(size_t roundIdx) {
    AddRoundConstants(roundIdx);
    state_[0] = state_[0].PoseidonSbox();
    MixColumns();
}

void Poseidon::Permute() {
    const PoseidonConfig& config = params_.Config();
    size_t roundIdx = 0;
    size_t halfFullRounds = config.fullRounds / 2;
    
    for (size_t i = 0; i < halfFullRounds; ++i) {
        FullRound(roundIdx++);
    }
    for (size_t i = 0; i < config.partialRounds; ++i) {
        PartialRound(roundIdx++);
    }
    for (size_t i = 0; i < halfFullRounds; ++i) {
        FullRound(roundIdx++);
    }
}

FieldElement Poseidon::Digest(const std::vector<FieldElement>& inputs) {
    if (inputs.size() != Config().inputs()) {
        throw std::invalid_argument("Poseidon arity mismatch: expected " +
                                    std::to_string(Config().inputs()) + " inputs, got " +
                                    std::to_string(inputs.size()));
    }
    
    state_[0] = FieldElement::Zero();
    for (size_t i = 0; i < inputs.size(); ++i) {
        state_[i + 1] = inputs[i];
    }
    Permute();
    return state_[0];
}

// ============================================================================
// Static Convenience Methods
// ============================================================================

FieldElement Poseidon::Hash(const std::vector<FieldElement>& inputs) {
    Poseidon hasher(inputs.size());
    return hasher.Digest(inputs);
}

FieldElement Poseidon::Hash2(const FieldElement& left, const FieldElement& right) {
    Poseidon hasher(2);
    return hasher.Digest({left, right});
}

} // namespace zkcomply
