// ZKCOMPLY - Proof Generator
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Drives witness computation and Groth16 proving for assembled witnesses.
// Generation never verifies; verification lives behind the gateway.

#ifndef ZKCOMPLY_COMPLIANCE_PROOF_GENERATOR_H
#define ZKCOMPLY_COMPLIANCE_PROOF_GENERATOR_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "zkcomply/compliance/circuit.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/compliance/input_assembler.h"
#include "zkcomply/crypto/field.h"
#include "zkcomply/util/json.h"

namespace zkcomply {
namespace util {
class ThreadPool;
}

namespace compliance {

// ============================================================================
// Proof Data
// ============================================================================

/**
 * Proof as emitted by snarkjs-compatible provers: projective coordinates
 * as decimal strings.
 *   pi_a = [x, y, "1"]
 *   pi_b = [[x.c0, x.c1], [y.c0, y.c1], ["1", "0"]]
 *   pi_c = [x, y, "1"]
 * Shapes are not validated here; see ProofFormatter::ValidateStructure.
 */
struct RawProof {
    std::vector<std::string> piA;
    std::vector<std::vector<std::string>> piB;
    std::vector<std::string> piC;
    std::string protocol{"groth16"};
    std::string curve{"bn128"};
    
    util::JSONValue ToJSON() const;
    
    /// nullopt unless pi_a/pi_b/pi_c are arrays of strings (pi_b nested)
    static std::optional<RawProof> FromJSON(const util::JSONValue& json);
};

struct GeneratedProof {
    ProofType type{ProofType::Whitelist};
    RawProof proof;
    std::vector<FieldElement> publicSignals;
    std::chrono::milliseconds elapsed{0};
};

// ============================================================================
// Proving Backends
// ============================================================================

/**
 * Computes a witness and a proof for one circuit.
 *
 * Implementations report failures as ComplianceError with
 * ProofGenerationFailed or ProofGenerationTimeout.
 */
class ProvingBackend {
public:
    struct Output {
        RawProof proof;
        std::vector<FieldElement> publicSignals;
    };
    
    virtual ~ProvingBackend() = default;
    
    virtual Output Prove(const CircuitArtifacts& artifacts,
                         const util::JSONValue& inputs) = 0;
};

/**
 * Runs the circom witness calculator and a rapidsnark-style prover:
 *   <calculator> input.json witness.wtns
 *   <prover> <zkey> witness.wtns proof.json public.json
 * inside a private temporary directory removed afterwards.
 */
class ExternalProverBackend : public ProvingBackend {
public:
    /// @param stepTimeout limit for each of the two subprocesses
    ExternalProverBackend(std::string proverPath,
                          std::chrono::milliseconds stepTimeout,
                          std::string tempRoot = "");
    
    Output Prove(const CircuitArtifacts& artifacts,
                 const util::JSONValue& inputs) override;
    
    const std::string& ProverPath() const { return proverPath_; }
    std::chrono::milliseconds StepTimeout() const { return stepTimeout_; }

private:
    std::string proverPath_;
    std::chrono::milliseconds stepTimeout_;
    std::string tempRoot_;
};

// ============================================================================
// Proof Generator
// ============================================================================

class ProofGenerator {
public:
    /// Outcome of one request within a batch
    struct BatchResult {
        std::optional<GeneratedProof> proof;
        std::optional<ErrorCode> errorCode;
        std::string error;
        
        bool Ok() const { return proof.has_value(); }
    };
    
    /// @param workerThreads batch parallelism, 0 = hardware concurrency
    ProofGenerator(ArtifactStore store,
                   std::shared_ptr<ProvingBackend> backend,
                   size_t workerThreads = 0);
    ~ProofGenerator();
    
    ProofGenerator(const ProofGenerator&) = delete;
    ProofGenerator& operator=(const ProofGenerator&) = delete;
    
    /**
     * Generate one proof.
     *
     * @throws ComplianceError(CircuitArtifactMissing) before the backend runs
     * @throws ComplianceError(ProofGenerationTimeout) on timeout
     * @throws ComplianceError with the witness's deferred-check code when the
     *         backend fails and one is set, else ProofGenerationFailed
     */
    GeneratedProof Generate(const WitnessRecord& witness) const;
    
    /// Independent requests in parallel; results keep the input order
    std::vector<BatchResult> GenerateBatch(const std::vector<WitnessRecord>& witnesses) const;
    
    const ArtifactStore& Artifacts() const { return store_; }

private:
    ArtifactStore store_;
    std::shared_ptr<ProvingBackend> backend_;
    std::unique_ptr<util::ThreadPool> pool_;
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_PROOF_GENERATOR_H
