// ZKCOMPLY - Proof Generator Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/proof_generator.h"
#include "zkcomply/util/logging.h"
#include "zkcomply/util/process.h"
#include "zkcomply/util/threadpool.h"

#include <cstdlib>
#include <filesystem>
#include <future>
#include <system_error>

namespace zkcomply {
namespace compliance {

namespace fs = std::filesystem;

// ============================================================================
// RawProof
// ============================================================================

namespace {

util::JSONValue StringArray(const std::vector<std::string>& values) {
    util::JSONValue::Array arr;
    for (const auto& v : values) {
        arr.push_back(util::JSONValue(v));
    }
    return util::JSONValue(std::move(arr));
}

std::optional<std::vector<std::string>> ReadStringArray(const util::JSONValue& json) {
    if (!json.IsArray()) {
        return std::nullopt;
    }
    std::vector<std::string> out;
    for (const auto& item : json.GetArray()) {
        if (!item.IsString()) {
            return std::nullopt;
        }
        out.push_back(item.GetString());
    }
    return out;
}

/// Last part of subprocess output, enough for a log line or error reason
std::string OutputTail(const std::string& output) {
    constexpr size_t MAX_TAIL = 512;
    if (output.size() <= MAX_TAIL) {
        return output;
    }
    return output.substr(output.size() - MAX_TAIL);
}

/// Private working directory, removed on scope exit
class TempDir {
public:
    explicit TempDir(const std::string& root) {
        fs::path base = root.empty() ? fs::temp_directory_path() : fs::path(root);
        std::string pattern = (base / "zkcomply-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr) {
            throw ComplianceError(ErrorCode::ProofGenerationFailed,
                                  "cannot create working directory under " + base.string());
        }
        path_ = buf.data();
    }
    
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            LOG_WARN(util::LogCategory::PROVER) << "Failed to remove " << path_.string()
                                                << ": " << ec.message();
        }
    }
    
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    
    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

void RunStep(const char* step, const std::vector<std::string>& argv,
             std::chrono::milliseconds timeout, const fs::path& workdir) {
    util::ProcessResult result = util::RunProcess(argv, timeout, workdir.string());
    if (result.timedOut) {
        LOG_WARN(util::LogCategory::PROVER) << step << " timed out after "
                                            << result.elapsed.count() << "ms";
        throw ComplianceError(ErrorCode::ProofGenerationTimeout,
                              std::string(step) + " exceeded " +
                              std::to_string(timeout.count()) + "ms");
    }
    if (result.exitCode != 0) {
        LOG_DEBUG(util::LogCategory::PROVER) << step << " output: " << OutputTail(result.output);
        throw ComplianceError(ErrorCode::ProofGenerationFailed,
                              std::string(step) + " exited with code " +
                              std::to_string(result.exitCode));
    }
}

} // anonymous namespace

util::JSONValue RawProof::ToJSON() const {
    util::JSONValue json(util::JSONValue::Object{});
    json["pi_a"] = StringArray(piA);
    util::JSONValue::Array b;
    for (const auto& row : piB) {
        b.push_back(StringArray(row));
    }
    json["pi_b"] = util::JSONValue(std::move(b));
    json["pi_c"] = StringArray(piC);
    json["protocol"] = protocol;
    json["curve"] = curve;
    return json;
}

std::optional<RawProof> RawProof::FromJSON(const util::JSONValue& json) {
    if (!json.IsObject()) {
        return std::nullopt;
    }
    RawProof proof;
    auto a = ReadStringArray(json["pi_a"]);
    auto c = ReadStringArray(json["pi_c"]);
    const util::JSONValue& b = json["pi_b"];
    if (!a || !c || !b.IsArray()) {
        return std::nullopt;
    }
    proof.piA = std::move(*a);
    proof.piC = std::move(*c);
    for (const auto& row : b.GetArray()) {
        auto values = ReadStringArray(row);
        if (!values) {
            return std::nullopt;
        }
        proof.piB.push_back(std::move(*values));
    }
    if (json["protocol"].IsString()) {
        proof.protocol = json["protocol"].GetString();
    }
    if (json["curve"].IsString()) {
        proof.curve = json["curve"].GetString();
    }
    return proof;
}

// ============================================================================
// ExternalProverBackend
// ============================================================================

ExternalProverBackend::ExternalProverBackend(std::string proverPath,
                                             std::chrono::milliseconds stepTimeout,
                                             std::string tempRoot)
    : proverPath_(std::move(proverPath))
    , stepTimeout_(stepTimeout)
    , tempRoot_(std::move(tempRoot)) {}

ProvingBackend::Output ExternalProverBackend::Prove(const CircuitArtifacts& artifacts,
                                                    const util::JSONValue& inputs) {
    TempDir work(tempRoot_);
    const fs::path& dir = work.Path();
    
    if (!util::SaveJSONFile((dir / "input.json").string(), inputs)) {
        throw ComplianceError(ErrorCode::ProofGenerationFailed, "cannot write witness input");
    }
    
    std::string calculator = fs::absolute(artifacts.witnessCalculator).string();
    std::string zkey = fs::absolute(artifacts.provingKey).string();
    
    RunStep("witness calculator", {calculator, "input.json", "witness.wtns"},
            stepTimeout_, dir);
    RunStep("prover", {proverPath_, zkey, "witness.wtns", "proof.json", "public.json"},
            stepTimeout_, dir);
    
    auto proofJson = util::LoadJSONFile((dir / "proof.json").string());
    if (!proofJson) {
        throw ComplianceError(ErrorCode::ProofGenerationFailed, "prover produced no proof");
    }
    auto proof = RawProof::FromJSON(*proofJson);
    if (!proof) {
        throw ComplianceError(ErrorCode::ProofGenerationFailed, "prover produced a malformed proof");
    }
    
    auto publicJson = util::LoadJSONFile((dir / "public.json").string());
    auto signals = publicJson ? ReadStringArray(*publicJson) : std::nullopt;
    if (!signals) {
        throw ComplianceError(ErrorCode::ProofGenerationFailed,
                              "prover produced malformed public signals");
    }
    
    Output out;
    out.proof = std::move(*proof);
    for (const auto& s : *signals) {
        auto fe = FieldElement::FromDecimal(s);
        if (!fe) {
            throw ComplianceError(ErrorCode::ProofGenerationFailed,
                                  "public signal is not a field element: " + s);
        }
        out.publicSignals.push_back(*fe);
    }
    return out;
}

// ============================================================================
// ProofGenerator
// ============================================================================

ProofGenerator::ProofGenerator(ArtifactStore store,
                               std::shared_ptr<ProvingBackend> backend,
                               size_t workerThreads)
    : store_(std::move(store))
    , backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("ProofGenerator requires a proving backend");
    }
    util::ThreadPool::Config config;
    config.numThreads = workerThreads;
    config.name = "prover";
    pool_ = std::make_unique<util::ThreadPool>(config);
}

ProofGenerator::~ProofGenerator() = default;

GeneratedProof ProofGenerator::Generate(const WitnessRecord& witness) const {
    const CircuitSpec& spec = GetCircuitSpec(witness.type);
    CircuitArtifacts artifacts = store_.Locate(witness.type);
    
    util::ScopedLogTimer timer(util::LogCategory::PROVER,
                               std::string("generate ") + spec.circuitName);
    
    ProvingBackend::Output out;
    try {
        out = backend_->Prove(artifacts, witness.inputs);
    } catch (const ComplianceError& e) {
        // An unsatisfiable circuit is reported under the check it encodes
        if (e.Code() == ErrorCode::ProofGenerationFailed && witness.deferredCheck) {
            LOG_INFO(util::LogCategory::PROVER)
                << ProofTypeName(witness.type) << " proof rejected: "
                << ErrorCodeName(witness.deferredCheck->code);
            throw ComplianceError(witness.deferredCheck->code, witness.deferredCheck->reason);
        }
        LOG_ERROR(util::LogCategory::PROVER)
            << ProofTypeName(witness.type) << " proof failed: " << ErrorCodeName(e.Code());
        throw;
    }
    
    if (out.publicSignals.size() != spec.PublicSignalCount()) {
        throw ComplianceError(ErrorCode::ProofGenerationFailed,
                              "expected " + std::to_string(spec.PublicSignalCount()) +
                              " public signals, prover returned " +
                              std::to_string(out.publicSignals.size()));
    }
    if (out.publicSignals != witness.publicSignals) {
        throw ComplianceError(ErrorCode::ProofGenerationFailed,
                              "public signals differ from the assembled witness");
    }
    
    GeneratedProof result;
    result.type = witness.type;
    result.proof = std::move(out.proof);
    result.publicSignals = std::move(out.publicSignals);
    result.elapsed = std::chrono::milliseconds(timer.ElapsedMs());
    
    LOG_INFO(util::LogCategory::PROVER) << "Generated " << ProofTypeName(witness.type)
                                        << " proof in " << result.elapsed.count() << "ms";
    return result;
}

std::vector<ProofGenerator::BatchResult>
ProofGenerator::GenerateBatch(const std::vector<WitnessRecord>& witnesses) const {
    std::vector<std::future<BatchResult>> futures;
    futures.reserve(witnesses.size());
    
    for (const auto& witness : witnesses) {
        futures.push_back(pool_->Submit([this, &witness]() {
            BatchResult r;
            try {
                r.proof = Generate(witness);
            } catch (const ComplianceError& e) {
                r.errorCode = e.Code();
                r.error = e.what();
            } catch (const std::exception& e) {
                r.errorCode = ErrorCode::ProofGenerationFailed;
                r.error = e.what();
            }
            return r;
        }));
    }
    
    std::vector<BatchResult> results = util::WaitAll(futures);
    
    size_t ok = 0;
    for (const auto& r : results) {
        if (r.Ok()) ++ok;
    }
    LOG_DEBUG(util::LogCategory::PROVER) << "Batch finished: " << ok << "/"
                                         << results.size() << " proofs generated";
    return results;
}

} // namespace compliance
} // namespace zkcomply
