// ZKCOMPLY - Compliance Configuration
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Keys may be given inside sections or flat with a dotted name:
//   [prover]                  prover.path = /opt/rapidsnark/prover
//   path = /opt/...

#ifndef ZKCOMPLY_COMPLIANCE_CONFIG_H
#define ZKCOMPLY_COMPLIANCE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "zkcomply/util/config.h"
#include "zkcomply/util/logging.h"

namespace zkcomply {
namespace compliance {

/// How the gateway decides proofs; fixed once the gateway is built
enum class VerifierMode {
    Mock,   ///< Structural acceptance only
    Real    ///< Groth16 pairing check
};

const char* VerifierModeName(VerifierMode mode);
std::optional<VerifierMode> VerifierModeFromString(const std::string& name);

/// Default limit for each prover subprocess
constexpr std::chrono::milliseconds DEFAULT_PROVER_TIMEOUT{300000};
constexpr size_t DEFAULT_SNAPSHOT_CACHE_SIZE = 16;

struct ComplianceConfig {
    std::string artifactsDir{"circuits"};
    std::string proverPath{"prover"};
    std::chrono::milliseconds proverTimeout{DEFAULT_PROVER_TIMEOUT};
    size_t merkleDepth{20};
    size_t snapshotCacheSize{DEFAULT_SNAPSHOT_CACHE_SIZE};
    VerifierMode verifierMode{VerifierMode::Real};
    util::LogLevel logLevel{util::LogLevel::Info};
    std::string logFile;
};

/**
 * Read and validate compliance settings.
 * @throws ComplianceError(InvalidConfiguration) on unknown keys or bad values
 */
ComplianceConfig LoadComplianceConfig(const util::ConfigManager& config);

/// Parse an INI file then LoadComplianceConfig
ComplianceConfig LoadComplianceConfigFile(const std::string& path);

/// Apply log level and optional file sink to the global logger
void ConfigureLogging(const ComplianceConfig& config);

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_CONFIG_H
