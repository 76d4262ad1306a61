// ZKCOMPLY - Compliance Configuration Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/config.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/compliance/merkle_tree.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <utility>
#include <vector>

namespace zkcomply {
namespace compliance {

namespace {

/// (section, key) pairs understood by LoadComplianceConfig
const std::vector<std::pair<std::string, std::string>>& KnownKeys() {
    static const std::vector<std::pair<std::string, std::string>> keys = {
        {"artifacts", "dir"},
        {"prover", "path"},
        {"prover", "timeout_ms"},
        {"merkle", "depth"},
        {"merkle", "cache_size"},
        {"verifier", "mode"},
        {"log", "level"},
        {"log", "file"},
    };
    return keys;
}

[[noreturn]] void Invalid(const std::string& reason) {
    throw ComplianceError(ErrorCode::InvalidConfiguration, reason);
}

/// Section form wins over the flat dotted form
std::optional<std::string> Lookup(const util::ConfigManager& config,
                                  const std::string& section, const std::string& key) {
    if (auto v = config.TryGetString(key, section)) {
        return v;
    }
    return config.TryGetString(section + "." + key);
}

uint64_t LookupUInt(const util::ConfigManager& config, const std::string& section,
                    const std::string& key, uint64_t defaultValue) {
    auto raw = Lookup(config, section, key);
    if (!raw) {
        return defaultValue;
    }
    std::string s = util::ConfigManager::Trim(*raw);
    if (s.empty() || !std::all_of(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
        Invalid(section + "." + key + " must be a non-negative integer");
    }
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        Invalid(section + "." + key + " is out of range");
    }
}

std::optional<util::LogLevel> ParseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const char* const names[] = {
        "trace", "debug", "info", "warn", "warning", "error", "fatal", "off"};
    for (const char* n : names) {
        if (lower == n) {
            return util::LogLevelFromString(lower);
        }
    }
    return std::nullopt;
}

} // anonymous namespace

const char* VerifierModeName(VerifierMode mode) {
    switch (mode) {
        case VerifierMode::Mock: return "mock";
        case VerifierMode::Real: return "real";
    }
    return "unknown";
}

std::optional<VerifierMode> VerifierModeFromString(const std::string& name) {
    if (name == "mock") return VerifierMode::Mock;
    if (name == "real") return VerifierMode::Real;
    return std::nullopt;
}

ComplianceConfig LoadComplianceConfig(const util::ConfigManager& config) {
    util::ConfigManager checked = config;
    for (const auto& [section, key] : KnownKeys()) {
        checked.AllowKey(key, section);
        checked.AllowKey(section + "." + key);
    }
    std::vector<std::string> problems = checked.Validate();
    if (!problems.empty()) {
        Invalid(problems.front());
    }
    
    ComplianceConfig out;
    
    if (auto dir = Lookup(config, "artifacts", "dir")) {
        out.artifactsDir = util::ConfigManager::ExpandTilde(
            util::ConfigManager::ExpandEnvVars(*dir));
    }
    if (out.artifactsDir.empty()) {
        Invalid("artifacts.dir must not be empty");
    }
    
    if (auto path = Lookup(config, "prover", "path")) {
        out.proverPath = util::ConfigManager::ExpandTilde(
            util::ConfigManager::ExpandEnvVars(*path));
    }
    if (out.proverPath.empty()) {
        Invalid("prover.path must not be empty");
    }
    
    uint64_t timeout = LookupUInt(config, "prover", "timeout_ms",
                                  static_cast<uint64_t>(DEFAULT_PROVER_TIMEOUT.count()));
    if (timeout == 0) {
        Invalid("prover.timeout_ms must be positive");
    }
    out.proverTimeout = std::chrono::milliseconds(static_cast<int64_t>(timeout));
    
    uint64_t depth = LookupUInt(config, "merkle", "depth", DEFAULT_TREE_DEPTH);
    if (depth == 0 || depth > MAX_TREE_DEPTH) {
        Invalid("merkle.depth must be between 1 and " + std::to_string(MAX_TREE_DEPTH));
    }
    out.merkleDepth = static_cast<size_t>(depth);
    
    uint64_t cacheSize = LookupUInt(config, "merkle", "cache_size", DEFAULT_SNAPSHOT_CACHE_SIZE);
    if (cacheSize == 0) {
        Invalid("merkle.cache_size must be positive");
    }
    out.snapshotCacheSize = static_cast<size_t>(cacheSize);
    
    if (auto mode = Lookup(config, "verifier", "mode")) {
        auto parsed = VerifierModeFromString(util::ConfigManager::Trim(*mode));
        if (!parsed) {
            Invalid("verifier.mode must be 'mock' or 'real', got '" + *mode + "'");
        }
        out.verifierMode = *parsed;
    }
    
    if (auto level = Lookup(config, "log", "level")) {
        auto parsed = ParseLogLevel(util::ConfigManager::Trim(*level));
        if (!parsed) {
            Invalid("unknown log.level '" + *level + "'");
        }
        out.logLevel = *parsed;
    }
    
    if (auto file = Lookup(config, "log", "file")) {
        out.logFile = util::ConfigManager::ExpandTilde(*file);
    }
    
    LOG_DEBUG(util::LogCategory::CONFIG)
        << "Loaded config: depth=" << out.merkleDepth
        << " verifier=" << VerifierModeName(out.verifierMode)
        << " timeout=" << out.proverTimeout.count() << "ms";
    return out;
}

ComplianceConfig LoadComplianceConfigFile(const std::string& path) {
    util::ConfigManager config;
    util::ConfigParseResult result = config.ParseFile(path);
    if (!result.success) {
        Invalid(result.errorMessage);
    }
    return LoadComplianceConfig(config);
}

void ConfigureLogging(const ComplianceConfig& config) {
    util::Logger& logger = util::Logger::Instance();
    logger.SetLevel(config.logLevel);
    if (!config.logFile.empty()) {
        auto sink = std::make_shared<util::FileSink>(config.logFile, config.logLevel);
        if (!sink->IsOpen()) {
            Invalid("cannot open log file " + config.logFile);
        }
        logger.AddSink(sink);
    }
}

} // namespace compliance
} // namespace zkcomply
