// ZKCOMPLY - Compliance Configuration Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcomply/compliance/config.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/compliance/merkle_tree.h"

#include <cstdlib>

namespace zkcomply {
namespace compliance {
namespace test {

namespace {

ComplianceConfig Load(const std::string& ini) {
    util::ConfigManager config;
    util::ConfigParseResult result = config.ParseString(ini);
    EXPECT_TRUE(result.success) << result.errorMessage;
    return LoadComplianceConfig(config);
}

ErrorCode LoadError(const std::string& ini) {
    try {
        Load(ini);
    } catch (const ComplianceError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected ComplianceError for:\n" << ini;
    return ErrorCode::InvalidInput;
}

} // namespace

TEST(ComplianceConfigTest, Defaults) {
    ComplianceConfig config = Load("");
    EXPECT_EQ(config.artifactsDir, "circuits");
    EXPECT_EQ(config.proverPath, "prover");
    EXPECT_EQ(config.proverTimeout, DEFAULT_PROVER_TIMEOUT);
    EXPECT_EQ(config.merkleDepth, DEFAULT_TREE_DEPTH);
    EXPECT_EQ(config.snapshotCacheSize, DEFAULT_SNAPSHOT_CACHE_SIZE);
    EXPECT_EQ(config.verifierMode, VerifierMode::Real);
    EXPECT_EQ(config.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(config.logFile.empty());
}

TEST(ComplianceConfigTest, Sections) {
    ComplianceConfig config = Load(
        "[artifacts]\n"
        "dir = /opt/circuits\n"
        "[prover]\n"
        "path = /opt/rapidsnark/prover\n"
        "timeout_ms = 1500\n"
        "[merkle]\n"
        "depth = 10\n"
        "cache_size = 4\n"
        "[verifier]\n"
        "mode = mock\n"
        "[log]\n"
        "level = debug\n");
    EXPECT_EQ(config.artifactsDir, "/opt/circuits");
    EXPECT_EQ(config.proverPath, "/opt/rapidsnark/prover");
    EXPECT_EQ(config.proverTimeout.count(), 1500);
    EXPECT_EQ(config.merkleDepth, 10u);
    EXPECT_EQ(config.snapshotCacheSize, 4u);
    EXPECT_EQ(config.verifierMode, VerifierMode::Mock);
    EXPECT_EQ(config.logLevel, util::LogLevel::Debug);
}

TEST(ComplianceConfigTest, DottedKeys) {
    ComplianceConfig config = Load(
        "verifier.mode = mock\n"
        "merkle.depth = 16\n");
    EXPECT_EQ(config.verifierMode, VerifierMode::Mock);
    EXPECT_EQ(config.merkleDepth, 16u);
}

TEST(ComplianceConfigTest, EnvironmentExpansion) {
    setenv("ZKCOMPLY_TEST_ARTIFACTS", "/srv/zk", 1);
    ComplianceConfig config = Load("artifacts.dir = ${ZKCOMPLY_TEST_ARTIFACTS}/circuits\n");
    EXPECT_EQ(config.artifactsDir, "/srv/zk/circuits");
    unsetenv("ZKCOMPLY_TEST_ARTIFACTS");
}

TEST(ComplianceConfigTest, UnknownKeyRejected) {
    EXPECT_EQ(LoadError("[prover]\npaht = /bin/prover\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("unknown = 1\n"), ErrorCode::InvalidConfiguration);
}

TEST(ComplianceConfigTest, BadValuesRejected) {
    EXPECT_EQ(LoadError("prover.timeout_ms = 0\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("prover.timeout_ms = -5\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("prover.timeout_ms = soon\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("merkle.depth = 0\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("merkle.depth = 33\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("merkle.cache_size = 0\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("verifier.mode = maybe\n"), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(LoadError("log.level = chatty\n"), ErrorCode::InvalidConfiguration);
}

TEST(ComplianceConfigTest, MissingFile) {
    try {
        LoadComplianceConfigFile("/nonexistent/zkcomply.conf");
        FAIL() << "expected InvalidConfiguration";
    } catch (const ComplianceError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::InvalidConfiguration);
    }
}

TEST(ComplianceConfigTest, VerifierModeNames) {
    EXPECT_STREQ(VerifierModeName(VerifierMode::Mock), "mock");
    EXPECT_EQ(VerifierModeFromString("real"), std::optional<VerifierMode>(VerifierMode::Real));
    EXPECT_FALSE(VerifierModeFromString("Real").has_value());
}

TEST(ComplianceConfigTest, ConfigureLoggingSetsLevel) {
    ComplianceConfig config;
    config.logLevel = util::LogLevel::Warn;
    ConfigureLogging(config);
    EXPECT_EQ(util::Logger::Instance().GetLevel(), util::LogLevel::Warn);
    util::Logger::Instance().SetLevel(util::LogLevel::Info);
}

TEST(ComplianceConfigTest, ConfigureLoggingUnwritableFile) {
    ComplianceConfig config;
    config.logFile = "/nonexistent-dir/zkcomply.log";
    EXPECT_THROW(ConfigureLogging(config), ComplianceError);
    util::Logger::Instance().SetLevel(util::LogLevel::Info);
}

} // namespace test
} // namespace compliance
} // namespace zkcomply
