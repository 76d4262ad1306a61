// ZKCOMPLY - Configuration File Parser Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcomply/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace zkcomply {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }
    
    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }
    
    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/zkcomply_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);
        
        std::ofstream file(filename);
        file << content;
        file.close();
        
        tempFiles_.push_back(filename);
        return filename;
    }
    
    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n; another\n\nkey = value\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key", ""), "value");
}

TEST_F(ConfigTest, Sections) {
    auto result = config_.ParseString(
        "[prover]\n"
        "path = /opt/prover\n"
        "timeout_ms = 5000\n"
        "[merkle]\n"
        "depth = 16\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("path", "", "prover"), "/opt/prover");
    EXPECT_EQ(config_.GetInt("timeout_ms", 0, "prover"), 5000);
    EXPECT_EQ(config_.GetUInt("depth", 0, "merkle"), 16u);
    EXPECT_FALSE(config_.HasKey("depth"));
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString("a = \"hello world\"\nb = 'single'\nc = \"x\\ty\"\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "hello world");
    EXPECT_EQ(config_.GetString("b", ""), "single");
    EXPECT_EQ(config_.GetString("c", ""), "x\ty");
}

TEST_F(ConfigTest, BareFlagIsTrue) {
    ASSERT_TRUE(config_.ParseString("verbose\n").success);
    EXPECT_TRUE(config_.GetBool("verbose", false));
}

TEST_F(ConfigTest, MissingBracketIsError) {
    auto result = config_.ParseString("[broken\nkey = 1\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
    EXPECT_EQ(result.errorFile, "test.conf");
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("bad key! = 1\n");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[log]\nlevel = debug\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("level", "", "log"), "debug");
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/zkcomply.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Access Tests
// ============================================================================

TEST_F(ConfigTest, IntegersAreStrict) {
    ASSERT_TRUE(config_.ParseString("a = 42\nb = 42abc\nc = -7\n").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_FALSE(config_.TryGetInt("b").has_value());
    EXPECT_EQ(config_.TryGetInt("c"), -7);
    EXPECT_FALSE(config_.TryGetUInt("c").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 9), 9u);
}

TEST_F(ConfigTest, Booleans) {
    EXPECT_EQ(ConfigManager::ParseBool("yes"), true);
    EXPECT_EQ(ConfigManager::ParseBool("OFF"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

TEST_F(ConfigTest, ListsFromCommasAndRepeats) {
    ASSERT_TRUE(config_.ParseString("allow = 1, 2\nallow = 3\n").success);
    std::vector<std::string> expected = {"1", "2", "3"};
    EXPECT_EQ(config_.GetList("allow"), expected);
    EXPECT_EQ(config_.GetString("allow", ""), "3");
}

TEST_F(ConfigTest, DefaultsDoNotOverride) {
    config_.Set("depth", "10");
    config_.SetDefault("depth", "20");
    config_.SetDefault("cache", "16");
    EXPECT_EQ(config_.GetString("depth", ""), "10");
    EXPECT_EQ(config_.GetString("cache", ""), "16");
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("ZKCOMPLY_TEST_DIR", "/srv/circuits", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${ZKCOMPLY_TEST_DIR}/x"), "/srv/circuits/x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$ZKCOMPLY_TEST_DIR"), "/srv/circuits");
    unsetenv("ZKCOMPLY_TEST_DIR");
}

TEST_F(ConfigTest, TildeExpansion) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/keys"), "/home/tester/keys");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/keys"), "~other/keys");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigTest, ValidateRequiredAndUnknown) {
    ASSERT_TRUE(config_.ParseString("[prover]\npath = p\ntypo = 1\n").success);
    config_.RequireKey("dir", "artifacts");
    config_.AllowKey("path", "prover");
    
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);
}

TEST_F(ConfigTest, NoAllowListAcceptsEverything) {
    ASSERT_TRUE(config_.ParseString("anything = 1\n").success);
    EXPECT_TRUE(config_.Validate().empty());
}

} // namespace test
} // namespace util
} // namespace zkcomply
