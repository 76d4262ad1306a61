// ZKCOMPLY - Nullifier Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcomply/compliance/nullifier.h"
#include "zkcomply/crypto/hash_engine.h"

#include <stdexcept>

namespace zkcomply {
namespace compliance {
namespace test {

// ============================================================================
// Derivation
// ============================================================================

TEST(NullifierDeriverTest, WhitelistIsHashOfIdentityAndRoot) {
    FieldElement id(12345);
    FieldElement root(777);
    EXPECT_EQ(NullifierDeriver::ForWhitelist(id, root), HashEngine::Hash({id, root}));
}

TEST(NullifierDeriverTest, Deterministic) {
    FieldElement id(12345);
    FieldElement root(777);
    EXPECT_EQ(NullifierDeriver::ForWhitelist(id, root),
              NullifierDeriver::ForWhitelist(id, root));
    EXPECT_NE(NullifierDeriver::ForWhitelist(id, root),
              NullifierDeriver::ForWhitelist(id, FieldElement(778)));
    EXPECT_NE(NullifierDeriver::ForWhitelist(id, root),
              NullifierDeriver::ForWhitelist(FieldElement(12346), root));
}

TEST(NullifierDeriverTest, BlacklistBindsChallenge) {
    FieldElement id(5);
    FieldElement root(6);
    FieldElement a = NullifierDeriver::ForBlacklist(id, root, FieldElement(1));
    FieldElement b = NullifierDeriver::ForBlacklist(id, root, FieldElement(2));
    EXPECT_NE(a, b);
    EXPECT_EQ(a, HashEngine::Hash({id, root, FieldElement(1)}));
    EXPECT_NE(a, NullifierDeriver::ForWhitelist(id, root));
}

TEST(NullifierDeriverTest, DeriveDispatch) {
    FieldElement id(5);
    FieldElement root(6);
    EXPECT_EQ(NullifierDeriver::Derive(ProofType::Whitelist, id, root),
              NullifierDeriver::ForWhitelist(id, root));
    EXPECT_EQ(NullifierDeriver::Derive(ProofType::Blacklist, id, root, FieldElement(9)),
              NullifierDeriver::ForBlacklist(id, root, FieldElement(9)));
    EXPECT_THROW(NullifierDeriver::Derive(ProofType::Blacklist, id, root),
                 std::invalid_argument);
    EXPECT_THROW(NullifierDeriver::Derive(ProofType::Aggregation, id, root),
                 std::invalid_argument);
}

// ============================================================================
// Registry
// ============================================================================

TEST(NullifierRegistryTest, ReplayDetected) {
    NullifierRegistry registry;
    FieldElement root(1);
    FieldElement n(100);
    EXPECT_EQ(registry.Add(root, n), NullifierRegistry::AddResult::Success);
    EXPECT_EQ(registry.Add(root, n), NullifierRegistry::AddResult::AlreadyUsed);
    EXPECT_TRUE(registry.Contains(root, n));
    EXPECT_EQ(registry.Count(root), 1u);
}

TEST(NullifierRegistryTest, ScopesAreIndependent) {
    NullifierRegistry registry;
    FieldElement n(100);
    EXPECT_EQ(registry.Add(FieldElement(1), n), NullifierRegistry::AddResult::Success);
    EXPECT_EQ(registry.Add(FieldElement(2), n), NullifierRegistry::AddResult::Success);
    EXPECT_FALSE(registry.Contains(FieldElement(3), n));
    EXPECT_EQ(registry.TotalCount(), 2u);
    
    EXPECT_EQ(registry.ClearScope(FieldElement(1)), 1u);
    EXPECT_FALSE(registry.Contains(FieldElement(1), n));
    EXPECT_TRUE(registry.Contains(FieldElement(2), n));
}

TEST(NullifierRegistryTest, ScopeCapacity) {
    NullifierRegistry registry(2);
    FieldElement root(1);
    EXPECT_EQ(registry.Add(root, FieldElement(10)), NullifierRegistry::AddResult::Success);
    EXPECT_EQ(registry.Add(root, FieldElement(11)), NullifierRegistry::AddResult::Success);
    EXPECT_EQ(registry.Add(root, FieldElement(12)), NullifierRegistry::AddResult::SetFull);
    EXPECT_EQ(registry.Add(root, FieldElement(10)), NullifierRegistry::AddResult::AlreadyUsed);
}

} // namespace test
} // namespace compliance
} // namespace zkcomply
