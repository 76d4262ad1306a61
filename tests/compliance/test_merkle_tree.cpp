// ZKCOMPLY - Merkle Tree Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcomply/compliance/errors.h"
#include "zkcomply/compliance/merkle_tree.h"
#include "zkcomply/crypto/hash_engine.h"

#include <type_traits>
#include <vector>

namespace zkcomply {
namespace compliance {
namespace test {

namespace {

std::vector<FieldElement> Identities(uint64_t count, uint64_t first = 1000) {
    std::vector<FieldElement> ids;
    for (uint64_t i = 0; i < count; ++i) {
        ids.emplace_back(first + i);
    }
    return ids;
}

template<typename F>
ErrorCode CodeOf(F&& f) {
    try {
        f();
    } catch (const ComplianceError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected ComplianceError";
    return ErrorCode::InvalidInput;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(MerkleTreeTest, ZeroHashesChain) {
    const auto& z = MerkleTree::ZeroHashes();
    ASSERT_EQ(z.size(), MAX_TREE_DEPTH + 1);
    EXPECT_TRUE(z[0].IsZero());
    EXPECT_EQ(z[1], HashEngine::HashPair(z[0], z[0]));
    EXPECT_EQ(z[5], HashEngine::HashPair(z[4], z[4]));
}

TEST(MerkleTreeTest, SingleLeafRootFoldsZeros) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build({FieldElement(42)});
    
    const auto& z = MerkleTree::ZeroHashes();
    FieldElement expected = HashEngine::HashLeaf(FieldElement(42));
    for (size_t level = 0; level < 4; ++level) {
        expected = HashEngine::HashPair(expected, z[level]);
    }
    EXPECT_EQ(tree->Root(), expected);
    EXPECT_EQ(tree->LeafCount(), 1u);
    EXPECT_EQ(tree->Depth(), 4u);
}

TEST(MerkleTreeTest, SingleLeafProofIsAllPadding) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build({FieldElement(42)});
    MerkleProof proof = tree->Prove(0);
    
    const auto& z = MerkleTree::ZeroHashes();
    ASSERT_EQ(proof.Depth(), 4u);
    for (size_t level = 0; level < 4; ++level) {
        EXPECT_EQ(proof.pathElements[level], z[level]) << "level " << level;
        EXPECT_EQ(proof.pathIndices[level], 0u);
    }
    EXPECT_TRUE(tree->Verify(HashEngine::HashLeaf(FieldElement(42)), proof));
}

TEST(MerkleTreeTest, FullTreeAtCapacity) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(16));
    EXPECT_EQ(tree->LeafCount(), 16u);
    EXPECT_EQ(tree->Capacity(), 16u);
    for (size_t i = 0; i < 16; ++i) {
        MerkleProof proof = tree->Prove(i);
        EXPECT_TRUE(tree->Verify(tree->Leaves()[i], proof)) << "index " << i;
    }
    TreeStats stats = tree->Stats();
    EXPECT_DOUBLE_EQ(stats.utilisation, 1.0);
}

TEST(MerkleTreeTest, CapacityExceeded) {
    MerkleTreeBuilder builder(4);
    EXPECT_EQ(CodeOf([&] { builder.Build(Identities(17)); }), ErrorCode::TreeCapacityExceeded);
}

TEST(MerkleTreeTest, EmptySetRejected) {
    MerkleTreeBuilder builder(4);
    EXPECT_EQ(CodeOf([&] { builder.Build({}); }), ErrorCode::EmptyIdentitySet);
}

TEST(MerkleTreeTest, DepthBounds) {
    EXPECT_EQ(CodeOf([] { MerkleTreeBuilder b(0); }), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(CodeOf([] { MerkleTreeBuilder b(MAX_TREE_DEPTH + 1); }),
              ErrorCode::InvalidConfiguration);
    EXPECT_NO_THROW(MerkleTreeBuilder{MAX_TREE_DEPTH});
}

TEST(MerkleTreeTest, RootDependsOnOrder) {
    MerkleTreeBuilder builder(4);
    auto a = builder.Build({FieldElement(1), FieldElement(2)});
    auto b = builder.Build({FieldElement(2), FieldElement(1)});
    EXPECT_NE(a->Root(), b->Root());
    EXPECT_EQ(a->Root(), builder.Build({FieldElement(1), FieldElement(2)})->Root());
}

TEST(MerkleTreeTest, VersionsIncrease) {
    MerkleTreeBuilder builder(4);
    auto a = builder.Build(Identities(3));
    auto b = builder.Build(Identities(3));
    EXPECT_LT(a->Version(), b->Version());
}

TEST(MerkleTreeTest, OnlyBuilderCreatesTrees) {
    static_assert(!std::is_default_constructible<MerkleTree::BuildKey>::value,
                  "trees must come from MerkleTreeBuilder");
    MerkleTreeBuilder builder(4);
    MerkleTreeRef tree = builder.Build(Identities(2));
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree.use_count(), 1);
    EXPECT_EQ(tree->LeafCount(), 2u);
}

// ============================================================================
// Proofs
// ============================================================================

TEST(MerkleTreeTest, PathIndicesAreIndexBits) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(11));
    MerkleProof proof = tree->Prove(10);  // 0b1010
    std::vector<uint8_t> expected = {0, 1, 0, 1};
    EXPECT_EQ(proof.pathIndices, expected);
    EXPECT_EQ(proof.leafIndex, 10u);
    EXPECT_EQ(proof.Depth(), 4u);
}

TEST(MerkleTreeTest, LastLeafSiblingIsPadding) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(5));
    MerkleProof proof = tree->Prove(4);
    EXPECT_EQ(proof.pathElements[0], MerkleTree::ZeroHashes()[0]);
    EXPECT_TRUE(tree->Verify(tree->Leaves()[4], proof));
}

TEST(MerkleTreeTest, IndexOutOfRange) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(5));
    EXPECT_EQ(CodeOf([&] { tree->Prove(5); }), ErrorCode::LeafIndexOutOfRange);
}

TEST(MerkleTreeTest, FindIdentity) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(5));
    EXPECT_EQ(tree->FindIdentity(FieldElement(1003)), std::optional<size_t>(3));
    EXPECT_FALSE(tree->FindIdentity(FieldElement(9999)).has_value());
    EXPECT_EQ(tree->FindLeaf(HashEngine::HashLeaf(FieldElement(1000))), std::optional<size_t>(0));
}

TEST(MerkleTreeTest, TamperedProofFails) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(6));
    FieldElement leaf = tree->Leaves()[2];
    MerkleProof proof = tree->Prove(2);
    
    MerkleProof badElement = proof;
    badElement.pathElements[1] += FieldElement::One();
    EXPECT_FALSE(tree->Verify(leaf, badElement));
    
    MerkleProof badIndex = proof;
    badIndex.pathIndices[0] ^= 1;
    EXPECT_FALSE(tree->Verify(leaf, badIndex));
    
    MerkleProof shortProof = proof;
    shortProof.pathElements.pop_back();
    shortProof.pathIndices.pop_back();
    EXPECT_FALSE(tree->Verify(leaf, shortProof));
    
    EXPECT_FALSE(tree->Verify(tree->Leaves()[3], proof));
}

TEST(MerkleTreeTest, ProofFailsAgainstRootWithoutMember) {
    MerkleTreeBuilder builder(4);
    std::vector<FieldElement> ids = Identities(6);
    auto tree = builder.Build(ids);
    MerkleProof proof = tree->Prove(4);
    FieldElement leaf = HashEngine::HashLeaf(ids[4]);
    ASSERT_TRUE(MerkleTree::VerifyProof(tree->Root(), leaf, proof, 4));
    
    std::vector<FieldElement> without = ids;
    without.erase(without.begin() + 4);
    auto reduced = builder.Build(without);
    EXPECT_NE(reduced->Root(), tree->Root());
    EXPECT_FALSE(MerkleTree::VerifyProof(reduced->Root(), leaf, proof, 4));
}

TEST(MerkleTreeTest, StaticVerifyUsesDepth) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(2));
    MerkleProof proof = tree->Prove(1);
    EXPECT_TRUE(MerkleTree::VerifyProof(tree->Root(), tree->Leaves()[1], proof, 4));
    EXPECT_FALSE(MerkleTree::VerifyProof(tree->Root(), tree->Leaves()[1], proof));
}

TEST(MerkleTreeTest, ProofJsonRejectsBadIndices) {
    util::JSONValue json = util::JSONValue::Parse(
        R"({"pathElements": ["1", "2"], "pathIndices": [0, 2]})");
    EXPECT_FALSE(MerkleProof::FromJSON(json).has_value());
    
    json = util::JSONValue::Parse(R"({"pathElements": ["1"], "pathIndices": [1], "leafIndex": 1})");
    auto proof = MerkleProof::FromJSON(json);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->pathIndices[0], 1);
}

// ============================================================================
// Export / Import
// ============================================================================

TEST(MerkleTreeTest, ExportImportKeepsRoot) {
    MerkleTreeBuilder builder(4);
    auto tree = builder.Build(Identities(7));
    auto imported = builder.Import(tree->Export());
    EXPECT_EQ(imported->Root(), tree->Root());
    EXPECT_EQ(imported->Leaves(), tree->Leaves());
}

TEST(MerkleTreeTest, ImportRejectsWrongRoot) {
    MerkleTreeBuilder builder(4);
    util::JSONValue json = builder.Build(Identities(3))->Export();
    json["root"] = "12345";
    EXPECT_EQ(CodeOf([&] { builder.Import(json); }), ErrorCode::InvalidInput);
}

TEST(MerkleTreeTest, ImportRejectsDepthMismatch) {
    util::JSONValue json = MerkleTreeBuilder(5).Build(Identities(3))->Export();
    EXPECT_EQ(CodeOf([&] { MerkleTreeBuilder(4).Import(json); }), ErrorCode::InvalidInput);
}

// ============================================================================
// Snapshot Cache
// ============================================================================

TEST(SnapshotCacheTest, SameSetBuiltOnce) {
    SnapshotCache cache(MerkleTreeBuilder(4), 4);
    auto a = cache.GetOrBuild(Identities(3));
    auto b = cache.GetOrBuild(Identities(3));
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(cache.BuildCount(), 1u);
    EXPECT_EQ(cache.Get(a->Root()).get(), a.get());
    EXPECT_EQ(cache.Get(FieldElement(1)), nullptr);
}

TEST(SnapshotCacheTest, OldestEvicted) {
    SnapshotCache cache(MerkleTreeBuilder(4), 2);
    auto first = cache.GetOrBuild(Identities(1, 1));
    auto second = cache.GetOrBuild(Identities(1, 2));
    auto third = cache.GetOrBuild(Identities(1, 3));
    EXPECT_EQ(cache.Size(), 2u);
    EXPECT_EQ(cache.Get(first->Root()), nullptr);
    EXPECT_NE(cache.Get(third->Root()), nullptr);
    
    // Evicted snapshots stay valid for holders
    EXPECT_EQ(first->LeafCount(), 1u);
}

TEST(SnapshotCacheTest, Clear) {
    SnapshotCache cache(MerkleTreeBuilder(4), 2);
    cache.GetOrBuild(Identities(2));
    cache.Clear();
    EXPECT_EQ(cache.Size(), 0u);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST(MerkleScenarioTest, WhitelistMembershipAtDefaultDepth) {
    MerkleTreeBuilder builder;
    auto tree = builder.Build({FieldElement(11111), FieldElement(12345),
                               FieldElement(33333), FieldElement(44444)});
    auto index = tree->FindIdentity(FieldElement(12345));
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(*index, 1u);
    
    MerkleProof proof = tree->Prove(*index);
    EXPECT_EQ(proof.Depth(), DEFAULT_TREE_DEPTH);
    EXPECT_TRUE(MerkleTree::VerifyProof(tree->Root(),
                                        HashEngine::HashLeaf(FieldElement(12345)), proof));
    EXPECT_FALSE(tree->FindIdentity(FieldElement(99999)).has_value());
}

} // namespace test
} // namespace compliance
} // namespace zkcomply
