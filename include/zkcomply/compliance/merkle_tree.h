// ZKCOMPLY - Merkle Tree
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Fixed-depth binary Poseidon Merkle trees over identity sets.
//
// A tree of depth d holds up to 2^d leaves. Unused positions hold the zero
// element, so every subtree made only of padding hashes to a known value:
//   Z[0] = 0,  Z[l+1] = H(Z[l], Z[l])
// Only nodes with at least one real leaf beneath them are stored; the rest
// are read from Z. The root is identical to hashing the fully padded tree.
//
// Each build yields an immutable snapshot shared through
// std::shared_ptr<const MerkleTree> and identified by its root.

#ifndef ZKCOMPLY_COMPLIANCE_MERKLE_TREE_H
#define ZKCOMPLY_COMPLIANCE_MERKLE_TREE_H

#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "zkcomply/core/types.h"
#include "zkcomply/crypto/field.h"
#include "zkcomply/util/json.h"

namespace zkcomply {
namespace compliance {

/// Depth used by the deployed circuits
constexpr size_t DEFAULT_TREE_DEPTH = 20;

/// Largest supported depth
constexpr size_t MAX_TREE_DEPTH = 32;

// ============================================================================
// Merkle Proof
// ============================================================================

/**
 * Inclusion path from a leaf to the root.
 * pathIndices[l] is 0 when the running node is a left child at level l,
 * 1 when it is a right child.
 */
struct MerkleProof {
    std::vector<FieldElement> pathElements;
    std::vector<uint8_t> pathIndices;
    size_t leafIndex{0};
    
    size_t Depth() const { return pathElements.size(); }
    
    /// {"leafIndex": n, "pathElements": ["<dec>", ...], "pathIndices": [0|1, ...]}
    util::JSONValue ToJSON() const;
    
    /// nullopt when the shape or any element is invalid
    static std::optional<MerkleProof> FromJSON(const util::JSONValue& json);
    
    /**
     * Recompute the root from a leaf.
     * nullopt if the two arrays differ in length or an index is not 0 or 1.
     */
    std::optional<FieldElement> ComputeRoot(const FieldElement& leaf) const;
};

/// Summary of a snapshot's occupancy
struct TreeStats {
    size_t depth{0};
    size_t leafCount{0};
    uint64_t capacity{0};
    double utilisation{0.0};
};

// ============================================================================
// Merkle Tree
// ============================================================================

class MerkleTreeBuilder;

/**
 * Immutable snapshot of one identity set.
 */
class MerkleTree {
public:
    const FieldElement& Root() const { return root_; }
    size_t Depth() const { return depth_; }
    size_t LeafCount() const { return levels_.front().size(); }
    uint64_t Capacity() const { return uint64_t(1) << depth_; }
    
    /// Leaf hashes in insertion order (padding excluded)
    const std::vector<FieldElement>& Leaves() const { return levels_.front(); }
    
    /// Process-wide build counter value assigned to this snapshot
    uint64_t Version() const { return version_; }
    
    /// Index of the first occurrence of a leaf hash
    std::optional<size_t> FindLeaf(const FieldElement& leaf) const;
    
    /// Index of an identity, hashing it into a leaf first
    std::optional<size_t> FindIdentity(const FieldElement& identity) const;
    
    /**
     * Inclusion proof for a real leaf.
     * @throws ComplianceError(LeafIndexOutOfRange) if index >= LeafCount()
     */
    MerkleProof Prove(size_t index) const;
    
    /// True iff the proof has this tree's depth and leads to Root()
    bool Verify(const FieldElement& leaf, const MerkleProof& proof) const;
    
    /// Verify against an arbitrary root; proofs of any other depth are rejected
    static bool VerifyProof(const FieldElement& root, const FieldElement& leaf,
                            const MerkleProof& proof,
                            size_t depth = DEFAULT_TREE_DEPTH);
    
    TreeStats Stats() const;
    
    /// {"depth": d, "root": "<dec>", "leaves": ["<dec>", ...]}
    util::JSONValue Export() const;
    
    /// Z[0..MAX_TREE_DEPTH], the roots of all-padding subtrees by height
    static const std::vector<FieldElement>& ZeroHashes();
    
    /// Construction token; only MerkleTreeBuilder can create one
    class BuildKey {
    private:
        friend class MerkleTreeBuilder;
        BuildKey() {}
    };
    
    MerkleTree(BuildKey, size_t depth, std::vector<std::vector<FieldElement>> levels,
               uint64_t version);

private:
    
    const FieldElement& NodeAt(size_t level, size_t index) const;
    
    size_t depth_;
    /// levels_[0] = leaves, levels_[depth_] = {root}
    std::vector<std::vector<FieldElement>> levels_;
    FieldElement root_;
    std::map<FieldElement, size_t> leafIndex_;
    uint64_t version_;
};

using MerkleTreeRef = std::shared_ptr<const MerkleTree>;

// ============================================================================
// Merkle Tree Builder
// ============================================================================

class MerkleTreeBuilder {
public:
    /// @throws ComplianceError(InvalidConfiguration) if depth is 0 or above MAX_TREE_DEPTH
    explicit MerkleTreeBuilder(size_t depth = DEFAULT_TREE_DEPTH);
    
    size_t Depth() const { return depth_; }
    
    /**
     * Hash every identity into a leaf and build the snapshot.
     * @throws ComplianceError(EmptyIdentitySet) for an empty set
     * @throws ComplianceError(TreeCapacityExceeded) beyond 2^depth identities
     */
    MerkleTreeRef Build(const std::vector<FieldElement>& identities) const;
    
    /// Build from precomputed leaf hashes
    MerkleTreeRef BuildFromLeaves(std::vector<FieldElement> leaves) const;
    
    /**
     * Rebuild a snapshot from Export() output.
     * @throws ComplianceError(InvalidInput) on a malformed document, a depth
     *         different from this builder's, or a root that does not match
     */
    MerkleTreeRef Import(const util::JSONValue& json) const;

private:
    size_t depth_;
};

// ============================================================================
// Snapshot Cache
// ============================================================================

/**
 * Bounded cache of built snapshots.
 *
 * Lookup is by root, or by the Keccak fingerprint of an identity list so a
 * given set is hashed into a tree at most once while cached. When full,
 * the least recently inserted snapshot is evicted.
 */
class SnapshotCache {
public:
    explicit SnapshotCache(MerkleTreeBuilder builder = MerkleTreeBuilder(),
                           size_t maxEntries = 16);
    
    /// Cached snapshot for this exact identity list, building it if needed
    MerkleTreeRef GetOrBuild(const std::vector<FieldElement>& identities);
    
    /// Snapshot previously built with the given root
    MerkleTreeRef Get(const FieldElement& root) const;
    
    size_t Size() const;
    
    /// Number of trees actually built by this cache
    uint64_t BuildCount() const;
    
    void Clear();
    
    const MerkleTreeBuilder& Builder() const { return builder_; }

private:
    MerkleTreeBuilder builder_;
    size_t maxEntries_;
    
    mutable std::mutex mutex_;
    std::map<FieldElement, MerkleTreeRef> byRoot_;
    std::map<Hash256, FieldElement> byFingerprint_;
    std::list<Hash256> insertionOrder_;
    uint64_t buildCount_{0};
};

} // namespace compliance
} // namespace zkcomply

#endif // ZKCOMPLY_COMPLIANCE_MERKLE_TREE_H
