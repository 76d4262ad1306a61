// ZKCOMPLY - Merkle Tree Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/compliance/merkle_tree.h"
#include "zkcomply/compliance/errors.h"
#include "zkcomply/crypto/hash_engine.h"
#include "zkcomply/util/logging.h"

#include <atomic>

namespace zkcomply {
namespace compliance {

namespace {

std::atomic<uint64_t> g_treeVersion{0};

} // namespace

// ============================================================================
// MerkleProof Implementation
// ============================================================================

util::JSONValue MerkleProof::ToJSON() const {
    util::JSONValue::Array elements;
    elements.reserve(pathElements.size());
    for (const auto& e : pathElements) {
        elements.emplace_back(e.ToDecimal());
    }
    
    util::JSONValue::Array indices;
    indices.reserve(pathIndices.size());
    for (uint8_t bit : pathIndices) {
        indices.emplace_back(static_cast<int>(bit));
    }
    
    util::JSONValue json;
    json["leafIndex"] = static_cast<uint64_t>(leafIndex);
    json["pathElements"] = std::move(elements);
    json["pathIndices"] = std::move(indices);
    return json;
}

std::optional<MerkleProof> MerkleProof::FromJSON(const util::JSONValue& json) {
    const auto& elements = json["pathElements"];
    const auto& indices = json["pathIndices"];
    if (!elements.IsArray() || !indices.IsArray() ||
        elements.Size() != indices.Size()) {
        return std::nullopt;
    }
    
    MerkleProof proof;
    if (json.HasKey("leafIndex")) {
        if (!json["leafIndex"].IsInt() || json["leafIndex"].GetInt() < 0) {
            return std::nullopt;
        }
        proof.leafIndex = static_cast<size_t>(json["leafIndex"].GetInt());
    }
    
    for (const auto& e : elements.GetArray()) {
        if (!e.IsString()) {
            return std::nullopt;
        }
        auto fe = FieldElement::FromDecimal(e.GetString());
        if (!fe) {
            return std::nullopt;
        }
        proof.pathElements.push_back(*fe);
    }
    
    for (const auto& i : indices.GetArray()) {
        if (!i.IsInt() || (i.GetInt() != 0 && i.GetInt() != 1)) {
            return std::nullopt;
        }
        proof.pathIndices.push_back(static_cast<uint8_t>(i.GetInt()));
    }
    
    return proof;
}

std::optional<FieldElement> MerkleProof::ComputeRoot(const FieldElement& leaf) const {
    if (pathElements.size() != pathIndices.size()) {
        return std::nullopt;
    }
    
    FieldElement current = leaf;
    for (size_t level = 0; level < pathElements.size(); ++level) {
        switch (pathIndices[level]) {
            case 0:
                current = HashEngine::HashPair(current, pathElements[level]);
                break;
            case 1:
                current = HashEngine::HashPair(pathElements[level], current);
                break;
            default:
                return std::nullopt;
        }
    }
    return current;
}

// ============================================================================
// MerkleTree Implementation
// ============================================================================

const std::vector<FieldElement>& MerkleTree::ZeroHashes() {
    static const std::vector<FieldElement> zeros = [] {
        std::vector<FieldElement> z;
        z.reserve(MAX_TREE_DEPTH + 1);
        z.push_back(FieldElement::Zero());
        for (size_t level = 0; level < MAX_TREE_DEPTH; ++level) {
            z.push_back(HashEngine::HashPair(z.back(), z.back()));
        }
        return z;
    }();
    return zeros;
}

MerkleTree::MerkleTree(BuildKey, size_t depth, std::vector<std::vector<FieldElement>> levels,
                       uint64_t version)
    : depth_(depth)
    , levels_(std::move(levels))
    , root_(levels_.back().front())
    , version_(version) {
    const auto& leaves = levels_.front();
    for (size_t i = 0; i < leaves.size(); ++i) {
        leafIndex_.emplace(leaves[i], i);  // keeps the first occurrence
    }
}

const FieldElement& MerkleTree::NodeAt(size_t level, size_t index) const {
    const auto& row = levels_[level];
    if (index < row.size()) {
        return row[index];
    }
    return ZeroHashes()[level];
}

std::optional<size_t> MerkleTree::FindLeaf(const FieldElement& leaf) const {
    auto it = leafIndex_.find(leaf);
    if (it == leafIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> MerkleTree::FindIdentity(const FieldElement& identity) const {
    return FindLeaf(HashEngine::HashLeaf(identity));
}

MerkleProof MerkleTree::Prove(size_t index) const {
    if (index >= LeafCount()) {
        throw ComplianceError(ErrorCode::LeafIndexOutOfRange,
                              "leaf index " + std::to_string(index) +
                              " outside [0, " + std::to_string(LeafCount()) + ")");
    }
    
    MerkleProof proof;
    proof.leafIndex = index;
    proof.pathElements.reserve(depth_);
    proof.pathIndices.reserve(depth_);
    
    size_t current = index;
    for (size_t level = 0; level < depth_; ++level) {
        proof.pathElements.push_back(NodeAt(level, current ^ 1));
        proof.pathIndices.push_back(static_cast<uint8_t>(current & 1));
        current >>= 1;
    }
    return proof;
}

bool MerkleTree::Verify(const FieldElement& leaf, const MerkleProof& proof) const {
    return VerifyProof(root_, leaf, proof, depth_);
}

bool MerkleTree::VerifyProof(const FieldElement& root, const FieldElement& leaf,
                             const MerkleProof& proof, size_t depth) {
    if (proof.pathElements.size() != depth) {
        return false;
    }
    auto computed = proof.ComputeRoot(leaf);
    return computed && *computed == root;
}

TreeStats MerkleTree::Stats() const {
    TreeStats stats;
    stats.depth = depth_;
    stats.leafCount = LeafCount();
    stats.capacity = Capacity();
    stats.utilisation = static_cast<double>(stats.leafCount) /
                        static_cast<double>(stats.capacity);
    return stats;
}

util::JSONValue MerkleTree::Export() const {
    util::JSONValue::Array leaves;
    leaves.reserve(LeafCount());
    for (const auto& leaf : Leaves()) {
        leaves.emplace_back(leaf.ToDecimal());
    }
    
    util::JSONValue json;
    json["depth"] = static_cast<uint64_t>(depth_);
    json["root"] = root_.ToDecimal();
    json["leaves"] = std::move(leaves);
    return json;
}

// ============================================================================
// MerkleTreeBuilder Implementation
// ============================================================================

MerkleTreeBuilder::MerkleTreeBuilder(size_t depth) : depth_(depth) {
    if (depth == 0 || depth > MAX_TREE_DEPTH) {
        throw ComplianceError(ErrorCode::InvalidConfiguration,
                              "tree depth must be in [1, " +
                              std::to_string(MAX_TREE_DEPTH) + "], got " +
                              std::to_string(depth));
    }
}

MerkleTreeRef MerkleTreeBuilder::Build(const std::vector<FieldElement>& identities) const {
    if (identities.empty()) {
        throw ComplianceError(ErrorCode::EmptyIdentitySet,
                              "identity set must contain at least one identity");
    }
    
    std::vector<FieldElement> leaves;
    leaves.reserve(identities.size());
    for (const auto& identity : identities) {
        leaves.push_back(HashEngine::HashLeaf(identity));
    }
    return BuildFromLeaves(std::move(leaves));
}

MerkleTreeRef MerkleTreeBuilder::BuildFromLeaves(std::vector<FieldElement> leaves) const {
    if (leaves.empty()) {
        throw ComplianceError(ErrorCode::EmptyIdentitySet,
                              "identity set must contain at least one identity");
    }
    uint64_t capacity = uint64_t(1) << depth_;
    if (static_cast<uint64_t>(leaves.size()) > capacity) {
        throw ComplianceError(ErrorCode::TreeCapacityExceeded,
                              std::to_string(leaves.size()) +
                              " leaves exceed tree capacity " + std::to_string(capacity));
    }
    
    ZKCOMPLY_LOG_TIMER(util::LogCategory::MERKLE, "tree build");
    
    const auto& zeros = MerkleTree::ZeroHashes();
    std::vector<std::vector<FieldElement>> levels;
    levels.reserve(depth_ + 1);
    levels.push_back(std::move(leaves));
    
    for (size_t level = 0; level < depth_; ++level) {
        const auto& row = levels.back();
        std::vector<FieldElement> parents;
        parents.reserve((row.size() + 1) / 2);
        for (size_t i = 0; i < row.size(); i += 2) {
            const FieldElement& right = (i + 1 < row.size()) ? row[i + 1] : zeros[level];
            parents.push_back(HashEngine::HashPair(row[i], right));
        }
        levels.push_back(std::move(parents));
    }
    
    uint64_t version = ++g_treeVersion;
    auto tree = std::make_shared<const MerkleTree>(
        MerkleTree::BuildKey(), depth_, std::move(levels), version);
    
    LOG_INFO(util::LogCategory::MERKLE)
        << "Built tree v" << version << " depth=" << depth_
        << " leaves=" << tree->LeafCount()
        << " root=" << tree->Root().ToDecimal();
    return tree;
}

MerkleTreeRef MerkleTreeBuilder::Import(const util::JSONValue& json) const {
    if (!json.IsObject() || !json["depth"].IsInt() ||
        !json["root"].IsString() || !json["leaves"].IsArray()) {
        throw ComplianceError(ErrorCode::InvalidInput, "malformed tree export");
    }
    if (json["depth"].GetInt() != static_cast<int64_t>(depth_)) {
        throw ComplianceError(ErrorCode::InvalidInput,
                              "tree export depth " +
                              std::to_string(json["depth"].GetInt()) +
                              " does not match builder depth " + std::to_string(depth_));
    }
    
    auto root = FieldElement::FromDecimal(json["root"].GetString());
    if (!root) {
        throw ComplianceError(ErrorCode::InvalidInput, "invalid root in tree export");
    }
    
    std::vector<FieldElement> leaves;
    leaves.reserve(json["leaves"].Size());
    for (const auto& value : json["leaves"].GetArray()) {
        auto leaf = value.IsString() ? FieldElement::FromDecimal(value.GetString())
                                     : std::nullopt;
        if (!leaf) {
            throw ComplianceError(ErrorCode::InvalidInput, "invalid leaf in tree export");
        }
        leaves.push_back(*leaf);
    }
    
    auto tree = BuildFromLeaves(std::move(leaves));
    if (tree->Root() != *root) {
        throw ComplianceError(ErrorCode::InvalidInput,
                              "tree export root does not match its leaves");
    }
    return tree;
}

// ============================================================================
// SnapshotCache Implementation
// ============================================================================

SnapshotCache::SnapshotCache(MerkleTreeBuilder builder, size_t maxEntries)
    : builder_(builder)
    , maxEntries_(maxEntries == 0 ? 1 : maxEntries) {}

MerkleTreeRef SnapshotCache::GetOrBuild(const std::vector<FieldElement>& identities) {
    Hash256 fingerprint = HashEngine::Fingerprint(identities);
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto fit = byFingerprint_.find(fingerprint);
    if (fit != byFingerprint_.end()) {
        auto rit = byRoot_.find(fit->second);
        if (rit != byRoot_.end()) {
            LOG_DEBUG(util::LogCategory::MERKLE)
                << "Snapshot cache hit for root " << fit->second.ToDecimal();
            return rit->second;
        }
    }
    
    // Built under the lock so concurrent callers never build the same set twice
    MerkleTreeRef tree = builder_.Build(identities);
    ++buildCount_;
    
    while (insertionOrder_.size() >= maxEntries_) {
        Hash256 oldest = insertionOrder_.front();
        insertionOrder_.pop_front();
        auto old = byFingerprint_.find(oldest);
        if (old != byFingerprint_.end()) {
            byRoot_.erase(old->second);
            byFingerprint_.erase(old);
        }
    }
    
    byRoot_[tree->Root()] = tree;
    byFingerprint_[fingerprint] = tree->Root();
    insertionOrder_.push_back(fingerprint);
    return tree;
}

MerkleTreeRef SnapshotCache::Get(const FieldElement& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byRoot_.find(root);
    if (it == byRoot_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t SnapshotCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return byRoot_.size();
}

uint64_t SnapshotCache::BuildCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buildCount_;
}

void SnapshotCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    byRoot_.clear();
    byFingerprint_.clear();
    insertionOrder_.clear();
}

} // namespace compliance
} // namespace zkcomply
