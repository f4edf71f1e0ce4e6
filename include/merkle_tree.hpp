#pragma once

#include "field.hpp"
#include "proofs.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace imm {

// Fixed-height binary Merkle tree over 2^(height-1) leaf slots. Only nodes that differ from the
// empty-subtree default are stored, so a tall tree with few leaves stays small.
class MerkleTree {
public:
    static constexpr std::uint32_t kMinHeight = 2;
    static constexpr std::uint32_t kMaxHeight = 32;

    explicit MerkleTree(std::uint32_t height);

    std::uint32_t height() const { return static_cast<std::uint32_t>(leafDepth_) + 1; }
    std::uint64_t slotCount() const { return 1ULL << leafDepth_; }

    void setLeaf(std::uint64_t index, const Hash& leafHash);
    Hash leaf(std::uint64_t index) const;
    Hash root() const;
    MerkleProof pathFor(std::uint64_t index) const;

    // Default hash of an empty subtree whose root sits `level` steps above the leaves.
    const Hash& emptySubtree(std::uint32_t level) const;
    std::size_t storedNodeCount() const { return nodes_.size(); }

private:
    struct NodeKey {
        std::uint64_t prefix;
        std::uint8_t depth;
    };
    struct NodeKeyHash {
        std::size_t operator()(const NodeKey& key) const noexcept;
    };
    struct NodeKeyEq {
        bool operator()(const NodeKey& a, const NodeKey& b) const noexcept;
    };

    const Hash& getNode(std::uint8_t depth, std::uint64_t prefix) const;
    void setNode(std::uint8_t depth, std::uint64_t prefix, const Hash& hash);
    void checkIndex(std::uint64_t index) const;
    void precomputeZeroes();

    std::uint8_t leafDepth_;
    // zeroHashes_[d] is the empty subtree rooted at depth d (0 = root, leafDepth_ = leaf).
    std::vector<Hash> zeroHashes_;
    std::unordered_map<NodeKey, Hash, NodeKeyHash, NodeKeyEq> nodes_;
};

} // namespace imm
