#pragma once

#include "field.hpp"
#include "leaf.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace imm {

// Authentication path ordered leaf-to-root. pathIndices[i] is true when the node on the
// path at level i is a right child, so the bits spell out the leaf index (LSB first).
struct MerkleProof {
    std::vector<Hash> siblings;
    std::vector<bool> pathIndices;

    std::size_t depth() const { return siblings.size(); }
    std::uint64_t leafIndex() const;
    bool isWellFormed() const;
};

struct MembershipProof {
    Leaf leaf;
    std::uint64_t leafIndex = 0;
    MerkleProof merkleProof;
};

struct NonMembershipProof {
    Leaf lowLeaf;
    std::uint64_t lowLeafIndex = 0;
    MerkleProof merkleProof;
};

// Everything needed to replay one insert without the tree.
struct InsertWitness {
    Hash oldRoot;
    Hash newRoot;
    Field key;
    Field value;
    std::uint64_t newLeafIndex = 0;
    std::uint64_t treeLength = 0;   // length before the insert
    Leaf lowLeaf;                   // contents before the insert
    std::uint64_t lowLeafIndex = 0;
    MerkleProof lowLeafPath;        // taken against oldRoot
    MerkleProof newLeafPath;        // taken after the low leaf was relinked
};

// Everything needed to replay one value update without the tree.
struct UpdateWitness {
    Hash oldRoot;
    Hash newRoot;
    Field key;
    Field oldValue;
    Field newValue;
    std::uint64_t leafIndex = 0;
    Field nextKey;
    std::uint64_t nextIndex = 0;
    std::uint64_t treeLength = 0;
    MerkleProof path;               // valid for both roots
};

} // namespace imm
