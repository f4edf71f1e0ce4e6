#include "merkle_tree.hpp"

#include "errors.hpp"
#include "hashing.hpp"

#include <functional>
#include <sstream>

namespace imm {

std::uint64_t MerkleProof::leafIndex() const {
    std::uint64_t idx = 0;
    for (std::size_t level = 0; level < pathIndices.size() && level < 64; ++level) {
        if (pathIndices[level]) {
            idx |= 1ULL << level;
        }
    }
    return idx;
}

bool MerkleProof::isWellFormed() const {
    return !siblings.empty() && siblings.size() == pathIndices.size() &&
           siblings.size() < MerkleTree::kMaxHeight;
}

MerkleTree::MerkleTree(std::uint32_t height) : leafDepth_(0) {
    if (height < kMinHeight || height > kMaxHeight) {
        std::ostringstream oss;
        oss << "tree height must be between " << kMinHeight << " and " << kMaxHeight << ", got "
            << height;
        throw InvalidHeightError(oss.str());
    }
    leafDepth_ = static_cast<std::uint8_t>(height - 1);
    precomputeZeroes();
}

void MerkleTree::setLeaf(std::uint64_t index, const Hash& leafHash) {
    checkIndex(index);
    setNode(leafDepth_, index, leafHash);

    Hash childHash = leafHash;
    for (std::int32_t depth = leafDepth_; depth > 0; --depth) {
        std::uint64_t prefix = index >> (leafDepth_ - depth);
        std::uint64_t siblingPrefix = prefix ^ 1ULL;
        bool isRight = (prefix & 1ULL) != 0;
        const Hash& sibling = getNode(static_cast<std::uint8_t>(depth), siblingPrefix);
        childHash = isRight ? hashNode(sibling, childHash) : hashNode(childHash, sibling);
        setNode(static_cast<std::uint8_t>(depth - 1), prefix >> 1, childHash);
    }
}

Hash MerkleTree::leaf(std::uint64_t index) const {
    checkIndex(index);
    return getNode(leafDepth_, index);
}

Hash MerkleTree::root() const {
    return getNode(0, 0);
}

MerkleProof MerkleTree::pathFor(std::uint64_t index) const {
    checkIndex(index);
    MerkleProof out;
    out.siblings.reserve(leafDepth_);
    out.pathIndices.reserve(leafDepth_);

    for (std::int32_t depth = leafDepth_; depth > 0; --depth) {
        std::uint64_t prefix = index >> (leafDepth_ - depth);
        std::uint64_t siblingPrefix = prefix ^ 1ULL;
        out.siblings.push_back(getNode(static_cast<std::uint8_t>(depth), siblingPrefix));
        out.pathIndices.push_back((prefix & 1ULL) != 0);
    }
    return out;
}

const Hash& MerkleTree::emptySubtree(std::uint32_t level) const {
    if (level > leafDepth_) {
        throw IndexOutOfRangeError("empty subtree level above the root");
    }
    return zeroHashes_[leafDepth_ - level];
}

std::size_t MerkleTree::NodeKeyHash::operator()(const NodeKey& key) const noexcept {
    return std::hash<std::uint64_t>{}((key.prefix << 8) ^ key.depth);
}

bool MerkleTree::NodeKeyEq::operator()(const NodeKey& a, const NodeKey& b) const noexcept {
    return a.prefix == b.prefix && a.depth == b.depth;
}

const Hash& MerkleTree::getNode(std::uint8_t depth, std::uint64_t prefix) const {
    auto it = nodes_.find(NodeKey{ prefix, depth });
    if (it != nodes_.end()) {
        return it->second;
    }
    return zeroHashes_[depth];
}

void MerkleTree::setNode(std::uint8_t depth, std::uint64_t prefix, const Hash& hash) {
    if (hash == zeroHashes_[depth]) {
        nodes_.erase(NodeKey{ prefix, depth });
        return;
    }
    nodes_[NodeKey{ prefix, depth }] = hash;
}

void MerkleTree::checkIndex(std::uint64_t index) const {
    if (index >= slotCount()) {
        std::ostringstream oss;
        oss << "leaf index " << index << " outside tree of " << slotCount() << " slots";
        throw CapacityExceededError(oss.str());
    }
}

void MerkleTree::precomputeZeroes() {
    zeroHashes_.assign(static_cast<std::size_t>(leafDepth_) + 1, Hash());
    zeroHashes_[leafDepth_] = emptyLeafHash();
    for (std::int32_t d = leafDepth_ - 1; d >= 0; --d) {
        zeroHashes_[d] = hashNode(zeroHashes_[d + 1], zeroHashes_[d + 1]);
    }
}

} // namespace imm
