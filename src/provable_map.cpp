#include "provable_map.hpp"

#include "hashing.hpp"

#include <algorithm>

namespace imm {

namespace {

bool pathCoversLength(const MerkleProof& proof, std::uint64_t length) {
    if (!proof.isWellFormed() || length == 0) {
        return false;
    }
    return length <= (1ULL << proof.depth());
}

// Unoccupied slots hash like the sentinel, so a zero-key leaf is only meaningful at index 0.
bool isUnoccupiedSlot(const Leaf& leaf, std::uint64_t index) {
    return leaf.key.isZero() && index != 0;
}

} // namespace

Hash ProvableIndexedMerkleMap::computeRoot(const Hash& leafHash, const MerkleProof& proof) {
    Hash current = leafHash;
    const std::size_t levels = std::min(proof.siblings.size(), proof.pathIndices.size());
    for (std::size_t level = 0; level < levels; ++level) {
        const Hash& sibling = proof.siblings[level];
        current = proof.pathIndices[level] ? hashNode(sibling, current) : hashNode(current, sibling);
    }
    return current;
}

bool ProvableIndexedMerkleMap::inGap(const Leaf& lowLeaf, const Field& key) {
    if (key <= lowLeaf.key) {
        return false;
    }
    return !lowLeaf.hasSuccessor() || key < lowLeaf.nextKey;
}

bool ProvableIndexedMerkleMap::verifyMembershipProof(const Hash& root,
                                                     const MembershipProof& proof,
                                                     const Field& key,
                                                     const Field& value,
                                                     std::uint64_t length) {
    if (proof.leaf.key != key || proof.leaf.value != value) {
        return false;
    }
    if (!pathCoversLength(proof.merkleProof, length)) {
        return false;
    }
    const std::uint64_t index = proof.merkleProof.leafIndex();
    if (index != proof.leafIndex || index >= length || isUnoccupiedSlot(proof.leaf, index)) {
        return false;
    }
    return computeRoot(hashLeaf(proof.leaf), proof.merkleProof) == root;
}

bool ProvableIndexedMerkleMap::verifyNonMembershipProof(const Hash& root,
                                                        const NonMembershipProof& proof,
                                                        const Field& key,
                                                        std::uint64_t length) {
    if (!inGap(proof.lowLeaf, key)) {
        return false;
    }
    if (!pathCoversLength(proof.merkleProof, length)) {
        return false;
    }
    const std::uint64_t index = proof.merkleProof.leafIndex();
    if (index != proof.lowLeafIndex || index >= length || isUnoccupiedSlot(proof.lowLeaf, index)) {
        return false;
    }
    return computeRoot(hashLeaf(proof.lowLeaf), proof.merkleProof) == root;
}

VerifyStatus ProvableIndexedMerkleMap::insert(const InsertWitness& witness) {
    const MerkleProof& lowPath = witness.lowLeafPath;
    const MerkleProof& newPath = witness.newLeafPath;

    // Shape: both paths address slots of the same tree and the low leaf is a stored leaf or the
    // sentinel. treeLength is the prover's claim; the root does not commit to it.
    if (!lowPath.isWellFormed() || !newPath.isWellFormed() || lowPath.depth() != newPath.depth()) {
        return VerifyStatus::InvalidWitness;
    }
    if (witness.newLeafIndex == 0 || witness.newLeafIndex != witness.treeLength ||
        witness.lowLeafIndex >= witness.treeLength ||
        isUnoccupiedSlot(witness.lowLeaf, witness.lowLeafIndex)) {
        return VerifyStatus::InvalidWitness;
    }
    if (lowPath.leafIndex() != witness.lowLeafIndex || newPath.leafIndex() != witness.newLeafIndex) {
        return VerifyStatus::InvalidWitness;
    }

    if (computeRoot(hashLeaf(witness.lowLeaf), lowPath) != witness.oldRoot) {
        return VerifyStatus::OldRootMismatch;
    }

    // The low leaf is committed under oldRoot, so an empty gap around key proves absence.
    if (!inGap(witness.lowLeaf, witness.key)) {
        return VerifyStatus::OrderingViolation;
    }

    Leaf relinked = witness.lowLeaf;
    relinked.nextKey = witness.key;
    relinked.nextIndex = witness.newLeafIndex;
    const Hash intermediateRoot = computeRoot(hashLeaf(relinked), lowPath);

    // newPath must show the target slot empty under the intermediate root.
    if (computeRoot(emptyLeafHash(), newPath) != intermediateRoot) {
        return VerifyStatus::NewRootMismatch;
    }

    const Leaf newLeaf(witness.key, witness.value, witness.lowLeaf.nextKey, witness.lowLeaf.nextIndex);
    if (computeRoot(hashLeaf(newLeaf), newPath) != witness.newRoot) {
        return VerifyStatus::NewRootMismatch;
    }
    return VerifyStatus::Ok;
}

VerifyStatus ProvableIndexedMerkleMap::update(const UpdateWitness& witness) {
    const MerkleProof& path = witness.path;
    if (!path.isWellFormed() || witness.key.isZero() || witness.leafIndex == 0 ||
        witness.leafIndex >= witness.treeLength || path.leafIndex() != witness.leafIndex) {
        return VerifyStatus::InvalidWitness;
    }

    Leaf leaf(witness.key, witness.oldValue, witness.nextKey, witness.nextIndex);
    if (computeRoot(hashLeaf(leaf), path) != witness.oldRoot) {
        return VerifyStatus::OldRootMismatch;
    }

    leaf.value = witness.newValue;
    if (computeRoot(hashLeaf(leaf), path) != witness.newRoot) {
        return VerifyStatus::NewRootMismatch;
    }
    return VerifyStatus::Ok;
}

VerifyStatus ProvableIndexedMerkleMap::verifyChain(const Hash& startRoot,
                                                   const std::vector<Step>& steps,
                                                   std::size_t* failedStep) {
    Hash current = startRoot;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const Step& step = steps[i];
        VerifyStatus status = VerifyStatus::InvalidWitness;
        Hash oldRoot;
        Hash newRoot;
        if (step.insert != nullptr && step.update == nullptr) {
            oldRoot = step.insert->oldRoot;
            newRoot = step.insert->newRoot;
            status = insert(*step.insert);
        } else if (step.update != nullptr && step.insert == nullptr) {
            oldRoot = step.update->oldRoot;
            newRoot = step.update->newRoot;
            status = update(*step.update);
        }
        if (status == VerifyStatus::Ok && oldRoot != current) {
            status = VerifyStatus::ChainBroken;
        }
        if (status != VerifyStatus::Ok) {
            if (failedStep != nullptr) {
                *failedStep = i;
            }
            return status;
        }
        current = newRoot;
    }
    return VerifyStatus::Ok;
}

} // namespace imm
