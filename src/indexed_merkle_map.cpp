#include "indexed_merkle_map.hpp"

#include "hashing.hpp"
#include "provable_map.hpp"

#include <sstream>

namespace imm {

namespace {

std::string describeKey(const char* prefix, const Field& key) {
    std::ostringstream oss;
    oss << prefix << " " << key.toDecimal();
    return oss.str();
}

} // namespace

IndexedMerkleMap::IndexedMerkleMap(std::uint32_t height) : leaves_(), tree_(height) {
    tree_.setLeaf(0, hashLeaf(leaves_.at(0)));
}

std::optional<Field> IndexedMerkleMap::getOption(const Field& key) const {
    auto index = leaves_.indexOf(key);
    if (!index) {
        return std::nullopt;
    }
    return leaves_.at(*index).value;
}

Field IndexedMerkleMap::get(const Field& key) const {
    auto value = getOption(key);
    if (!value) {
        throw KeyNotFoundError(describeKey("no leaf for key", key));
    }
    return *value;
}

void IndexedMerkleMap::insert(const Field& key, const Field& value) {
    applyInsert(key, value, nullptr);
}

std::optional<InsertWitness> IndexedMerkleMap::insertAndGenerateWitness(const Field& key,
                                                                         const Field& value,
                                                                         bool captureOldState) {
    if (!captureOldState) {
        applyInsert(key, value, nullptr);
        return std::nullopt;
    }
    InsertWitness witness;
    applyInsert(key, value, &witness);
    return witness;
}

void IndexedMerkleMap::applyInsert(const Field& key, const Field& value, InsertWitness* witness) {
    if (key.isZero()) {
        throw DuplicateKeyError("the zero key is reserved for the sentinel leaf");
    }
    if (leaves_.contains(key)) {
        throw DuplicateKeyError(describeKey("key already present:", key));
    }
    const std::uint64_t newIndex = leaves_.size();
    if (newIndex >= tree_.slotCount()) {
        std::ostringstream oss;
        oss << "tree of height " << height() << " is full (" << tree_.slotCount()
            << " slots including the sentinel)";
        throw CapacityExceededError(oss.str());
    }

    const std::uint64_t lowIndex = leaves_.lowLeafIndex(key);
    const Leaf lowLeaf = leaves_.at(lowIndex);

    if (witness != nullptr) {
        witness->oldRoot = tree_.root();
        witness->key = key;
        witness->value = value;
        witness->newLeafIndex = newIndex;
        witness->treeLength = leaves_.size();
        witness->lowLeaf = lowLeaf;
        witness->lowLeafIndex = lowIndex;
        witness->lowLeafPath = tree_.pathFor(lowIndex);
    }

    leaves_.setSuccessor(lowIndex, key, newIndex);
    tree_.setLeaf(lowIndex, hashLeaf(leaves_.at(lowIndex)));

    // The slot is still empty here; its path now reflects the relinked low leaf.
    if (witness != nullptr) {
        witness->newLeafPath = tree_.pathFor(newIndex);
    }

    const Leaf newLeaf(key, value, lowLeaf.nextKey, lowLeaf.nextIndex);
    leaves_.append(newLeaf);
    tree_.setLeaf(newIndex, hashLeaf(newLeaf));

    if (witness != nullptr) {
        witness->newRoot = tree_.root();
    }
}

Field IndexedMerkleMap::update(const Field& key, const Field& newValue) {
    return applyUpdate(key, newValue, nullptr);
}

std::optional<UpdateWitness> IndexedMerkleMap::updateAndGenerateWitness(const Field& key,
                                                                         const Field& newValue,
                                                                         bool captureOldState) {
    if (!captureOldState) {
        applyUpdate(key, newValue, nullptr);
        return std::nullopt;
    }
    UpdateWitness witness;
    applyUpdate(key, newValue, &witness);
    return witness;
}

std::uint64_t IndexedMerkleMap::updatableIndex(const Field& key) const {
    auto index = leaves_.indexOf(key);
    if (!index || *index == 0) {
        throw KeyNotFoundError(describeKey("cannot update missing key", key));
    }
    return *index;
}

Field IndexedMerkleMap::applyUpdate(const Field& key, const Field& newValue, UpdateWitness* witness) {
    const std::uint64_t index = updatableIndex(key);
    const Leaf before = leaves_.at(index);

    if (witness != nullptr) {
        witness->oldRoot = tree_.root();
        witness->key = key;
        witness->oldValue = before.value;
        witness->newValue = newValue;
        witness->leafIndex = index;
        witness->nextKey = before.nextKey;
        witness->nextIndex = before.nextIndex;
        witness->treeLength = leaves_.size();
        witness->path = tree_.pathFor(index);
    }

    leaves_.setValue(index, newValue);
    tree_.setLeaf(index, hashLeaf(leaves_.at(index)));

    if (witness != nullptr) {
        witness->newRoot = tree_.root();
    }
    return before.value;
}

std::optional<Field> IndexedMerkleMap::set(const Field& key, const Field& value) {
    auto index = leaves_.indexOf(key);
    if (index && *index != 0) {
        return applyUpdate(key, value, nullptr);
    }
    applyInsert(key, value, nullptr);
    return std::nullopt;
}

MembershipProof IndexedMerkleMap::getMembershipProof(const Field& key) const {
    auto index = leaves_.indexOf(key);
    if (!index) {
        throw KeyNotFoundError(describeKey("no membership proof for missing key", key));
    }
    MembershipProof proof;
    proof.leaf = leaves_.at(*index);
    proof.leafIndex = *index;
    proof.merkleProof = tree_.pathFor(*index);
    return proof;
}

NonMembershipProof IndexedMerkleMap::getNonMembershipProof(const Field& key) const {
    if (leaves_.contains(key)) {
        throw KeyPresentError(describeKey("key is present:", key));
    }
    const std::uint64_t lowIndex = leaves_.lowLeafIndex(key);
    NonMembershipProof proof;
    proof.lowLeaf = leaves_.at(lowIndex);
    proof.lowLeafIndex = lowIndex;
    proof.merkleProof = tree_.pathFor(lowIndex);
    return proof;
}

bool IndexedMerkleMap::verifyMembershipProof(const Hash& root,
                                             const MembershipProof& proof,
                                             const Field& key,
                                             const Field& value,
                                             std::uint64_t length) {
    return ProvableIndexedMerkleMap::verifyMembershipProof(root, proof, key, value, length);
}

bool IndexedMerkleMap::verifyNonMembershipProof(const Hash& root,
                                                const NonMembershipProof& proof,
                                                const Field& key,
                                                std::uint64_t length) {
    return ProvableIndexedMerkleMap::verifyNonMembershipProof(root, proof, key, length);
}

} // namespace imm
