#include "leaf_store.hpp"

#include "errors.hpp"

#include <sstream>

namespace imm {

SortedLeafIterator& SortedLeafIterator::operator++() {
    if (remaining_ == 0) {
        return *this;
    }
    const Leaf& current = (*leaves_)[index_];
    if (!current.hasSuccessor()) {
        remaining_ = 0;
        return *this;
    }
    index_ = current.nextIndex;
    --remaining_;
    return *this;
}

LeafStore::LeafStore() {
    leaves_.push_back(Leaf::empty());
}

const Leaf& LeafStore::at(std::uint64_t index) const {
    if (index >= leaves_.size()) {
        std::ostringstream oss;
        oss << "leaf index " << index << " is not occupied (length " << leaves_.size() << ")";
        throw IndexOutOfRangeError(oss.str());
    }
    return leaves_[index];
}

Leaf& LeafStore::mutableAt(std::uint64_t index) {
    at(index);
    return leaves_[index];
}

std::optional<std::uint64_t> LeafStore::indexOf(const Field& key) const {
    if (key.isZero()) {
        return 0;
    }
    auto it = keyIndex_.find(key);
    if (it == keyIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint64_t LeafStore::lowLeafIndex(const Field& key) const {
    auto it = orderedKeys_.lower_bound(key);
    if (it == orderedKeys_.begin()) {
        return 0;
    }
    --it;
    return it->second;
}

std::uint64_t LeafStore::append(const Leaf& leaf) {
    std::uint64_t index = leaves_.size();
    leaves_.push_back(leaf);
    keyIndex_.emplace(leaf.key, index);
    orderedKeys_.emplace(leaf.key, index);
    return index;
}

void LeafStore::setValue(std::uint64_t index, const Field& value) {
    mutableAt(index).value = value;
}

void LeafStore::setSuccessor(std::uint64_t index, const Field& nextKey, std::uint64_t nextIndex) {
    Leaf& leaf = mutableAt(index);
    leaf.nextKey = nextKey;
    leaf.nextIndex = nextIndex;
}

} // namespace imm
