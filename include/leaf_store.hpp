#pragma once

#include "field.hpp"
#include "leaf.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace imm {

// Walks the linked list embedded in the leaves, starting at the sentinel.
class SortedLeafIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Leaf;
    using difference_type = std::ptrdiff_t;
    using pointer = const Leaf*;
    using reference = const Leaf&;

    SortedLeafIterator() : leaves_(nullptr), index_(0), remaining_(0) {}
    SortedLeafIterator(const std::vector<Leaf>* leaves, std::uint64_t index, std::uint64_t remaining)
        : leaves_(leaves), index_(index), remaining_(remaining) {}

    reference operator*() const { return (*leaves_)[index_]; }
    pointer operator->() const { return &(*leaves_)[index_]; }

    SortedLeafIterator& operator++();
    SortedLeafIterator operator++(int) {
        SortedLeafIterator copy = *this;
        ++(*this);
        return copy;
    }

    bool operator==(const SortedLeafIterator& other) const { return remaining_ == other.remaining_; }
    bool operator!=(const SortedLeafIterator& other) const { return !(*this == other); }

private:
    const std::vector<Leaf>* leaves_;
    std::uint64_t index_;
    // Bounds the walk by the number of occupied leaves.
    std::uint64_t remaining_;
};

// Restartable, non-owning view; each begin() starts again from leaves[0]. Valid only while
// the LeafStore it came from is alive and unmoved.
class SortedLeafRange {
public:
    explicit SortedLeafRange(const std::vector<Leaf>* leaves) : leaves_(leaves) {}

    SortedLeafIterator begin() const { return SortedLeafIterator(leaves_, 0, leaves_->size()); }
    SortedLeafIterator end() const { return SortedLeafIterator(leaves_, 0, 0); }

    std::vector<Leaf> toVector() const { return std::vector<Leaf>(begin(), end()); }

private:
    const std::vector<Leaf>* leaves_;
};

// Arena of leaves addressed by position, with two side indexes over the keys:
// a hash map for exact lookup and an ordered map for predecessor search.
class LeafStore {
public:
    LeafStore();

    std::uint64_t size() const { return leaves_.size(); }
    const Leaf& at(std::uint64_t index) const;

    // Index of the leaf holding key; the zero key resolves to the sentinel.
    std::optional<std::uint64_t> indexOf(const Field& key) const;
    bool contains(const Field& key) const { return indexOf(key).has_value(); }

    // Leaf with the greatest stored key strictly below key (the sentinel when none is).
    std::uint64_t lowLeafIndex(const Field& key) const;

    std::uint64_t append(const Leaf& leaf);
    void setValue(std::uint64_t index, const Field& value);
    void setSuccessor(std::uint64_t index, const Field& nextKey, std::uint64_t nextIndex);

    SortedLeafRange sorted() const { return SortedLeafRange(&leaves_); }

private:
    Leaf& mutableAt(std::uint64_t index);

    std::vector<Leaf> leaves_;
    std::unordered_map<Field, std::uint64_t, FieldHasher> keyIndex_;
    std::map<Field, std::uint64_t> orderedKeys_;
};

} // namespace imm
