#pragma once

#include "field.hpp"

#include <cstdint>

namespace imm {

// One slot of the tree. nextKey/nextIndex link to the leaf with the next larger key;
// nextKey == 0 marks the largest key.
struct Leaf {
    Field key;
    Field value;
    Field nextKey;
    std::uint64_t nextIndex = 0;

    Leaf() = default;
    Leaf(const Field& k, const Field& v, const Field& nk, std::uint64_t ni)
        : key(k), value(v), nextKey(nk), nextIndex(ni) {}

    static Leaf empty() { return Leaf(); }

    bool hasSuccessor() const { return !nextKey.isZero(); }

    bool operator==(const Leaf& other) const {
        return key == other.key && value == other.value && nextKey == other.nextKey &&
               nextIndex == other.nextIndex;
    }
    bool operator!=(const Leaf& other) const { return !(*this == other); }
};

} // namespace imm
