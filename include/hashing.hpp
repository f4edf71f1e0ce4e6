#pragma once

#include "field.hpp"
#include "leaf.hpp"

#include <cstddef>
#include <cstdint>

namespace imm {

Hash sha256(const std::uint8_t* data, std::size_t len);

// SHA-256(left || right)
Hash hashNode(const Hash& left, const Hash& right);

// SHA-256(key || value || nextKey || be64(nextIndex))
Hash hashLeaf(const Leaf& leaf);

// Hash of an unoccupied slot, equal to hashLeaf(Leaf::empty()).
const Hash& emptyLeafHash();

} // namespace imm
