#include "hashing.hpp"

#include <picosha2.h>

#include <algorithm>
#include <array>

namespace imm {

namespace {

constexpr std::size_t kLeafPreimageSize = 3 * Field::kSize + 8;

template <typename It>
It appendBytes(It out, const Field& field) {
    return std::copy(field.bytes().begin(), field.bytes().end(), out);
}

} // namespace

Hash sha256(const std::uint8_t* data, std::size_t len) {
    Hash::Bytes digest{};
    picosha2::hash256(data, data + len, digest.begin(), digest.end());
    return Hash(digest);
}

Hash hashNode(const Hash& left, const Hash& right) {
    std::array<std::uint8_t, 2 * Hash::kSize> buf{};
    auto out = std::copy(left.bytes().begin(), left.bytes().end(), buf.begin());
    std::copy(right.bytes().begin(), right.bytes().end(), out);
    return sha256(buf.data(), buf.size());
}

Hash hashLeaf(const Leaf& leaf) {
    std::array<std::uint8_t, kLeafPreimageSize> buf{};
    auto out = appendBytes(buf.begin(), leaf.key);
    out = appendBytes(out, leaf.value);
    out = appendBytes(out, leaf.nextKey);
    for (int shift = 56; shift >= 0; shift -= 8) {
        *out++ = static_cast<std::uint8_t>(leaf.nextIndex >> shift);
    }
    return sha256(buf.data(), buf.size());
}

const Hash& emptyLeafHash() {
    static const Hash empty = hashLeaf(Leaf::empty());
    return empty;
}

} // namespace imm
