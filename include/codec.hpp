#pragma once

#include "errors.hpp"
#include "field.hpp"
#include "leaf.hpp"
#include "proofs.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace imm {

// Deterministic byte layout for shipping proofs and witnesses between processes:
// Field/Hash as 32 raw bytes, integers as little-endian u64, vectors prefixed by a
// little-endian u32 count, bools as a single 0/1 byte. Decoders throw CodecError on
// truncated, oversized or malformed input.
using Bytes = std::vector<std::uint8_t>;

Bytes encode(const Leaf& leaf);
Bytes encode(const MerkleProof& proof);
Bytes encode(const MembershipProof& proof);
Bytes encode(const NonMembershipProof& proof);
Bytes encode(const InsertWitness& witness);
Bytes encode(const UpdateWitness& witness);

Leaf decodeLeaf(const Bytes& bytes);
MerkleProof decodeMerkleProof(const Bytes& bytes);
MembershipProof decodeMembershipProof(const Bytes& bytes);
NonMembershipProof decodeNonMembershipProof(const Bytes& bytes);
InsertWitness decodeInsertWitness(const Bytes& bytes);
UpdateWitness decodeUpdateWitness(const Bytes& bytes);

template <typename T>
std::string encodeHex(const T& value) {
    Bytes bytes = encode(value);
    return bytesToHex(bytes.data(), bytes.size());
}

// hexToBytes failures are rethrown as CodecError.
Bytes decodeHexPayload(const std::string& hex);

} // namespace imm
