#include "codec.hpp"

#include "merkle_tree.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace imm {

namespace {

class Writer {
public:
    void putBytes(const std::uint8_t* data, std::size_t len) { out_.insert(out_.end(), data, data + len); }
    void putField(const Field& field) { putBytes(field.bytes().data(), Field::kSize); }
    void putHash(const Hash& hash) { putBytes(hash.bytes().data(), Hash::kSize); }
    void putBool(bool value) { out_.push_back(value ? 1 : 0); }

    void putU64(std::uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
        }
    }

    void putU32(std::uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
        }
    }

    void putLeaf(const Leaf& leaf) {
        putField(leaf.key);
        putField(leaf.value);
        putField(leaf.nextKey);
        putU64(leaf.nextIndex);
    }

    void putMerkleProof(const MerkleProof& proof) {
        putU32(static_cast<std::uint32_t>(proof.siblings.size()));
        for (const auto& sibling : proof.siblings) {
            putHash(sibling);
        }
        putU32(static_cast<std::uint32_t>(proof.pathIndices.size()));
        for (bool isRight : proof.pathIndices) {
            putBool(isRight);
        }
    }

    Bytes take() { return std::move(out_); }

private:
    Bytes out_;
};

class Reader {
public:
    explicit Reader(const Bytes& in) : in_(in), pos_(0) {}

    const std::uint8_t* take(std::size_t len, const char* what) {
        if (in_.size() - pos_ < len) {
            std::ostringstream oss;
            oss << "truncated input while reading " << what << " at offset " << pos_;
            throw CodecError(oss.str());
        }
        const std::uint8_t* ptr = in_.data() + pos_;
        pos_ += len;
        return ptr;
    }

    Field getField() { return *Field::tryFromSlice(take(Field::kSize, "field"), Field::kSize); }
    Hash getHash() { return *Hash::tryFromSlice(take(Hash::kSize, "hash"), Hash::kSize); }

    bool getBool() {
        std::uint8_t raw = *take(1, "bool");
        if (raw > 1) {
            throw CodecError("bool byte must be 0 or 1");
        }
        return raw == 1;
    }

    std::uint64_t getU64() {
        const std::uint8_t* raw = take(8, "u64");
        std::uint64_t value = 0;
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | raw[i];
        }
        return value;
    }

    std::uint32_t getU32() {
        const std::uint8_t* raw = take(4, "u32");
        std::uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | raw[i];
        }
        return value;
    }

    Leaf getLeaf() {
        Leaf leaf;
        leaf.key = getField();
        leaf.value = getField();
        leaf.nextKey = getField();
        leaf.nextIndex = getU64();
        return leaf;
    }

    MerkleProof getMerkleProof() {
        MerkleProof proof;
        std::uint32_t siblingCount = getPathCount();
        proof.siblings.reserve(siblingCount);
        for (std::uint32_t i = 0; i < siblingCount; ++i) {
            proof.siblings.push_back(getHash());
        }
        std::uint32_t indexCount = getPathCount();
        if (indexCount != siblingCount) {
            throw CodecError("merkle proof sibling and direction counts differ");
        }
        proof.pathIndices.reserve(indexCount);
        for (std::uint32_t i = 0; i < indexCount; ++i) {
            proof.pathIndices.push_back(getBool());
        }
        return proof;
    }

    void finish() const {
        if (pos_ != in_.size()) {
            std::ostringstream oss;
            oss << (in_.size() - pos_) << " trailing bytes after payload";
            throw CodecError(oss.str());
        }
    }

private:
    std::uint32_t getPathCount() {
        std::uint32_t count = getU32();
        if (count >= MerkleTree::kMaxHeight) {
            std::ostringstream oss;
            oss << "merkle proof depth " << count << " exceeds maximum of "
                << (MerkleTree::kMaxHeight - 1);
            throw CodecError(oss.str());
        }
        return count;
    }

    const Bytes& in_;
    std::size_t pos_;
};

} // namespace

Bytes encode(const Leaf& leaf) {
    Writer w;
    w.putLeaf(leaf);
    return w.take();
}

Bytes encode(const MerkleProof& proof) {
    Writer w;
    w.putMerkleProof(proof);
    return w.take();
}

Bytes encode(const MembershipProof& proof) {
    Writer w;
    w.putLeaf(proof.leaf);
    w.putU64(proof.leafIndex);
    w.putMerkleProof(proof.merkleProof);
    return w.take();
}

Bytes encode(const NonMembershipProof& proof) {
    Writer w;
    w.putLeaf(proof.lowLeaf);
    w.putU64(proof.lowLeafIndex);
    w.putMerkleProof(proof.merkleProof);
    return w.take();
}

Bytes encode(const InsertWitness& witness) {
    Writer w;
    w.putHash(witness.oldRoot);
    w.putHash(witness.newRoot);
    w.putField(witness.key);
    w.putField(witness.value);
    w.putU64(witness.newLeafIndex);
    w.putU64(witness.treeLength);
    w.putLeaf(witness.lowLeaf);
    w.putU64(witness.lowLeafIndex);
    w.putMerkleProof(witness.lowLeafPath);
    w.putMerkleProof(witness.newLeafPath);
    return w.take();
}

Bytes encode(const UpdateWitness& witness) {
    Writer w;
    w.putHash(witness.oldRoot);
    w.putHash(witness.newRoot);
    w.putField(witness.key);
    w.putField(witness.oldValue);
    w.putField(witness.newValue);
    w.putU64(witness.leafIndex);
    w.putField(witness.nextKey);
    w.putU64(witness.nextIndex);
    w.putU64(witness.treeLength);
    w.putMerkleProof(witness.path);
    return w.take();
}

Leaf decodeLeaf(const Bytes& bytes) {
    Reader r(bytes);
    Leaf leaf = r.getLeaf();
    r.finish();
    return leaf;
}

MerkleProof decodeMerkleProof(const Bytes& bytes) {
    Reader r(bytes);
    MerkleProof proof = r.getMerkleProof();
    r.finish();
    return proof;
}

MembershipProof decodeMembershipProof(const Bytes& bytes) {
    Reader r(bytes);
    MembershipProof proof;
    proof.leaf = r.getLeaf();
    proof.leafIndex = r.getU64();
    proof.merkleProof = r.getMerkleProof();
    r.finish();
    return proof;
}

NonMembershipProof decodeNonMembershipProof(const Bytes& bytes) {
    Reader r(bytes);
    NonMembershipProof proof;
    proof.lowLeaf = r.getLeaf();
    proof.lowLeafIndex = r.getU64();
    proof.merkleProof = r.getMerkleProof();
    r.finish();
    return proof;
}

InsertWitness decodeInsertWitness(const Bytes& bytes) {
    Reader r(bytes);
    InsertWitness witness;
    witness.oldRoot = r.getHash();
    witness.newRoot = r.getHash();
    witness.key = r.getField();
    witness.value = r.getField();
    witness.newLeafIndex = r.getU64();
    witness.treeLength = r.getU64();
    witness.lowLeaf = r.getLeaf();
    witness.lowLeafIndex = r.getU64();
    witness.lowLeafPath = r.getMerkleProof();
    witness.newLeafPath = r.getMerkleProof();
    r.finish();
    return witness;
}

UpdateWitness decodeUpdateWitness(const Bytes& bytes) {
    Reader r(bytes);
    UpdateWitness witness;
    witness.oldRoot = r.getHash();
    witness.newRoot = r.getHash();
    witness.key = r.getField();
    witness.oldValue = r.getField();
    witness.newValue = r.getField();
    witness.leafIndex = r.getU64();
    witness.nextKey = r.getField();
    witness.nextIndex = r.getU64();
    witness.treeLength = r.getU64();
    witness.path = r.getMerkleProof();
    r.finish();
    return witness;
}

Bytes decodeHexPayload(const std::string& hex) {
    try {
        return hexToBytes(hex);
    } catch (const std::invalid_argument& ex) {
        throw CodecError(std::string("bad hex payload: ") + ex.what());
    }
}

} // namespace imm
