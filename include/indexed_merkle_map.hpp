#pragma once

#include "errors.hpp"
#include "field.hpp"
#include "leaf.hpp"
#include "leaf_store.hpp"
#include "merkle_tree.hpp"
#include "proofs.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace imm {

// Authenticated key-value map. Leaves form a sorted linked list (key -> next larger key) and
// are committed by a fixed-height Merkle tree, so one leaf proof shows either that a key is
// present or that no key lies between a stored key and its successor.
//
// Leaf 0 is a permanent zero-key sentinel. Keys are appended at index length() and never
// removed; updates only change a leaf's value.
//
// Not synchronized: one owner mutates, and reads must not overlap a mutation.
class IndexedMerkleMap {
public:
    static constexpr std::uint32_t kMinHeight = MerkleTree::kMinHeight;
    static constexpr std::uint32_t kMaxHeight = MerkleTree::kMaxHeight;

    // Throws InvalidHeightError unless kMinHeight <= height <= kMaxHeight.
    explicit IndexedMerkleMap(std::uint32_t height);

    std::uint32_t height() const { return tree_.height(); }
    // Occupied leaves including the sentinel.
    std::uint64_t length() const { return leaves_.size(); }
    // Slot the next insert will occupy.
    std::uint64_t nextIndex() const { return leaves_.size(); }
    // Number of keys that can be inserted into an empty map.
    std::uint64_t capacity() const { return tree_.slotCount() - 1; }
    Hash root() const { return tree_.root(); }

    std::optional<Field> getOption(const Field& key) const;
    // Throws KeyNotFoundError; for callers that have already checked presence.
    Field get(const Field& key) const;
    bool contains(const Field& key) const { return leaves_.contains(key); }
    const Leaf& leafAt(std::uint64_t index) const { return leaves_.at(index); }
    // Ascending walk from the sentinel. The range points into this map: it must not outlive
    // the map or be used after the map is moved, and a mutation invalidates live iterators.
    SortedLeafRange sortedLeaves() const { return leaves_.sorted(); }

    // Throws DuplicateKeyError (present or zero key) or CapacityExceededError.
    void insert(const Field& key, const Field& value);
    // Same mutation; returns nullopt when captureOldState is false.
    std::optional<InsertWitness> insertAndGenerateWitness(const Field& key,
                                                          const Field& value,
                                                          bool captureOldState = true);

    // Returns the previous value. Throws KeyNotFoundError; the sentinel cannot be updated.
    Field update(const Field& key, const Field& newValue);
    std::optional<UpdateWitness> updateAndGenerateWitness(const Field& key,
                                                          const Field& newValue,
                                                          bool captureOldState = true);

    // Update when present (returns the old value), insert otherwise (returns nullopt).
    std::optional<Field> set(const Field& key, const Field& value);

    MembershipProof getMembershipProof(const Field& key) const;
    // Throws KeyPresentError when key is stored (the zero key always is).
    NonMembershipProof getNonMembershipProof(const Field& key) const;

    static bool verifyMembershipProof(const Hash& root,
                                      const MembershipProof& proof,
                                      const Field& key,
                                      const Field& value,
                                      std::uint64_t length);
    static bool verifyNonMembershipProof(const Hash& root,
                                         const NonMembershipProof& proof,
                                         const Field& key,
                                         std::uint64_t length);

    std::size_t storedNodeCount() const { return tree_.storedNodeCount(); }

private:
    void applyInsert(const Field& key, const Field& value, InsertWitness* witness);
    Field applyUpdate(const Field& key, const Field& newValue, UpdateWitness* witness);
    std::uint64_t updatableIndex(const Field& key) const;

    LeafStore leaves_;
    MerkleTree tree_;
};

} // namespace imm
