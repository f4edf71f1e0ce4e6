#pragma once

#include "errors.hpp"
#include "field.hpp"
#include "proofs.hpp"

#include <cstdint>
#include <vector>

namespace imm {

// Stateless checks over proofs and witnesses. Nothing here touches a tree; every function is
// pure, so results can be replayed or cached and calls may run on any thread.
class ProvableIndexedMerkleMap {
public:
    ProvableIndexedMerkleMap() = delete;

    // Climb from a leaf hash to the root the path commits to.
    static Hash computeRoot(const Hash& leafHash, const MerkleProof& proof);

    // length bounds the path: it must be deep enough to address length slots and the proven
    // leaf must lie below length. Root equality stays the deciding check.
    static bool verifyMembershipProof(const Hash& root,
                                      const MembershipProof& proof,
                                      const Field& key,
                                      const Field& value,
                                      std::uint64_t length);
    static bool verifyNonMembershipProof(const Hash& root,
                                         const NonMembershipProof& proof,
                                         const Field& key,
                                         std::uint64_t length);

    static VerifyStatus insert(const InsertWitness& witness);
    static VerifyStatus update(const UpdateWitness& witness);

    // A single witness in a sequence; one of the two pointers is set.
    struct Step {
        const InsertWitness* insert = nullptr;
        const UpdateWitness* update = nullptr;
    };

    // Replays steps in order starting from startRoot. Stops at the first failure and reports
    // its index through failedStep when given.
    static VerifyStatus verifyChain(const Hash& startRoot,
                                    const std::vector<Step>& steps,
                                    std::size_t* failedStep = nullptr);

    // Whether key falls in the open gap (lowLeaf.key, lowLeaf.nextKey).
    static bool inGap(const Leaf& lowLeaf, const Field& key);
};

} // namespace imm
