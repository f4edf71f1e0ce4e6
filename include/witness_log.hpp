#pragma once

#include "errors.hpp"
#include "field.hpp"
#include "proofs.hpp"
#include "provable_map.hpp"

#include <cstddef>
#include <iosfwd>
#include <utility>
#include <vector>

namespace imm {

// Line-oriented transcript of witnessed transitions, as written by generate_witnesses:
//   S <start root hex>
//   I <insert witness hex> | U <update witness hex>
// Blank lines are skipped.
struct WitnessLog {
    Hash startRoot;
    std::vector<InsertWitness> inserts;
    std::vector<UpdateWitness> updates;
    // Per step: 'I' or 'U' plus the index into the matching vector.
    std::vector<std::pair<char, std::size_t>> order;

    // Steps point into this log and are invalidated when it changes.
    std::vector<ProvableIndexedMerkleMap::Step> steps() const;
    // Root after the last step, or startRoot for an empty log.
    Hash finalRoot() const;
};

void writeStartRoot(std::ostream& out, const Hash& root);
void writeWitness(std::ostream& out, const InsertWitness& witness);
void writeWitness(std::ostream& out, const UpdateWitness& witness);

// Throws CodecError naming the line on malformed input, on a repeated or misplaced S line, and
// when the S line is missing.
WitnessLog readWitnessLog(std::istream& in);

// verifyChain over the log from its declared start root.
VerifyStatus replayWitnessLog(const WitnessLog& log, std::size_t* failedStep = nullptr);

} // namespace imm
