#include "indexed_merkle_map.hpp"
#include "provable_map.hpp"
#include "tool_config.hpp"

#include <exception>
#include <iostream>
#include <string>

using namespace imm;

namespace {

void printProofCheck(const char* label, bool ok) {
    std::cout << "  " << label << ": " << (ok ? "verified" : "REJECTED") << "\n";
}

std::string describeSuccessor(const Leaf& leaf) {
    return leaf.hasSuccessor() ? leaf.nextKey.toDecimal() : std::string("none");
}

} // namespace

int main() {
    ToolConfig config;
    try {
        config = loadToolConfig();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    IndexedMerkleMap map(config.treeHeight);
    std::cout << "Indexed Merkle map of height " << map.height() << " (" << map.capacity()
              << " insertable keys)\n";
    std::cout << "Empty root: " << map.root().toHex() << "\n\n";

    const Field key = Field::fromU32(100);
    map.insert(key, Field::fromU32(200));
    std::cout << "insert(100, 200) -> root " << map.root().toHex() << "\n";

    Field previous = map.update(key, Field::fromU32(300));
    std::cout << "update(100, 300) replaced " << previous.toDecimal() << "\n";

    auto replaced = map.set(Field::fromU32(50), Field::fromU32(400));
    std::cout << "set(50, 400) " << (replaced ? "updated an existing key" : "inserted a new key")
              << "\n";

    std::cout << "get(100) = " << map.get(key).toDecimal() << "\n";
    auto missing = map.getOption(Field::fromU32(7));
    std::cout << "getOption(7) = " << (missing ? missing->toDecimal() : std::string("absent"))
              << "\n\n";

    std::cout << "Proofs against root " << map.root().toHex() << ":\n";
    auto membership = map.getMembershipProof(key);
    printProofCheck("100 -> 300 membership",
                    IndexedMerkleMap::verifyMembershipProof(
                        map.root(), membership, key, Field::fromU32(300), map.length()));

    const Field absent = Field::fromU32(999);
    auto nonMembership = map.getNonMembershipProof(absent);
    std::cout << "  999 falls between " << nonMembership.lowLeaf.key.toDecimal() << " and "
              << describeSuccessor(nonMembership.lowLeaf) << "\n";
    printProofCheck("999 non-membership",
                    IndexedMerkleMap::verifyNonMembershipProof(
                        map.root(), nonMembership, absent, map.length()));

    std::cout << "\nWitnessed transitions:\n";
    auto insertWitness = map.insertAndGenerateWitness(Field::fromU32(75), Field::fromU32(1));
    auto updateWitness = map.updateAndGenerateWitness(Field::fromU32(75), Field::fromU32(2));
    std::cout << "  insert(75, 1): " << toString(ProvableIndexedMerkleMap::insert(*insertWitness))
              << "\n";
    std::cout << "  update(75, 2): " << toString(ProvableIndexedMerkleMap::update(*updateWitness))
              << "\n";

    std::cout << "\nSorted leaves (" << map.length() << " including the sentinel):\n";
    for (const Leaf& leaf : map.sortedLeaves()) {
        if (leaf.key.isZero()) {
            continue;
        }
        std::cout << "  key=" << leaf.key.toDecimal() << " value=" << leaf.value.toDecimal()
                  << " next=" << describeSuccessor(leaf) << "\n";
    }
    return 0;
}
