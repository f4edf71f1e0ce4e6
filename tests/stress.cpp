#include "hashing.hpp"
#include "indexed_merkle_map.hpp"
#include "provable_map.hpp"
#include "random_keys.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "stress failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

const char* kSeedHex = "7374726573732d746573742d696e64657865642d6d65726b6c652d6d61702d31";

imm::Hash denseRoot(const imm::IndexedMerkleMap& map) {
    std::vector<imm::Hash> level(1ULL << (map.height() - 1), imm::emptyLeafHash());
    for (std::uint64_t i = 0; i < map.length(); ++i) {
        level[i] = imm::hashLeaf(map.leafAt(i));
    }
    while (level.size() > 1) {
        std::vector<imm::Hash> parent;
        for (std::size_t i = 0; i < level.size(); i += 2) {
            parent.push_back(imm::hashNode(level[i], level[i + 1]));
        }
        level.swap(parent);
    }
    return level.front();
}

void checkInvariants(const imm::IndexedMerkleMap& map,
                     const std::map<imm::Field, imm::Field>& model,
                     bool checkRoot) {
    expect(map.length() == model.size() + 1, "length tracks the number of keys plus the sentinel");

    auto expected = model.begin();
    std::uint64_t visited = 0;
    imm::Field previous;
    for (const imm::Leaf& leaf : map.sortedLeaves()) {
        if (visited == 0) {
            expect(leaf.key.isZero(), "walk starts at the sentinel");
        } else {
            expect(previous < leaf.key, "walk must be strictly ascending");
            expect(expected != model.end() && expected->first == leaf.key, "walk matches the model");
            expect(expected->second == leaf.value, "value matches the model");
            ++expected;
        }
        previous = leaf.key;
        ++visited;
    }
    expect(visited == map.length(), "walk visits every occupied leaf");
    expect(expected == model.end(), "walk covers every model key");

    for (std::uint64_t i = 0; i < map.length(); ++i) {
        const imm::Leaf& leaf = map.leafAt(i);
        if (leaf.hasSuccessor()) {
            expect(leaf.nextIndex < map.length(), "successor index is occupied");
            expect(map.leafAt(leaf.nextIndex).key == leaf.nextKey, "nextIndex resolves to nextKey");
        } else {
            expect(leaf.nextIndex == 0, "tail leaf has no successor index");
        }
    }

    if (checkRoot) {
        expect(map.root() == denseRoot(map), "sparse root equals a dense recomputation");
    }
}

void runRandomWorkload(std::uint32_t height, std::size_t operations) {
    imm::IndexedMerkleMap map(height);
    imm::KeySource source(imm::Hash::fromHex(kSeedHex));
    std::map<imm::Field, imm::Field> model;
    std::vector<imm::Field> keys;

    for (std::size_t op = 0; op < operations; ++op) {
        const std::uint64_t choice = source.nextBelow(10);
        const imm::Field value = source.next();
        if (choice < 5 && model.size() < map.capacity()) {
            const imm::Field key = source.next();
            map.insert(key, value);
            model[key] = value;
            keys.push_back(key);
        } else if (choice < 8 && !keys.empty()) {
            const imm::Field& key = keys[source.nextBelow(keys.size())];
            expect(map.update(key, value) == model[key], "update returns the model's old value");
            model[key] = value;
        } else if (!keys.empty()) {
            const imm::Field& key = keys[source.nextBelow(keys.size())];
            auto proof = map.getMembershipProof(key);
            expect(imm::IndexedMerkleMap::verifyMembershipProof(map.root(), proof, key, model[key],
                                                               map.length()),
                   "random membership proof");
            const imm::Field absent = source.next();
            if (model.count(absent) == 0) {
                auto gap = map.getNonMembershipProof(absent);
                expect(imm::IndexedMerkleMap::verifyNonMembershipProof(map.root(), gap, absent,
                                                                      map.length()),
                       "random non-membership proof");
            }
        }
        if (op % 25 == 0 || op + 1 == operations) {
            checkInvariants(map, model, height <= 12);
        }
    }
}

void testDuplicateStormLeavesStateIntact() {
    imm::IndexedMerkleMap map(10);
    std::map<imm::Field, imm::Field> model;
    for (std::uint32_t i = 1; i <= 50; ++i) {
        map.insert(imm::Field::fromU32(i * 3), imm::Field::fromU32(i));
        model[imm::Field::fromU32(i * 3)] = imm::Field::fromU32(i);
    }
    const imm::Hash root = map.root();
    for (std::uint32_t i = 1; i <= 50; ++i) {
        try {
            map.insert(imm::Field::fromU32(i * 3), imm::Field::fromU32(0));
            fail("duplicate insert accepted");
        } catch (const imm::DuplicateKeyError&) {
        }
    }
    expect(map.root() == root, "rejected inserts must not touch the root");
    checkInvariants(map, model, true);
}

} // namespace

int main() {
    runRandomWorkload(10, 800);
    runRandomWorkload(20, 600);
    runRandomWorkload(32, 300);
    testDuplicateStormLeavesStateIntact();

    std::cout << "stress passed" << std::endl;
    return 0;
}
