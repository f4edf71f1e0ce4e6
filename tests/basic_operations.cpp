#include "indexed_merkle_map.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "basic_operations failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

imm::Field f(std::uint32_t v) {
    return imm::Field::fromU32(v);
}

void testInitialization() {
    imm::IndexedMerkleMap map(10);
    expect(map.height() == 10, "height not recorded");
    expect(map.length() == 1, "fresh map should hold only the sentinel");
    expect(map.nextIndex() == 1, "next index should follow the sentinel");
    expect(map.capacity() == 511, "height 10 should accept 2^9 - 1 keys");

    const imm::Leaf& sentinel = map.leafAt(0);
    expect(sentinel == imm::Leaf::empty(), "sentinel must be the all-zero leaf");
    expect(map.getOption(imm::Field::zero()) == imm::Field::zero(), "zero key resolves to the sentinel");
    expect(map.get(imm::Field::zero()) == imm::Field::zero(), "get(0) should return zero");

    imm::IndexedMerkleMap other(10);
    expect(map.root() == other.root(), "empty maps of equal height must share a root");
    imm::IndexedMerkleMap taller(11);
    expect(map.root() != taller.root(), "height must change the empty root");
}

void testInvalidHeight() {
    for (std::uint32_t height : { 0u, 1u, 33u }) {
        bool caught = false;
        try {
            imm::IndexedMerkleMap map(height);
        } catch (const imm::InvalidHeightError& ex) {
            caught = ex.kind() == imm::ErrorKind::InvalidHeight;
        }
        expect(caught, "height " + std::to_string(height) + " should be rejected");
    }
    imm::IndexedMerkleMap smallest(2);
    imm::IndexedMerkleMap largest(32);
    expect(smallest.capacity() == 1 && largest.capacity() == (1ULL << 31) - 1,
           "boundary heights should construct");
}

void testInsertAndGet() {
    imm::IndexedMerkleMap map(10);
    const imm::Hash before = map.root();
    map.insert(f(100), f(200));
    expect(map.root() != before, "insert must change the root");
    expect(map.length() == 2, "length should grow by one");
    expect(map.get(f(100)) == f(200), "get after insert");
    expect(map.contains(f(100)), "contains after insert");
    expect(!map.getOption(f(101)).has_value(), "absent key should be nullopt");

    const imm::Leaf& sentinel = map.leafAt(0);
    expect(sentinel.nextKey == f(100) && sentinel.nextIndex == 1, "sentinel should link to the new key");
    const imm::Leaf& leaf = map.leafAt(1);
    expect(!leaf.hasSuccessor() && leaf.nextIndex == 0, "largest key links to nothing");

    bool caught = false;
    try {
        map.get(f(101));
    } catch (const imm::KeyNotFoundError&) {
        caught = true;
    }
    expect(caught, "get on an absent key must throw");
}

void testMiddleInsertRelinks() {
    imm::IndexedMerkleMap map(8);
    map.insert(f(10), f(1));
    map.insert(f(30), f(3));
    map.insert(f(20), f(2));

    const imm::Leaf& ten = map.leafAt(1);
    const imm::Leaf& thirty = map.leafAt(2);
    const imm::Leaf& twenty = map.leafAt(3);
    expect(ten.nextKey == f(20) && ten.nextIndex == 3, "10 should now point at 20");
    expect(twenty.nextKey == f(30) && twenty.nextIndex == 2, "20 should inherit 10's old successor");
    expect(!thirty.hasSuccessor(), "30 remains the tail");
}

void testDuplicateRejected() {
    imm::IndexedMerkleMap map(10);
    map.insert(f(5), f(50));
    const imm::Hash rootAfterFirst = map.root();
    bool caught = false;
    try {
        map.insert(f(5), f(51));
    } catch (const imm::DuplicateKeyError& ex) {
        caught = ex.kind() == imm::ErrorKind::DuplicateKey;
    }
    expect(caught, "duplicate insert must throw DuplicateKeyError");
    expect(map.root() == rootAfterFirst, "failed insert must leave the root untouched");
    expect(map.length() == 2, "failed insert must leave the length untouched");
    expect(map.get(f(5)) == f(50), "failed insert must keep the original value");

    caught = false;
    try {
        map.insert(imm::Field::zero(), f(1));
    } catch (const imm::DuplicateKeyError&) {
        caught = true;
    }
    expect(caught, "the zero key is reserved");
}

void testUpdate() {
    imm::IndexedMerkleMap map(10);
    map.insert(f(7), f(70));
    map.insert(f(9), f(90));
    const imm::Leaf linkBefore = map.leafAt(1);
    const imm::Hash before = map.root();

    imm::Field old = map.update(f(7), f(71));
    expect(old == f(70), "update returns the previous value");
    expect(map.get(f(7)) == f(71), "update stores the new value");
    expect(map.root() != before, "update must change the root");
    expect(map.length() == 3, "update must not change length");
    const imm::Leaf& linkAfter = map.leafAt(1);
    expect(linkAfter.key == linkBefore.key && linkAfter.nextKey == linkBefore.nextKey &&
               linkAfter.nextIndex == linkBefore.nextIndex,
           "update must only touch the value");

    bool caught = false;
    try {
        map.update(f(8), f(1));
    } catch (const imm::KeyNotFoundError&) {
        caught = true;
    }
    expect(caught, "update of an absent key must throw");

    caught = false;
    try {
        map.update(imm::Field::zero(), f(1));
    } catch (const imm::KeyNotFoundError&) {
        caught = true;
    }
    expect(caught, "the sentinel value is fixed");
}

void testSet() {
    imm::IndexedMerkleMap map(6);
    auto first = map.set(f(3), f(30));
    expect(!first.has_value(), "set on a new key inserts");
    auto second = map.set(f(3), f(31));
    expect(second.has_value() && *second == f(30), "set on an existing key returns the old value");
    expect(map.get(f(3)) == f(31), "set stores the new value");
    expect(map.length() == 2, "set-as-update must not grow the map");

    bool caught = false;
    try {
        map.set(imm::Field::zero(), f(1));
    } catch (const imm::DuplicateKeyError&) {
        caught = true;
    }
    expect(caught, "set(0) must be refused");
}

void testSortedLeaves() {
    imm::IndexedMerkleMap map(8);
    const std::vector<std::uint32_t> keys = { 40, 10, 30, 20, 50 };
    for (auto k : keys) {
        map.insert(f(k), f(k * 10));
    }

    std::vector<std::uint32_t> expected = { 0, 10, 20, 30, 40, 50 };
    for (int pass = 0; pass < 2; ++pass) {
        std::size_t i = 0;
        for (const imm::Leaf& leaf : map.sortedLeaves()) {
            expect(i < expected.size(), "sorted walk produced too many leaves");
            expect(leaf.key == f(expected[i]), "sorted walk out of order");
            ++i;
        }
        expect(i == expected.size(), "sorted walk should visit every leaf");
    }
    expect(map.sortedLeaves().toVector().size() == map.length(), "toVector covers all leaves");
}

void testConcreteScenario() {
    imm::IndexedMerkleMap map(10);
    const imm::Hash rootBefore = map.root();
    map.insert(f(100), f(200));
    const imm::Hash rootAfter = map.root();
    expect(rootBefore != rootAfter, "insert changes the root");
    expect(map.get(f(100)) == f(200), "scenario get");
    expect(map.update(f(100), f(300)) == f(200), "scenario update returns 200");

    auto proof = map.getNonMembershipProof(f(999));
    expect(proof.lowLeaf.key == f(100), "999's low leaf is 100");
    expect(imm::IndexedMerkleMap::verifyNonMembershipProof(map.root(), proof, f(999), map.length()),
           "non-membership verifies against the current root");
    expect(!imm::IndexedMerkleMap::verifyNonMembershipProof(rootAfter, proof, f(999), map.length()),
           "non-membership must fail against the pre-update root");
}

} // namespace

int main() {
    testInitialization();
    testInvalidHeight();
    testInsertAndGet();
    testMiddleInsertRelinks();
    testDuplicateRejected();
    testUpdate();
    testSet();
    testSortedLeaves();
    testConcreteScenario();

    std::cout << "basic_operations passed" << std::endl;
    return 0;
}
