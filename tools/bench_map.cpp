#include "indexed_merkle_map.hpp"
#include "provable_map.hpp"
#include "random_keys.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <vector>

namespace {

using BenchClock = std::chrono::steady_clock;

long long elapsedUs(BenchClock::time_point start, BenchClock::time_point end) {
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

} // namespace

int main() {
    const std::vector<std::uint32_t> heights = { 8, 16, 24, 32 };
    const std::size_t operations = 200;

    imm::KeySource keys(imm::Hash::fromHex(
        "62656e63682d6d61702d736565642d3030303030303030303030303030303030"));

    for (auto height : heights) {
        imm::IndexedMerkleMap map(height);
        const std::size_t count =
            std::min<std::uint64_t>(operations, map.capacity());

        std::vector<imm::Field> inserted;
        inserted.reserve(count);
        auto start = BenchClock::now();
        for (std::size_t i = 0; i < count; ++i) {
            imm::Field key = keys.next();
            map.insert(key, keys.next());
            inserted.push_back(key);
        }
        auto afterInsert = BenchClock::now();

        std::vector<imm::UpdateWitness> witnesses;
        witnesses.reserve(count);
        for (const auto& key : inserted) {
            witnesses.push_back(*map.updateAndGenerateWitness(key, keys.next()));
        }
        auto afterUpdate = BenchClock::now();

        std::size_t proofsOk = 0;
        for (const auto& key : inserted) {
            auto proof = map.getMembershipProof(key);
            if (imm::IndexedMerkleMap::verifyMembershipProof(
                    map.root(), proof, key, proof.leaf.value, map.length())) {
                ++proofsOk;
            }
        }
        auto afterProofs = BenchClock::now();

        std::size_t replayOk = 0;
        for (const auto& witness : witnesses) {
            if (imm::ProvableIndexedMerkleMap::update(witness) == imm::VerifyStatus::Ok) {
                ++replayOk;
            }
        }
        auto end = BenchClock::now();

        std::cout << "height=" << height << " n=" << count
                  << " insert: " << elapsedUs(start, afterInsert) / static_cast<long long>(count)
                  << "us/op update+witness: "
                  << elapsedUs(afterInsert, afterUpdate) / static_cast<long long>(count)
                  << "us/op prove+verify: "
                  << elapsedUs(afterUpdate, afterProofs) / static_cast<long long>(count)
                  << "us/op replay: " << elapsedUs(afterProofs, end) / static_cast<long long>(count)
                  << "us/op nodes=" << map.storedNodeCount() << " ok=" << proofsOk << "/"
                  << replayOk << "\n";
    }

    return 0;
}
