#include "indexed_merkle_map.hpp"
#include "tool_config.hpp"
#include "witness_log.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

// Builds a map from random inserts and updates and prints them as a witness log
// (see witness_log.hpp).
int main(int argc, char* argv[]) {
    long count = 16;
    if (argc > 1) {
        char* end = nullptr;
        long parsed = std::strtol(argv[1], &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            count = parsed;
        } else {
            std::cerr << "Usage: generate_witnesses <count> [output]\n";
            return 1;
        }
    }
    std::string outputPath;
    if (argc > 2) {
        outputPath = argv[2];
    }

    imm::ToolConfig config;
    std::unique_ptr<imm::KeySource> keys;
    try {
        config = imm::loadToolConfig();
        keys = imm::makeKeySource(config);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    imm::IndexedMerkleMap map(config.treeHeight);
    std::ostringstream out;
    imm::writeStartRoot(out, map.root());

    long inserts = 0;
    long updates = 0;
    for (long i = 0; i < count; ++i) {
        const bool full = map.length() > map.capacity();
        const bool canUpdate = map.length() > 1;
        if (canUpdate && (full || keys->nextBelow(3) == 0)) {
            std::uint64_t index = 1 + keys->nextBelow(map.length() - 1);
            const imm::Field key = map.leafAt(index).key;
            auto witness = map.updateAndGenerateWitness(key, keys->next());
            imm::writeWitness(out, *witness);
            ++updates;
            continue;
        }
        imm::Field key = keys->next();
        while (map.contains(key)) {
            key = keys->next();
        }
        auto witness = map.insertAndGenerateWitness(key, keys->next());
        imm::writeWitness(out, *witness);
        ++inserts;
    }

    if (outputPath.empty()) {
        std::cout << out.str();
    } else {
        std::ofstream ofs(outputPath);
        if (!ofs) {
            std::cerr << "Unable to open output path: " << outputPath << "\n";
            return 1;
        }
        ofs << out.str();
    }

    std::cerr << "Generated " << inserts << " insert and " << updates << " update witnesses"
              << (keys->deterministic() ? " (seeded)" : "") << ", final root "
              << map.root().toHex() << "\n";
    return 0;
}
