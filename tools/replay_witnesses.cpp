#include "provable_map.hpp"
#include "witness_log.hpp"

#include <fstream>
#include <iostream>

// Stateless replay of a generate_witnesses file: no tree is built, only the witnesses and the
// declared start root are used.
int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: replay_witnesses <input>\n";
        return 1;
    }

    std::ifstream in(argv[1]);
    if (!in) {
        std::cerr << "Unable to open input path: " << argv[1] << "\n";
        return 1;
    }

    imm::WitnessLog log;
    try {
        log = imm::readWitnessLog(in);
    } catch (const imm::CodecError& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    if (log.order.empty()) {
        std::cerr << "No witnesses found\n";
        return 1;
    }

    std::size_t failedStep = 0;
    imm::VerifyStatus status = imm::replayWitnessLog(log, &failedStep);
    if (status != imm::VerifyStatus::Ok) {
        std::cerr << "Replay rejected at step " << failedStep << ": " << imm::toString(status) << "\n";
        return 1;
    }

    std::cout << "Replayed " << log.inserts.size() << " inserts and " << log.updates.size()
              << " updates; final root " << log.finalRoot().toHex() << "\n";
    return 0;
}
