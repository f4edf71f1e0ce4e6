#include "witness_log.hpp"

#include "codec.hpp"

#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace imm {

namespace {

[[noreturn]] void lineError(std::size_t lineNo, const std::string& what) {
    std::ostringstream oss;
    oss << "line " << lineNo << ": " << what;
    throw CodecError(oss.str());
}

} // namespace

std::vector<ProvableIndexedMerkleMap::Step> WitnessLog::steps() const {
    std::vector<ProvableIndexedMerkleMap::Step> out;
    out.reserve(order.size());
    for (const auto& entry : order) {
        ProvableIndexedMerkleMap::Step step;
        if (entry.first == 'I') {
            step.insert = &inserts.at(entry.second);
        } else {
            step.update = &updates.at(entry.second);
        }
        out.push_back(step);
    }
    return out;
}

Hash WitnessLog::finalRoot() const {
    if (order.empty()) {
        return startRoot;
    }
    const auto& last = order.back();
    return last.first == 'I' ? inserts.at(last.second).newRoot : updates.at(last.second).newRoot;
}

void writeStartRoot(std::ostream& out, const Hash& root) {
    out << "S " << root.toHex() << "\n";
}

void writeWitness(std::ostream& out, const InsertWitness& witness) {
    out << "I " << encodeHex(witness) << "\n";
}

void writeWitness(std::ostream& out, const UpdateWitness& witness) {
    out << "U " << encodeHex(witness) << "\n";
}

WitnessLog readWitnessLog(std::istream& in) {
    WitnessLog log;
    bool haveStart = false;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }
        if (line.size() < 3 || line[1] != ' ') {
            lineError(lineNo, "expected '<tag> <hex>'");
        }
        const std::string payload = line.substr(2);
        const char tag = line[0];
        if (tag != 'S' && tag != 'I' && tag != 'U') {
            lineError(lineNo, std::string("unknown tag '") + tag + "'");
        }
        if (tag == 'S' && (haveStart || !log.order.empty())) {
            lineError(lineNo, "start root must appear once, before any witness");
        }
        try {
            if (tag == 'S') {
                log.startRoot = Hash::fromHex(payload);
                haveStart = true;
            } else if (tag == 'I') {
                log.inserts.push_back(decodeInsertWitness(decodeHexPayload(payload)));
                log.order.emplace_back('I', log.inserts.size() - 1);
            } else {
                log.updates.push_back(decodeUpdateWitness(decodeHexPayload(payload)));
                log.order.emplace_back('U', log.updates.size() - 1);
            }
        } catch (const std::invalid_argument& ex) {
            lineError(lineNo, ex.what());
        } catch (const CodecError& ex) {
            lineError(lineNo, ex.what());
        }
    }
    if (!haveStart) {
        throw CodecError("no start root declared; expected an 'S <root hex>' line");
    }
    return log;
}

VerifyStatus replayWitnessLog(const WitnessLog& log, std::size_t* failedStep) {
    return ProvableIndexedMerkleMap::verifyChain(log.startRoot, log.steps(), failedStep);
}

} // namespace imm
