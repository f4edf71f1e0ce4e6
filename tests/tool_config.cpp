#include "tool_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "tool_config failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

const char* kSeedHex = "746f6f6c2d636f6e6669672d746573742d736565642d30303030303030303031";

void clearEnv() {
    unsetenv("IMM_TREE_HEIGHT");
    unsetenv("IMM_RANDOM_SEED_HEX");
}

// Returns the rejection message, or fails when the configuration loads.
std::string expectRejected(const std::string& label) {
    try {
        imm::loadToolConfig();
    } catch (const std::invalid_argument& ex) {
        return ex.what();
    }
    fail(label + " was accepted");
}

void testDefaults() {
    clearEnv();
    imm::ToolConfig config = imm::loadToolConfig();
    expect(config.treeHeight == imm::kDefaultToolTreeHeight, "default height");
    expect(!config.seed.has_value(), "no seed by default");
    expect(!imm::makeKeySource(config)->deterministic(), "unseeded source draws fresh randomness");

    setenv("IMM_TREE_HEIGHT", "   ", 1);
    expect(imm::loadToolConfig().treeHeight == imm::kDefaultToolTreeHeight,
           "blank value falls back to the default");
}

void testHeightParsing() {
    clearEnv();
    setenv("IMM_TREE_HEIGHT", " 12\n", 1);
    expect(imm::loadToolConfig().treeHeight == 12, "surrounding whitespace is trimmed");

    setenv("IMM_TREE_HEIGHT", "2", 1);
    expect(imm::loadToolConfig().treeHeight == 2, "smallest height accepted");
    setenv("IMM_TREE_HEIGHT", "32", 1);
    expect(imm::loadToolConfig().treeHeight == 32, "largest height accepted");

    for (const char* bad : { "1", "33", "0", "-4" }) {
        setenv("IMM_TREE_HEIGHT", bad, 1);
        const std::string message = expectRejected(std::string("height ") + bad);
        expect(message.find("IMM_TREE_HEIGHT") != std::string::npos,
               "height error names the variable");
    }
    for (const char* bad : { "abc", "16x", "1.5" }) {
        setenv("IMM_TREE_HEIGHT", bad, 1);
        expectRejected(std::string("height ") + bad);
    }
    clearEnv();
}

void testSeedParsing() {
    clearEnv();
    setenv("IMM_RANDOM_SEED_HEX", "abcd", 1);
    std::string message = expectRejected("short seed");
    expect(message.find("IMM_RANDOM_SEED_HEX") != std::string::npos, "seed error names the variable");

    setenv("IMM_RANDOM_SEED_HEX", "zz", 1);
    expectRejected("non-hex seed");

    setenv("IMM_RANDOM_SEED_HEX", kSeedHex, 1);
    imm::ToolConfig config = imm::loadToolConfig();
    expect(config.seed.has_value() && config.seed->toHex() == kSeedHex, "seed parsed");

    auto first = imm::makeKeySource(config);
    auto second = imm::makeKeySource(config);
    expect(first->deterministic() && second->deterministic(), "seeded sources are deterministic");
    for (int i = 0; i < 8; ++i) {
        expect(first->next() == second->next(), "equal seeds give equal key streams");
    }
    clearEnv();
}

} // namespace

int main() {
    testDefaults();
    testHeightParsing();
    testSeedParsing();

    std::cout << "tool_config passed" << std::endl;
    return 0;
}
