#include "tool_config.hpp"

#include "merkle_tree.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace imm {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::uint32_t parseHeight(const std::string& text) {
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || parsed < static_cast<long>(MerkleTree::kMinHeight) ||
        parsed > static_cast<long>(MerkleTree::kMaxHeight)) {
        std::ostringstream oss;
        oss << "IMM_TREE_HEIGHT must be an integer between " << MerkleTree::kMinHeight << " and "
            << MerkleTree::kMaxHeight << ", got \"" << text << "\"";
        throw std::invalid_argument(oss.str());
    }
    return static_cast<std::uint32_t>(parsed);
}

} // namespace

ToolConfig loadToolConfig() {
    ToolConfig config;
    if (auto height = readEnv("IMM_TREE_HEIGHT")) {
        config.treeHeight = parseHeight(*height);
    }
    if (auto seedHex = readEnv("IMM_RANDOM_SEED_HEX")) {
        try {
            config.seed = Hash::fromHex(*seedHex);
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument(std::string("IMM_RANDOM_SEED_HEX: ") + ex.what());
        }
    }
    return config;
}

std::unique_ptr<KeySource> makeKeySource(const ToolConfig& config) {
    if (config.seed) {
        return std::make_unique<KeySource>(*config.seed);
    }
    return std::make_unique<KeySource>();
}

} // namespace imm
