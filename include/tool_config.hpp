#pragma once

#include "field.hpp"
#include "random_keys.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace imm {

constexpr std::uint32_t kDefaultToolTreeHeight = 16;

// Settings shared by the command-line tools, read from the environment:
//   IMM_TREE_HEIGHT      tree height for freshly built maps (default 16)
//   IMM_RANDOM_SEED_HEX  optional 32-byte hex seed; makes generated keys reproducible
struct ToolConfig {
    std::uint32_t treeHeight = kDefaultToolTreeHeight;
    std::optional<Hash> seed;
};

// Throws std::invalid_argument when a variable is set to an unusable value.
ToolConfig loadToolConfig();

std::unique_ptr<KeySource> makeKeySource(const ToolConfig& config);

} // namespace imm
