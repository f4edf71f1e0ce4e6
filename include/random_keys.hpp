#pragma once

#include "field.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace imm {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);

// Source of non-zero 256-bit keys and values for tools and tests. Unseeded sources draw from
// libsodium; seeded ones expand SHA-256(seed || be64(counter)) and repeat across runs.
class KeySource {
public:
    KeySource();
    explicit KeySource(const Hash& seed);
    ~KeySource();

    KeySource(const KeySource&) = delete;
    KeySource& operator=(const KeySource&) = delete;

    Field next();
    // Uniform enough for test workloads; not for cryptographic sampling.
    std::uint64_t nextBelow(std::uint64_t bound);

    bool deterministic() const { return seeded_; }

private:
    std::array<std::uint8_t, 32> nextBlock();

    bool seeded_;
    std::array<std::uint8_t, 32> seed_;
    std::uint64_t counter_;
};

} // namespace imm
