#include "random_keys.hpp"

#include "hashing.hpp"

#include <algorithm>
#include <stdexcept>

#include <sodium.h>

namespace imm {

namespace {

void ensureSodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    ensureSodium();
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

KeySource::KeySource() : seeded_(false), seed_{}, counter_(0) {
    ensureSodium();
}

KeySource::KeySource(const Hash& seed) : seeded_(true), seed_(seed.bytes()), counter_(0) {}

KeySource::~KeySource() {
    if (seeded_) {
        sodium_memzero(seed_.data(), seed_.size());
    }
}

std::array<std::uint8_t, 32> KeySource::nextBlock() {
    std::array<std::uint8_t, 32> block{};
    if (!seeded_) {
        randombytes_buf(block.data(), block.size());
        return block;
    }
    std::array<std::uint8_t, 40> preimage{};
    std::copy(seed_.begin(), seed_.end(), preimage.begin());
    for (int i = 0; i < 8; ++i) {
        preimage[32 + i] = static_cast<std::uint8_t>(counter_ >> (56 - 8 * i));
    }
    ++counter_;
    Hash digest = sha256(preimage.data(), preimage.size());
    sodium_memzero(preimage.data(), preimage.size());
    return digest.bytes();
}

Field KeySource::next() {
    for (;;) {
        Field candidate(nextBlock());
        if (!candidate.isZero()) {
            return candidate;
        }
    }
}

std::uint64_t KeySource::nextBelow(std::uint64_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("nextBelow bound must be positive");
    }
    auto block = nextBlock();
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | block[i];
    }
    return value % bound;
}

} // namespace imm
