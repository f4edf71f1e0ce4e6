#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace imm {

std::string bytesToHex(const std::uint8_t* data, std::size_t len);
std::vector<std::uint8_t> hexToBytes(const std::string& hex);

// 256-bit unsigned integer stored big-endian, so byte order equals numeric order.
class Field {
public:
    static constexpr std::size_t kSize = 32;
    using Bytes = std::array<std::uint8_t, kSize>;

    Field() : bytes_{} {}
    explicit Field(const Bytes& bytes) : bytes_(bytes) {}

    static Field zero() { return Field(); }
    static Field fromU32(std::uint32_t value);
    static Field fromU64(std::uint64_t value);
    static Field fromUint256(const boost::multiprecision::uint256_t& value);
    static Field fromDecimal(const std::string& decimal);
    static Field fromHex(const std::string& hex);
    static Field fromBytes(const Bytes& bytes) { return Field(bytes); }
    static std::optional<Field> tryFromSlice(const std::uint8_t* data, std::size_t len);

    boost::multiprecision::uint256_t toUint256() const;
    std::string toDecimal() const;
    std::string toHex() const;

    const Bytes& bytes() const { return bytes_; }
    bool isZero() const;

    bool operator==(const Field& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Field& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Field& other) const { return bytes_ < other.bytes_; }
    bool operator<=(const Field& other) const { return bytes_ <= other.bytes_; }
    bool operator>(const Field& other) const { return bytes_ > other.bytes_; }
    bool operator>=(const Field& other) const { return bytes_ >= other.bytes_; }

private:
    Bytes bytes_;
};

struct FieldHasher {
    std::size_t operator()(const Field& field) const noexcept;
};

/// 32-byte SHA-256 digest.
class Hash {
public:
    static constexpr std::size_t kSize = 32;
    using Bytes = std::array<std::uint8_t, kSize>;

    Hash() : bytes_{} {}
    explicit Hash(const Bytes& bytes) : bytes_(bytes) {}

    static Hash zero() { return Hash(); }
    static Hash fromHex(const std::string& hex);
    static std::optional<Hash> tryFromSlice(const std::uint8_t* data, std::size_t len);

    std::string toHex() const;
    const Bytes& bytes() const { return bytes_; }

    bool operator==(const Hash& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Hash& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace imm
