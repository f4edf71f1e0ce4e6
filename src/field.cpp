#include "field.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mp = boost::multiprecision;

namespace imm {

namespace {

bool isHexString(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
}

std::string stripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

template <typename Out>
Out fixedFromHex(const std::string& hex, const char* what) {
    auto bytes = hexToBytes(hex);
    if (bytes.size() != Out::kSize) {
        std::ostringstream oss;
        oss << what << " hex must encode exactly " << Out::kSize << " bytes, got " << bytes.size();
        throw std::invalid_argument(oss.str());
    }
    typename Out::Bytes out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Out(out);
}

} // namespace

std::string bytesToHex(const std::uint8_t* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<std::uint8_t> hexToBytes(const std::string& hex) {
    const std::string digits = stripHexPrefix(hex);
    if (digits.empty()) {
        return {};
    }
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    if (!isHexString(digits)) {
        throw std::invalid_argument("hex string contains non-hex characters");
    }
    std::vector<std::uint8_t> out;
    out.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        std::string byteString = digits.substr(i, 2);
        out.push_back(static_cast<std::uint8_t>(std::stoul(byteString, nullptr, 16)));
    }
    return out;
}

Field Field::fromU32(std::uint32_t value) {
    return fromU64(value);
}

Field Field::fromU64(std::uint64_t value) {
    Bytes bytes{};
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[kSize - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    return Field(bytes);
}

Field Field::fromUint256(const mp::uint256_t& value) {
    std::vector<std::uint8_t> raw;
    mp::export_bits(value, std::back_inserter(raw), 8);
    Bytes bytes{};
    // export_bits drops leading zero bytes; right-align into the fixed buffer.
    std::copy(raw.begin(), raw.end(), bytes.begin() + (kSize - raw.size()));
    return Field(bytes);
}

Field Field::fromDecimal(const std::string& decimal) {
    if (decimal.empty() ||
        !std::all_of(decimal.begin(), decimal.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        throw std::invalid_argument("field decimal must be a non-empty string of digits");
    }
    // Boost reads a leading zero as an octal prefix.
    const auto firstNonZero = decimal.find_first_not_of('0');
    const std::string digits =
        firstNonZero == std::string::npos ? std::string("0") : decimal.substr(firstNonZero);
    mp::cpp_int parsed(digits.c_str());
    if (parsed > mp::cpp_int(std::numeric_limits<mp::uint256_t>::max())) {
        throw std::invalid_argument("field decimal exceeds 256 bits");
    }
    return fromUint256(parsed.convert_to<mp::uint256_t>());
}

Field Field::fromHex(const std::string& hex) {
    return fixedFromHex<Field>(hex, "field");
}

std::optional<Field> Field::tryFromSlice(const std::uint8_t* data, std::size_t len) {
    if (data == nullptr || len != kSize) {
        return std::nullopt;
    }
    Bytes bytes{};
    std::memcpy(bytes.data(), data, kSize);
    return Field(bytes);
}

mp::uint256_t Field::toUint256() const {
    mp::uint256_t value;
    mp::import_bits(value, bytes_.begin(), bytes_.end());
    return value;
}

std::string Field::toDecimal() const {
    return toUint256().str();
}

std::string Field::toHex() const {
    return bytesToHex(bytes_.data(), bytes_.size());
}

bool Field::isZero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::size_t FieldHasher::operator()(const Field& field) const noexcept {
    // Keys are usually hashes or small integers; fold all 32 bytes so both spread well.
    std::uint64_t acc = 0xcbf29ce484222325ULL;
    for (auto b : field.bytes()) {
        acc ^= b;
        acc *= 0x100000001b3ULL;
    }
    return static_cast<std::size_t>(acc);
}

Hash Hash::fromHex(const std::string& hex) {
    return fixedFromHex<Hash>(hex, "hash");
}

std::optional<Hash> Hash::tryFromSlice(const std::uint8_t* data, std::size_t len) {
    if (data == nullptr || len != kSize) {
        return std::nullopt;
    }
    Bytes bytes{};
    std::memcpy(bytes.data(), data, kSize);
    return Hash(bytes);
}

std::string Hash::toHex() const {
    return bytesToHex(bytes_.data(), bytes_.size());
}

} // namespace imm
