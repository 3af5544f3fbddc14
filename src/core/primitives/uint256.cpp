/**
 * @file uint256.cpp
 * @brief Реализация 256-битного целого числа
 */

#include "uint256.hpp"

#include <algorithm>

namespace stablebridge::core {

namespace {

using u128 = unsigned __int128;

/**
 * @brief Преобразовать hex символ в число
 */
[[nodiscard]] inline std::optional<uint8_t> hex_char_to_int(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

uint256 uint256::operator+(const uint256& other) const noexcept {
    uint256 result;
    uint64_t carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        u128 sum = static_cast<u128>(limbs_[i]) + other.limbs_[i] + carry;
        result.limbs_[i] = static_cast<uint64_t>(sum);
        carry = static_cast<uint64_t>(sum >> 64);
    }
    return result;
}

uint256 uint256::operator-(const uint256& other) const noexcept {
    uint256 result;
    uint64_t borrow = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        uint64_t lhs = limbs_[i];
        uint64_t rhs = other.limbs_[i];
        uint64_t diff = lhs - rhs - borrow;
        borrow = (lhs < rhs || (lhs == rhs && borrow)) ? 1 : 0;
        result.limbs_[i] = diff;
    }
    return result;
}

std::optional<uint256> uint256::checked_mul(uint64_t factor) const noexcept {
    uint256 result;
    uint64_t carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        u128 product = static_cast<u128>(limbs_[i]) * factor + carry;
        result.limbs_[i] = static_cast<uint64_t>(product);
        carry = static_cast<uint64_t>(product >> 64);
    }
    if (carry != 0) {
        return std::nullopt;
    }
    return result;
}

std::pair<uint256, uint64_t> uint256::divmod(uint64_t divisor) const noexcept {
    uint256 quotient;
    u128 remainder = 0;
    for (std::size_t i = 4; i-- > 0;) {
        u128 current = (remainder << 64) | limbs_[i];
        quotient.limbs_[i] = static_cast<uint64_t>(current / divisor);
        remainder = current % divisor;
    }
    return {quotient, static_cast<uint64_t>(remainder)};
}

uint256 uint256::scale_percent(uint64_t percent) const noexcept {
    // Сначала делим, чтобы не переполниться на очень больших значениях
    auto [whole, rest] = divmod(100);
    auto scaled_whole = whole.checked_mul(percent);
    if (!scaled_whole) {
        return max();
    }
    u128 scaled_rest = static_cast<u128>(rest) * percent / 100;
    return *scaled_whole + uint256{static_cast<uint64_t>(scaled_rest)};
}

double uint256::to_double() const noexcept {
    double result = 0.0;
    for (std::size_t i = 4; i-- > 0;) {
        result = result * 18446744073709551616.0 + static_cast<double>(limbs_[i]);
    }
    return result;
}

std::string uint256::to_hex() const {
    std::string out;
    out.reserve(SIZE * 2);
    for (uint8_t byte : to_be_bytes()) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

std::string uint256::to_quantity() const {
    std::string hex = to_hex();
    auto first = hex.find_first_not_of('0');
    if (first == std::string::npos) {
        return "0x0";
    }
    return "0x" + hex.substr(first);
}

std::string uint256::to_decimal() const {
    if (is_zero()) {
        return "0";
    }

    // Делим на 10^18 кусками, чтобы не делать 78 делений на 10
    constexpr uint64_t CHUNK = 1'000'000'000'000'000'000ULL;
    constexpr int CHUNK_DIGITS = 18;

    std::string out;
    uint256 value = *this;
    while (!value.is_zero()) {
        auto [quotient, rest] = value.divmod(CHUNK);
        std::string part = std::to_string(rest);
        if (!quotient.is_zero()) {
            part.insert(0, CHUNK_DIGITS - part.size(), '0');
        }
        out.insert(0, part);
        value = quotient;
    }
    return out;
}

Hash256 uint256::to_be_bytes() const noexcept {
    Hash256 out{};
    for (std::size_t limb = 0; limb < 4; ++limb) {
        for (std::size_t byte = 0; byte < 8; ++byte) {
            out[SIZE - 1 - (limb * 8 + byte)] =
                static_cast<uint8_t>(limbs_[limb] >> (byte * 8));
        }
    }
    return out;
}

std::optional<uint256> uint256::from_be_bytes(ByteSpan bytes) noexcept {
    if (bytes.size() > SIZE) {
        return std::nullopt;
    }
    uint256 result;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::size_t position = bytes.size() - 1 - i;  // от младшего байта
        result.limbs_[i / 8] |= static_cast<uint64_t>(bytes[position]) << ((i % 8) * 8);
    }
    return result;
}

std::optional<uint256> uint256::from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.empty() || hex.size() > SIZE * 2) {
        return std::nullopt;
    }

    uint256 result;
    for (std::size_t i = 0; i < hex.size(); ++i) {
        auto nibble = hex_char_to_int(hex[hex.size() - 1 - i]);
        if (!nibble) {
            return std::nullopt;
        }
        result.limbs_[i / 16] |= static_cast<uint64_t>(*nibble) << ((i % 16) * 4);
    }
    return result;
}

std::optional<uint256> uint256::from_decimal(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    uint256 result;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        auto scaled = result.checked_mul(10);
        if (!scaled) {
            return std::nullopt;
        }
        uint256 next = *scaled + uint256{static_cast<uint64_t>(c - '0')};
        if (next < *scaled) {
            return std::nullopt;
        }
        result = next;
    }
    return result;
}

std::optional<uint256> uint256::pow10(unsigned exponent) noexcept {
    uint256 result = one();
    for (unsigned i = 0; i < exponent; ++i) {
        auto next = result.checked_mul(10);
        if (!next) {
            return std::nullopt;
        }
        result = *next;
    }
    return result;
}

} // namespace stablebridge::core
