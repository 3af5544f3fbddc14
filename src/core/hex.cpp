/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace stablebridge::hex {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

[[nodiscard]] inline int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[nodiscard]] std::string_view strip_prefix(std::string_view text) noexcept {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    return text;
}

} // anonymous namespace

std::string encode(ByteSpan data, bool with_prefix) {
    std::string out;
    out.reserve(data.size() * 2 + 2);
    if (with_prefix) {
        out = "0x";
    }
    for (uint8_t byte : data) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

std::optional<Bytes> decode(std::string_view text) {
    text = strip_prefix(text);
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Result<Address> parse_address(std::string_view text) {
    auto bytes = decode(text);
    if (!bytes || bytes->size() != Address{}.size()) {
        return Err<Address>(
            ErrorCode::InvalidAddress,
            std::format("Некорректный EVM адрес: '{}'", text)
        );
    }
    Address address{};
    std::copy(bytes->begin(), bytes->end(), address.begin());
    return address;
}

std::string address_to_string(const Address& address) {
    return encode(address);
}

Result<Hash256> parse_hash(std::string_view text) {
    auto bytes = decode(text);
    if (!bytes || bytes->size() != Hash256{}.size()) {
        return Err<Hash256>(
            ErrorCode::CryptoInvalidLength,
            std::format("Некорректный хеш: '{}'", text)
        );
    }
    Hash256 hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

bool is_evm_address(std::string_view text) noexcept {
    if (!(text.starts_with("0x") || text.starts_with("0X")) || text.size() != 42) {
        return false;
    }
    return std::all_of(text.begin() + 2, text.end(), [](char c) {
        return nibble(c) >= 0;
    });
}

bool same_address(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x))
            == std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace stablebridge::hex
