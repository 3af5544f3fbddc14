/**
 * @file abi.cpp
 * @brief Реализация кодирования ABI
 */

#include "abi.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace stablebridge::evm::abi {

namespace {

using constants::ABI_WORD_SIZE;

void append_selector(Bytes& out, const std::array<uint8_t, 4>& selector) {
    out.insert(out.end(), selector.begin(), selector.end());
}

void append_word(Bytes& out, const Hash256& word) {
    out.insert(out.end(), word.begin(), word.end());
}

void append_uint(Bytes& out, const core::uint256& value) {
    append_word(out, value.to_be_bytes());
}

/**
 * @brief Хвост динамического bytes: длина и данные, дополненные нулями
 */
void append_dynamic_bytes(Bytes& out, ByteSpan data) {
    append_uint(out, core::uint256{static_cast<uint64_t>(data.size())});
    out.insert(out.end(), data.begin(), data.end());
    std::size_t padding = (ABI_WORD_SIZE - data.size() % ABI_WORD_SIZE) % ABI_WORD_SIZE;
    out.insert(out.end(), padding, 0);
}

[[nodiscard]] std::size_t padded_size(std::size_t size) noexcept {
    return (size + ABI_WORD_SIZE - 1) / ABI_WORD_SIZE * ABI_WORD_SIZE;
}

/**
 * @brief Прочитать слово по смещению как небольшое число
 */
[[nodiscard]] std::optional<std::size_t> read_small(ByteSpan data, std::size_t offset) {
    if (offset + ABI_WORD_SIZE > data.size()) {
        return std::nullopt;
    }
    auto value = core::uint256::from_be_bytes(data.subspan(offset, ABI_WORD_SIZE));
    if (!value || !value->fits_u64() || value->low_u64() > data.size()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value->low_u64());
}

} // anonymous namespace

Hash256 address_to_word(const Address& address) noexcept {
    Hash256 word{};
    std::copy(address.begin(), address.end(), word.begin() + (ABI_WORD_SIZE - address.size()));
    return word;
}

Address word_to_address(const Hash256& word) noexcept {
    Address address{};
    std::copy(word.end() - static_cast<std::ptrdiff_t>(address.size()), word.end(), address.begin());
    return address;
}

Bytes encode_balance_of(const Address& owner) {
    Bytes out;
    out.reserve(4 + ABI_WORD_SIZE);
    append_selector(out, constants::SELECTOR_BALANCE_OF);
    append_word(out, address_to_word(owner));
    return out;
}

Bytes encode_allowance(const Address& owner, const Address& spender) {
    Bytes out;
    out.reserve(4 + 2 * ABI_WORD_SIZE);
    append_selector(out, constants::SELECTOR_ALLOWANCE);
    append_word(out, address_to_word(owner));
    append_word(out, address_to_word(spender));
    return out;
}

Bytes encode_approve(const Address& spender, const core::uint256& amount) {
    Bytes out;
    out.reserve(4 + 2 * ABI_WORD_SIZE);
    append_selector(out, constants::SELECTOR_APPROVE);
    append_word(out, address_to_word(spender));
    append_uint(out, amount);
    return out;
}

Bytes encode_deposit_for_burn(
    const core::uint256& amount,
    uint32_t destination_domain,
    const Hash256& mint_recipient,
    const Address& burn_token
) {
    Bytes out;
    out.reserve(4 + 4 * ABI_WORD_SIZE);
    append_selector(out, constants::SELECTOR_DEPOSIT_FOR_BURN);
    append_uint(out, amount);
    append_uint(out, core::uint256{static_cast<uint64_t>(destination_domain)});
    append_word(out, mint_recipient);
    append_word(out, address_to_word(burn_token));
    return out;
}

Bytes encode_receive_message(ByteSpan message, ByteSpan attestation) {
    // Голова: два смещения, затем хвосты в том же порядке
    std::size_t message_offset = 2 * ABI_WORD_SIZE;
    std::size_t attestation_offset = message_offset + ABI_WORD_SIZE + padded_size(message.size());

    Bytes out;
    out.reserve(4 + attestation_offset + ABI_WORD_SIZE + padded_size(attestation.size()));
    append_selector(out, constants::SELECTOR_RECEIVE_MESSAGE);
    append_uint(out, core::uint256{static_cast<uint64_t>(message_offset)});
    append_uint(out, core::uint256{static_cast<uint64_t>(attestation_offset)});
    append_dynamic_bytes(out, message);
    append_dynamic_bytes(out, attestation);
    return out;
}

Result<core::uint256> decode_uint256(ByteSpan data) {
    if (data.size() < ABI_WORD_SIZE) {
        return Err<core::uint256>(
            ErrorCode::RpcParseError,
            std::format("Ожидалось слово ABI, получено {} байт", data.size())
        );
    }
    auto value = core::uint256::from_be_bytes(data.first(ABI_WORD_SIZE));
    if (!value) {
        return Err<core::uint256>(ErrorCode::RpcParseError);
    }
    return *value;
}

Result<Bytes> decode_bytes(ByteSpan data) {
    auto offset = read_small(data, 0);
    if (!offset) {
        return Err<Bytes>(ErrorCode::RpcParseError, "Некорректное смещение bytes в ABI");
    }
    auto length = read_small(data, *offset);
    if (!length) {
        return Err<Bytes>(ErrorCode::RpcParseError, "Некорректная длина bytes в ABI");
    }
    std::size_t start = *offset + ABI_WORD_SIZE;
    if (start + *length > data.size()) {
        return Err<Bytes>(
            ErrorCode::RpcParseError,
            std::format("bytes выходит за пределы данных: {} + {} > {}",
                        start, *length, data.size())
        );
    }
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(start),
                 data.begin() + static_cast<std::ptrdiff_t>(start + *length));
}

} // namespace stablebridge::evm::abi
