/**
 * @file abi.hpp
 * @brief Кодирование вызовов контрактов (Solidity ABI)
 *
 * Только функции, которые нужны для ERC-20 и контрактов
 * нативного протокола (TokenMessenger / MessageTransmitter).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/uint256.hpp"

#include <array>
#include <cstdint>

namespace stablebridge::evm::abi {

// =============================================================================
// Слова ABI
// =============================================================================

/**
 * @brief Адрес, дополненный нулями слева до 32 байт
 *
 * Так же кодируется получатель mintRecipient (bytes32).
 */
[[nodiscard]] Hash256 address_to_word(const Address& address) noexcept;

/**
 * @brief Последние 20 байт слова как адрес
 */
[[nodiscard]] Address word_to_address(const Hash256& word) noexcept;

// =============================================================================
// Calldata
// =============================================================================

/**
 * @brief balanceOf(address owner)
 */
[[nodiscard]] Bytes encode_balance_of(const Address& owner);

/**
 * @brief allowance(address owner, address spender)
 */
[[nodiscard]] Bytes encode_allowance(const Address& owner, const Address& spender);

/**
 * @brief approve(address spender, uint256 amount)
 */
[[nodiscard]] Bytes encode_approve(const Address& spender, const core::uint256& amount);

/**
 * @brief depositForBurn(uint256 amount, uint32 destinationDomain,
 *                       bytes32 mintRecipient, address burnToken)
 */
[[nodiscard]] Bytes encode_deposit_for_burn(
    const core::uint256& amount,
    uint32_t destination_domain,
    const Hash256& mint_recipient,
    const Address& burn_token
);

/**
 * @brief receiveMessage(bytes message, bytes attestation)
 */
[[nodiscard]] Bytes encode_receive_message(ByteSpan message, ByteSpan attestation);

// =============================================================================
// Декодирование
// =============================================================================

/**
 * @brief Первое слово результата eth_call как uint256
 *
 * @return RpcParseError если данных меньше 32 байт
 */
[[nodiscard]] Result<core::uint256> decode_uint256(ByteSpan data);

/**
 * @brief Единственный параметр типа bytes (данные события MessageSent)
 *
 * Формат: offset (32) | length (32) | данные, дополненные до 32.
 */
[[nodiscard]] Result<Bytes> decode_bytes(ByteSpan data);

} // namespace stablebridge::evm::abi
