/**
 * @file transaction.hpp
 * @brief Legacy EVM транзакция с защитой от replay (EIP-155)
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/uint256.hpp"

#include <cstdint>
#include <optional>

namespace stablebridge::evm {

/**
 * @brief Компоненты ECDSA подписи secp256k1
 */
struct Signature {
    core::uint256 r;
    core::uint256 s;
    uint8_t recovery_id{0};  ///< 0 или 1
};

/**
 * @brief Неподписанная legacy транзакция
 */
struct Transaction {
    uint64_t nonce{0};
    core::uint256 gas_price;
    uint64_t gas_limit{0};
    std::optional<Address> to;      ///< Отсутствует при создании контракта
    core::uint256 value;
    Bytes data;
    uint64_t chain_id{1};

    /**
     * @brief RLP для подписи: [nonce, gasPrice, gas, to, value, data, chainId, 0, 0]
     */
    [[nodiscard]] Bytes signing_payload() const;

    /**
     * @brief keccak256 от signing_payload()
     */
    [[nodiscard]] Hash256 signing_hash() const;

    /**
     * @brief Подписанная транзакция для eth_sendRawTransaction
     *
     * v = recovery_id + chain_id * 2 + 35
     */
    [[nodiscard]] Bytes encode_signed(const Signature& signature) const;
};

/**
 * @brief Хеш подписанной транзакции (идентификатор в сети)
 */
[[nodiscard]] Hash256 transaction_hash(ByteSpan signed_tx);

} // namespace stablebridge::evm
