/**
 * @file chain_node.hpp
 * @brief Интерфейс EVM ноды
 *
 * Все методы const и без состояния: один экземпляр обслуживает
 * параллельные операции.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/uint256.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stablebridge::rpc {

/**
 * @brief Запись лога из receipt
 */
struct LogEntry {
    Address address{};
    std::vector<Hash256> topics;
    Bytes data;
};

/**
 * @brief Receipt транзакции
 */
struct TxReceipt {
    Hash256 transaction_hash{};
    bool success{false};          ///< status == 1
    uint64_t block_number{0};
    uint64_t gas_used{0};
    std::vector<LogEntry> logs;
};

/**
 * @brief Параметры eth_estimateGas
 */
struct CallRequest {
    std::optional<Address> from;
    Address to{};
    Bytes data;
    core::uint256 value;
};

/**
 * @brief Абстрактная EVM нода
 */
class ChainNode {
public:
    virtual ~ChainNode() = default;

    /**
     * @brief Баланс нативного токена (wei)
     */
    [[nodiscard]] virtual Result<core::uint256> get_balance(const Address& owner) const = 0;

    /**
     * @brief eth_call на последнем блоке
     */
    [[nodiscard]] virtual Result<Bytes> call(const Address& to, ByteSpan data) const = 0;

    /**
     * @brief Nonce с учётом pending транзакций
     */
    [[nodiscard]] virtual Result<uint64_t> get_transaction_count(const Address& owner) const = 0;

    [[nodiscard]] virtual Result<core::uint256> gas_price() const = 0;

    [[nodiscard]] virtual Result<uint64_t> estimate_gas(const CallRequest& request) const = 0;

    /**
     * @brief Отправить подписанную транзакцию
     *
     * @return Хеш транзакции
     */
    [[nodiscard]] virtual Result<Hash256> send_raw_transaction(ByteSpan signed_tx) const = 0;

    /**
     * @brief Receipt транзакции
     *
     * @return std::nullopt пока транзакция не включена в блок
     */
    [[nodiscard]] virtual Result<std::optional<TxReceipt>> get_transaction_receipt(
        const Hash256& tx_hash
    ) const = 0;
};

} // namespace stablebridge::rpc
