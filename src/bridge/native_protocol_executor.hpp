/**
 * @file native_protocol_executor.hpp
 * @brief Перевод стейблкоина через нативный протокол: burn → аттестация → mint
 *
 * Последовательность:
 * 1. Проверка газа и баланса (до любой транзакции)
 * 2. approve, если разрешение меньше суммы
 * 3. depositForBurn и ожидание receipt
 * 4. Поиск MessageSent, опрос сервиса аттестаций
 * 5. receiveMessage на сети назначения
 *
 * Если аттестация не готова за отведённое время или mint не удалось
 * отправить и подтвердить, перевод считается успешным с незавершённым
 * mint (BridgeResult::is_pending). Отказом после burn считается только
 * mint, отклонённый сетью.
 */

#pragma once

#include "attestation_client.hpp"
#include "balance_oracle.hpp"
#include "tx_sender.hpp"
#include "types.hpp"
#include "../chain/chain_clients.hpp"
#include "../chain/chain_registry.hpp"
#include "../crypto/signer.hpp"

#include <optional>
#include <string>

namespace stablebridge::bridge {

/**
 * @brief Исполнитель нативного протокола
 *
 * Не идемпотентен: повторный вызов выполняет новый перевод.
 */
class NativeProtocolExecutor {
public:
    NativeProtocolExecutor(const chain::ChainRegistry& registry,
                           const chain::ChainClients& clients,
                           const BalanceOracle& balances,
                           const AttestationClient& attestations,
                           ExecutionSettings settings = {});

    /**
     * @brief Котировка: сумма 1:1, без комиссии протокола
     */
    [[nodiscard]] Result<Quote> quote(
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount
    ) const;

    /**
     * @brief Выполнить перевод
     *
     * @param signer EVM ключ владельца средств
     * @param recipient Получатель на сети назначения; по умолчанию адрес ключа
     */
    [[nodiscard]] BridgeResult execute(
        const crypto::Signer& signer,
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::optional<std::string>& recipient = std::nullopt,
        const ProgressCallback& progress = {}
    ) const;

private:
    /**
     * @brief Шаги перевода; результат заполняется по мере выполнения
     */
    void transfer(
        const crypto::Signer& signer,
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::optional<std::string>& recipient,
        const ProgressCallback& progress,
        BridgeResult& result
    ) const;

    /**
     * @brief Опросить сервис аттестаций и выполнить mint
     *
     * Заполняет destination_tx_hash, когда получен receipt mint.
     */
    void attest_and_mint(
        const crypto::Signer& signer,
        const chain::ChainConfig& destination,
        Bytes message,
        const ProgressCallback& progress,
        BridgeResult& result
    ) const;

    [[nodiscard]] uint32_t estimated_total_seconds() const;

    const chain::ChainRegistry& registry_;
    const chain::ChainClients& clients_;
    const BalanceOracle& balances_;
    const AttestationClient& attestations_;
    ExecutionSettings settings_;
};

} // namespace stablebridge::bridge
