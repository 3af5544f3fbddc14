/**
 * @file aggregator_executor.hpp
 * @brief Исполнение котировок агрегаторов
 *
 * Одна реализация для fast relay, общего агрегатора,
 * обмена внутри сети и перевода нативного газового токена.
 */

#pragma once

#include "aggregator_client.hpp"
#include "balance_oracle.hpp"
#include "tx_sender.hpp"
#include "types.hpp"
#include "../chain/chain_clients.hpp"
#include "../chain/chain_registry.hpp"
#include "../crypto/signer.hpp"

namespace stablebridge::bridge {

/**
 * @brief Исполнитель плана агрегатора
 *
 * Котировка запрашивается заново при каждом вызове execute.
 */
class AggregatorExecutor {
public:
    AggregatorExecutor(const chain::ChainRegistry& registry,
                       const chain::ChainClients& clients,
                       const BalanceOracle& balances,
                       const AggregatorClient& client,
                       ExecutionSettings settings = {});

    /**
     * @brief Получить котировку и выполнить её план
     *
     * @param backend FastRelay или GeneralAggregator
     * @param request Параметры котировки; from_address должен совпадать с ключом
     */
    [[nodiscard]] BridgeResult execute(
        const crypto::Signer& signer,
        Backend backend,
        const QuoteRequest& request,
        const ProgressCallback& progress = {}
    ) const;

private:
    void transfer(
        const crypto::Signer& signer,
        Backend backend,
        const QuoteRequest& request,
        const ProgressCallback& progress,
        BridgeResult& result
    ) const;

    /**
     * @brief Отправить и подтвердить один шаблон транзакции
     */
    [[nodiscard]] Result<Hash256> run_step(
        const TxSender& sender,
        const chain::ChainConfig& source,
        const TxTemplate& tx,
        const std::string& label
    ) const;

    const chain::ChainRegistry& registry_;
    const chain::ChainClients& clients_;
    const BalanceOracle& balances_;
    const AggregatorClient& client_;
    ExecutionSettings settings_;
};

} // namespace stablebridge::bridge
