/**
 * @file balance_oracle.hpp
 * @brief Чтение балансов стейблкоина и нативного токена
 */

#pragma once

#include "../chain/chain_clients.hpp"
#include "../chain/chain_registry.hpp"
#include "../core/primitives/token_amount.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace stablebridge::bridge {

/**
 * @brief Баланс-оракул
 *
 * Методы без префикса fetch_ никогда не возвращают ошибку:
 * сбой одной сети логируется и превращается в нулевой баланс.
 * Методы fetch_ возвращают Result для исполнителей, которым
 * нужно отличать "ноль" от "не удалось прочитать".
 */
class BalanceOracle {
public:
    BalanceOracle(const chain::ChainRegistry& registry, const chain::ChainClients& clients);

    // =========================================================================
    // Одна сеть
    // =========================================================================

    /**
     * @brief Баланс стейблкоина с точностью этой сети
     */
    [[nodiscard]] core::TokenAmount stablecoin_balance(
        chain::Chain chain, const std::string& address) const;

    /**
     * @brief Баланс нативного токена (18 знаков)
     */
    [[nodiscard]] core::TokenAmount native_balance(
        chain::Chain chain, const std::string& address) const;

    /**
     * @brief Баланс произвольного ERC-20 токена
     */
    [[nodiscard]] core::TokenAmount token_balance(
        chain::Chain chain, const std::string& token, uint8_t decimals,
        const std::string& address) const;

    [[nodiscard]] Result<core::TokenAmount> fetch_stablecoin_balance(
        chain::Chain chain, const std::string& address) const;

    [[nodiscard]] Result<core::TokenAmount> fetch_native_balance(
        chain::Chain chain, const std::string& address) const;

    [[nodiscard]] Result<core::TokenAmount> fetch_token_balance(
        chain::Chain chain, const std::string& token, uint8_t decimals,
        const std::string& address) const;

    // =========================================================================
    // Все сети
    // =========================================================================

    /**
     * @brief Балансы стейблкоина во всех поддерживаемых EVM сетях
     *
     * Сети опрашиваются параллельно; результат собирается
     * после завершения всех запросов.
     */
    [[nodiscard]] std::map<chain::Chain, core::TokenAmount> all_stablecoin_balances(
        const std::string& address) const;

    /**
     * @brief Первая сеть, где баланс стейблкоина покрывает сумму
     *
     * @param address Адрес владельца
     * @param required Требуемая сумма
     * @param exclude Сеть, которую не рассматривать (обычно сеть назначения)
     */
    [[nodiscard]] std::optional<std::pair<chain::Chain, core::TokenAmount>>
    find_chain_with_balance(
        const std::string& address,
        const core::TokenAmount& required,
        std::optional<chain::Chain> exclude = std::nullopt) const;

private:
    /**
     * @brief Конфигурация и клиент EVM сети
     */
    [[nodiscard]] Result<std::pair<const chain::ChainConfig*, const rpc::ChainNode*>>
    evm_chain(chain::Chain chain) const;

    const chain::ChainRegistry& registry_;
    const chain::ChainClients& clients_;
};

} // namespace stablebridge::bridge
