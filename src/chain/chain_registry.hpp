/**
 * @file chain_registry.hpp
 * @brief Реестр параметров сетей
 *
 * Встроенные параметры всех сетей, объединённые с конфигурацией.
 * Создаётся один раз при запуске и дальше не изменяется.
 */

#pragma once

#include "chain_config.hpp"
#include "../core/config.hpp"

#include <map>
#include <vector>

namespace stablebridge::chain {

/**
 * @brief Неизменяемый реестр сетей
 *
 * Сеть без RPC endpoint считается неподдерживаемой
 * для всех операций.
 */
class ChainRegistry {
public:
    /**
     * @brief Реестр из встроенных параметров и конфигурации
     *
     * @param config Конфигурация (rpc_url, переопределения fast_relay и min_gas)
     * @return ConfigInvalidValue при некорректном min_gas
     */
    [[nodiscard]] static Result<ChainRegistry> from_config(const Config& config);

    /**
     * @brief Реестр из готовых записей (используется в тестах)
     */
    explicit ChainRegistry(std::vector<ChainConfig> configs);

    // =========================================================================
    // Доступ к параметрам
    // =========================================================================

    /**
     * @brief Параметры поддерживаемой сети
     *
     * @return nullptr если сеть не поддерживается
     */
    [[nodiscard]] const ChainConfig* config_for(Chain chain) const;

    /**
     * @brief Поддерживается ли сеть
     */
    [[nodiscard]] bool is_supported(Chain chain) const;

    /**
     * @brief Список поддерживаемых сетей в порядке объявления
     */
    [[nodiscard]] std::vector<Chain> supported_chains() const;

    /**
     * @brief Встроенные параметры всех сетей (без RPC endpoint)
     */
    [[nodiscard]] static std::vector<ChainConfig> builtin_chains();

private:
    std::map<Chain, ChainConfig> chains_;
};

} // namespace stablebridge::chain
