/**
 * @file route_selector.hpp
 * @brief Проверка маршрутов и выбор механизма перевода
 */

#pragma once

#include "types.hpp"
#include "../chain/chain_registry.hpp"
#include "../chain/route_table.hpp"

#include <vector>

namespace stablebridge::bridge {

/**
 * @brief Выбор маршрута
 *
 * Маршрут действителен, только если он есть в таблице и обе сети
 * поддерживаются реестром. Результаты детерминированы.
 */
class RouteSelector {
public:
    RouteSelector(const chain::ChainRegistry& registry, chain::RouteTable routes);

    /**
     * @brief Действителен ли маршрут source → destination
     */
    [[nodiscard]] bool is_valid_route(
        chain::Chain source,
        chain::Chain destination,
        chain::RouteKind kind = chain::RouteKind::Stablecoin
    ) const;

    /**
     * @brief Сети, из которых можно перевести в destination
     */
    [[nodiscard]] std::vector<chain::Chain> valid_sources_for(
        chain::Chain destination,
        chain::RouteKind kind = chain::RouteKind::Stablecoin
    ) const;

    /**
     * @brief Сети, в которые можно перевести из source
     */
    [[nodiscard]] std::vector<chain::Chain> valid_destinations_for(
        chain::Chain source,
        chain::RouteKind kind = chain::RouteKind::Stablecoin
    ) const;

    /**
     * @brief Куда можно перевести нативный газовый токен из source
     */
    [[nodiscard]] std::vector<chain::Chain> native_bridge_destinations(chain::Chain source) const;

    [[nodiscard]] bool supports_swap(chain::Chain chain) const;

    /**
     * @brief Механизм для маршрута
     *
     * 1. Любая из сетей только через агрегатор (нет контрактов
     *    нативного протокола, не EVM, или флаг) → GeneralAggregator
     * 2. Обе сети допускают fast relay → FastRelay
     * 3. Иначе NativeProtocol
     */
    [[nodiscard]] Backend best_backend(chain::Chain source, chain::Chain destination) const;

    /**
     * @brief Нет контрактов нативного протокола хотя бы в одной из сетей
     */
    [[nodiscard]] bool requires_aggregator(chain::Chain source, chain::Chain destination) const;

    [[nodiscard]] const chain::RouteTable& routes() const noexcept { return routes_; }

private:
    [[nodiscard]] bool aggregator_only(chain::Chain chain) const;

    const chain::ChainRegistry& registry_;
    chain::RouteTable routes_;
};

} // namespace stablebridge::bridge
