/**
 * @file route_table.hpp
 * @brief Статические таблицы допустимых маршрутов
 *
 * Таблицы несимметричны: наличие A→B не означает наличия B→A.
 */

#pragma once

#include "chain.hpp"

#include <set>
#include <utility>
#include <vector>

namespace stablebridge::chain {

/**
 * @brief Вид переводимого актива
 */
enum class RouteKind {
    Stablecoin,  ///< Стейблкоин (USDC и аналоги)
    Native,      ///< Нативный газовый токен
};

/**
 * @brief Упорядоченная пара (источник, назначение)
 */
using Route = std::pair<Chain, Chain>;

/**
 * @brief Таблицы маршрутов
 */
class RouteTable {
public:
    /**
     * @brief Создать таблицы из явных наборов
     *
     * Пары с одинаковыми источником и назначением отбрасываются.
     */
    RouteTable(std::set<Route> stablecoin_routes,
               std::set<Route> native_routes,
               std::set<Chain> swap_chains);

    /**
     * @brief Встроенные таблицы
     */
    [[nodiscard]] static RouteTable builtin();

    /**
     * @brief Есть ли маршрут source → destination
     */
    [[nodiscard]] bool contains(Chain source, Chain destination, RouteKind kind) const;

    /**
     * @brief Все маршруты данного вида в детерминированном порядке
     */
    [[nodiscard]] std::vector<Route> routes(RouteKind kind) const;

    /**
     * @brief Поддерживается ли обмен внутри сети
     */
    [[nodiscard]] bool supports_swap(Chain chain) const;

private:
    [[nodiscard]] const std::set<Route>& table(RouteKind kind) const noexcept;

    std::set<Route> stablecoin_routes_;
    std::set<Route> native_routes_;
    std::set<Chain> swap_chains_;
};

} // namespace stablebridge::chain
