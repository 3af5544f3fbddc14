/**
 * @file route_table.cpp
 * @brief Встроенные маршруты
 */

#include "route_table.hpp"

#include <array>

namespace stablebridge::chain {

namespace {

/// @brief Сети нативного протокола: между ними допустимы все пары
constexpr std::array<Chain, 6> NATIVE_PROTOCOL_CHAINS = {
    Chain::Ethereum, Chain::Polygon, Chain::Base,
    Chain::Arbitrum, Chain::Optimism, Chain::Avalanche,
};

void drop_self_routes(std::set<Route>& routes) {
    std::erase_if(routes, [](const Route& route) {
        return route.first == route.second;
    });
}

} // anonymous namespace

RouteTable::RouteTable(std::set<Route> stablecoin_routes,
                       std::set<Route> native_routes,
                       std::set<Chain> swap_chains)
    : stablecoin_routes_(std::move(stablecoin_routes))
    , native_routes_(std::move(native_routes))
    , swap_chains_(std::move(swap_chains)) {
    drop_self_routes(stablecoin_routes_);
    drop_self_routes(native_routes_);
}

RouteTable RouteTable::builtin() {
    std::set<Route> stablecoin;

    for (Chain source : NATIVE_PROTOCOL_CHAINS) {
        for (Chain destination : NATIVE_PROTOCOL_CHAINS) {
            if (source != destination) {
                stablecoin.emplace(source, destination);
            }
        }
    }

    // BNB Chain: в обратную сторону только Base и Polygon
    stablecoin.emplace(Chain::Base, Chain::Bsc);
    stablecoin.emplace(Chain::Polygon, Chain::Bsc);
    stablecoin.emplace(Chain::Arbitrum, Chain::Bsc);
    stablecoin.emplace(Chain::Bsc, Chain::Base);
    stablecoin.emplace(Chain::Bsc, Chain::Polygon);

    // Solana: только как сеть назначения
    stablecoin.emplace(Chain::Base, Chain::Solana);
    stablecoin.emplace(Chain::Polygon, Chain::Solana);
    stablecoin.emplace(Chain::Arbitrum, Chain::Solana);

    // Abstract
    stablecoin.emplace(Chain::Base, Chain::Abstract);
    stablecoin.emplace(Chain::Ethereum, Chain::Abstract);
    stablecoin.emplace(Chain::Abstract, Chain::Base);

    std::set<Route> native = {
        {Chain::Base, Chain::Arbitrum},
        {Chain::Arbitrum, Chain::Base},
        {Chain::Base, Chain::Optimism},
        {Chain::Optimism, Chain::Base},
        {Chain::Arbitrum, Chain::Optimism},
        {Chain::Ethereum, Chain::Base},
        {Chain::Ethereum, Chain::Arbitrum},
        {Chain::Base, Chain::Abstract},
        {Chain::Abstract, Chain::Base},
    };

    std::set<Chain> swap = {
        Chain::Ethereum, Chain::Polygon, Chain::Base, Chain::Arbitrum,
        Chain::Optimism, Chain::Avalanche, Chain::Bsc, Chain::Abstract,
    };

    return RouteTable(std::move(stablecoin), std::move(native), std::move(swap));
}

const std::set<Route>& RouteTable::table(RouteKind kind) const noexcept {
    return kind == RouteKind::Native ? native_routes_ : stablecoin_routes_;
}

bool RouteTable::contains(Chain source, Chain destination, RouteKind kind) const {
    return table(kind).contains(Route{source, destination});
}

std::vector<Route> RouteTable::routes(RouteKind kind) const {
    const auto& routes = table(kind);
    return std::vector<Route>(routes.begin(), routes.end());
}

bool RouteTable::supports_swap(Chain chain) const {
    return swap_chains_.contains(chain);
}

} // namespace stablebridge::chain
