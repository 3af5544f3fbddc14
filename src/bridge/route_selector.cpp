/**
 * @file route_selector.cpp
 * @brief Реализация выбора маршрута
 */

#include "route_selector.hpp"

#include <utility>

namespace stablebridge::bridge {

RouteSelector::RouteSelector(const chain::ChainRegistry& registry, chain::RouteTable routes)
    : registry_(registry), routes_(std::move(routes)) {}

bool RouteSelector::is_valid_route(
    chain::Chain source,
    chain::Chain destination,
    chain::RouteKind kind
) const {
    if (source == destination) {
        return false;
    }
    if (!registry_.is_supported(source) || !registry_.is_supported(destination)) {
        return false;
    }
    return routes_.contains(source, destination, kind);
}

std::vector<chain::Chain> RouteSelector::valid_sources_for(
    chain::Chain destination,
    chain::RouteKind kind
) const {
    std::vector<chain::Chain> sources;
    for (chain::Chain source : chain::ALL_CHAINS) {
        if (is_valid_route(source, destination, kind)) {
            sources.push_back(source);
        }
    }
    return sources;
}

std::vector<chain::Chain> RouteSelector::valid_destinations_for(
    chain::Chain source,
    chain::RouteKind kind
) const {
    std::vector<chain::Chain> destinations;
    for (chain::Chain destination : chain::ALL_CHAINS) {
        if (is_valid_route(source, destination, kind)) {
            destinations.push_back(destination);
        }
    }
    return destinations;
}

std::vector<chain::Chain> RouteSelector::native_bridge_destinations(chain::Chain source) const {
    return valid_destinations_for(source, chain::RouteKind::Native);
}

bool RouteSelector::supports_swap(chain::Chain chain) const {
    return registry_.is_supported(chain) && routes_.supports_swap(chain);
}

// =============================================================================
// Выбор механизма
// =============================================================================

bool RouteSelector::aggregator_only(chain::Chain chain) const {
    const chain::ChainConfig* config = registry_.config_for(chain);
    if (!config) {
        return true;
    }
    return config->aggregator_only || !config->is_evm() || !config->supports_native_protocol();
}

Backend RouteSelector::best_backend(chain::Chain source, chain::Chain destination) const {
    if (aggregator_only(source) || aggregator_only(destination)) {
        return Backend::GeneralAggregator;
    }

    const chain::ChainConfig* src = registry_.config_for(source);
    const chain::ChainConfig* dst = registry_.config_for(destination);
    if (src->fast_relay_eligible && dst->fast_relay_eligible) {
        return Backend::FastRelay;
    }
    return Backend::NativeProtocol;
}

bool RouteSelector::requires_aggregator(chain::Chain source, chain::Chain destination) const {
    const chain::ChainConfig* src = registry_.config_for(source);
    const chain::ChainConfig* dst = registry_.config_for(destination);
    if (!src || !dst) {
        return true;
    }
    return !src->supports_native_protocol() || !dst->supports_native_protocol();
}

} // namespace stablebridge::bridge
