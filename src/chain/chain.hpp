/**
 * @file chain.hpp
 * @brief Перечисление поддерживаемых сетей
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <string_view>

namespace stablebridge::chain {

/**
 * @brief Сеть (blockchain)
 */
enum class Chain {
    Ethereum,
    Polygon,
    Base,
    Arbitrum,
    Optimism,
    Avalanche,
    Bsc,
    Abstract,
    Solana,
};

/**
 * @brief Семейство сетей: определяет формат адресов и подписи
 */
enum class ChainFamily {
    Evm,     ///< Ethereum-совместимая сеть
    Solana,  ///< Solana (только как сеть назначения)
};

/// @brief Все сети в порядке объявления
inline constexpr std::array<Chain, 9> ALL_CHAINS = {
    Chain::Ethereum, Chain::Polygon, Chain::Base, Chain::Arbitrum, Chain::Optimism,
    Chain::Avalanche, Chain::Bsc, Chain::Abstract, Chain::Solana,
};

/**
 * @brief Каноническое имя сети (нижний регистр)
 */
[[nodiscard]] constexpr std::string_view to_string(Chain chain) noexcept {
    switch (chain) {
        case Chain::Ethereum:  return "ethereum";
        case Chain::Polygon:   return "polygon";
        case Chain::Base:      return "base";
        case Chain::Arbitrum:  return "arbitrum";
        case Chain::Optimism:  return "optimism";
        case Chain::Avalanche: return "avalanche";
        case Chain::Bsc:       return "bsc";
        case Chain::Abstract:  return "abstract";
        case Chain::Solana:    return "solana";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view to_string(ChainFamily family) noexcept {
    switch (family) {
        case ChainFamily::Evm:    return "evm";
        case ChainFamily::Solana: return "solana";
        default: return "unknown";
    }
}

/**
 * @brief Разобрать имя сети без учёта регистра
 *
 * @return UnsupportedChain для неизвестного имени
 */
[[nodiscard]] Result<Chain> parse_chain(std::string_view name);

} // namespace stablebridge::chain
