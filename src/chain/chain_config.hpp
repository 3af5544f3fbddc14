/**
 * @file chain_config.hpp
 * @brief Параметры одной сети
 *
 * Все факты о сети собраны в одной записи: идентификаторы, стейблкоин
 * и его точность, контракты нативного протокола, требования к газу
 * и RPC endpoint.
 */

#pragma once

#include "chain.hpp"
#include "../core/constants.hpp"
#include "../core/primitives/token_amount.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace stablebridge::chain {

/**
 * @brief Контракты нативного протокола burn/attest/mint
 */
struct NativeProtocolContracts {
    /// @brief TokenMessenger (depositForBurn)
    std::string token_messenger;

    /// @brief MessageTransmitter (receiveMessage)
    std::string message_transmitter;
};

/**
 * @brief Параметры сети
 */
struct ChainConfig {
    Chain chain{Chain::Ethereum};

    /// @brief Отображаемое имя ("Base", "BNB Chain")
    std::string display_name;

    ChainFamily family{ChainFamily::Evm};

    /// @brief Числовой chain id (EIP-155)
    uint64_t chain_id{0};

    /// @brief Идентификатор сети в API fast relay
    uint64_t relay_chain_id{0};

    /// @brief Идентификатор сети в API общего агрегатора
    uint64_t aggregator_chain_id{0};

    /// @brief Домен нативного протокола
    std::optional<uint32_t> native_domain;

    // =========================================================================
    // Стейблкоин
    // =========================================================================

    /// @brief Адрес контракта стейблкоина
    std::string stablecoin_address;

    std::string stablecoin_symbol{"USDC"};

    /// @brief Точность стейблкоина (6, на bsc 18)
    uint8_t stablecoin_decimals{6};

    /// @brief Контракты нативного протокола; отсутствуют, если протокол не работает в сети
    std::optional<NativeProtocolContracts> native_protocol;

    // =========================================================================
    // Газ
    // =========================================================================

    /// @brief Символ нативного токена ("ETH", "POL")
    std::string native_symbol{"ETH"};

    /// @brief Минимальный остаток нативного токена перед отправкой (wei)
    core::uint256 min_gas_wei;

    // =========================================================================
    // Маршрутизация
    // =========================================================================

    /// @brief Сеть допускает fast relay
    bool fast_relay_eligible{false};

    /// @brief Сеть доступна только через общий агрегатор
    bool aggregator_only{false};

    /// @brief RPC endpoint; пустой означает, что сеть не поддерживается
    std::string rpc_url;

    /**
     * @brief Работает ли в сети нативный протокол
     */
    [[nodiscard]] bool supports_native_protocol() const noexcept {
        return native_protocol.has_value() && native_domain.has_value();
    }

    [[nodiscard]] bool is_evm() const noexcept {
        return family == ChainFamily::Evm;
    }

    /**
     * @brief Минимальный остаток газа как сумма
     */
    [[nodiscard]] core::TokenAmount min_gas() const noexcept {
        return core::TokenAmount::from_raw(min_gas_wei, constants::NATIVE_DECIMALS);
    }
};

} // namespace stablebridge::chain
