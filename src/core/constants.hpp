/**
 * @file constants.hpp
 * @brief Константы протоколов и stablebridge
 *
 * Содержит все магические числа: селекторы ABI, топики событий,
 * лимиты газа, интервалы ожидания и адреса внешних сервисов.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string_view>

namespace stablebridge::constants {

// =============================================================================
// Размеры
// =============================================================================

/// @brief Размер keccak256 хеша в байтах
inline constexpr std::size_t KECCAK256_SIZE = 32;

/// @brief Размер EVM адреса в байтах
inline constexpr std::size_t ADDRESS_SIZE = 20;

/// @brief Размер слова ABI в байтах
inline constexpr std::size_t ABI_WORD_SIZE = 32;

/// @brief Точность нативного газового токена EVM сетей
inline constexpr uint8_t NATIVE_DECIMALS = 18;

// =============================================================================
// ABI селекторы (первые 4 байта keccak256 сигнатуры)
// =============================================================================

/// @brief balanceOf(address)
inline constexpr std::array<uint8_t, 4> SELECTOR_BALANCE_OF = {0x70, 0xa0, 0x82, 0x31};

/// @brief allowance(address,address)
inline constexpr std::array<uint8_t, 4> SELECTOR_ALLOWANCE = {0xdd, 0x62, 0xed, 0x3e};

/// @brief approve(address,uint256)
inline constexpr std::array<uint8_t, 4> SELECTOR_APPROVE = {0x09, 0x5e, 0xa7, 0xb3};

/// @brief depositForBurn(uint256,uint32,bytes32,address)
inline constexpr std::array<uint8_t, 4> SELECTOR_DEPOSIT_FOR_BURN = {0x6f, 0xd3, 0x50, 0x4e};

/// @brief receiveMessage(bytes,bytes)
inline constexpr std::array<uint8_t, 4> SELECTOR_RECEIVE_MESSAGE = {0x57, 0xec, 0xfd, 0x28};

/// @brief Топик события MessageSent(bytes)
inline constexpr std::string_view MESSAGE_SENT_TOPIC =
    "0x8c5261668696ce22758910d05bab8f186d6eb247ceac2af2e82c7dc17669b036";

/// @brief Адрес-заглушка нативного токена в API агрегаторов
inline constexpr std::string_view NATIVE_TOKEN_ADDRESS =
    "0x0000000000000000000000000000000000000000";

// =============================================================================
// Газ
// =============================================================================

/// @brief Лимит газа для approve
inline constexpr uint64_t GAS_LIMIT_APPROVE = 100'000;

/// @brief Лимит газа для depositForBurn
inline constexpr uint64_t GAS_LIMIT_BURN = 300'000;

/// @brief Лимит газа для receiveMessage
inline constexpr uint64_t GAS_LIMIT_MINT = 300'000;

/// @brief Консервативный лимит газа, если eth_estimateGas не ответил
inline constexpr uint64_t GAS_LIMIT_FALLBACK = 500'000;

/// @brief Запас к оценке газа (проценты)
inline constexpr uint64_t GAS_ESTIMATE_MARGIN_PERCENT = 120;

/// @brief Множитель цены газа для approve/burn (проценты)
inline constexpr uint64_t GAS_PRICE_BOOST_PERCENT = 120;

/// @brief Множитель цены газа для mint на сети назначения (проценты)
inline constexpr uint64_t GAS_PRICE_BOOST_MINT_PERCENT = 150;

/// @brief Множитель цены газа для транзакций агрегатора (проценты)
inline constexpr uint64_t GAS_PRICE_BOOST_AGGREGATOR_PERCENT = 130;

// =============================================================================
// Ожидание и повторы
// =============================================================================

/// @brief Интервал опроса сервиса аттестаций (секунды)
inline constexpr uint32_t ATTESTATION_POLL_INTERVAL_SEC = 15;

/// @brief Максимальное ожидание аттестации (секунды)
inline constexpr uint32_t ATTESTATION_MAX_WAIT_SEC = 900;

/// @brief Оценка времени фазы burn для прогресса (секунды)
inline constexpr uint32_t BURN_PHASE_ESTIMATE_SEC = 30;

/// @brief Таймаут ожидания receipt (секунды)
inline constexpr uint32_t RECEIPT_TIMEOUT_SEC = 120;

/// @brief Интервал опроса receipt (секунды)
inline constexpr uint32_t RECEIPT_POLL_INTERVAL_SEC = 2;

/// @brief Количество попыток отправки транзакции
inline constexpr uint32_t BROADCAST_ATTEMPTS = 3;

/// @brief Базовая пауза между попытками отправки (мс)
inline constexpr uint32_t BROADCAST_BACKOFF_MS = 1000;

/// @brief Таймаут HTTP запросов по умолчанию (секунды)
inline constexpr uint32_t DEFAULT_HTTP_TIMEOUT_SEC = 30;

// =============================================================================
// Внешние сервисы
// =============================================================================

/// @brief Сервис аттестаций нативного протокола
inline constexpr std::string_view DEFAULT_ATTESTATION_URL = "https://iris-api.circle.com";

/// @brief API fast relay агрегатора
inline constexpr std::string_view DEFAULT_RELAY_URL = "https://api.relay.link";

/// @brief API общего bridge агрегатора
inline constexpr std::string_view DEFAULT_LIFI_URL = "https://li.quest/v1";

} // namespace stablebridge::constants
