/**
 * @file config.hpp
 * @brief Конфигурация stablebridge
 *
 * Загрузка и парсинг конфигурации из TOML файла с последующим
 * наложением переменных окружения.
 *
 * Пример конфигурации (stablebridge.toml):
 * @code
 * [chains.base]
 * rpc_url = "https://mainnet.base.org"
 * fast_relay = true
 * min_gas = "0.0001"
 *
 * [chains.ethereum]
 * rpc_url = "https://eth.llamarpc.com"
 *
 * [aggregator]
 * relay_url = "https://api.relay.link"
 * lifi_url = "https://li.quest/v1"
 * api_key = ""
 * timeout = 30
 *
 * [attestation]
 * url = "https://iris-api.circle.com"
 * poll_interval = 15
 * max_wait = 900
 *
 * [transactions]
 * receipt_timeout = 120
 * broadcast_attempts = 3
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 *
 * Переменные окружения: <CHAIN>_RPC_URL (например BASE_RPC_URL),
 * LIFI_API_KEY, ATTESTATION_URL.
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace stablebridge {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки одной сети из секции [chains.<name>]
 */
struct ChainSettings {
    /// @brief RPC endpoint; без него сеть не поддерживается
    std::string rpc_url;

    /// @brief Переопределить допуск к fast relay
    std::optional<bool> fast_relay;

    /// @brief Переопределить минимальный остаток газа (в нативных единицах, "0.005")
    std::optional<std::string> min_gas;
};

/**
 * @brief Настройки внешних агрегаторов
 */
struct AggregatorConfig {
    /// @brief API fast relay
    std::string relay_url{constants::DEFAULT_RELAY_URL};

    /// @brief API общего bridge агрегатора
    std::string lifi_url{constants::DEFAULT_LIFI_URL};

    /// @brief Ключ API общего агрегатора (опционально)
    std::string api_key;

    /// @brief Таймаут HTTP запросов (секунды)
    uint32_t timeout = constants::DEFAULT_HTTP_TIMEOUT_SEC;
};

/**
 * @brief Настройки сервиса аттестаций
 */
struct AttestationConfig {
    std::string url{constants::DEFAULT_ATTESTATION_URL};

    /// @brief Интервал опроса (секунды)
    uint32_t poll_interval = constants::ATTESTATION_POLL_INTERVAL_SEC;

    /// @brief Максимальное ожидание (секунды)
    uint32_t max_wait = constants::ATTESTATION_MAX_WAIT_SEC;
};

/**
 * @brief Настройки отправки транзакций
 */
struct TransactionsConfig {
    /// @brief Таймаут ожидания receipt (секунды)
    uint32_t receipt_timeout = constants::RECEIPT_TIMEOUT_SEC;

    /// @brief Интервал опроса receipt (секунды)
    uint32_t receipt_poll_interval = constants::RECEIPT_POLL_INTERVAL_SEC;

    /// @brief Количество попыток отправки
    uint32_t broadcast_attempts = constants::BROADCAST_ATTEMPTS;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

/**
 * @brief Функция чтения переменной окружения
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief Полная конфигурация stablebridge
 */
struct Config {
    /// @brief Сети по имени ("base", "ethereum", ...)
    std::map<std::string, ChainSettings> chains;

    AggregatorConfig aggregator;
    AttestationConfig attestation;
    TransactionsConfig transactions;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./stablebridge.toml
     * 3. /etc/stablebridge/stablebridge.toml
     * 4. ~/.config/stablebridge/stablebridge.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Наложить переменные окружения поверх файла
     *
     * @param lookup Источник переменных (по умолчанию std::getenv)
     */
    void apply_env_overrides(const EnvLookup& lookup = {});

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Имена сетей и формат URL
     * - Интервалы опроса и таймауты
     * - Значения min_gas и уровень логирования
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace stablebridge
