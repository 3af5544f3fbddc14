/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "primitives/token_amount.hpp"
#include "../chain/chain.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <vector>

namespace stablebridge {

namespace {

/**
 * @brief Заполнить Config из разобранной TOML таблицы
 */
Config from_table(const toml::table& table) {
    Config config;

    // === Секция [chains.<name>] ===
    if (auto chains = table["chains"].as_table()) {
        for (const auto& [key, node] : *chains) {
            auto chain_table = node.as_table();
            if (!chain_table) {
                continue;
            }

            ChainSettings settings;
            if (auto val = (*chain_table)["rpc_url"].value<std::string>()) {
                settings.rpc_url = *val;
            }
            if (auto val = (*chain_table)["fast_relay"].value<bool>()) {
                settings.fast_relay = *val;
            }
            if (auto val = (*chain_table)["min_gas"].value<std::string>()) {
                settings.min_gas = *val;
            }

            std::string name(key.str());
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            config.chains[name] = std::move(settings);
        }
    }

    // === Секция [aggregator] ===
    if (auto aggregator = table["aggregator"].as_table()) {
        if (auto val = (*aggregator)["relay_url"].value<std::string>()) {
            config.aggregator.relay_url = *val;
        }
        if (auto val = (*aggregator)["lifi_url"].value<std::string>()) {
            config.aggregator.lifi_url = *val;
        }
        if (auto val = (*aggregator)["api_key"].value<std::string>()) {
            config.aggregator.api_key = *val;
        }
        if (auto val = (*aggregator)["timeout"].value<int64_t>()) {
            config.aggregator.timeout = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [attestation] ===
    if (auto attestation = table["attestation"].as_table()) {
        if (auto val = (*attestation)["url"].value<std::string>()) {
            config.attestation.url = *val;
        }
        if (auto val = (*attestation)["poll_interval"].value<int64_t>()) {
            config.attestation.poll_interval = static_cast<uint32_t>(*val);
        }
        if (auto val = (*attestation)["max_wait"].value<int64_t>()) {
            config.attestation.max_wait = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [transactions] ===
    if (auto transactions = table["transactions"].as_table()) {
        if (auto val = (*transactions)["receipt_timeout"].value<int64_t>()) {
            config.transactions.receipt_timeout = static_cast<uint32_t>(*val);
        }
        if (auto val = (*transactions)["receipt_poll_interval"].value<int64_t>()) {
            config.transactions.receipt_poll_interval = static_cast<uint32_t>(*val);
        }
        if (auto val = (*transactions)["broadcast_attempts"].value<int64_t>()) {
            config.transactions.broadcast_attempts = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

[[nodiscard]] bool is_http_url(std::string_view url) noexcept {
    return url.starts_with("http://") || url.starts_with("https://");
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("stablebridge.toml");
    search_paths.push_back("/etc/stablebridge/stablebridge.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "stablebridge" / "stablebridge.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Переменные окружения
// =============================================================================

void Config::apply_env_overrides(const EnvLookup& lookup) {
    EnvLookup env = lookup;
    if (!env) {
        env = [](const std::string& name) -> std::optional<std::string> {
            if (const char* value = std::getenv(name.c_str()); value && *value) {
                return std::string(value);
            }
            return std::nullopt;
        };
    }

    for (chain::Chain chain : chain::ALL_CHAINS) {
        std::string name(chain::to_string(chain));
        std::string variable = name + "_RPC_URL";
        std::transform(variable.begin(), variable.end(), variable.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });

        if (auto url = env(variable)) {
            chains[name].rpc_url = *url;
            log::Logger::instance().debug(
                "Config", std::format("{} задан через {}", name, variable)
            );
        }
    }

    if (auto key = env("LIFI_API_KEY")) {
        aggregator.api_key = *key;
    }
    if (auto url = env("ATTESTATION_URL")) {
        attestation.url = *url;
    }
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    for (const auto& [name, settings] : chains) {
        if (!chain::parse_chain(name)) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Неизвестная сеть в секции chains: '{}'", name)
            );
        }
        if (!settings.rpc_url.empty() && !is_http_url(settings.rpc_url)) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("rpc_url сети '{}' должен начинаться с http:// или https://", name)
            );
        }
        if (settings.min_gas &&
            !core::TokenAmount::parse(*settings.min_gas, constants::NATIVE_DECIMALS)) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Некорректный min_gas сети '{}': '{}'", name, *settings.min_gas)
            );
        }
    }

    if (!is_http_url(aggregator.relay_url) || !is_http_url(aggregator.lifi_url)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "URL агрегаторов должны начинаться с http:// или https://"
        );
    }
    if (aggregator.timeout == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "aggregator.timeout не может быть 0");
    }

    if (!is_http_url(attestation.url)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "attestation.url должен начинаться с http:// или https://"
        );
    }
    if (attestation.poll_interval == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "attestation.poll_interval не может быть 0");
    }
    if (attestation.max_wait < attestation.poll_interval) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "attestation.max_wait не может быть меньше poll_interval"
        );
    }

    if (transactions.receipt_timeout == 0 || transactions.receipt_poll_interval == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Таймауты ожидания транзакций не могут быть 0"
        );
    }
    if (transactions.broadcast_attempts == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "transactions.broadcast_attempts должен быть не меньше 1"
        );
    }

    if (!log::parse_log_level(logging.level)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.level должен быть 'debug', 'info', 'warn' или 'error'"
        );
    }

    return {};
}

} // namespace stablebridge
