/**
 * @file main.cpp
 * @brief Точка входа stablebridge
 *
 * stablebridge - перевод стейблкоинов между сетями через
 * нативный протокол (burn/mint), fast relay или общий агрегатор.
 *
 * Использование:
 *   stablebridge [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/primitives/token_amount.hpp"
#include "chain/chain.hpp"
#include "bridge/bridge_service.hpp"
#include "log/logger.hpp"

#ifdef STABLEBRIDGE_HAS_SIGNER
#include "crypto/secp256k1_signer.hpp"
#endif

#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Переменная окружения с приватным ключом
constexpr const char* PRIVATE_KEY_ENV = "STABLEBRIDGE_PRIVATE_KEY";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
stablebridge v)" << VERSION << R"(
Перевод стейблкоинов между сетями

ИСПОЛЬЗОВАНИЕ:
    stablebridge [ОПЦИИ] КОМАНДА

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (stablebridge.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы

КОМАНДЫ:
    --test-config                      Проверить конфигурацию и выйти
    --routes                           Показать доступные маршруты
    --balances ADDRESS                 Балансы стейблкоина во всех сетях
    --quote SRC DST AMOUNT ADDRESS     Котировка перевода
    --bridge SRC DST AMOUNT [--to ADDRESS]
                                       Выполнить перевод (ключ из )" << PRIVATE_KEY_ENV << R"()

ПРИМЕРЫ:
    stablebridge -c /etc/stablebridge/stablebridge.toml --routes
    stablebridge --quote base arbitrum 25.5 0xYourAddress
    stablebridge --bridge base solana 10 --to SolanaAddress

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "stablebridge v" << VERSION << std::endl;
#ifdef STABLEBRIDGE_HAS_SIGNER
    std::cout << "Подпись транзакций: libsecp256k1" << std::endl;
#else
    std::cout << "Подпись транзакций: недоступна (собрано без libsecp256k1)" << std::endl;
#endif
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool show_routes = false;
    std::optional<std::string> balances_address;
    std::vector<std::string> quote;     ///< SRC DST AMOUNT ADDRESS
    std::vector<std::string> bridge;    ///< SRC DST AMOUNT
    std::optional<std::string> to_address;
    std::optional<std::string> error;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto take = [&](int& i, int count, std::vector<std::string>& out, std::string_view name) {
        if (i + count >= argc) {
            args.error = std::format("{}: ожидается {} аргумента(ов)", name, count);
            return;
        }
        for (int k = 0; k < count; ++k) {
            out.emplace_back(argv[++i]);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--routes") {
            args.show_routes = true;
        } else if (arg == "--balances" && i + 1 < argc) {
            args.balances_address = argv[++i];
        } else if (arg == "--quote") {
            take(i, 4, args.quote, arg);
        } else if (arg == "--bridge") {
            take(i, 3, args.bridge, arg);
        } else if (arg == "--to" && i + 1 < argc) {
            args.to_address = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else {
            args.error = std::format("Неизвестный аргумент: {}", arg);
        }
    }

    return args;
}

/**
 * @brief Сеть и сумма из аргументов команды
 */
struct Transfer {
    stablebridge::chain::Chain source;
    stablebridge::chain::Chain destination;
    stablebridge::core::TokenAmount amount;
};

stablebridge::Result<Transfer> parse_transfer(
    const stablebridge::bridge::BridgeService& service,
    const std::vector<std::string>& values
) {
    using namespace stablebridge;

    auto source = chain::parse_chain(values[0]);
    if (!source) {
        return std::unexpected(source.error());
    }
    auto destination = chain::parse_chain(values[1]);
    if (!destination) {
        return std::unexpected(destination.error());
    }

    const chain::ChainConfig* config = service.registry().config_for(*source);
    uint8_t decimals = config ? config->stablecoin_decimals : 6;
    auto amount = core::TokenAmount::parse(values[2], decimals);
    if (!amount) {
        return std::unexpected(amount.error());
    }
    return Transfer{*source, *destination, *amount};
}

// =============================================================================
// Команды
// =============================================================================

int run_routes(const stablebridge::bridge::BridgeService& service) {
    using namespace stablebridge;

    std::cout << "Маршруты стейблкоина:" << std::endl;
    for (chain::Chain source : service.registry().supported_chains()) {
        auto destinations = service.routes().valid_destinations_for(source);
        if (destinations.empty()) {
            continue;
        }
        for (chain::Chain destination : destinations) {
            std::cout << std::format("  {:10} → {:10} [{}]",
                                     chain::to_string(source), chain::to_string(destination),
                                     bridge::to_string(service.best_backend(source, destination)))
                      << std::endl;
        }
    }

    std::cout << "Маршруты нативного токена:" << std::endl;
    for (chain::Chain source : service.registry().supported_chains()) {
        for (chain::Chain destination : service.routes().native_bridge_destinations(source)) {
            std::cout << std::format("  {:10} → {}", chain::to_string(source),
                                     chain::to_string(destination))
                      << std::endl;
        }
    }
    return 0;
}

int run_balances(const stablebridge::bridge::BridgeService& service, const std::string& address) {
    using namespace stablebridge;

    for (const auto& [chain_id, amount] : service.balances(address)) {
        const chain::ChainConfig* config = service.registry().config_for(chain_id);
        std::cout << std::format("  {:10} {} {}", chain::to_string(chain_id),
                                 amount.to_string(2), config->stablecoin_symbol)
                  << std::endl;
    }
    return 0;
}

int run_quote(const stablebridge::bridge::BridgeService& service, const std::vector<std::string>& values) {
    using namespace stablebridge;

    auto transfer = parse_transfer(service, values);
    if (!transfer) {
        std::cerr << "[ERROR] " << transfer.error().message << std::endl;
        return 1;
    }

    auto quote = service.quote(transfer->source, transfer->destination, transfer->amount, values[3]);
    if (!quote) {
        std::cerr << "[ERROR] " << quote.error().message << std::endl;
        return 1;
    }

    std::cout << std::format("Механизм:    {} ({})", bridge::to_string(quote->backend()), quote->tool) << std::endl;
    std::cout << std::format("Отправка:    {}", quote->input_amount.to_string()) << std::endl;
    std::cout << std::format("Получение:   {}", quote->output_amount.to_string()) << std::endl;
    std::cout << std::format("Комиссия:    {} ({:.3f}%)", quote->fee_amount.to_string(), quote->fee_percent) << std::endl;
    std::cout << std::format("Время:       ~{} с", quote->estimated_seconds) << std::endl;
    return 0;
}

int run_bridge(
    const stablebridge::bridge::BridgeService& service,
    const std::vector<std::string>& values,
    const std::optional<std::string>& to_address
) {
    using namespace stablebridge;

#ifdef STABLEBRIDGE_HAS_SIGNER
    const char* key = std::getenv(PRIVATE_KEY_ENV);
    if (!key || std::string_view(key).empty()) {
        std::cerr << "[ERROR] Не задан " << PRIVATE_KEY_ENV << std::endl;
        return 1;
    }
    auto signer = crypto::Secp256k1Signer::from_private_key(key);
    if (!signer) {
        std::cerr << "[ERROR] " << signer.error().message << std::endl;
        return 1;
    }

    auto transfer = parse_transfer(service, values);
    if (!transfer) {
        std::cerr << "[ERROR] " << transfer.error().message << std::endl;
        return 1;
    }

    auto progress = [](const bridge::ProgressEvent& event) {
        std::cout << std::format("[{:>4}/{}s] {}", event.elapsed_seconds,
                                 event.estimated_total_seconds, event.message)
                  << std::endl;
    };

    auto result = service.bridge(**signer, transfer->source, transfer->destination,
                                 transfer->amount, to_address, progress);

    for (const auto& hash : result.tx_hashes) {
        std::cout << "  tx: " << hash << std::endl;
    }
    if (!result.success) {
        std::cerr << "[ERROR] " << result.error_message << std::endl;
        return 1;
    }
    if (result.is_pending()) {
        std::cout << "[INFO] Burn выполнен, mint будет завершён после аттестации" << std::endl;
    } else {
        std::cout << std::format("[INFO] Получено: {}", result.amount_received.to_string()) << std::endl;
    }
    return 0;
#else
    (void)service;
    (void)values;
    (void)to_address;
    std::cerr << "[ERROR] Собрано без libsecp256k1: подпись транзакций недоступна" << std::endl;
    return 1;
#endif
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace stablebridge;

    auto args = parse_args(argc, argv);

    if (args.error) {
        std::cerr << "[ERROR] " << *args.error << std::endl;
        print_help();
        return 1;
    }

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(args.config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;
    config.apply_env_overrides();

    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    log::LoggerConfig logger_config;
    logger_config.level = log::parse_log_level(config.logging.level).value_or(log::LogLevel::Info);
    logger_config.color = config.logging.color;
    log::Logger::instance().configure(logger_config);

    if (args.test_config) {
        std::cout << "[INFO] Конфигурация корректна" << std::endl;
        std::cout << "[INFO] Сетей настроено: " << config.chains.size() << std::endl;
        return 0;
    }

    auto service = bridge::BridgeService::create(config);
    if (!service) {
        std::cerr << "[ERROR] " << service.error().message << std::endl;
        return 1;
    }

    if (args.show_routes) {
        return run_routes(**service);
    }
    if (args.balances_address) {
        return run_balances(**service, *args.balances_address);
    }
    if (!args.quote.empty()) {
        return run_quote(**service, args.quote);
    }
    if (!args.bridge.empty()) {
        return run_bridge(**service, args.bridge, args.to_address);
    }

    print_help();
    return 0;
}
