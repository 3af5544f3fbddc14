/**
 * @file bridge_service.hpp
 * @brief Фасад: проверка маршрута, выбор механизма, исполнение
 *
 * Единственная точка входа для вызывающего кода (CLI, бот, API).
 * Все операции независимы и могут выполняться из разных потоков:
 * реестр, таблицы маршрутов и клиенты нод неизменяемы.
 */

#pragma once

#include "aggregator_client.hpp"
#include "aggregator_executor.hpp"
#include "attestation_client.hpp"
#include "balance_oracle.hpp"
#include "native_protocol_executor.hpp"
#include "route_selector.hpp"
#include "types.hpp"
#include "../chain/chain_clients.hpp"
#include "../chain/chain_registry.hpp"
#include "../chain/route_table.hpp"
#include "../core/config.hpp"
#include "../crypto/signer.hpp"
#include "../rpc/http_transport.hpp"

#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace stablebridge::bridge {

/**
 * @brief Токены обмена внутри сети
 *
 * По умолчанию: нативный токен → стейблкоин сети.
 */
struct SwapTokens {
    /// @brief Списываемый токен; по умолчанию нативный
    std::optional<std::string> from_token;

    /// @brief Получаемый токен; по умолчанию стейблкоин сети
    std::optional<std::string> to_token;

    /// @brief Точность получаемого токена; по умолчанию из реестра
    std::optional<uint8_t> to_decimals;

    /// @brief Точность списываемого токена; сумма приводится к ней перед котировкой
    std::optional<uint8_t> from_decimals;
};

/**
 * @brief Сервис переводов
 *
 * Не копируется и не перемещается: внутренние компоненты
 * ссылаются на реестр и клиентов, которыми владеет сервис.
 */
class BridgeService {
public:
    /**
     * @brief Сервис по конфигурации
     *
     * @param config Проверенная конфигурация
     * @param transport HTTP транспорт; по умолчанию libcurl
     */
    [[nodiscard]] static Result<std::unique_ptr<BridgeService>> create(
        const Config& config,
        std::shared_ptr<const rpc::HttpTransport> transport = nullptr
    );

    BridgeService(chain::ChainRegistry registry,
                  chain::ChainClients clients,
                  chain::RouteTable routes,
                  const Config& config,
                  std::shared_ptr<const rpc::HttpTransport> transport,
                  ExecutionSettings settings = {});

    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;
    BridgeService(BridgeService&&) = delete;
    BridgeService& operator=(BridgeService&&) = delete;

    // =========================================================================
    // Переводы
    // =========================================================================

    /**
     * @brief Перевести стейблкоин из source в destination
     *
     * Проверяет маршрут, выбирает механизм (best_backend) и выполняет
     * перевод. Исключения превращаются в UnknownFailure.
     *
     * @param signer Ключ владельца средств
     * @param amount Сумма (приводится к точности стейблкоина source)
     * @param destination_address Получатель; по умолчанию адрес ключа
     * @param progress Callback прогресса
     */
    [[nodiscard]] BridgeResult bridge(
        const crypto::Signer& signer,
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::optional<std::string>& destination_address = std::nullopt,
        const ProgressCallback& progress = {}
    ) const;

    /**
     * @brief bridge() в отдельном потоке
     *
     * Сервис должен жить до получения результата.
     */
    [[nodiscard]] std::future<BridgeResult> bridge_async(
        std::shared_ptr<const crypto::Signer> signer,
        chain::Chain source,
        chain::Chain destination,
        core::TokenAmount amount,
        std::optional<std::string> destination_address = std::nullopt,
        ProgressCallback progress = {}
    ) const;

    /**
     * @brief Перевести нативный газовый токен (маршруты RouteKind::Native)
     *
     * @param amount Сумма с точностью 18 знаков
     */
    [[nodiscard]] BridgeResult bridge_native(
        const crypto::Signer& signer,
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::optional<std::string>& destination_address = std::nullopt,
        const ProgressCallback& progress = {}
    ) const;

    /**
     * @brief Обмен внутри одной сети через общий агрегатор
     *
     * @param amount Сумма в точности списываемого токена
     */
    [[nodiscard]] BridgeResult swap(
        const crypto::Signer& signer,
        chain::Chain chain,
        const core::TokenAmount& amount,
        const SwapTokens& tokens = {},
        const ProgressCallback& progress = {}
    ) const;

    // =========================================================================
    // Котировки
    // =========================================================================

    /**
     * @brief Котировка механизма, который выбрал бы bridge()
     */
    [[nodiscard]] Result<Quote> quote(
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::string& address,
        const std::optional<std::string>& destination_address = std::nullopt
    ) const;

    /**
     * @brief Котировка fast relay независимо от выбора механизма
     */
    [[nodiscard]] Result<Quote> fast_bridge_quote(
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::string& address,
        const std::optional<std::string>& destination_address = std::nullopt
    ) const;

    [[nodiscard]] Result<Quote> swap_quote(
        chain::Chain chain,
        const core::TokenAmount& amount,
        const std::string& address,
        const SwapTokens& tokens = {}
    ) const;

    // =========================================================================
    // Запросы
    // =========================================================================

    [[nodiscard]] core::TokenAmount balance(chain::Chain chain, const std::string& address) const;

    [[nodiscard]] std::map<chain::Chain, core::TokenAmount> balances(const std::string& address) const;

    [[nodiscard]] bool is_valid_route(
        chain::Chain source,
        chain::Chain destination,
        chain::RouteKind kind = chain::RouteKind::Stablecoin
    ) const;

    [[nodiscard]] Backend best_backend(chain::Chain source, chain::Chain destination) const;

    [[nodiscard]] const chain::ChainRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const RouteSelector& routes() const noexcept { return selector_; }
    [[nodiscard]] const BalanceOracle& balance_oracle() const noexcept { return balances_; }

private:
    /**
     * @brief Проверка пары сетей и маршрута
     */
    [[nodiscard]] Result<void> check_route(
        chain::Chain source,
        chain::Chain destination,
        chain::RouteKind kind
    ) const;

    /**
     * @brief Запрос котировки перевода стейблкоина
     */
    [[nodiscard]] Result<QuoteRequest> stablecoin_request(
        chain::Chain source,
        chain::Chain destination,
        const core::TokenAmount& amount,
        const std::string& from_address,
        const std::optional<std::string>& to_address
    ) const;

    [[nodiscard]] Result<QuoteRequest> swap_request(
        chain::Chain chain,
        const core::TokenAmount& amount,
        const std::string& address,
        const SwapTokens& tokens
    ) const;

    chain::ChainRegistry registry_;
    chain::ChainClients clients_;
    RouteSelector selector_;
    BalanceOracle balances_;
    AttestationClient attestations_;
    AggregatorClient aggregator_client_;
    NativeProtocolExecutor native_executor_;
    AggregatorExecutor aggregator_executor_;
};

} // namespace stablebridge::bridge
