/**
 * @file aggregator_client.hpp
 * @brief Клиенты API агрегаторов: fast relay и общий bridge/DEX агрегатор
 *
 * Оба клиента возвращают Quote с готовым планом исполнения.
 * Котировка не кешируется: каждый вызов делает один HTTP запрос.
 */

#pragma once

#include "types.hpp"
#include "../chain/chain_registry.hpp"
#include "../core/config.hpp"
#include "../rpc/http_transport.hpp"

#include <memory>
#include <string>

namespace stablebridge::bridge {

/**
 * @brief Параметры котировки
 *
 * Токены задаются адресами контрактов; нативный токен
 * обозначается constants::NATIVE_TOKEN_ADDRESS.
 */
struct QuoteRequest {
    chain::Chain source{chain::Chain::Ethereum};
    chain::Chain destination{chain::Chain::Ethereum};

    std::string from_token;
    std::string to_token;

    /// @brief Точность актива назначения, если агрегатор её не вернёт
    uint8_t to_decimals{6};

    /// @brief Сумма в точности исходного актива
    core::TokenAmount amount;

    std::string from_address;
    std::string to_address;
};

/**
 * @brief Клиент котировок агрегаторов
 */
class AggregatorClient {
public:
    AggregatorClient(const chain::ChainRegistry& registry,
                     AggregatorConfig config,
                     std::shared_ptr<const rpc::HttpTransport> transport);

    /**
     * @brief Котировка fast relay (POST {relay_url}/quote)
     *
     * @return Quote с RelayPlan или QuoteFailed с текстом ошибки агрегатора
     */
    [[nodiscard]] Result<Quote> relay_quote(const QuoteRequest& request) const;

    /**
     * @brief Котировка общего агрегатора (GET {lifi_url}/quote)
     *
     * @return Quote с AggregatorPlan или QuoteFailed с текстом ошибки агрегатора
     */
    [[nodiscard]] Result<Quote> aggregator_quote(const QuoteRequest& request) const;

    /**
     * @brief Котировка нужного механизма
     */
    [[nodiscard]] Result<Quote> quote(Backend backend, const QuoteRequest& request) const;

private:
    const chain::ChainRegistry& registry_;
    AggregatorConfig config_;
    std::shared_ptr<const rpc::HttpTransport> transport_;
};

} // namespace stablebridge::bridge
