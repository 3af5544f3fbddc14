/**
 * @file bridge_service.cpp
 * @brief Реализация фасада переводов
 */

#include "bridge_service.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../log/logger.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <utility>

namespace stablebridge::bridge {

namespace {

constexpr std::string_view COMPONENT = "Bridge";

ExecutionSettings settings_from(const Config& config) {
    ExecutionSettings settings;
    settings.sender.broadcast_attempts = config.transactions.broadcast_attempts;
    settings.sender.receipt.interval = std::chrono::seconds(config.transactions.receipt_poll_interval);
    settings.sender.receipt.max_wait = std::chrono::seconds(config.transactions.receipt_timeout);
    settings.attestation.interval = std::chrono::seconds(config.attestation.poll_interval);
    settings.attestation.max_wait = std::chrono::seconds(config.attestation.max_wait);
    return settings;
}

BridgeResult failed_result(
    Backend backend,
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const Error& error
) {
    BridgeResult result;
    result.backend = backend;
    result.source = source;
    result.destination = destination;
    result.amount_sent = amount;
    result.amount_received = core::TokenAmount::zero(amount.decimals);
    result.fail(error);
    return result;
}

Error unexpected_failure(const std::exception& e) {
    log::Logger::instance().error(COMPONENT, std::format("Непредвиденная ошибка: {}", e.what()));
    return Error{ErrorCode::UnknownFailure, e.what()};
}

} // anonymous namespace

// =============================================================================
// Создание
// =============================================================================

Result<std::unique_ptr<BridgeService>> BridgeService::create(
    const Config& config,
    std::shared_ptr<const rpc::HttpTransport> transport
) {
    auto registry = chain::ChainRegistry::from_config(config);
    if (!registry) {
        return std::unexpected(registry.error());
    }
    if (!transport) {
        transport = std::make_shared<rpc::CurlHttpTransport>(config.aggregator.timeout);
    }

    auto clients = chain::ChainClients::connect(*registry, transport);
    return std::make_unique<BridgeService>(
        std::move(*registry),
        std::move(clients),
        chain::RouteTable::builtin(),
        config,
        std::move(transport),
        settings_from(config)
    );
}

BridgeService::BridgeService(
    chain::ChainRegistry registry,
    chain::ChainClients clients,
    chain::RouteTable routes,
    const Config& config,
    std::shared_ptr<const rpc::HttpTransport> transport,
    ExecutionSettings settings
) : registry_(std::move(registry)),
    clients_(std::move(clients)),
    selector_(registry_, std::move(routes)),
    balances_(registry_, clients_),
    attestations_(config.attestation.url, transport),
    aggregator_client_(registry_, config.aggregator, transport),
    native_executor_(registry_, clients_, balances_, attestations_, settings),
    aggregator_executor_(registry_, clients_, balances_, aggregator_client_, settings) {

    std::string chains;
    for (chain::Chain chain : registry_.supported_chains()) {
        if (!chains.empty()) {
            chains += ", ";
        }
        chains += chain::to_string(chain);
    }
    log::Logger::instance().info(COMPONENT, std::format("Поддерживаемые сети: {}",
                                                        chains.empty() ? "нет" : chains));
}

// =============================================================================
// Проверки и запросы
// =============================================================================

Result<void> BridgeService::check_route(
    chain::Chain source,
    chain::Chain destination,
    chain::RouteKind kind
) const {
    for (chain::Chain chain : {source, destination}) {
        if (!registry_.is_supported(chain)) {
            return Err<void>(
                ErrorCode::UnsupportedChain,
                std::format("Сеть {} не настроена", chain::to_string(chain))
            );
        }
    }
    if (!selector_.is_valid_route(source, destination, kind)) {
        return Err<void>(
            ErrorCode::InvalidRoute,
            std::format("Маршрут {} → {} недоступен",
                        chain::to_string(source), chain::to_string(destination))
        );
    }
    return {};
}

Result<QuoteRequest> BridgeService::stablecoin_request(
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::string& from_address,
    const std::optional<std::string>& to_address
) const {
    const chain::ChainConfig& src = *registry_.config_for(source);
    const chain::ChainConfig& dst = *registry_.config_for(destination);

    if (!to_address && !dst.is_evm()) {
        return Err<QuoteRequest>(
            ErrorCode::InvalidAddress,
            std::format("Для сети {} нужен адрес получателя", dst.display_name)
        );
    }
    if (to_address && dst.is_evm() && !hex::is_evm_address(*to_address)) {
        return Err<QuoteRequest>(
            ErrorCode::InvalidAddress,
            std::format("Некорректный адрес получателя: '{}'", *to_address)
        );
    }

    QuoteRequest request;
    request.source = source;
    request.destination = destination;
    request.from_token = src.stablecoin_address;
    request.to_token = dst.stablecoin_address;
    request.to_decimals = dst.stablecoin_decimals;
    request.amount = amount.rescale(src.stablecoin_decimals);
    request.from_address = from_address;
    request.to_address = to_address.value_or(from_address);
    return request;
}

Result<QuoteRequest> BridgeService::swap_request(
    chain::Chain chain,
    const core::TokenAmount& amount,
    const std::string& address,
    const SwapTokens& tokens
) const {
    if (!selector_.supports_swap(chain)) {
        return Err<QuoteRequest>(
            ErrorCode::InvalidRoute,
            std::format("Обмен в сети {} недоступен", chain::to_string(chain))
        );
    }
    const chain::ChainConfig& config = *registry_.config_for(chain);

    QuoteRequest request;
    request.source = chain;
    request.destination = chain;
    request.from_token = tokens.from_token.value_or(std::string(constants::NATIVE_TOKEN_ADDRESS));
    request.to_token = tokens.to_token.value_or(config.stablecoin_address);

    // Точность известна для нативного токена и стейблкоина сети
    auto decimals_of = [&config](const std::string& token) -> std::optional<uint8_t> {
        if (hex::same_address(token, constants::NATIVE_TOKEN_ADDRESS)) {
            return constants::NATIVE_DECIMALS;
        }
        if (hex::same_address(token, config.stablecoin_address)) {
            return config.stablecoin_decimals;
        }
        return std::nullopt;
    };

    request.to_decimals = tokens.to_decimals
        .or_else([&] { return decimals_of(request.to_token); })
        .value_or(constants::NATIVE_DECIMALS);
    const uint8_t from_decimals = tokens.from_decimals
        .or_else([&] { return decimals_of(request.from_token); })
        .value_or(amount.decimals);
    request.amount = amount.rescale(from_decimals);
    request.from_address = address;
    request.to_address = address;

    if (hex::same_address(request.from_token, request.to_token)) {
        return Err<QuoteRequest>(ErrorCode::InvalidRoute, "Токены обмена совпадают");
    }
    return request;
}

// =============================================================================
// Переводы
// =============================================================================

BridgeResult BridgeService::bridge(
    const crypto::Signer& signer,
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::optional<std::string>& destination_address,
    const ProgressCallback& progress
) const {
    Backend backend = Backend::NativeProtocol;
    try {
        if (auto route = check_route(source, destination, chain::RouteKind::Stablecoin); !route) {
            return failed_result(backend, source, destination, amount, route.error());
        }
        backend = selector_.best_backend(source, destination);
        log::Logger::instance().info(COMPONENT, std::format(
            "Перевод {} {} → {} через {}", amount.to_string(),
            chain::to_string(source), chain::to_string(destination), to_string(backend)));

        if (backend == Backend::NativeProtocol) {
            return native_executor_.execute(
                signer, source, destination, amount, destination_address, progress);
        }

        auto request = stablecoin_request(
            source, destination, amount, signer.address(), destination_address);
        if (!request) {
            return failed_result(backend, source, destination, amount, request.error());
        }
        return aggregator_executor_.execute(signer, backend, *request, progress);
    } catch (const std::exception& e) {
        return failed_result(backend, source, destination, amount, unexpected_failure(e));
    }
}

std::future<BridgeResult> BridgeService::bridge_async(
    std::shared_ptr<const crypto::Signer> signer,
    chain::Chain source,
    chain::Chain destination,
    core::TokenAmount amount,
    std::optional<std::string> destination_address,
    ProgressCallback progress
) const {
    return std::async(
        std::launch::async,
        [this, signer = std::move(signer), source, destination, amount,
         destination_address = std::move(destination_address),
         progress = std::move(progress)] {
            return bridge(*signer, source, destination, amount, destination_address, progress);
        }
    );
}

BridgeResult BridgeService::bridge_native(
    const crypto::Signer& signer,
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::optional<std::string>& destination_address,
    const ProgressCallback& progress
) const {
    Backend backend = Backend::GeneralAggregator;
    try {
        if (auto route = check_route(source, destination, chain::RouteKind::Native); !route) {
            return failed_result(backend, source, destination, amount, route.error());
        }

        const chain::ChainConfig& src = *registry_.config_for(source);
        const chain::ChainConfig& dst = *registry_.config_for(destination);
        if (src.fast_relay_eligible && dst.fast_relay_eligible) {
            backend = Backend::FastRelay;
        }

        if (destination_address && !hex::is_evm_address(*destination_address)) {
            return failed_result(backend, source, destination, amount,
                                 Error{ErrorCode::InvalidAddress, "Некорректный адрес получателя"});
        }

        const std::string owner = signer.address();
        QuoteRequest request;
        request.source = source;
        request.destination = destination;
        request.from_token = std::string(constants::NATIVE_TOKEN_ADDRESS);
        request.to_token = std::string(constants::NATIVE_TOKEN_ADDRESS);
        request.to_decimals = constants::NATIVE_DECIMALS;
        request.amount = amount.rescale(constants::NATIVE_DECIMALS);
        request.from_address = owner;
        request.to_address = destination_address.value_or(owner);

        return aggregator_executor_.execute(signer, backend, request, progress);
    } catch (const std::exception& e) {
        return failed_result(backend, source, destination, amount, unexpected_failure(e));
    }
}

BridgeResult BridgeService::swap(
    const crypto::Signer& signer,
    chain::Chain chain,
    const core::TokenAmount& amount,
    const SwapTokens& tokens,
    const ProgressCallback& progress
) const {
    try {
        auto request = swap_request(chain, amount, signer.address(), tokens);
        if (!request) {
            return failed_result(Backend::GeneralAggregator, chain, chain, amount, request.error());
        }
        return aggregator_executor_.execute(signer, Backend::GeneralAggregator, *request, progress);
    } catch (const std::exception& e) {
        return failed_result(Backend::GeneralAggregator, chain, chain, amount, unexpected_failure(e));
    }
}

// =============================================================================
// Котировки
// =============================================================================

Result<Quote> BridgeService::quote(
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::string& address,
    const std::optional<std::string>& destination_address
) const {
    if (auto route = check_route(source, destination, chain::RouteKind::Stablecoin); !route) {
        return std::unexpected(route.error());
    }

    Backend backend = selector_.best_backend(source, destination);
    if (backend == Backend::NativeProtocol) {
        return native_executor_.quote(source, destination, amount);
    }

    auto request = stablecoin_request(source, destination, amount, address, destination_address);
    if (!request) {
        return std::unexpected(request.error());
    }
    return aggregator_client_.quote(backend, *request);
}

Result<Quote> BridgeService::fast_bridge_quote(
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::string& address,
    const std::optional<std::string>& destination_address
) const {
    if (auto route = check_route(source, destination, chain::RouteKind::Stablecoin); !route) {
        return std::unexpected(route.error());
    }
    auto request = stablecoin_request(source, destination, amount, address, destination_address);
    if (!request) {
        return std::unexpected(request.error());
    }
    return aggregator_client_.relay_quote(*request);
}

Result<Quote> BridgeService::swap_quote(
    chain::Chain chain,
    const core::TokenAmount& amount,
    const std::string& address,
    const SwapTokens& tokens
) const {
    auto request = swap_request(chain, amount, address, tokens);
    if (!request) {
        return std::unexpected(request.error());
    }
    return aggregator_client_.aggregator_quote(*request);
}

// =============================================================================
// Запросы
// =============================================================================

core::TokenAmount BridgeService::balance(chain::Chain chain, const std::string& address) const {
    return balances_.stablecoin_balance(chain, address);
}

std::map<chain::Chain, core::TokenAmount> BridgeService::balances(const std::string& address) const {
    return balances_.all_stablecoin_balances(address);
}

bool BridgeService::is_valid_route(
    chain::Chain source,
    chain::Chain destination,
    chain::RouteKind kind
) const {
    return selector_.is_valid_route(source, destination, kind);
}

Backend BridgeService::best_backend(chain::Chain source, chain::Chain destination) const {
    return selector_.best_backend(source, destination);
}

} // namespace stablebridge::bridge
