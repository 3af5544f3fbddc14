/**
 * @file aggregator_client.cpp
 * @brief Запросы котировок к API агрегаторов
 */

#include "aggregator_client.hpp"
#include "../core/hex.hpp"
#include "../log/logger.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace stablebridge::bridge {

using json = nlohmann::json;

namespace {

constexpr std::string_view COMPONENT = "Aggregator";
constexpr std::string_view RELAY_TOOL = "Relay";

std::string trim_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

/**
 * @brief Целое из JSON: число, десятичная или 0x-строка
 */
std::optional<core::uint256> parse_uint(const json& value) {
    if (value.is_number_unsigned()) {
        return core::uint256{value.get<uint64_t>()};
    }
    if (value.is_number_integer()) {
        auto signed_value = value.get<int64_t>();
        if (signed_value < 0) {
            return std::nullopt;
        }
        return core::uint256{static_cast<uint64_t>(signed_value)};
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    const auto& text = value.get_ref<const std::string&>();
    if (text == "0x" || text == "0X") {
        return core::uint256::zero();
    }
    if (text.starts_with("0x") || text.starts_with("0X")) {
        return core::uint256::from_hex(text);
    }
    return core::uint256::from_decimal(text);
}

/**
 * @brief Текст ошибки агрегатора из тела ответа
 */
std::string error_text(const rpc::HttpResponse& response) {
    auto body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        if (body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
        if (body.contains("error") && body["error"].is_string()) {
            return body["error"].get<std::string>();
        }
    }
    return std::format("HTTP {}", response.status);
}

/**
 * @brief Шаблон транзакции из объекта {to, data, value, chainId, gas|gasLimit}
 */
Result<TxTemplate> parse_tx_template(const json& object, uint64_t default_chain_id) {
    if (!object.is_object() || !object.contains("to") || !object["to"].is_string()) {
        return Err<TxTemplate>(ErrorCode::QuoteFailed, "Шаблон транзакции без получателя");
    }

    TxTemplate tx;
    tx.to = object["to"].get<std::string>();
    tx.chain_id = default_chain_id;

    if (object.contains("data") && object["data"].is_string()) {
        auto data = hex::decode(object["data"].get<std::string>());
        if (!data) {
            return Err<TxTemplate>(ErrorCode::QuoteFailed, "Некорректные calldata в шаблоне");
        }
        tx.data = std::move(*data);
    }
    if (object.contains("value") && !object["value"].is_null()) {
        auto value = parse_uint(object["value"]);
        if (!value) {
            return Err<TxTemplate>(ErrorCode::QuoteFailed, "Некорректное value в шаблоне");
        }
        tx.value = *value;
    }
    if (object.contains("chainId")) {
        auto chain_id = parse_uint(object["chainId"]);
        if (chain_id && chain_id->fits_u64()) {
            tx.chain_id = chain_id->low_u64();
        }
    }
    for (const char* key : {"gas", "gasLimit"}) {
        if (object.contains(key) && !object[key].is_null()) {
            auto gas = parse_uint(object[key]);
            if (gas && gas->fits_u64() && !gas->is_zero()) {
                tx.gas_limit = gas->low_u64();
            }
        }
    }
    return tx;
}

/**
 * @brief Комиссия как разница входа и выхода (один и тот же актив)
 */
void fill_same_asset_fee(Quote& quote) {
    auto input = quote.input_amount.rescale(quote.output_amount.decimals);
    quote.fee_amount = input.saturating_sub(quote.output_amount);
    double input_value = input.to_double();
    quote.fee_percent = input_value > 0.0 ? quote.fee_amount.to_double() / input_value * 100.0 : 0.0;
}

} // anonymous namespace

AggregatorClient::AggregatorClient(
    const chain::ChainRegistry& registry,
    AggregatorConfig config,
    std::shared_ptr<const rpc::HttpTransport> transport
) : registry_(registry), config_(std::move(config)), transport_(std::move(transport)) {
    config_.relay_url = trim_slash(config_.relay_url);
    config_.lifi_url = trim_slash(config_.lifi_url);
}

Result<Quote> AggregatorClient::quote(Backend backend, const QuoteRequest& request) const {
    switch (backend) {
        case Backend::FastRelay:         return relay_quote(request);
        case Backend::GeneralAggregator: return aggregator_quote(request);
        default:
            return Err<Quote>(ErrorCode::QuoteFailed, "Нативный протокол не использует агрегатор");
    }
}

// =============================================================================
// Fast relay
// =============================================================================

Result<Quote> AggregatorClient::relay_quote(const QuoteRequest& request) const {
    const chain::ChainConfig* src = registry_.config_for(request.source);
    const chain::ChainConfig* dst = registry_.config_for(request.destination);
    if (!src || !dst) {
        return Err<Quote>(ErrorCode::UnsupportedChain, "Сеть котировки не поддерживается");
    }

    json body = {
        {"user", request.from_address},
        {"recipient", request.to_address},
        {"originChainId", src->relay_chain_id},
        {"destinationChainId", dst->relay_chain_id},
        {"originCurrency", request.from_token},
        {"destinationCurrency", request.to_token},
        {"amount", request.amount.raw.to_decimal()},
        {"tradeType", "EXACT_INPUT"},
    };

    const std::string url = config_.relay_url + "/quote";
    log::Logger::instance().debug(COMPONENT, std::format("POST {}", url));

    auto response = transport_->post(url, body.dump(), {{"Content-Type", "application/json"}});
    if (!response) {
        return Err<Quote>(ErrorCode::QuoteFailed, response.error().message);
    }
    if (!response->ok()) {
        return Err<Quote>(ErrorCode::QuoteFailed, std::format("Relay: {}", error_text(*response)));
    }

    try {
        json payload = json::parse(response->body);

        RelayPlan plan;
        for (const auto& step_json : payload.value("steps", json::array())) {
            RelayStep step;
            step.id = step_json.value("id", std::string{});
            step.kind = step_json.value("kind", std::string{});
            if (step.kind != "transaction") {
                return Err<Quote>(
                    ErrorCode::QuoteFailed,
                    std::format("Relay: шаг '{}' типа '{}' не поддерживается", step.id, step.kind)
                );
            }
            for (const auto& item : step_json.value("items", json::array())) {
                if (!item.contains("data")) {
                    return Err<Quote>(ErrorCode::QuoteFailed, "Relay: элемент шага без данных");
                }
                auto tx = parse_tx_template(item["data"], src->chain_id);
                if (!tx) {
                    return std::unexpected(tx.error());
                }
                step.items.push_back(std::move(*tx));
            }
            if (!step.items.empty()) {
                plan.steps.push_back(std::move(step));
            }
        }
        if (plan.steps.empty()) {
            return Err<Quote>(ErrorCode::QuoteFailed, "Relay: пустой план исполнения");
        }

        const json details = payload.value("details", json::object());
        const json currency_out = details.value("currencyOut", json::object());

        uint8_t out_decimals = request.to_decimals;
        if (currency_out.contains("currency") && currency_out["currency"].contains("decimals")) {
            out_decimals = currency_out["currency"]["decimals"].get<uint8_t>();
        }

        auto out_raw = currency_out.contains("amount")
            ? parse_uint(currency_out["amount"])
            : std::optional<core::uint256>{};
        if (!out_raw) {
            return Err<Quote>(ErrorCode::QuoteFailed, "Relay: нет ожидаемой суммы получения");
        }

        Quote quote;
        quote.source = request.source;
        quote.destination = request.destination;
        quote.input_amount = request.amount;
        quote.output_amount = core::TokenAmount::from_raw(*out_raw, out_decimals);
        quote.estimated_seconds = details.value("timeEstimate", 0u);
        quote.tool = std::string(RELAY_TOOL);
        quote.payload = std::move(plan);

        bool same_asset = hex::same_address(request.from_token, src->stablecoin_address)
                       && hex::same_address(request.to_token, dst->stablecoin_address);
        if (same_asset) {
            fill_same_asset_fee(quote);
        } else {
            quote.fee_amount = core::TokenAmount::zero(out_decimals);
            const json fees = payload.value("fees", json::object());
            if (fees.contains("relayer") && fees["relayer"].contains("amountUsd")) {
                log::Logger::instance().debug(
                    COMPONENT,
                    std::format("Relay: комиссия ${}", fees["relayer"]["amountUsd"].dump())
                );
            }
        }
        return quote;
    } catch (const json::exception& e) {
        return Err<Quote>(ErrorCode::QuoteFailed, std::format("Relay: некорректный ответ: {}", e.what()));
    }
}

// =============================================================================
// Общий агрегатор
// =============================================================================

Result<Quote> AggregatorClient::aggregator_quote(const QuoteRequest& request) const {
    const chain::ChainConfig* src = registry_.config_for(request.source);
    const chain::ChainConfig* dst = registry_.config_for(request.destination);
    if (!src || !dst) {
        return Err<Quote>(ErrorCode::UnsupportedChain, "Сеть котировки не поддерживается");
    }

    const std::string url = std::format(
        "{}/quote?fromChain={}&toChain={}&fromToken={}&toToken={}&fromAmount={}"
        "&fromAddress={}&toAddress={}",
        config_.lifi_url, src->aggregator_chain_id, dst->aggregator_chain_id,
        request.from_token, request.to_token, request.amount.raw.to_decimal(),
        request.from_address, request.to_address
    );
    log::Logger::instance().debug(COMPONENT, std::format("GET {}", url));

    rpc::HttpHeaders headers;
    if (!config_.api_key.empty()) {
        headers["x-lifi-api-key"] = config_.api_key;
    }

    auto response = transport_->get(url, headers);
    if (!response) {
        return Err<Quote>(ErrorCode::QuoteFailed, response.error().message);
    }
    if (!response->ok()) {
        return Err<Quote>(ErrorCode::QuoteFailed, std::format("LI.FI: {}", error_text(*response)));
    }

    try {
        json payload = json::parse(response->body);

        if (!payload.contains("transactionRequest")) {
            return Err<Quote>(ErrorCode::QuoteFailed, "LI.FI: нет transactionRequest");
        }
        auto tx = parse_tx_template(payload["transactionRequest"], src->chain_id);
        if (!tx) {
            return std::unexpected(tx.error());
        }

        const json estimate = payload.value("estimate", json::object());
        auto to_amount = estimate.contains("toAmount")
            ? parse_uint(estimate["toAmount"])
            : std::optional<core::uint256>{};
        if (!to_amount) {
            return Err<Quote>(ErrorCode::QuoteFailed, "LI.FI: нет ожидаемой суммы получения");
        }

        uint8_t out_decimals = request.to_decimals;
        const json action = payload.value("action", json::object());
        if (action.contains("toToken") && action["toToken"].contains("decimals")) {
            out_decimals = action["toToken"]["decimals"].get<uint8_t>();
        }

        AggregatorPlan plan;
        plan.transaction = std::move(*tx);
        plan.from_amount = request.amount.raw;
        if (estimate.contains("approvalAddress") && estimate["approvalAddress"].is_string()) {
            plan.approval_address = estimate["approvalAddress"].get<std::string>();
        }
        if (!hex::same_address(request.from_token, constants::NATIVE_TOKEN_ADDRESS)) {
            plan.from_token = request.from_token;
        }

        Quote quote;
        quote.source = request.source;
        quote.destination = request.destination;
        quote.input_amount = request.amount;
        quote.output_amount = core::TokenAmount::from_raw(*to_amount, out_decimals);
        quote.tool = payload.value("tool", std::string{"lifi"});

        if (estimate.contains("executionDuration") && estimate["executionDuration"].is_number()) {
            quote.estimated_seconds = static_cast<uint32_t>(estimate["executionDuration"].get<double>());
        }

        bool same_asset = hex::same_address(request.from_token, src->stablecoin_address)
                       && hex::same_address(request.to_token, dst->stablecoin_address);
        if (same_asset) {
            fill_same_asset_fee(quote);
        } else {
            quote.fee_amount = core::TokenAmount::zero(out_decimals);
            double fraction = 0.0;
            for (const auto& cost : estimate.value("feeCosts", json::array())) {
                if (cost.contains("percentage") && cost["percentage"].is_string()) {
                    fraction += std::stod(cost["percentage"].get<std::string>());
                } else if (cost.contains("percentage") && cost["percentage"].is_number()) {
                    fraction += cost["percentage"].get<double>();
                }
            }
            quote.fee_percent = fraction * 100.0;
        }

        quote.payload = std::move(plan);
        return quote;
    } catch (const json::exception& e) {
        return Err<Quote>(ErrorCode::QuoteFailed, std::format("LI.FI: некорректный ответ: {}", e.what()));
    } catch (const std::logic_error& e) {
        return Err<Quote>(ErrorCode::QuoteFailed, std::format("LI.FI: некорректная комиссия: {}", e.what()));
    }
}

} // namespace stablebridge::bridge
