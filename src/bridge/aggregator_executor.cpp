/**
 * @file aggregator_executor.cpp
 * @brief Реализация исполнения котировок агрегаторов
 */

#include "aggregator_executor.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../log/logger.hpp"

#include <exception>
#include <format>
#include <utility>
#include <vector>

namespace stablebridge::bridge {

namespace {

constexpr std::string_view COMPONENT = "AggregatorBridge";

struct PlannedTx {
    std::string label;
    const TxTemplate* tx;
};

/**
 * @brief Транзакции плана в порядке исполнения
 */
std::vector<PlannedTx> flatten(const Quote& quote) {
    std::vector<PlannedTx> planned;
    if (const auto* relay = std::get_if<RelayPlan>(&quote.payload)) {
        for (const auto& step : relay->steps) {
            for (const auto& item : step.items) {
                planned.push_back({step.id.empty() ? std::string("step") : step.id, &item});
            }
        }
    } else if (const auto* aggregator = std::get_if<AggregatorPlan>(&quote.payload)) {
        planned.push_back({quote.tool, &aggregator->transaction});
    }
    return planned;
}

} // anonymous namespace

AggregatorExecutor::AggregatorExecutor(
    const chain::ChainRegistry& registry,
    const chain::ChainClients& clients,
    const BalanceOracle& balances,
    const AggregatorClient& client,
    ExecutionSettings settings
) : registry_(registry),
    clients_(clients),
    balances_(balances),
    client_(client),
    settings_(std::move(settings)) {}

Result<Hash256> AggregatorExecutor::run_step(
    const TxSender& sender,
    const chain::ChainConfig& source,
    const TxTemplate& tx,
    const std::string& label
) const {
    if (tx.chain_id != source.chain_id) {
        return Err<Hash256>(
            ErrorCode::QuoteFailed,
            std::format("Шаг '{}' относится к сети {}, ожидалась {}", label, tx.chain_id, source.chain_id)
        );
    }
    auto to = hex::parse_address(tx.to);
    if (!to) {
        return std::unexpected(to.error());
    }

    TxRequest request;
    request.to = *to;
    request.data = tx.data;
    request.value = tx.value;
    request.gas_limit = tx.gas_limit;
    request.gas_price_percent = constants::GAS_PRICE_BOOST_AGGREGATOR_PERCENT;
    request.label = label;

    auto hash = sender.send(request);
    if (!hash) {
        return hash;
    }

    auto receipt = sender.wait_for_receipt(*hash);
    if (!receipt) {
        return std::unexpected(receipt.error());
    }
    if (!receipt->success) {
        return Err<Hash256>(
            ErrorCode::TransactionReverted,
            std::format("{} отклонена сетью: {}", label, hex::encode(*hash))
        );
    }
    return hash;
}

BridgeResult AggregatorExecutor::execute(
    const crypto::Signer& signer,
    Backend backend,
    const QuoteRequest& request,
    const ProgressCallback& progress
) const {
    BridgeResult result;
    result.backend = backend;
    result.source = request.source;
    result.destination = request.destination;
    result.amount_sent = request.amount;
    result.amount_received = core::TokenAmount::zero(request.to_decimals);

    try {
        transfer(signer, backend, request, progress, result);
    } catch (const std::exception& e) {
        log::Logger::instance().error(
            COMPONENT, std::format("Непредвиденная ошибка {}: {}", to_string(backend), e.what()));
        result.amount_received = core::TokenAmount::zero(request.to_decimals);
        result.fail(Error{ErrorCode::UnknownFailure, e.what()});
    }
    return result;
}

void AggregatorExecutor::transfer(
    const crypto::Signer& signer,
    Backend backend,
    const QuoteRequest& request,
    const ProgressCallback& progress,
    BridgeResult& result
) const {
    auto& logger = log::Logger::instance();

    // =========================================================================
    // Предусловия
    // =========================================================================

    if (signer.family() != chain::ChainFamily::Evm) {
        result.fail(Error{ErrorCode::UnsupportedSigner, "Для исполнения плана нужен EVM ключ"});
        return;
    }
    if (request.amount.is_zero()) {
        result.fail(Error{ErrorCode::InvalidAmount, "Сумма равна нулю"});
        return;
    }

    const chain::ChainConfig* src = registry_.config_for(request.source);
    const rpc::ChainNode* node = clients_.node_for(request.source);
    if (!src || !src->is_evm() || !node) {
        result.fail(Error{ErrorCode::UnsupportedChain,
                          std::format("Исходная сеть {} не поддерживается",
                                      chain::to_string(request.source))});
        return;
    }

    notify_progress(progress, {ProgressStage::Quoting, "Запрос котировки", 0, 0});

    auto quote = client_.quote(backend, request);
    if (!quote) {
        result.fail(quote.error());
        return;
    }
    const uint32_t total = quote->estimated_seconds;
    auto planned = flatten(*quote);
    if (planned.empty()) {
        result.fail(Error{ErrorCode::QuoteFailed, "Пустой план исполнения"});
        return;
    }

    core::uint256 carried_value;
    for (const auto& item : planned) {
        carried_value = carried_value + item.tx->value;
    }

    const std::string owner = signer.address();

    auto gas = balances_.fetch_native_balance(request.source, owner);
    if (!gas) {
        result.fail(gas.error());
        return;
    }
    auto required_gas = src->min_gas()
        + core::TokenAmount::from_raw(carried_value, constants::NATIVE_DECIMALS);
    if (*gas < required_gas) {
        result.fail(Error{
            ErrorCode::InsufficientGas,
            std::format("Недостаточно {} в сети {}: {} < {}",
                        src->native_symbol, src->display_name,
                        gas->to_string(), required_gas.to_string())
        });
        return;
    }

    const bool from_native = hex::same_address(request.from_token, constants::NATIVE_TOKEN_ADDRESS);
    if (!from_native) {
        auto balance = balances_.fetch_token_balance(
            request.source, request.from_token, request.amount.decimals, owner);
        if (!balance) {
            result.fail(balance.error());
            return;
        }
        if (*balance < request.amount) {
            result.fail(Error{
                ErrorCode::InsufficientBalance,
                std::format("Недостаточный баланс в сети {}: {} < {}",
                            src->display_name, balance->to_string(), request.amount.to_string())
            });
            return;
        }
    }

    // =========================================================================
    // Исполнение
    // =========================================================================

    TxSender sender(*node, signer, src->chain_id, settings_.sender, settings_.clock);
    sender.on_broadcast([&result](const Hash256& hash) {
        result.tx_hashes.push_back(hex::encode(hash));
    });

    if (const auto* plan = std::get_if<AggregatorPlan>(&quote->payload)) {
        if (plan->approval_address && plan->from_token) {
            notify_progress(progress, {ProgressStage::Approving,
                                       "Проверка разрешения на списание", 0, total});

            auto token = hex::parse_address(*plan->from_token);
            auto spender = hex::parse_address(*plan->approval_address);
            if (!token || !spender) {
                result.fail(Error{ErrorCode::ApprovalFailed, "Некорректный адрес для approve"});
                return;
            }
            auto approval = sender.approve_if_needed(
                *token, *spender, plan->from_amount, constants::GAS_PRICE_BOOST_AGGREGATOR_PERCENT);
            if (!approval) {
                Error error = approval.error();
                if (error.code != ErrorCode::ApprovalFailed) {
                    error = Error{ErrorCode::ApprovalFailed, std::format("approve: {}", error.message)};
                }
                result.fail(error);
                return;
            }
        }
    }

    for (std::size_t i = 0; i < planned.size(); ++i) {
        const auto& [label, tx] = planned[i];
        notify_progress(progress, {ProgressStage::Executing,
                                   std::format("Шаг {}/{}: {}", i + 1, planned.size(), label),
                                   0, total});

        auto hash = run_step(sender, *src, *tx, label);
        if (!hash) {
            result.fail(hash.error());
            return;
        }
        result.source_tx_hash = hex::encode(*hash);
    }

    result.success = true;
    result.amount_received = quote->output_amount;
    logger.info(COMPONENT, std::format("{} {} → {}: отправлено {}, ожидается {} ({})",
                                       to_string(backend),
                                       chain::to_string(request.source),
                                       chain::to_string(request.destination),
                                       request.amount.to_string(),
                                       quote->output_amount.to_string(),
                                       quote->tool));
    notify_progress(progress, {ProgressStage::Done, "Транзакции подтверждены", total, total});
}

} // namespace stablebridge::bridge
