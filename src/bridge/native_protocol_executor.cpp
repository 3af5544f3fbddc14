/**
 * @file native_protocol_executor.cpp
 * @brief Реализация перевода через нативный протокол
 */

#include "native_protocol_executor.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../crypto/keccak.hpp"
#include "../evm/abi.hpp"
#include "../log/logger.hpp"

#include <exception>
#include <format>
#include <utility>

namespace stablebridge::bridge {

namespace {

constexpr std::string_view COMPONENT = "NativeBridge";
constexpr std::string_view TOOL_NAME = "CCTP";

/**
 * @brief Сообщение протокола из логов receipt burn
 */
std::optional<Bytes> find_message_sent(const rpc::TxReceipt& receipt) {
    auto topic = hex::parse_hash(constants::MESSAGE_SENT_TOPIC);
    if (!topic) {
        return std::nullopt;
    }
    for (const auto& entry : receipt.logs) {
        if (entry.topics.empty() || entry.topics.front() != *topic) {
            continue;
        }
        auto message = evm::abi::decode_bytes(entry.data);
        if (!message) {
            log::Logger::instance().warning(COMPONENT, message.error().message);
            return std::nullopt;
        }
        return std::move(*message);
    }
    return std::nullopt;
}

std::string format_remaining(uint32_t seconds) {
    return std::format("~{}м {}с", seconds / 60, seconds % 60);
}

} // anonymous namespace

NativeProtocolExecutor::NativeProtocolExecutor(
    const chain::ChainRegistry& registry,
    const chain::ChainClients& clients,
    const BalanceOracle& balances,
    const AttestationClient& attestations,
    ExecutionSettings settings
) : registry_(registry),
    clients_(clients),
    balances_(balances),
    attestations_(attestations),
    settings_(std::move(settings)) {}

uint32_t NativeProtocolExecutor::estimated_total_seconds() const {
    auto max_wait = std::chrono::duration_cast<std::chrono::seconds>(settings_.attestation.max_wait);
    return static_cast<uint32_t>(max_wait.count()) + constants::BURN_PHASE_ESTIMATE_SEC;
}

// =============================================================================
// Котировка
// =============================================================================

Result<Quote> NativeProtocolExecutor::quote(
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount
) const {
    const chain::ChainConfig* src = registry_.config_for(source);
    const chain::ChainConfig* dst = registry_.config_for(destination);
    if (!src || !dst || !src->supports_native_protocol() || !dst->supports_native_protocol()) {
        return Err<Quote>(
            ErrorCode::InvalidRoute,
            std::format("Нативный протокол недоступен для {} → {}",
                        chain::to_string(source), chain::to_string(destination))
        );
    }

    Quote quote;
    quote.source = source;
    quote.destination = destination;
    quote.input_amount = amount.rescale(src->stablecoin_decimals);
    quote.output_amount = quote.input_amount.rescale(dst->stablecoin_decimals);
    quote.fee_amount = core::TokenAmount::zero(dst->stablecoin_decimals);
    quote.fee_percent = 0.0;
    quote.estimated_seconds = estimated_total_seconds();
    quote.tool = std::string(TOOL_NAME);
    quote.payload = NativeProtocolPlan{*src->native_domain, *dst->native_domain};
    return quote;
}

// =============================================================================
// Перевод
// =============================================================================

BridgeResult NativeProtocolExecutor::execute(
    const crypto::Signer& signer,
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::optional<std::string>& recipient,
    const ProgressCallback& progress
) const {
    BridgeResult result;
    result.backend = Backend::NativeProtocol;
    result.source = source;
    result.destination = destination;
    result.amount_sent = amount;

    try {
        transfer(signer, source, destination, amount, recipient, progress, result);
    } catch (const std::exception& e) {
        auto& logger = log::Logger::instance();
        if (result.success) {
            // burn подтверждён: средства можно получить позже через mint
            result.destination_tx_hash.reset();
            logger.warning(COMPONENT, std::format("Mint прерван ({}), перевод ожидает mint", e.what()));
        } else {
            logger.error(COMPONENT, std::format("Непредвиденная ошибка перевода: {}", e.what()));
            result.fail(Error{ErrorCode::UnknownFailure, e.what()});
        }
    }
    return result;
}

void NativeProtocolExecutor::transfer(
    const crypto::Signer& signer,
    chain::Chain source,
    chain::Chain destination,
    const core::TokenAmount& amount,
    const std::optional<std::string>& recipient,
    const ProgressCallback& progress,
    BridgeResult& result
) const {
    auto& logger = log::Logger::instance();
    const uint32_t total = estimated_total_seconds();

    // =========================================================================
    // Предусловия
    // =========================================================================

    auto plan = quote(source, destination, amount);
    if (!plan) {
        result.fail(plan.error());
        return;
    }
    const chain::ChainConfig& src = *registry_.config_for(source);
    const chain::ChainConfig& dst = *registry_.config_for(destination);
    const core::TokenAmount send_amount = plan->input_amount;
    result.amount_sent = send_amount;
    result.amount_received = core::TokenAmount::zero(dst.stablecoin_decimals);

    if (signer.family() != chain::ChainFamily::Evm) {
        result.fail(Error{ErrorCode::UnsupportedSigner,
                          "Для нативного протокола нужен EVM ключ"});
        return;
    }
    if (send_amount.is_zero()) {
        result.fail(Error{ErrorCode::InvalidAmount, "Сумма перевода равна нулю"});
        return;
    }

    const rpc::ChainNode* src_node = clients_.node_for(source);
    const rpc::ChainNode* dst_node = clients_.node_for(destination);
    if (!src_node || !dst_node) {
        result.fail(Error{ErrorCode::UnsupportedChain, "Нет клиента ноды для сети перевода"});
        return;
    }

    const std::string owner = signer.address();
    auto mint_recipient = hex::parse_address(recipient.value_or(owner));
    if (!mint_recipient) {
        result.fail(mint_recipient.error());
        return;
    }
    auto token = hex::parse_address(src.stablecoin_address);
    auto messenger = hex::parse_address(src.native_protocol->token_messenger);
    auto transmitter = hex::parse_address(dst.native_protocol->message_transmitter);
    if (!token || !messenger || !transmitter) {
        result.fail(Error{ErrorCode::ConfigInvalidValue, "Некорректный адрес контракта в реестре"});
        return;
    }

    auto gas = balances_.fetch_native_balance(source, owner);
    if (!gas) {
        result.fail(gas.error());
        return;
    }
    if (*gas < src.min_gas()) {
        result.fail(Error{
            ErrorCode::InsufficientGas,
            std::format("Недостаточно {} для газа в сети {}: {} < {}",
                        src.native_symbol, src.display_name,
                        gas->to_string(), src.min_gas().to_string())
        });
        return;
    }

    auto balance = balances_.fetch_stablecoin_balance(source, owner);
    if (!balance) {
        result.fail(balance.error());
        return;
    }
    if (*balance < send_amount) {
        result.fail(Error{
            ErrorCode::InsufficientBalance,
            std::format("Недостаточно {} в сети {}: {} < {}",
                        src.stablecoin_symbol, src.display_name,
                        balance->to_string(), send_amount.to_string())
        });
        return;
    }

    notify_progress(progress, {ProgressStage::Starting,
                               std::format("Перевод {} → {}", src.display_name, dst.display_name),
                               0, total});

    // =========================================================================
    // approve и burn
    // =========================================================================

    TxSender sender(*src_node, signer, src.chain_id, settings_.sender, settings_.clock);
    sender.on_broadcast([&result](const Hash256& hash) {
        result.tx_hashes.push_back(hex::encode(hash));
    });

    notify_progress(progress, {ProgressStage::Approving,
                               "Проверка разрешения на списание", 0, total});
    auto approval = sender.approve_if_needed(
        *token, *messenger, send_amount.raw, constants::GAS_PRICE_BOOST_PERCENT);
    if (!approval) {
        Error error = approval.error();
        if (error.code != ErrorCode::ApprovalFailed) {
            error = Error{ErrorCode::ApprovalFailed, std::format("approve: {}", error.message)};
        }
        result.fail(error);
        return;
    }

    notify_progress(progress, {ProgressStage::Burning,
                               std::format("Сжигание {} {}", send_amount.to_string(),
                                           src.stablecoin_symbol),
                               0, total});

    TxRequest burn;
    burn.to = *messenger;
    burn.data = evm::abi::encode_deposit_for_burn(
        send_amount.raw, *dst.native_domain, evm::abi::address_to_word(*mint_recipient), *token);
    burn.gas_limit = constants::GAS_LIMIT_BURN;
    burn.gas_price_percent = constants::GAS_PRICE_BOOST_PERCENT;
    burn.label = "burn";

    auto burn_hash = sender.send(burn);
    if (!burn_hash) {
        result.fail(burn_hash.error());
        return;
    }
    result.source_tx_hash = hex::encode(*burn_hash);

    auto burn_receipt = sender.wait_for_receipt(*burn_hash);
    if (!burn_receipt) {
        result.fail(burn_receipt.error());
        return;
    }
    if (!burn_receipt->success) {
        result.fail(Error{ErrorCode::TransactionReverted,
                          std::format("Burn отклонён сетью: {}", *result.source_tx_hash)});
        return;
    }
    logger.info(COMPONENT, std::format("Burn подтверждён: {}", *result.source_tx_hash));

    // Дальше перевод успешен: либо mint, либо ожидание аттестации
    result.success = true;
    result.amount_received = plan->output_amount;

    auto message = find_message_sent(*burn_receipt);
    if (!message) {
        logger.warning(COMPONENT, std::format("В {} нет события MessageSent, mint отложен",
                                              *result.source_tx_hash));
        return;
    }

    attest_and_mint(signer, dst, std::move(*message), progress, result);
}

void NativeProtocolExecutor::attest_and_mint(
    const crypto::Signer& signer,
    const chain::ChainConfig& destination,
    Bytes message,
    const ProgressCallback& progress,
    BridgeResult& result
) const {
    auto& logger = log::Logger::instance();
    const uint32_t total = estimated_total_seconds();
    const uint32_t max_wait = total - constants::BURN_PHASE_ESTIMATE_SEC;

    const Hash256 message_hash = crypto::keccak256(ByteSpan(message));
    logger.info(COMPONENT, std::format("Ожидание аттестации {}", hex::encode(message_hash)));

    notify_progress(progress, {ProgressStage::WaitingAttestation,
                               std::format("Ожидание аттестации ({})", format_remaining(max_wait)),
                               constants::BURN_PHASE_ESTIMATE_SEC, total});

    auto attestation = poll_until(
        settings_.attestation,
        settings_.clock,
        [&]() -> std::optional<Attestation> {
            auto response = attestations_.fetch(message_hash);
            if (!response) {
                logger.debug(COMPONENT, response.error().message);
                return std::nullopt;
            }
            return *response;
        },
        [&](uint32_t elapsed) {
            uint32_t remaining = elapsed < max_wait ? max_wait - elapsed : 0;
            notify_progress(progress, {ProgressStage::WaitingAttestation,
                                       std::format("Ожидание аттестации ({})",
                                                   format_remaining(remaining)),
                                       elapsed + constants::BURN_PHASE_ESTIMATE_SEC, total});
        }
    );

    if (!attestation) {
        logger.info(COMPONENT, "Аттестация ещё не готова, mint будет выполнен позже");
        return;
    }

    const rpc::ChainNode* node = clients_.node_for(destination.chain);
    auto transmitter = hex::parse_address(destination.native_protocol->message_transmitter);
    if (!node || !transmitter) {
        logger.warning(COMPONENT, std::format("Нет клиента ноды {}, mint будет выполнен позже",
                                              destination.display_name));
        return;
    }

    notify_progress(progress, {ProgressStage::Minting,
                               std::format("Mint в сети {}", destination.display_name),
                               max_wait, total});

    const Bytes& mint_message = attestation->message.empty() ? message : attestation->message;

    TxSender sender(*node, signer, destination.chain_id, settings_.sender, settings_.clock);
    sender.on_broadcast([&result](const Hash256& hash) {
        result.tx_hashes.push_back(hex::encode(hash));
    });

    TxRequest mint;
    mint.to = *transmitter;
    mint.data = evm::abi::encode_receive_message(mint_message, attestation->attestation);
    mint.gas_limit = constants::GAS_LIMIT_MINT;
    mint.gas_price_percent = constants::GAS_PRICE_BOOST_MINT_PERCENT;
    mint.label = "mint";

    // Ошибки отправки и ожидания mint оставляют перевод незавершённым:
    // burn подтверждён, mint можно повторить по аттестации
    auto mint_hash = sender.send(mint);
    if (!mint_hash) {
        logger.warning(COMPONENT, std::format("Mint не отправлен: {}", mint_hash.error().message));
        return;
    }

    auto receipt = sender.wait_for_receipt(*mint_hash);
    if (!receipt) {
        logger.warning(COMPONENT, std::format("Mint {} не подтверждён: {}",
                                              hex::encode(*mint_hash), receipt.error().message));
        return;
    }
    result.destination_tx_hash = hex::encode(*mint_hash);
    if (!receipt->success) {
        result.amount_received = core::TokenAmount::zero(destination.stablecoin_decimals);
        result.fail(Error{ErrorCode::TransactionReverted,
                          std::format("Mint отклонён сетью: {}", *result.destination_tx_hash)});
        return;
    }

    logger.info(COMPONENT, std::format("Mint подтверждён: {}", *result.destination_tx_hash));
    notify_progress(progress, {ProgressStage::Done, "Перевод завершён", total, total});
}

} // namespace stablebridge::bridge
