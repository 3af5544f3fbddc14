/**
 * @file tx_sender.cpp
 * @brief Реализация отправителя транзакций
 */

#include "tx_sender.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../evm/abi.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace stablebridge::bridge {

namespace {

constexpr std::string_view COMPONENT = "TxSender";

/// @brief Ответы ноды, после которых повтор бесполезен
constexpr std::array<std::string_view, 4> NON_RETRYABLE = {
    "nonce too low",
    "already known",
    "replacement transaction underpriced",
    "insufficient funds",
};

bool contains_ignore_case(std::string_view haystack, std::string_view needle) noexcept {
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a))
                == std::tolower(static_cast<unsigned char>(b));
        }
    );
    return it != haystack.end();
}

} // anonymous namespace

bool is_retryable_broadcast_error(std::string_view message) noexcept {
    for (std::string_view marker : NON_RETRYABLE) {
        if (contains_ignore_case(message, marker)) {
            return false;
        }
    }
    return true;
}

TxSender::TxSender(
    const rpc::ChainNode& node,
    const crypto::Signer& signer,
    uint64_t chain_id,
    SenderPolicy policy,
    PollClock clock
) : node_(node),
    signer_(signer),
    chain_id_(chain_id),
    policy_(std::move(policy)),
    clock_(std::move(clock)) {}

Result<Address> TxSender::from_address() const {
    return hex::parse_address(signer_.address());
}

uint64_t TxSender::resolve_gas_limit(const TxRequest& request, const Address& from) const {
    if (request.gas_limit) {
        return *request.gas_limit;
    }

    rpc::CallRequest call{from, request.to, request.data, request.value};
    auto estimate = node_.estimate_gas(call);
    if (!estimate) {
        log::Logger::instance().warning(
            COMPONENT,
            std::format("Оценка газа для {} не удалась ({}), лимит {}",
                        request.label, estimate.error().message,
                        constants::GAS_LIMIT_FALLBACK)
        );
        return constants::GAS_LIMIT_FALLBACK;
    }
    return *estimate * constants::GAS_ESTIMATE_MARGIN_PERCENT / 100;
}

// =============================================================================
// Отправка
// =============================================================================

Result<Hash256> TxSender::send(const TxRequest& request) const {
    auto& logger = log::Logger::instance();

    auto from = from_address();
    if (!from) {
        return std::unexpected(from.error());
    }

    auto price = node_.gas_price();
    if (!price) {
        return std::unexpected(price.error());
    }

    evm::Transaction tx;
    tx.gas_price = price->scale_percent(request.gas_price_percent);
    tx.gas_limit = resolve_gas_limit(request, *from);
    tx.to = request.to;
    tx.value = request.value;
    tx.data = request.data;
    tx.chain_id = chain_id_;

    const uint32_t attempts = std::max<uint32_t>(policy_.broadcast_attempts, 1);
    Error last_error{ErrorCode::BroadcastFailed};

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto nonce = node_.get_transaction_count(*from);
        if (!nonce) {
            last_error = Error{ErrorCode::BroadcastFailed,
                               std::format("nonce: {}", nonce.error().message)};
        } else {
            tx.nonce = *nonce;

            auto signed_tx = signer_.sign_transaction(tx);
            if (!signed_tx) {
                return std::unexpected(signed_tx.error());
            }

            auto hash = node_.send_raw_transaction(*signed_tx);
            if (hash) {
                logger.info(COMPONENT, std::format("{} отправлена: {} (nonce {}, газ {})",
                                                   request.label, hex::encode(*hash),
                                                   tx.nonce, tx.gas_limit));
                if (on_broadcast_) {
                    on_broadcast_(*hash);
                }
                return *hash;
            }

            last_error = Error{ErrorCode::BroadcastFailed, hash.error().message};
            if (!is_retryable_broadcast_error(hash.error().message)) {
                logger.error(COMPONENT, std::format("{}: {}", request.label, hash.error().message));
                return std::unexpected(last_error);
            }
        }

        logger.warning(COMPONENT, std::format("{}: попытка {}/{} не удалась: {}",
                                              request.label, attempt, attempts,
                                              last_error.message));
        if (attempt < attempts) {
            clock_.sleep(policy_.broadcast_backoff * attempt);
        }
    }

    return std::unexpected(last_error);
}

Result<rpc::TxReceipt> TxSender::wait_for_receipt(const Hash256& tx_hash) const {
    auto receipt = poll_until(policy_.receipt, clock_, [&]() -> std::optional<rpc::TxReceipt> {
        auto result = node_.get_transaction_receipt(tx_hash);
        if (!result) {
            log::Logger::instance().debug(COMPONENT, result.error().message);
            return std::nullopt;
        }
        return *result;
    });

    if (!receipt) {
        return Err<rpc::TxReceipt>(
            ErrorCode::ReceiptTimeout,
            std::format("Нет receipt для {}", hex::encode(tx_hash))
        );
    }
    return *receipt;
}

// =============================================================================
// Разрешение на списание
// =============================================================================

Result<std::optional<Hash256>> TxSender::approve_if_needed(
    const Address& token,
    const Address& spender,
    const core::uint256& amount,
    uint64_t gas_price_percent
) const {
    auto owner = from_address();
    if (!owner) {
        return std::unexpected(owner.error());
    }

    auto data = node_.call(token, evm::abi::encode_allowance(*owner, spender));
    if (!data) {
        return std::unexpected(data.error());
    }
    auto allowance = evm::abi::decode_uint256(*data);
    if (!allowance) {
        return std::unexpected(allowance.error());
    }
    if (*allowance >= amount) {
        return std::optional<Hash256>{};
    }

    TxRequest request;
    request.to = token;
    request.data = evm::abi::encode_approve(spender, core::uint256::max());
    request.gas_limit = constants::GAS_LIMIT_APPROVE;
    request.gas_price_percent = gas_price_percent;
    request.label = "approve";

    auto hash = send(request);
    if (!hash) {
        return std::unexpected(hash.error());
    }

    auto receipt = wait_for_receipt(*hash);
    if (!receipt) {
        return std::unexpected(receipt.error());
    }
    if (!receipt->success) {
        return Err<std::optional<Hash256>>(
            ErrorCode::ApprovalFailed,
            std::format("approve отклонён: {}", hex::encode(*hash))
        );
    }
    return std::optional<Hash256>{*hash};
}

} // namespace stablebridge::bridge
