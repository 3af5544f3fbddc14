/**
 * @file tx_sender.hpp
 * @brief Сборка, подпись, отправка и подтверждение транзакций
 *
 * Общий путь транзакции для всех исполнителей:
 * цена газа → лимит газа → nonce → подпись → отправка → receipt.
 */

#pragma once

#include "poll_until.hpp"
#include "../crypto/signer.hpp"
#include "../rpc/chain_node.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stablebridge::bridge {

/**
 * @brief Запрос на отправку транзакции
 */
struct TxRequest {
    Address to{};
    Bytes data;
    core::uint256 value;

    /// @brief Явный лимит газа; без него используется оценка
    std::optional<uint64_t> gas_limit;

    /// @brief Множитель текущей цены газа (проценты)
    uint64_t gas_price_percent{100};

    /// @brief Имя для логов ("approve", "burn", ...)
    std::string label{"tx"};
};

/**
 * @brief Параметры отправки и ожидания
 */
struct SenderPolicy {
    /// @brief Максимум попыток отправки
    uint32_t broadcast_attempts{3};

    /// @brief Базовая пауза между попытками (растёт линейно)
    std::chrono::milliseconds broadcast_backoff{std::chrono::milliseconds(1000)};

    /// @brief Ожидание receipt
    PollPolicy receipt{std::chrono::seconds(2), std::chrono::seconds(120)};
};

/**
 * @brief Параметры исполнителей: отправка, ожидание аттестации, часы
 */
struct ExecutionSettings {
    SenderPolicy sender;
    PollPolicy attestation;
    PollClock clock{PollClock::system()};
};

/**
 * @brief Отправитель транзакций в одну EVM сеть от имени одного ключа
 *
 * Не владеет нодой и ключом: оба должны жить дольше отправителя.
 */
class TxSender {
public:
    TxSender(const rpc::ChainNode& node,
             const crypto::Signer& signer,
             uint64_t chain_id,
             SenderPolicy policy = {},
             PollClock clock = PollClock::system());

    /**
     * @brief Собрать, подписать и отправить транзакцию
     *
     * Nonce запрашивается заново перед каждой попыткой.
     * Не повторяются: конфликт nonce, "already known",
     * замена с недостаточной ценой.
     *
     * @return Хеш транзакции или BroadcastFailed / SigningFailed
     */
    [[nodiscard]] Result<Hash256> send(const TxRequest& request) const;

    /**
     * @brief Дождаться receipt
     *
     * @return Receipt (в том числе с success=false) или ReceiptTimeout
     */
    [[nodiscard]] Result<rpc::TxReceipt> wait_for_receipt(const Hash256& tx_hash) const;

    /**
     * @brief Выдать разрешение spender на списание token, если текущего мало
     *
     * Разрешение выдаётся на 2^256-1 и подтверждается receipt.
     *
     * @return Хеш approve, std::nullopt если разрешения достаточно,
     *         ApprovalFailed если approve отклонён сетью
     */
    [[nodiscard]] Result<std::optional<Hash256>> approve_if_needed(
        const Address& token,
        const Address& spender,
        const core::uint256& amount,
        uint64_t gas_price_percent
    ) const;

    /**
     * @brief Лимит газа: явный, оценка с запасом 20% или 500 000
     */
    [[nodiscard]] uint64_t resolve_gas_limit(const TxRequest& request, const Address& from) const;

    /**
     * @brief Адрес ключа
     */
    [[nodiscard]] Result<Address> from_address() const;

    /**
     * @brief Вызывать callback для каждой принятой нодой транзакции
     *
     * Так исполнитель получает хеши даже тех транзакций,
     * после которых операция завершилась ошибкой.
     */
    void on_broadcast(std::function<void(const Hash256&)> callback) {
        on_broadcast_ = std::move(callback);
    }

private:
    const rpc::ChainNode& node_;
    const crypto::Signer& signer_;
    uint64_t chain_id_;
    SenderPolicy policy_;
    PollClock clock_;
    std::function<void(const Hash256&)> on_broadcast_;
};

/**
 * @brief Можно ли повторить отправку после такой ошибки ноды
 */
[[nodiscard]] bool is_retryable_broadcast_error(std::string_view message) noexcept;

} // namespace stablebridge::bridge
