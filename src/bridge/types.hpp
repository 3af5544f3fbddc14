/**
 * @file types.hpp
 * @brief Типы операций бриджа: котировки, результаты, прогресс
 */

#pragma once

#include "../chain/chain.hpp"
#include "../core/primitives/token_amount.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stablebridge::bridge {

// =============================================================================
// Механизмы перевода
// =============================================================================

/**
 * @brief Механизм, которым выполняется перевод
 */
enum class Backend {
    NativeProtocol,     ///< burn → аттестация → mint
    FastRelay,          ///< Агрегатор relay-ликвидности
    GeneralAggregator,  ///< Общий bridge/DEX агрегатор
};

[[nodiscard]] constexpr std::string_view to_string(Backend backend) noexcept {
    switch (backend) {
        case Backend::NativeProtocol:    return "native_protocol";
        case Backend::FastRelay:         return "fast_relay";
        case Backend::GeneralAggregator: return "general_aggregator";
        default: return "unknown";
    }
}

// =============================================================================
// Котировка
// =============================================================================

/**
 * @brief Шаблон транзакции от агрегатора
 */
struct TxTemplate {
    std::string to;
    Bytes data;
    core::uint256 value;
    uint64_t chain_id{0};

    /// @brief Лимит газа, если агрегатор его указал
    std::optional<uint64_t> gas_limit;
};

/**
 * @brief План нативного протокола (параметры burn вычисляются при исполнении)
 */
struct NativeProtocolPlan {
    uint32_t source_domain{0};
    uint32_t destination_domain{0};
};

/**
 * @brief Шаг плана fast relay
 */
struct RelayStep {
    std::string id;     ///< "approve", "deposit", ...
    std::string kind;   ///< Поддерживается только "transaction"
    std::vector<TxTemplate> items;
};

/**
 * @brief Многошаговый план fast relay
 */
struct RelayPlan {
    std::vector<RelayStep> steps;
};

/**
 * @brief План общего агрегатора: одна транзакция и, возможно, approve
 */
struct AggregatorPlan {
    TxTemplate transaction;

    /// @brief Кому выдать разрешение на списание токена
    std::optional<std::string> approval_address;

    /// @brief Списываемый токен; отсутствует для нативного
    std::optional<std::string> from_token;

    /// @brief Списываемая сумма в минимальных единицах
    core::uint256 from_amount;
};

/**
 * @brief Полезная нагрузка котировки
 */
using QuotePayload = std::variant<NativeProtocolPlan, RelayPlan, AggregatorPlan>;

/**
 * @brief Котировка перевода
 *
 * Действительна только для одного вызова, не кешируется.
 */
struct Quote {
    chain::Chain source{chain::Chain::Ethereum};
    chain::Chain destination{chain::Chain::Ethereum};

    core::TokenAmount input_amount;

    /// @brief Ожидаемая сумма в точности актива назначения
    core::TokenAmount output_amount;

    core::TokenAmount fee_amount;
    double fee_percent{0.0};
    uint32_t estimated_seconds{0};

    /// @brief Название инструмента ("CCTP", "Relay", "stargate", ...)
    std::string tool;

    QuotePayload payload;

    /**
     * @brief Механизм, которому принадлежит план
     */
    [[nodiscard]] Backend backend() const noexcept {
        if (std::holds_alternative<NativeProtocolPlan>(payload)) return Backend::NativeProtocol;
        if (std::holds_alternative<RelayPlan>(payload)) return Backend::FastRelay;
        return Backend::GeneralAggregator;
    }
};

// =============================================================================
// Результат
// =============================================================================

/**
 * @brief Результат перевода или обмена
 *
 * После первой отправленной транзакции все полученные хеши
 * сохраняются, даже если операция завершилась ошибкой.
 */
struct BridgeResult {
    bool success{false};
    Backend backend{Backend::NativeProtocol};
    chain::Chain source{chain::Chain::Ethereum};
    chain::Chain destination{chain::Chain::Ethereum};

    core::TokenAmount amount_sent;
    core::TokenAmount amount_received;

    /// @brief Основная транзакция на сети источника (burn или deposit)
    std::optional<std::string> source_tx_hash;

    /// @brief Транзакция mint на сети назначения
    std::optional<std::string> destination_tx_hash;

    /// @brief Все отправленные транзакции по порядку, включая approve
    std::vector<std::string> tx_hashes;

    std::optional<ErrorCode> error_code;
    std::string error_message;

    /**
     * @brief Burn выполнен, mint ещё не сделан (аттестация не готова)
     */
    [[nodiscard]] bool is_pending() const noexcept {
        return success && backend == Backend::NativeProtocol
            && source_tx_hash.has_value() && !destination_tx_hash.has_value();
    }

    /**
     * @brief Записать ошибку
     */
    void fail(const Error& error) {
        success = false;
        error_code = error.code;
        error_message = error.message;
    }
};

// =============================================================================
// Прогресс
// =============================================================================

/**
 * @brief Этап операции
 */
enum class ProgressStage {
    Starting,
    Approving,
    Burning,
    WaitingAttestation,
    Minting,
    Quoting,
    Executing,
    Done,
};

[[nodiscard]] constexpr std::string_view to_string(ProgressStage stage) noexcept {
    switch (stage) {
        case ProgressStage::Starting:           return "starting";
        case ProgressStage::Approving:          return "approving";
        case ProgressStage::Burning:            return "burning";
        case ProgressStage::WaitingAttestation: return "waiting_attestation";
        case ProgressStage::Minting:            return "minting";
        case ProgressStage::Quoting:            return "quoting";
        case ProgressStage::Executing:          return "executing";
        case ProgressStage::Done:               return "done";
        default: return "unknown";
    }
}

/**
 * @brief Событие прогресса
 */
struct ProgressEvent {
    ProgressStage stage{ProgressStage::Starting};
    std::string message;
    uint32_t elapsed_seconds{0};
    uint32_t estimated_total_seconds{0};
};

/**
 * @brief Callback прогресса (синхронный)
 */
using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Вызвать callback прогресса
 *
 * Исключение из callback логируется и не прерывает операцию.
 */
void notify_progress(const ProgressCallback& callback, ProgressEvent event);

} // namespace stablebridge::bridge
