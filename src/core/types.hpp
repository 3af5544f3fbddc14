/**
 * @file types.hpp
 * @brief Базовые типы для stablebridge
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (keccak256, tx hash, message hash)
 * - Address: 20-байтный EVM адрес
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stablebridge {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - keccak256 хешей
 * - Хешей транзакций
 * - Ключа поиска аттестации (хеш сообщения)
 *
 * Хранится в big-endian формате (как в Ethereum JSON-RPC).
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief EVM адрес (20 байт)
 */
using Address = std::array<uint8_t, 20>;

/**
 * @brief Динамический массив байт
 *
 * Calldata, подписанные транзакции, сообщения и аттестации.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок stablebridge
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Ошибки передаются как значения (Result<T>), а не исключениями.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки сети (200-299)
    NetworkConnectionFailed = 200,
    NetworkTimeout = 201,

    // Ошибки RPC (300-399)
    RpcConnectionFailed = 300,
    RpcAuthFailed = 301,
    RpcParseError = 302,
    RpcMethodNotFound = 303,
    RpcInvalidParams = 304,
    RpcInternalError = 305,
    RpcTimeout = 306,

    // Ошибки бриджинга (600-699)
    UnsupportedChain = 600,
    InvalidRoute = 601,
    InsufficientGas = 602,
    InsufficientBalance = 603,
    QuoteFailed = 604,
    ApprovalFailed = 605,
    TransactionReverted = 606,
    BroadcastFailed = 607,
    ReceiptTimeout = 608,
    AttestationTimeout = 609,
    InvalidAmount = 610,
    InvalidAddress = 611,
    UnsupportedSigner = 612,
    UnknownFailure = 699,

    // Криптографические ошибки (700-799)
    CryptoInvalidLength = 700,
    SigningFailed = 701,
    InvalidKey = 702,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NetworkConnectionFailed: return "Ошибка подключения к сети";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::RpcConnectionFailed: return "Ошибка подключения к RPC";
        case ErrorCode::RpcAuthFailed: return "Ошибка авторизации RPC";
        case ErrorCode::RpcParseError: return "Ошибка парсинга ответа RPC";
        case ErrorCode::RpcMethodNotFound: return "RPC метод не найден";
        case ErrorCode::RpcInvalidParams: return "Некорректные параметры RPC";
        case ErrorCode::RpcInternalError: return "Внутренняя ошибка RPC";
        case ErrorCode::RpcTimeout: return "Таймаут RPC";
        case ErrorCode::UnsupportedChain: return "Сеть не поддерживается";
        case ErrorCode::InvalidRoute: return "Маршрут недоступен";
        case ErrorCode::InsufficientGas: return "Недостаточно нативного токена для газа";
        case ErrorCode::InsufficientBalance: return "Недостаточный баланс";
        case ErrorCode::QuoteFailed: return "Не удалось получить котировку";
        case ErrorCode::ApprovalFailed: return "Ошибка approve";
        case ErrorCode::TransactionReverted: return "Транзакция отклонена в сети";
        case ErrorCode::BroadcastFailed: return "Ошибка отправки транзакции";
        case ErrorCode::ReceiptTimeout: return "Подтверждение транзакции не получено";
        case ErrorCode::AttestationTimeout: return "Аттестация ещё не готова";
        case ErrorCode::InvalidAmount: return "Некорректная сумма";
        case ErrorCode::InvalidAddress: return "Некорректный адрес";
        case ErrorCode::UnsupportedSigner: return "Ключ не подходит для этой сети";
        case ErrorCode::UnknownFailure: return "Неизвестная ошибка";
        case ErrorCode::CryptoInvalidLength: return "Некорректная длина данных";
        case ErrorCode::SigningFailed: return "Ошибка подписи транзакции";
        case ErrorCode::InvalidKey: return "Некорректный приватный ключ";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * Result<TokenAmount> parsed = TokenAmount::parse("12.5", 6);
 * if (!parsed) {
 *     std::cerr << parsed.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать успешный результат
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace stablebridge
