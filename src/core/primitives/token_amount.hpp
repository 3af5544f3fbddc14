/**
 * @file token_amount.hpp
 * @brief Точная десятичная сумма токена
 *
 * Значение равно raw / 10^decimals. Парсинг и форматирование
 * выполняются без плавающей точки, поэтому 6-значный USDC и
 * 18-значный USDC на bsc представляются одинаково точно.
 */

#pragma once

#include "uint256.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace stablebridge::core {

/**
 * @brief Сумма токена с явной точностью
 */
struct TokenAmount {
    /// @brief Значение в минимальных единицах
    uint256 raw;

    /// @brief Количество знаков после запятой
    uint8_t decimals{0};

    /// @brief Максимальная поддерживаемая точность
    static constexpr uint8_t MAX_DECIMALS = 36;

    /**
     * @brief Разобрать десятичную строку ("12", "12.5", ".5")
     *
     * Лишние знаки после запятой отбрасываются (усечение к нулю).
     * Знак, экспонента и пустая строка отклоняются с InvalidAmount.
     *
     * @param text Десятичная строка
     * @param decimals Точность результата
     */
    [[nodiscard]] static Result<TokenAmount> parse(std::string_view text, uint8_t decimals);

    /**
     * @brief Создать из минимальных единиц
     */
    [[nodiscard]] static TokenAmount from_raw(uint256 raw, uint8_t decimals) noexcept {
        return TokenAmount{raw, decimals};
    }

    /**
     * @brief Нулевая сумма заданной точности
     */
    [[nodiscard]] static TokenAmount zero(uint8_t decimals) noexcept {
        return TokenAmount{uint256::zero(), decimals};
    }

    /**
     * @brief Привести к другой точности
     *
     * Уменьшение точности усекает к нулю, увеличение точно
     * (при переполнении насыщается до максимума).
     */
    [[nodiscard]] TokenAmount rescale(uint8_t new_decimals) const noexcept;

    /**
     * @brief Разность в точности *this, не меньше нуля
     */
    [[nodiscard]] TokenAmount saturating_sub(const TokenAmount& other) const noexcept;

    /**
     * @brief Сумма в точности *this
     */
    [[nodiscard]] TokenAmount operator+(const TokenAmount& other) const noexcept;

    [[nodiscard]] bool is_zero() const noexcept { return raw.is_zero(); }

    /**
     * @brief Десятичная строка без лишних нулей ("1.5", "0", "1000")
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Десятичная строка с фиксированным числом знаков (усечение)
     */
    [[nodiscard]] std::string to_string(uint8_t places) const;

    /**
     * @brief Приближённое значение (только для отображения)
     */
    [[nodiscard]] double to_double() const noexcept;

    /**
     * @brief Точное сравнение значений с разной точностью
     */
    [[nodiscard]] std::strong_ordering operator<=>(const TokenAmount& other) const noexcept;

    [[nodiscard]] bool operator==(const TokenAmount& other) const noexcept {
        return (*this <=> other) == std::strong_ordering::equal;
    }
};

} // namespace stablebridge::core
