/**
 * @file uint256.hpp
 * @brief 256-битное беззнаковое целое число
 *
 * Тип для сумм в минимальных единицах токена (wei, 10^-6 USDC)
 * и для слов ABI. Поддерживает арифметику, нужную для масштабирования
 * сумм между разными точностями.
 */

#pragma once

#include "../types.hpp"

#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stablebridge::core {

/**
 * @brief 256-битное беззнаковое целое число
 *
 * Хранится как 4 limb по 64 бита, младший limb первым.
 * Сериализуется в big-endian (как в ABI и JSON-RPC).
 */
class uint256 {
public:
    /// @brief Размер в байтах
    static constexpr std::size_t SIZE = 32;

    /// @brief Конструктор по умолчанию (нулевое значение)
    constexpr uint256() noexcept : limbs_{} {}

    /// @brief Конструктор из 64-битного числа
    constexpr explicit uint256(uint64_t value) noexcept : limbs_{value, 0, 0, 0} {}

    // =========================================================================
    // Доступ к данным
    // =========================================================================

    /**
     * @brief Проверить, является ли нулём
     */
    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return (limbs_[0] | limbs_[1] | limbs_[2] | limbs_[3]) == 0;
    }

    /**
     * @brief Помещается ли значение в uint64_t
     */
    [[nodiscard]] constexpr bool fits_u64() const noexcept {
        return (limbs_[1] | limbs_[2] | limbs_[3]) == 0;
    }

    /**
     * @brief Младшие 64 бита
     */
    [[nodiscard]] constexpr uint64_t low_u64() const noexcept {
        return limbs_[0];
    }

    // =========================================================================
    // Сравнение
    // =========================================================================

    [[nodiscard]] constexpr std::strong_ordering operator<=>(
        const uint256& other
    ) const noexcept {
        for (std::size_t i = 4; i-- > 0;) {
            if (limbs_[i] < other.limbs_[i]) return std::strong_ordering::less;
            if (limbs_[i] > other.limbs_[i]) return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

    [[nodiscard]] constexpr bool operator==(const uint256& other) const noexcept {
        return limbs_ == other.limbs_;
    }

    // =========================================================================
    // Арифметика
    // =========================================================================

    /**
     * @brief Сложение по модулю 2^256
     */
    [[nodiscard]] uint256 operator+(const uint256& other) const noexcept;

    /**
     * @brief Вычитание по модулю 2^256
     *
     * Вызывающий сам проверяет, что *this >= other.
     */
    [[nodiscard]] uint256 operator-(const uint256& other) const noexcept;

    /**
     * @brief Умножение на 64-битное число
     *
     * @return std::nullopt при переполнении
     */
    [[nodiscard]] std::optional<uint256> checked_mul(uint64_t factor) const noexcept;

    /**
     * @brief Деление на 64-битное число с остатком
     *
     * @param divisor Делитель (не ноль)
     * @return Пара (частное, остаток)
     */
    [[nodiscard]] std::pair<uint256, uint64_t> divmod(uint64_t divisor) const noexcept;

    /**
     * @brief Умножить на percent/100 с усечением
     *
     * Используется для множителей цены газа и запаса к оценке газа.
     */
    [[nodiscard]] uint256 scale_percent(uint64_t percent) const noexcept;

    /**
     * @brief Приближённое значение в double
     *
     * Только для отображения и процентов комиссии.
     */
    [[nodiscard]] double to_double() const noexcept;

    // =========================================================================
    // Строковое и байтовое представление
    // =========================================================================

    /**
     * @brief Hex строка из 64 символов без префикса (big-endian)
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief JSON-RPC quantity: "0x" без ведущих нулей ("0x0" для нуля)
     */
    [[nodiscard]] std::string to_quantity() const;

    /**
     * @brief Десятичная строка
     */
    [[nodiscard]] std::string to_decimal() const;

    /**
     * @brief 32 байта big-endian (слово ABI)
     */
    [[nodiscard]] Hash256 to_be_bytes() const noexcept;

    /**
     * @brief Создать из big-endian байт (не более 32)
     */
    [[nodiscard]] static std::optional<uint256> from_be_bytes(ByteSpan bytes) noexcept;

    /**
     * @brief Создать из hex строки (с "0x" или без, до 64 символов)
     */
    [[nodiscard]] static std::optional<uint256> from_hex(std::string_view hex);

    /**
     * @brief Создать из десятичной строки
     */
    [[nodiscard]] static std::optional<uint256> from_decimal(std::string_view text);

    // =========================================================================
    // Статические константы
    // =========================================================================

    [[nodiscard]] static constexpr uint256 zero() noexcept {
        return uint256{};
    }

    /**
     * @brief Максимальное значение (2^256 - 1), безлимитный approve
     */
    [[nodiscard]] static constexpr uint256 max() noexcept {
        uint256 result;
        for (auto& limb : result.limbs_) {
            limb = ~uint64_t{0};
        }
        return result;
    }

    [[nodiscard]] static constexpr uint256 one() noexcept {
        return uint256{1ULL};
    }

    /**
     * @brief 10^exponent
     *
     * @return std::nullopt если exponent > 77
     */
    [[nodiscard]] static std::optional<uint256> pow10(unsigned exponent) noexcept;

private:
    std::array<uint64_t, 4> limbs_;
};

} // namespace stablebridge::core
