/**
 * @file keccak.hpp
 * @brief Keccak-256 (вариант Ethereum)
 *
 * Используется для:
 * - Хеша подписываемой транзакции и её идентификатора
 * - Ключа поиска аттестации (хеш сообщения MessageSent)
 * - Селекторов функций и топиков событий
 *
 * @note Это оригинальный Keccak с padding 0x01, а не SHA3-256 (0x06).
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace stablebridge::crypto {

/**
 * @brief Состояние Keccak-f[1600] (25 x 64-bit слов)
 */
using KeccakState = std::array<uint64_t, 25>;

/**
 * @brief Перестановка Keccak-f[1600] (24 раунда)
 */
void keccak_f1600(KeccakState& state) noexcept;

/**
 * @brief Потоковый хешер Keccak-256
 *
 * Пример использования:
 * @code
 * Keccak256 hasher;
 * hasher.update(header);
 * hasher.update(payload);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Keccak256 {
public:
    /// @brief Размер блока поглощения (rate) в байтах
    static constexpr std::size_t RATE = 136;

    Keccak256() noexcept = default;

    /**
     * @brief Добавить данные
     */
    void update(ByteSpan data) noexcept;

    /**
     * @brief Завершить и получить хеш
     *
     * После вызова объект нельзя использовать повторно без reset().
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить состояние
     */
    void reset() noexcept;

private:
    void absorb_block() noexcept;

    KeccakState state_{};
    std::array<uint8_t, RATE> buffer_{};
    std::size_t buffer_len_{0};
};

/**
 * @brief Keccak-256 от произвольных данных
 */
[[nodiscard]] Hash256 keccak256(ByteSpan data) noexcept;

/**
 * @brief Keccak-256 от строки (сигнатуры функций и событий)
 */
[[nodiscard]] Hash256 keccak256(std::string_view text) noexcept;

/**
 * @brief Селектор функции: первые 4 байта keccak256 сигнатуры
 *
 * @param signature Например "balanceOf(address)"
 */
[[nodiscard]] std::array<uint8_t, 4> function_selector(std::string_view signature) noexcept;

} // namespace stablebridge::crypto
