/**
 * @file rlp.hpp
 * @brief Recursive Length Prefix сериализация
 *
 * Используется только для подписи и отправки legacy транзакций,
 * поэтому поддерживается лишь запись.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/uint256.hpp"

#include <cstdint>
#include <vector>

namespace stablebridge::evm::rlp {

/**
 * @brief Поток записи RLP списка
 *
 * Элементы накапливаются в payload, а финальный префикс списка
 * добавляется в finish().
 *
 * Пример использования:
 * @code
 * RlpWriter writer;
 * writer.write_u64(nonce);
 * writer.write_uint(gas_price);
 * writer.write_bytes(data);
 * Bytes encoded = writer.finish();
 * @endcode
 */
class RlpWriter {
public:
    RlpWriter() = default;

    // =========================================================================
    // Запись элементов списка
    // =========================================================================

    /**
     * @brief Записать строку байт
     */
    void write_bytes(ByteSpan data);

    /**
     * @brief Записать целое без ведущих нулей (0 кодируется как 0x80)
     */
    void write_u64(uint64_t value);

    /**
     * @brief Записать 256-битное целое без ведущих нулей
     */
    void write_uint(const core::uint256& value);

    /**
     * @brief Записать уже закодированный RLP элемент как есть
     */
    void write_raw(ByteSpan encoded);

    // =========================================================================
    // Результат
    // =========================================================================

    /**
     * @brief Закодированный список из записанных элементов
     */
    [[nodiscard]] Bytes finish() const;

    /**
     * @brief Размер payload без префикса списка
     */
    [[nodiscard]] std::size_t payload_size() const noexcept { return payload_.size(); }

private:
    Bytes payload_;
};

/**
 * @brief Закодировать одну строку байт
 */
[[nodiscard]] Bytes encode_bytes(ByteSpan data);

/**
 * @brief Закодировать целое (big-endian без ведущих нулей)
 */
[[nodiscard]] Bytes encode_uint(const core::uint256& value);

/**
 * @brief Обернуть готовый payload префиксом списка
 */
[[nodiscard]] Bytes encode_list_payload(ByteSpan payload);

} // namespace stablebridge::evm::rlp
