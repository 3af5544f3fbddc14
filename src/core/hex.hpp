/**
 * @file hex.hpp
 * @brief Hex кодирование байт и EVM адресов
 *
 * JSON-RPC, ABI calldata и ответы агрегаторов передают байты
 * как hex строки с префиксом "0x".
 */

#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace stablebridge::hex {

/**
 * @brief Закодировать байты в hex
 *
 * @param data Данные
 * @param with_prefix Добавить префикс "0x"
 * @return std::string Строка в нижнем регистре
 */
[[nodiscard]] std::string encode(ByteSpan data, bool with_prefix = true);

/**
 * @brief Декодировать hex строку
 *
 * Принимает строку с префиксом "0x" или без. Пустая строка и "0x"
 * дают пустой массив.
 *
 * @return std::nullopt при нечётной длине или недопустимом символе
 */
[[nodiscard]] std::optional<Bytes> decode(std::string_view text);

/**
 * @brief Разобрать EVM адрес (ровно 20 байт)
 */
[[nodiscard]] Result<Address> parse_address(std::string_view text);

/**
 * @brief Адрес в hex с префиксом "0x" (нижний регистр)
 */
[[nodiscard]] std::string address_to_string(const Address& address);

/**
 * @brief Разобрать 32-байтный хеш
 */
[[nodiscard]] Result<Hash256> parse_hash(std::string_view text);

/**
 * @brief Проверить, что строка похожа на EVM адрес
 */
[[nodiscard]] bool is_evm_address(std::string_view text) noexcept;

/**
 * @brief Сравнить адреса без учёта регистра (checksum и lowercase равны)
 */
[[nodiscard]] bool same_address(std::string_view a, std::string_view b) noexcept;

} // namespace stablebridge::hex
