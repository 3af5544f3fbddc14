/**
 * @file signer.hpp
 * @brief Интерфейс ключа, которым подписываются транзакции
 *
 * Ключ передаётся в каждый вызов и нигде не сохраняется.
 * Хранение и загрузка ключей вне этой библиотеки.
 */

#pragma once

#include "../core/types.hpp"
#include "../chain/chain.hpp"
#include "../evm/transaction.hpp"

#include <string>

namespace stablebridge::crypto {

/**
 * @brief Абстрактный подписант
 */
class Signer {
public:
    virtual ~Signer() = default;

    /**
     * @brief Семейство сетей, для которых подходит ключ
     */
    [[nodiscard]] virtual chain::ChainFamily family() const noexcept = 0;

    /**
     * @brief Адрес в текстовом виде (0x... для EVM)
     */
    [[nodiscard]] virtual std::string address() const = 0;

    /**
     * @brief Подписать legacy транзакцию
     *
     * @return Сырая подписанная транзакция для eth_sendRawTransaction
     */
    [[nodiscard]] virtual Result<Bytes> sign_transaction(const evm::Transaction& tx) const = 0;
};

} // namespace stablebridge::crypto
