/**
 * @file secp256k1_signer.hpp
 * @brief EVM подписант на основе libsecp256k1
 *
 * Собирается только если libsecp256k1 найдена при сборке.
 */

#pragma once

#include "signer.hpp"

#include <memory>
#include <string_view>

namespace stablebridge::crypto {

/**
 * @brief Подписант EVM транзакций по сырому приватному ключу
 */
class Secp256k1Signer final : public Signer {
public:
    /**
     * @brief Создать подписант из hex приватного ключа
     *
     * @param private_key_hex 32 байта в hex (с "0x" или без)
     * @return InvalidKey если ключ некорректен
     */
    [[nodiscard]] static Result<std::unique_ptr<Secp256k1Signer>> from_private_key(
        std::string_view private_key_hex
    );

    ~Secp256k1Signer() override;

    Secp256k1Signer(const Secp256k1Signer&) = delete;
    Secp256k1Signer& operator=(const Secp256k1Signer&) = delete;

    [[nodiscard]] chain::ChainFamily family() const noexcept override {
        return chain::ChainFamily::Evm;
    }

    [[nodiscard]] std::string address() const override;

    [[nodiscard]] Result<Bytes> sign_transaction(const evm::Transaction& tx) const override;

private:
    struct Impl;
    explicit Secp256k1Signer(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace stablebridge::crypto
