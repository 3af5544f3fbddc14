/**
 * @file fake_signer.hpp
 * @brief Подписант без криптографии для тестов
 */

#pragma once

#include "crypto/signer.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stablebridge::tests {

/// @brief Адрес тестового ключа
inline constexpr std::string_view TEST_ADDRESS = "0x1111111111111111111111111111111111111111";

/**
 * @brief Возвращает RLP без подписи и запоминает транзакции
 */
class FakeSigner final : public crypto::Signer {
public:
    explicit FakeSigner(chain::ChainFamily family = chain::ChainFamily::Evm,
                        std::string address = std::string(TEST_ADDRESS))
        : family_(family), address_(std::move(address)) {}

    [[nodiscard]] chain::ChainFamily family() const noexcept override { return family_; }

    [[nodiscard]] std::string address() const override { return address_; }

    [[nodiscard]] Result<Bytes> sign_transaction(const evm::Transaction& tx) const override {
        std::lock_guard lock(mutex_);
        signed_.push_back(tx);
        return tx.signing_payload();
    }

    [[nodiscard]] std::vector<evm::Transaction> signed_transactions() const {
        std::lock_guard lock(mutex_);
        return signed_;
    }

private:
    chain::ChainFamily family_;
    std::string address_;
    mutable std::mutex mutex_;
    mutable std::vector<evm::Transaction> signed_;
};

} // namespace stablebridge::tests
