/**
 * @file secp256k1_signer.cpp
 * @brief Реализация подписи через libsecp256k1
 */

#include "secp256k1_signer.hpp"
#include "keccak.hpp"
#include "../core/hex.hpp"

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>

namespace stablebridge::crypto {

// =============================================================================
// Secp256k1Signer::Impl
// =============================================================================

struct Secp256k1Signer::Impl {
    secp256k1_context* context{nullptr};
    std::array<uint8_t, 32> secret{};
    Address address{};

    Impl() {
        context = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    }

    ~Impl() {
        // Ключ не должен остаться в освобождённой памяти
        std::fill(secret.begin(), secret.end(), 0);
        if (context) {
            secp256k1_context_destroy(context);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    /**
     * @brief Вычислить EVM адрес: последние 20 байт keccak256(pubkey[1..65])
     */
    Result<void> derive_address() {
        secp256k1_pubkey pubkey;
        if (secp256k1_ec_pubkey_create(context, &pubkey, secret.data()) != 1) {
            return std::unexpected(Error{ErrorCode::InvalidKey, "Не удалось вычислить публичный ключ"});
        }

        std::array<uint8_t, 65> serialized{};
        std::size_t length = serialized.size();
        secp256k1_ec_pubkey_serialize(
            context, serialized.data(), &length, &pubkey, SECP256K1_EC_UNCOMPRESSED
        );

        Hash256 digest = keccak256(ByteSpan{serialized.data() + 1, 64});
        std::copy(digest.end() - 20, digest.end(), address.begin());
        return {};
    }
};

// =============================================================================
// Secp256k1Signer
// =============================================================================

Secp256k1Signer::Secp256k1Signer(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Secp256k1Signer::~Secp256k1Signer() = default;

Result<std::unique_ptr<Secp256k1Signer>> Secp256k1Signer::from_private_key(
    std::string_view private_key_hex
) {
    auto bytes = hex::decode(private_key_hex);
    if (!bytes || bytes->size() != 32) {
        return Err<std::unique_ptr<Secp256k1Signer>>(
            ErrorCode::InvalidKey, "Приватный ключ должен быть 32 байта в hex"
        );
    }

    auto impl = std::make_unique<Impl>();
    if (!impl->context) {
        return Err<std::unique_ptr<Secp256k1Signer>>(
            ErrorCode::SigningFailed, "Не удалось создать контекст secp256k1"
        );
    }
    std::copy(bytes->begin(), bytes->end(), impl->secret.begin());
    std::fill(bytes->begin(), bytes->end(), 0);

    if (secp256k1_ec_seckey_verify(impl->context, impl->secret.data()) != 1) {
        return Err<std::unique_ptr<Secp256k1Signer>>(ErrorCode::InvalidKey);
    }
    if (auto derived = impl->derive_address(); !derived) {
        return std::unexpected(derived.error());
    }

    return std::unique_ptr<Secp256k1Signer>(new Secp256k1Signer(std::move(impl)));
}

std::string Secp256k1Signer::address() const {
    return hex::address_to_string(impl_->address);
}

Result<Bytes> Secp256k1Signer::sign_transaction(const evm::Transaction& tx) const {
    Hash256 digest = tx.signing_hash();

    secp256k1_ecdsa_recoverable_signature signature;
    if (secp256k1_ecdsa_sign_recoverable(
            impl_->context, &signature, digest.data(), impl_->secret.data(),
            secp256k1_nonce_function_rfc6979, nullptr) != 1) {
        return Err<Bytes>(ErrorCode::SigningFailed);
    }

    std::array<uint8_t, 64> compact{};
    int recovery_id = 0;
    if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
            impl_->context, compact.data(), &recovery_id, &signature) != 1) {
        return Err<Bytes>(ErrorCode::SigningFailed, "Не удалось сериализовать подпись");
    }

    evm::Signature sig;
    sig.r = *core::uint256::from_be_bytes(ByteSpan{compact.data(), 32});
    sig.s = *core::uint256::from_be_bytes(ByteSpan{compact.data() + 32, 32});
    sig.recovery_id = static_cast<uint8_t>(recovery_id);

    return tx.encode_signed(sig);
}

} // namespace stablebridge::crypto
