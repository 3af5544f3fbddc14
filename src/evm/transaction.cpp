/**
 * @file transaction.cpp
 * @brief Сериализация legacy транзакций
 */

#include "transaction.hpp"
#include "rlp.hpp"
#include "../crypto/keccak.hpp"

namespace stablebridge::evm {

namespace {

/**
 * @brief Общая часть: [nonce, gasPrice, gas, to, value, data]
 */
void write_body(rlp::RlpWriter& writer, const Transaction& tx) {
    writer.write_u64(tx.nonce);
    writer.write_uint(tx.gas_price);
    writer.write_u64(tx.gas_limit);
    if (tx.to) {
        writer.write_bytes(*tx.to);
    } else {
        writer.write_bytes(ByteSpan{});
    }
    writer.write_uint(tx.value);
    writer.write_bytes(tx.data);
}

} // anonymous namespace

Bytes Transaction::signing_payload() const {
    rlp::RlpWriter writer;
    write_body(writer, *this);
    writer.write_u64(chain_id);
    writer.write_u64(0);
    writer.write_u64(0);
    return writer.finish();
}

Hash256 Transaction::signing_hash() const {
    return crypto::keccak256(signing_payload());
}

Bytes Transaction::encode_signed(const Signature& signature) const {
    // v = recovery_id + chain_id * 2 + 35 может превысить 64 бита
    core::uint256 v = core::uint256{chain_id}.checked_mul(2).value_or(core::uint256::max())
        + core::uint256{35ULL + signature.recovery_id};

    rlp::RlpWriter writer;
    write_body(writer, *this);
    writer.write_uint(v);
    writer.write_uint(signature.r);
    writer.write_uint(signature.s);
    return writer.finish();
}

Hash256 transaction_hash(ByteSpan signed_tx) {
    return crypto::keccak256(signed_tx);
}

} // namespace stablebridge::evm
