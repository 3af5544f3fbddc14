/**
 * @file test_secp256k1_signer.cpp
 * @brief Тесты подписанта на libsecp256k1
 */

#include <gtest/gtest.h>

#include "core/hex.hpp"
#include "crypto/secp256k1_signer.hpp"

#include <string>

namespace stablebridge::tests {

namespace {

constexpr const char* EIP155_KEY =
    "0x4646464646464646464646464646464646464646464646464646464646464646";

} // anonymous namespace

TEST(Secp256k1SignerTest, DerivesAddress) {
    auto signer = crypto::Secp256k1Signer::from_private_key(EIP155_KEY);
    ASSERT_TRUE(signer.has_value()) << signer.error().message;
    EXPECT_EQ((*signer)->address(), "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");
    EXPECT_EQ((*signer)->family(), chain::ChainFamily::Evm);
}

/**
 * @brief Тест: детерминированная подпись примера EIP-155
 */
TEST(Secp256k1SignerTest, SignsEip155Example) {
    auto signer = crypto::Secp256k1Signer::from_private_key(EIP155_KEY);
    ASSERT_TRUE(signer.has_value());

    evm::Transaction tx;
    tx.nonce = 9;
    tx.gas_price = core::uint256{20'000'000'000};
    tx.gas_limit = 21000;
    tx.to = hex::parse_address("0x3535353535353535353535353535353535353535").value();
    tx.value = core::uint256{1'000'000'000'000'000'000ULL};
    tx.chain_id = 1;

    auto raw = (*signer)->sign_transaction(tx);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(hex::encode(*raw),
              "0xf86c098504a817c800825208943535353535353535353535353535353535353535"
              "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c"
              "71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc"
              "64214b297fb1966a3b6d83");
}

TEST(Secp256k1SignerTest, RejectsBadKeys) {
    auto short_key = crypto::Secp256k1Signer::from_private_key("0x1234");
    ASSERT_FALSE(short_key.has_value());
    EXPECT_EQ(short_key.error().code, ErrorCode::InvalidKey);

    auto zero_key = crypto::Secp256k1Signer::from_private_key(std::string(64, '0'));
    ASSERT_FALSE(zero_key.has_value());
    EXPECT_EQ(zero_key.error().code, ErrorCode::InvalidKey);

    auto not_hex = crypto::Secp256k1Signer::from_private_key(std::string(64, 'z'));
    ASSERT_FALSE(not_hex.has_value());
    EXPECT_EQ(not_hex.error().code, ErrorCode::InvalidKey);
}

} // namespace stablebridge::tests
