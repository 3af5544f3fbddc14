/**
 * @file test_evm.cpp
 * @brief Тесты keccak256, RLP, транзакций и ABI
 */

#include <gtest/gtest.h>

#include "core/constants.hpp"
#include "core/hex.hpp"
#include "crypto/keccak.hpp"
#include "evm/abi.hpp"
#include "evm/rlp.hpp"
#include "evm/transaction.hpp"

#include <string>

namespace stablebridge::tests {

namespace {

std::string to_hex(ByteSpan data) {
    return hex::encode(data, false);
}

Bytes from_hex(std::string_view text) {
    return hex::decode(text).value();
}

/// @brief Пример из EIP-155
evm::Transaction eip155_transaction() {
    evm::Transaction tx;
    tx.nonce = 9;
    tx.gas_price = core::uint256{20'000'000'000};
    tx.gas_limit = 21000;
    tx.to = hex::parse_address("0x3535353535353535353535353535353535353535").value();
    tx.value = core::uint256{1'000'000'000'000'000'000ULL};
    tx.chain_id = 1;
    return tx;
}

} // anonymous namespace

// =============================================================================
// Тесты keccak256
// =============================================================================

TEST(KeccakTest, EmptyInput) {
    EXPECT_EQ(to_hex(crypto::keccak256(std::string_view{})),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

/**
 * @brief Тест: вход длиннее одного блока (136 байт)
 */
TEST(KeccakTest, MultiBlockInput) {
    std::string input(200, 'a');
    EXPECT_EQ(to_hex(crypto::keccak256(input)),
              "96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

TEST(KeccakTest, IncrementalMatchesOneShot) {
    std::string input(200, 'a');
    crypto::Keccak256 hasher;
    hasher.update(ByteSpan(reinterpret_cast<const uint8_t*>(input.data()), 7));
    hasher.update(ByteSpan(reinterpret_cast<const uint8_t*>(input.data()) + 7, input.size() - 7));
    EXPECT_EQ(hasher.finalize(), crypto::keccak256(input));
}

/**
 * @brief Тест: селекторы совпадают с зашитыми константами
 */
TEST(KeccakTest, FunctionSelectors) {
    EXPECT_EQ(crypto::function_selector("balanceOf(address)"), constants::SELECTOR_BALANCE_OF);
    EXPECT_EQ(crypto::function_selector("allowance(address,address)"), constants::SELECTOR_ALLOWANCE);
    EXPECT_EQ(crypto::function_selector("approve(address,uint256)"), constants::SELECTOR_APPROVE);
    EXPECT_EQ(crypto::function_selector("depositForBurn(uint256,uint32,bytes32,address)"),
              constants::SELECTOR_DEPOSIT_FOR_BURN);
    EXPECT_EQ(crypto::function_selector("receiveMessage(bytes,bytes)"),
              constants::SELECTOR_RECEIVE_MESSAGE);
}

TEST(KeccakTest, MessageSentTopic) {
    EXPECT_EQ(hex::encode(crypto::keccak256(std::string_view{"MessageSent(bytes)"})),
              constants::MESSAGE_SENT_TOPIC);
}

// =============================================================================
// Тесты RLP
// =============================================================================

TEST(RlpTest, ShortString) {
    std::string dog = "dog";
    auto encoded = evm::rlp::encode_bytes(
        ByteSpan(reinterpret_cast<const uint8_t*>(dog.data()), dog.size()));
    EXPECT_EQ(to_hex(encoded), "83646f67");
}

TEST(RlpTest, SingleLowByteIsItself) {
    Bytes byte{0x7f};
    EXPECT_EQ(to_hex(evm::rlp::encode_bytes(byte)), "7f");
}

TEST(RlpTest, Integers) {
    EXPECT_EQ(to_hex(evm::rlp::encode_uint(core::uint256{0})), "80");
    EXPECT_EQ(to_hex(evm::rlp::encode_uint(core::uint256{15})), "0f");
    EXPECT_EQ(to_hex(evm::rlp::encode_uint(core::uint256{1024})), "820400");
}

TEST(RlpTest, EmptyList) {
    evm::rlp::RlpWriter writer;
    EXPECT_EQ(to_hex(writer.finish()), "c0");
}

/**
 * @brief Тест: строка длиннее 55 байт получает длинный префикс
 */
TEST(RlpTest, LongString) {
    Bytes data(56, 0xaa);
    auto encoded = evm::rlp::encode_bytes(data);
    ASSERT_EQ(encoded.size(), 58u);
    EXPECT_EQ(encoded[0], 0xb8);
    EXPECT_EQ(encoded[1], 56);
}

// =============================================================================
// Тесты транзакций (EIP-155)
// =============================================================================

TEST(TransactionTest, SigningPayload) {
    EXPECT_EQ(to_hex(eip155_transaction().signing_payload()),
              "ec098504a817c800825208943535353535353535353535353535353535353535"
              "880de0b6b3a764000080018080");
}

TEST(TransactionTest, SigningHash) {
    EXPECT_EQ(to_hex(eip155_transaction().signing_hash()),
              "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53");
}

/**
 * @brief Тест: подписанная транзакция с v = 37
 */
TEST(TransactionTest, EncodeSigned) {
    evm::Signature signature;
    signature.r = core::uint256::from_decimal(
        "18515461264373351373200002665853028612451056578545711640558177340181847433846").value();
    signature.s = core::uint256::from_decimal(
        "46948507304638947509940763649030358759909902576025900602547168820602576006531").value();
    signature.recovery_id = 0;

    EXPECT_EQ(to_hex(eip155_transaction().encode_signed(signature)),
              "f86c098504a817c800825208943535353535353535353535353535353535353535"
              "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c"
              "71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc"
              "64214b297fb1966a3b6d83");
}

TEST(TransactionTest, HashIsKeccakOfRawBytes) {
    Bytes raw = eip155_transaction().signing_payload();
    EXPECT_EQ(evm::transaction_hash(raw), crypto::keccak256(raw));
}

// =============================================================================
// Тесты ABI
// =============================================================================

TEST(AbiTest, BalanceOf) {
    auto owner = hex::parse_address("0x1111111111111111111111111111111111111111").value();
    auto data = evm::abi::encode_balance_of(owner);
    ASSERT_EQ(data.size(), 36u);
    EXPECT_EQ(to_hex(ByteSpan(data).first(4)), "70a08231");
    EXPECT_EQ(to_hex(ByteSpan(data).subspan(4, 12)), std::string(24, '0'));
    EXPECT_EQ(to_hex(ByteSpan(data).subspan(16)), std::string(40, '1'));
}

TEST(AbiTest, AddressWordRoundTrip) {
    auto address = hex::parse_address("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48").value();
    EXPECT_EQ(evm::abi::word_to_address(evm::abi::address_to_word(address)), address);
}

TEST(AbiTest, DepositForBurnLayout) {
    auto recipient = hex::parse_address("0x2222222222222222222222222222222222222222").value();
    auto token = hex::parse_address("0x3333333333333333333333333333333333333333").value();
    auto data = evm::abi::encode_deposit_for_burn(
        core::uint256{25'000'000}, 6, evm::abi::address_to_word(recipient), token);

    ASSERT_EQ(data.size(), 4u + 4 * 32);
    EXPECT_EQ(to_hex(ByteSpan(data).first(4)), "6fd3504e");
    EXPECT_EQ(evm::abi::decode_uint256(ByteSpan(data).subspan(4)).value(), core::uint256{25'000'000});
    EXPECT_EQ(evm::abi::decode_uint256(ByteSpan(data).subspan(36)).value(), core::uint256{6});
    EXPECT_EQ(data[4 + 3 * 32 + 12], 0x33);
}

/**
 * @brief Тест: receiveMessage кодирует два динамических bytes
 */
TEST(AbiTest, ReceiveMessageLayout) {
    Bytes message(33, 0x01);
    Bytes attestation(65, 0x02);
    auto data = evm::abi::encode_receive_message(message, attestation);

    // селектор + 2 смещения + (длина + 64) + (длина + 96)
    ASSERT_EQ(data.size(), 4u + 64 + 32 + 64 + 32 + 96);
    EXPECT_EQ(to_hex(ByteSpan(data).first(4)), "57ecfd28");

    ByteSpan body = ByteSpan(data).subspan(4);
    EXPECT_EQ(evm::abi::decode_uint256(body).value(), core::uint256{64});
    EXPECT_EQ(evm::abi::decode_uint256(body.subspan(32)).value(), core::uint256{160});

    auto decoded = evm::abi::decode_bytes(body);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, message);
}

TEST(AbiTest, DecodeBytesRejectsTruncated) {
    Bytes data = from_hex("0x"
        "0000000000000000000000000000000000000000000000000000000000000020"
        "0000000000000000000000000000000000000000000000000000000000000010"
        "abcd");
    auto decoded = evm::abi::decode_bytes(data);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::RpcParseError);
}

TEST(AbiTest, DecodeUintRejectsShortWord) {
    Bytes data(31, 0);
    EXPECT_FALSE(evm::abi::decode_uint256(data).has_value());
}

// =============================================================================
// Тесты hex
// =============================================================================

TEST(HexTest, DecodeRejectsGarbage) {
    EXPECT_FALSE(hex::decode("PENDING").has_value());
    EXPECT_FALSE(hex::decode("0xabc").has_value());
    EXPECT_TRUE(hex::decode("0x").has_value());
}

TEST(HexTest, AddressParsing) {
    EXPECT_TRUE(hex::is_evm_address("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"));
    EXPECT_FALSE(hex::is_evm_address("0xA0b8"));
    EXPECT_FALSE(hex::is_evm_address("7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU"));

    auto parsed = hex::parse_address("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(hex::address_to_string(*parsed), "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");

    auto bad = hex::parse_address("not-an-address");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidAddress);
}

} // namespace stablebridge::tests
