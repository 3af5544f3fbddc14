/**
 * @file test_native_protocol_executor.cpp
 * @brief Тесты перевода burn → аттестация → mint
 */

#include <gtest/gtest.h>

#include "bridge/attestation_client.hpp"
#include "bridge/balance_oracle.hpp"
#include "bridge/native_protocol_executor.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"
#include "crypto/keccak.hpp"
#include "evm/abi.hpp"

#include "fakes/fake_clock.hpp"
#include "fakes/fake_http_transport.hpp"
#include "fakes/fake_signer.hpp"
#include "fakes/test_network.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace stablebridge::tests {

using namespace std::chrono_literals;
using chain::Chain;

namespace {

/**
 * @brief Данные события MessageSent(bytes)
 */
Bytes encode_message_log(const Bytes& message) {
    Bytes out;
    Hash256 offset = core::uint256{32}.to_be_bytes();
    Hash256 length = core::uint256{static_cast<uint64_t>(message.size())}.to_be_bytes();
    out.insert(out.end(), offset.begin(), offset.end());
    out.insert(out.end(), length.begin(), length.end());
    out.insert(out.end(), message.begin(), message.end());
    out.resize(out.size() + (32 - message.size() % 32) % 32, 0);
    return out;
}

} // anonymous namespace

// =============================================================================
// Тестовый класс
// =============================================================================

class NativeProtocolExecutorTest : public ::testing::Test {
protected:
    NativeProtocolExecutorTest()
        : registry_(make_registry({Chain::Base, Chain::Arbitrum, Chain::Bsc}))
        , network_(registry_)
        , clients_(network_.clients())
        , oracle_(registry_, clients_)
        , transport_(std::make_shared<FakeHttpTransport>())
        , attestations_("https://iris.test", transport_) {}

    void SetUp() override {
        message_ = Bytes(120, 0x5a);
        attestation_ = Bytes(65, 0x1c);

        auto& base = network_.node(Chain::Base);
        base.native_balance = ether("0.01");
        base.token_balances[stablecoin(Chain::Base)] = core::uint256{100'000'000};

        rpc::LogEntry log;
        log.address = address(registry_.config_for(Chain::Base)->native_protocol->message_transmitter);
        log.topics.push_back(hex::parse_hash(constants::MESSAGE_SENT_TOPIC).value());
        log.data = encode_message_log(message_);
        // tx 0: approve, tx 1: burn
        base.logs[1] = {log};
    }

    Address stablecoin(Chain chain) const {
        return address(registry_.config_for(chain)->stablecoin_address);
    }

    bridge::NativeProtocolExecutor make_executor() {
        bridge::ExecutionSettings settings;
        settings.sender.broadcast_attempts = 3;
        settings.sender.receipt = bridge::PollPolicy{2s, 120s};
        settings.attestation = bridge::PollPolicy{15s, 60s};
        settings.clock = clock_.clock();
        return bridge::NativeProtocolExecutor(registry_, clients_, oracle_, attestations_, settings);
    }

    void attestation_ready() {
        transport_->respond("/attestations/", 200,
                            R"({"status":"complete","attestation":")" +
                            hex::encode(attestation_) + R"("})");
    }

    static core::TokenAmount usdc(std::string_view amount) {
        return core::TokenAmount::parse(amount, 6).value();
    }

    chain::ChainRegistry registry_;
    TestNetwork network_;
    chain::ChainClients clients_;
    bridge::BalanceOracle oracle_;
    std::shared_ptr<FakeHttpTransport> transport_;
    bridge::AttestationClient attestations_;
    FakeSigner signer_;
    FakeClock clock_;
    Bytes message_;
    Bytes attestation_;
};

// =============================================================================
// Тесты котировки
// =============================================================================

TEST_F(NativeProtocolExecutorTest, QuoteIsOneToOne) {
    auto executor = make_executor();
    auto quote = executor.quote(Chain::Base, Chain::Arbitrum, usdc("25"));
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->output_amount, quote->input_amount);
    EXPECT_TRUE(quote->fee_amount.is_zero());
    EXPECT_EQ(quote->fee_percent, 0.0);
    EXPECT_EQ(quote->tool, "CCTP");
    EXPECT_EQ(quote->estimated_seconds, 90u);
    EXPECT_EQ(quote->backend(), bridge::Backend::NativeProtocol);

    const auto& plan = std::get<bridge::NativeProtocolPlan>(quote->payload);
    EXPECT_EQ(plan.source_domain, 6u);
    EXPECT_EQ(plan.destination_domain, 3u);
}

TEST_F(NativeProtocolExecutorTest, QuoteRejectsChainWithoutProtocol) {
    auto executor = make_executor();
    auto quote = executor.quote(Chain::Base, Chain::Bsc, usdc("25"));
    ASSERT_FALSE(quote.has_value());
    EXPECT_EQ(quote.error().code, ErrorCode::InvalidRoute);
}

// =============================================================================
// Тесты полного перевода
// =============================================================================

/**
 * @brief Тест: approve, burn, аттестация и mint
 */
TEST_F(NativeProtocolExecutorTest, FullTransfer) {
    attestation_ready();
    auto executor = make_executor();

    std::vector<bridge::ProgressEvent> events;
    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"), std::nullopt,
                                   [&](const bridge::ProgressEvent& event) {
                                       events.push_back(event);
                                   });

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(result.is_pending());
    EXPECT_EQ(result.backend, bridge::Backend::NativeProtocol);
    EXPECT_TRUE(result.source_tx_hash.has_value());
    EXPECT_TRUE(result.destination_tx_hash.has_value());
    EXPECT_EQ(result.tx_hashes.size(), 3u);
    EXPECT_EQ(result.amount_sent.to_string(), "25");
    EXPECT_EQ(result.amount_received.to_string(), "25");

    // approve и burn в сети источника, mint в сети назначения
    EXPECT_EQ(network_.node(Chain::Base).sent_count(), 2u);
    EXPECT_EQ(network_.node(Chain::Arbitrum).sent_count(), 1u);

    auto signed_txs = signer_.signed_transactions();
    ASSERT_EQ(signed_txs.size(), 3u);

    const auto& burn = signed_txs[1];
    EXPECT_EQ(burn.gas_limit, constants::GAS_LIMIT_BURN);
    EXPECT_EQ(burn.chain_id, 8453u);
    EXPECT_EQ(burn.data, evm::abi::encode_deposit_for_burn(
        core::uint256{25'000'000}, 3, evm::abi::address_to_word(address(TEST_ADDRESS)),
        stablecoin(Chain::Base)));

    const auto& mint = signed_txs[2];
    EXPECT_EQ(mint.chain_id, 42161u);
    EXPECT_EQ(mint.gas_limit, constants::GAS_LIMIT_MINT);
    EXPECT_EQ(mint.gas_price, core::uint256{1'500'000'000});
    EXPECT_EQ(mint.data, evm::abi::encode_receive_message(message_, attestation_));

    // Аттестация запрашивается по keccak256 сообщения
    auto requests = transport_->requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_EQ(requests.front().url,
              "https://iris.test/attestations/" + hex::encode(crypto::keccak256(ByteSpan(message_))));

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().stage, bridge::ProgressStage::Starting);
    EXPECT_EQ(events.back().stage, bridge::ProgressStage::Done);
}

TEST_F(NativeProtocolExecutorTest, ExistingAllowanceSkipsApprove) {
    attestation_ready();
    network_.node(Chain::Base).allowances[stablecoin(Chain::Base)] = core::uint256::max();
    // Без approve burn становится транзакцией 0
    network_.node(Chain::Base).logs[0] = network_.node(Chain::Base).logs[1];

    auto executor = make_executor();
    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.tx_hashes.size(), 2u);
    EXPECT_EQ(network_.node(Chain::Base).sent_count(), 1u);
}

TEST_F(NativeProtocolExecutorTest, CustomRecipientInBurn) {
    attestation_ready();
    std::string recipient = "0x9999999999999999999999999999999999999999";

    auto executor = make_executor();
    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"), recipient);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(signer_.signed_transactions()[1].data, evm::abi::encode_deposit_for_burn(
        core::uint256{25'000'000}, 3, evm::abi::address_to_word(address(recipient)),
        stablecoin(Chain::Base)));
}

/**
 * @brief Тест: аттестация не готова к сроку, перевод ожидает mint
 */
TEST_F(NativeProtocolExecutorTest, AttestationTimeoutIsPending) {
    transport_->respond("/attestations/", 404, R"({"error":"Message hash not found"})");
    auto executor = make_executor();

    std::vector<bridge::ProgressEvent> events;
    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"), std::nullopt,
                                   [&](const bridge::ProgressEvent& event) {
                                       events.push_back(event);
                                   });

    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(result.is_pending());
    EXPECT_TRUE(result.source_tx_hash.has_value());
    EXPECT_FALSE(result.destination_tx_hash.has_value());
    EXPECT_EQ(result.amount_received.to_string(), "25");
    EXPECT_EQ(network_.node(Chain::Arbitrum).sent_count(), 0u);
    EXPECT_LE(clock_.slept(), 60s + 120s);

    // Прошедшее время в событиях ожидания включает фазу burn
    std::vector<uint32_t> waiting;
    for (const auto& event : events) {
        if (event.stage == bridge::ProgressStage::WaitingAttestation) {
            waiting.push_back(event.elapsed_seconds);
            EXPECT_EQ(event.estimated_total_seconds, 90u);
        }
    }
    ASSERT_GE(waiting.size(), 2u);
    EXPECT_EQ(waiting[0], 30u);
    EXPECT_EQ(waiting[1], 45u);
}

TEST_F(NativeProtocolExecutorTest, PendingAttestationStatusKeepsPolling) {
    transport_->respond("/attestations/", 200, R"({"status":"pending_confirmations","attestation":"PENDING"})");
    attestation_ready();
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(result.destination_tx_hash.has_value());
    EXPECT_EQ(transport_->requests().size(), 2u);
}

TEST_F(NativeProtocolExecutorTest, MissingMessageSentIsPending) {
    network_.node(Chain::Base).logs.clear();
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.is_pending());
    EXPECT_TRUE(transport_->requests().empty());
}

/**
 * @brief Тест: сеть назначения недоступна после burn, перевод ожидает mint
 */
TEST_F(NativeProtocolExecutorTest, MintBroadcastFailureIsPending) {
    attestation_ready();
    network_.node(Chain::Arbitrum).offline = true;
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(result.is_pending());
    EXPECT_TRUE(result.source_tx_hash.has_value());
    EXPECT_FALSE(result.destination_tx_hash.has_value());
    EXPECT_FALSE(result.error_code.has_value());
    EXPECT_EQ(result.tx_hashes.size(), 2u);
    EXPECT_EQ(result.amount_received.to_string(), "25");
}

TEST_F(NativeProtocolExecutorTest, MintReceiptTimeoutIsPending) {
    attestation_ready();
    network_.node(Chain::Arbitrum).receipts_pending = true;
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(result.is_pending());
    EXPECT_FALSE(result.destination_tx_hash.has_value());
    // Хеш отправленного mint доступен для ручной проверки
    EXPECT_EQ(result.tx_hashes.size(), 3u);
    EXPECT_EQ(network_.node(Chain::Arbitrum).sent_count(), 1u);
}

TEST_F(NativeProtocolExecutorTest, ThrowingSourceNodeKeepsHashes) {
    network_.node(Chain::Base).allowances[stablecoin(Chain::Base)] = core::uint256::max();
    network_.node(Chain::Base).receipt_throws = true;
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::UnknownFailure);
    EXPECT_NE(result.error_message.find("malformed"), std::string::npos);
    ASSERT_TRUE(result.source_tx_hash.has_value());
    ASSERT_EQ(result.tx_hashes.size(), 1u);
    EXPECT_EQ(result.tx_hashes.front(), *result.source_tx_hash);
}

TEST_F(NativeProtocolExecutorTest, ThrowingDestinationNodeIsPending) {
    attestation_ready();
    network_.node(Chain::Arbitrum).receipt_throws = true;
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(result.is_pending());
    EXPECT_EQ(result.tx_hashes.size(), 3u);
}

TEST_F(NativeProtocolExecutorTest, ThrowingProgressCallbackDoesNotAbort) {
    attestation_ready();
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"), std::nullopt,
                                   [](const bridge::ProgressEvent&) { throw 42; });
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_TRUE(result.destination_tx_hash.has_value());
}

// =============================================================================
// Тесты отказов
// =============================================================================

/**
 * @brief Тест: нехватка стейблкоина не отправляет ни одной транзакции
 */
TEST_F(NativeProtocolExecutorTest, InsufficientBalanceSendsNothing) {
    network_.node(Chain::Base).token_balances[stablecoin(Chain::Base)] = core::uint256{10'000'000};
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::InsufficientBalance);
    EXPECT_EQ(network_.node(Chain::Base).send_attempts(), 0u);
    EXPECT_TRUE(result.tx_hashes.empty());
}

TEST_F(NativeProtocolExecutorTest, InsufficientGasSendsNothing) {
    network_.node(Chain::Base).native_balance = core::uint256{1000};
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::InsufficientGas);
    EXPECT_EQ(network_.node(Chain::Base).send_attempts(), 0u);
}

TEST_F(NativeProtocolExecutorTest, ZeroAmountRejected) {
    auto executor = make_executor();
    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("0.0000001"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::InvalidAmount);
}

TEST_F(NativeProtocolExecutorTest, NonEvmSignerRejected) {
    FakeSigner solana_signer(chain::ChainFamily::Solana, "7xKXtg2CW87d97TXJSDpbD5jBkheTqA83TZRuJosgAsU");
    auto executor = make_executor();
    auto result = executor.execute(solana_signer, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::UnsupportedSigner);
}

TEST_F(NativeProtocolExecutorTest, BurnRevertFails) {
    network_.node(Chain::Base).reverted = {1};
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::TransactionReverted);
    EXPECT_TRUE(result.source_tx_hash.has_value());
    EXPECT_EQ(network_.node(Chain::Arbitrum).sent_count(), 0u);
}

TEST_F(NativeProtocolExecutorTest, ApproveBroadcastFailureIsApprovalFailed) {
    network_.node(Chain::Base).send_errors = {"insufficient funds for gas"};
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::ApprovalFailed);
    EXPECT_EQ(network_.node(Chain::Base).sent_count(), 0u);
}

TEST_F(NativeProtocolExecutorTest, MintRevertFails) {
    attestation_ready();
    network_.node(Chain::Arbitrum).reverted = {0};
    auto executor = make_executor();

    auto result = executor.execute(signer_, Chain::Base, Chain::Arbitrum, usdc("25"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::TransactionReverted);
    EXPECT_TRUE(result.destination_tx_hash.has_value());
    EXPECT_TRUE(result.amount_received.is_zero());
}

// =============================================================================
// Тесты клиента аттестаций
// =============================================================================

TEST_F(NativeProtocolExecutorTest, AttestationClientParsesMessage) {
    transport_->respond("/attestations/", 200,
                        R"({"status":"complete","attestation":"0xaabb","message":"0x0102"})");
    auto response = attestations_.fetch(Hash256{});
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->has_value());
    EXPECT_EQ((*response)->attestation, (Bytes{0xaa, 0xbb}));
    EXPECT_EQ((*response)->message, (Bytes{0x01, 0x02}));
}

TEST_F(NativeProtocolExecutorTest, AttestationClientServerError) {
    transport_->respond("/attestations/", 503, "unavailable");
    auto response = attestations_.fetch(Hash256{});
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, ErrorCode::RpcInternalError);
}

TEST_F(NativeProtocolExecutorTest, AttestationClientMalformedJson) {
    transport_->respond("/attestations/", 200, "{not json");
    auto response = attestations_.fetch(Hash256{});
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, ErrorCode::RpcParseError);
}

TEST(AttestationClientTest, UrlTrimsTrailingSlash) {
    bridge::AttestationClient client("https://iris-api.circle.com/", std::make_shared<FakeHttpTransport>());
    EXPECT_EQ(client.url_for(Hash256{}),
              "https://iris-api.circle.com/attestations/0x" + std::string(64, '0'));
}

} // namespace stablebridge::tests
