/**
 * @file test_balance_oracle.cpp
 * @brief Тесты чтения балансов
 */

#include <gtest/gtest.h>

#include "bridge/balance_oracle.hpp"

#include "fakes/fake_signer.hpp"
#include "fakes/test_network.hpp"

namespace stablebridge::tests {

using chain::Chain;

// =============================================================================
// Тестовый класс
// =============================================================================

class BalanceOracleTest : public ::testing::Test {
protected:
    BalanceOracleTest()
        : registry_(make_registry({Chain::Ethereum, Chain::Polygon, Chain::Base,
                                   Chain::Bsc, Chain::Solana}))
        , network_(registry_)
        , clients_(network_.clients())
        , oracle_(registry_, clients_) {}

    void set_stablecoin(Chain chain, std::string_view amount) {
        const auto* config = registry_.config_for(chain);
        auto value = core::TokenAmount::parse(amount, config->stablecoin_decimals).value();
        network_.node(chain).token_balances[address(config->stablecoin_address)] = value.raw;
    }

    chain::ChainRegistry registry_;
    TestNetwork network_;
    chain::ChainClients clients_;
    bridge::BalanceOracle oracle_;
    std::string wallet_{TEST_ADDRESS};
};

// =============================================================================
// Тесты одной сети
// =============================================================================

TEST_F(BalanceOracleTest, StablecoinBalanceSixDecimals) {
    set_stablecoin(Chain::Base, "125.5");
    auto balance = oracle_.stablecoin_balance(Chain::Base, wallet_);
    EXPECT_EQ(balance.decimals, 6);
    EXPECT_EQ(balance.raw, core::uint256{125'500'000});
    EXPECT_EQ(balance.to_string(), "125.5");
}

/**
 * @brief Тест: стейблкоин bsc с 18 знаками
 */
TEST_F(BalanceOracleTest, StablecoinBalanceEighteenDecimals) {
    set_stablecoin(Chain::Bsc, "3.25");
    auto balance = oracle_.stablecoin_balance(Chain::Bsc, wallet_);
    EXPECT_EQ(balance.decimals, 18);
    EXPECT_EQ(balance.to_string(), "3.25");
}

TEST_F(BalanceOracleTest, NativeBalance) {
    network_.node(Chain::Ethereum).native_balance = ether("0.75");
    auto balance = oracle_.native_balance(Chain::Ethereum, wallet_);
    EXPECT_EQ(balance.decimals, 18);
    EXPECT_EQ(balance.to_string(), "0.75");
}

TEST_F(BalanceOracleTest, ArbitraryTokenBalance) {
    std::string token = "0x4444444444444444444444444444444444444444";
    network_.node(Chain::Polygon).token_balances[address(token)] = core::uint256{12'345};
    auto balance = oracle_.token_balance(Chain::Polygon, token, 2, wallet_);
    EXPECT_EQ(balance.to_string(), "123.45");
}

/**
 * @brief Тест: недоступная сеть даёт ноль, а не ошибку
 */
TEST_F(BalanceOracleTest, OfflineChainReadsAsZero) {
    set_stablecoin(Chain::Base, "10");
    network_.node(Chain::Base).offline = true;

    auto balance = oracle_.stablecoin_balance(Chain::Base, wallet_);
    EXPECT_TRUE(balance.is_zero());
    EXPECT_EQ(balance.decimals, 6);

    auto fetched = oracle_.fetch_stablecoin_balance(Chain::Base, wallet_);
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, ErrorCode::RpcConnectionFailed);
}

TEST_F(BalanceOracleTest, UnsupportedChainReadsAsZero) {
    EXPECT_TRUE(oracle_.stablecoin_balance(Chain::Arbitrum, wallet_).is_zero());

    auto fetched = oracle_.fetch_native_balance(Chain::Arbitrum, wallet_);
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, ErrorCode::UnsupportedChain);
}

TEST_F(BalanceOracleTest, SolanaBalanceNotReadable) {
    auto fetched = oracle_.fetch_stablecoin_balance(Chain::Solana, wallet_);
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, ErrorCode::UnsupportedChain);
}

TEST_F(BalanceOracleTest, InvalidAddressReadsAsZero) {
    set_stablecoin(Chain::Base, "10");
    EXPECT_TRUE(oracle_.stablecoin_balance(Chain::Base, "not-an-address").is_zero());
    auto fetched = oracle_.fetch_stablecoin_balance(Chain::Base, "not-an-address");
    ASSERT_FALSE(fetched.has_value());
    EXPECT_EQ(fetched.error().code, ErrorCode::InvalidAddress);
}

// =============================================================================
// Тесты всех сетей
// =============================================================================

/**
 * @brief Тест: одна недоступная сеть не ломает остальные
 */
TEST_F(BalanceOracleTest, AllBalancesWithOneOfflineChain) {
    set_stablecoin(Chain::Ethereum, "1");
    set_stablecoin(Chain::Polygon, "2");
    set_stablecoin(Chain::Base, "3");
    set_stablecoin(Chain::Bsc, "4");
    network_.node(Chain::Polygon).offline = true;

    auto balances = oracle_.all_stablecoin_balances(wallet_);

    // Solana пропускается
    ASSERT_EQ(balances.size(), 4u);
    EXPECT_EQ(balances.at(Chain::Ethereum).to_string(), "1");
    EXPECT_TRUE(balances.at(Chain::Polygon).is_zero());
    EXPECT_EQ(balances.at(Chain::Base).to_string(), "3");
    EXPECT_EQ(balances.at(Chain::Bsc).to_string(), "4");
    EXPECT_EQ(balances.at(Chain::Bsc).decimals, 18);
}

TEST_F(BalanceOracleTest, FindChainWithBalanceUsesDeclarationOrder) {
    set_stablecoin(Chain::Polygon, "50");
    set_stablecoin(Chain::Base, "80");

    auto required = core::TokenAmount::parse("40", 6).value();
    auto found = oracle_.find_chain_with_balance(wallet_, required);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->first, Chain::Polygon);
    EXPECT_EQ(found->second.to_string(), "50");

    auto excluded = oracle_.find_chain_with_balance(wallet_, required, Chain::Polygon);
    ASSERT_TRUE(excluded.has_value());
    EXPECT_EQ(excluded->first, Chain::Base);
}

/**
 * @brief Тест: сравнение суммы с балансом другой точности
 */
TEST_F(BalanceOracleTest, FindChainComparesAcrossPrecisions) {
    set_stablecoin(Chain::Bsc, "100");

    auto required = core::TokenAmount::parse("99.5", 6).value();
    auto found = oracle_.find_chain_with_balance(wallet_, required);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->first, Chain::Bsc);

    auto too_much = core::TokenAmount::parse("100.000001", 6).value();
    EXPECT_FALSE(oracle_.find_chain_with_balance(wallet_, too_much).has_value());
}

TEST_F(BalanceOracleTest, FindChainIgnoresZeroBalances) {
    auto required = core::TokenAmount::zero(6);
    EXPECT_FALSE(oracle_.find_chain_with_balance(wallet_, required).has_value());
}

} // namespace stablebridge::tests
