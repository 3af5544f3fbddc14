/**
 * @file test_config.cpp
 * @brief Тесты загрузки и валидации конфигурации
 */

#include <gtest/gtest.h>

#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <map>

namespace stablebridge::tests {

// =============================================================================
// Тестовый класс
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    static constexpr const char* FULL_CONFIG = R"(
[chains.base]
rpc_url = "https://mainnet.base.org"
fast_relay = false
min_gas = "0.0002"

[chains.Ethereum]
rpc_url = "https://eth.llamarpc.com"

[aggregator]
relay_url = "https://relay.example"
lifi_url = "https://lifi.example/v1"
api_key = "secret"
timeout = 10

[attestation]
url = "https://attest.example"
poll_interval = 5
max_wait = 60

[transactions]
receipt_timeout = 90
receipt_poll_interval = 3
broadcast_attempts = 5

[logging]
level = "debug"
color = false
)";

    static EnvLookup env_from(std::map<std::string, std::string> values) {
        return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
            auto it = values.find(name);
            if (it == values.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }
};

// =============================================================================
// Тесты разбора
// =============================================================================

/**
 * @brief Тест: все секции читаются
 */
TEST_F(ConfigTest, ParsesAllSections) {
    auto config = Config::parse(FULL_CONFIG);
    ASSERT_TRUE(config.has_value()) << config.error().message;

    ASSERT_EQ(config->chains.size(), 2u);
    const auto& base = config->chains.at("base");
    EXPECT_EQ(base.rpc_url, "https://mainnet.base.org");
    ASSERT_TRUE(base.fast_relay.has_value());
    EXPECT_FALSE(*base.fast_relay);
    EXPECT_EQ(base.min_gas, "0.0002");

    // Имена сетей приводятся к нижнему регистру
    EXPECT_TRUE(config->chains.contains("ethereum"));

    EXPECT_EQ(config->aggregator.relay_url, "https://relay.example");
    EXPECT_EQ(config->aggregator.lifi_url, "https://lifi.example/v1");
    EXPECT_EQ(config->aggregator.api_key, "secret");
    EXPECT_EQ(config->aggregator.timeout, 10u);

    EXPECT_EQ(config->attestation.url, "https://attest.example");
    EXPECT_EQ(config->attestation.poll_interval, 5u);
    EXPECT_EQ(config->attestation.max_wait, 60u);

    EXPECT_EQ(config->transactions.receipt_timeout, 90u);
    EXPECT_EQ(config->transactions.receipt_poll_interval, 3u);
    EXPECT_EQ(config->transactions.broadcast_attempts, 5u);

    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);

    EXPECT_TRUE(config->validate().has_value());
}

TEST_F(ConfigTest, EmptyConfigUsesDefaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->chains.empty());
    EXPECT_EQ(config->aggregator.relay_url, constants::DEFAULT_RELAY_URL);
    EXPECT_EQ(config->attestation.url, constants::DEFAULT_ATTESTATION_URL);
    EXPECT_EQ(config->attestation.poll_interval, constants::ATTESTATION_POLL_INTERVAL_SEC);
    EXPECT_TRUE(config->validate().has_value());
}

TEST_F(ConfigTest, MalformedTomlFails) {
    auto config = Config::parse("[chains.base\nrpc_url = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    auto config = Config::load("/nonexistent/stablebridge.toml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "stablebridge_config_test.toml";
    {
        std::ofstream out(path);
        out << FULL_CONFIG;
    }

    auto config = Config::load_with_search(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->chains.size(), 2u);
}

// =============================================================================
// Тесты переменных окружения
// =============================================================================

/**
 * @brief Тест: <CHAIN>_RPC_URL добавляет сеть и перекрывает файл
 */
TEST_F(ConfigTest, EnvOverridesRpcUrls) {
    auto config = Config::parse(FULL_CONFIG).value();
    config.apply_env_overrides(env_from({
        {"BASE_RPC_URL", "https://base.override"},
        {"ARBITRUM_RPC_URL", "https://arb.example"},
        {"LIFI_API_KEY", "env-key"},
        {"ATTESTATION_URL", "https://iris.override"},
    }));

    EXPECT_EQ(config.chains.at("base").rpc_url, "https://base.override");
    // Остальные настройки сети сохраняются
    EXPECT_EQ(config.chains.at("base").min_gas, "0.0002");
    EXPECT_EQ(config.chains.at("arbitrum").rpc_url, "https://arb.example");
    EXPECT_EQ(config.chains.at("ethereum").rpc_url, "https://eth.llamarpc.com");
    EXPECT_EQ(config.aggregator.api_key, "env-key");
    EXPECT_EQ(config.attestation.url, "https://iris.override");
}

TEST_F(ConfigTest, EnvWithoutValuesChangesNothing) {
    auto config = Config::parse(FULL_CONFIG).value();
    config.apply_env_overrides(env_from({}));
    EXPECT_EQ(config.chains.size(), 2u);
    EXPECT_EQ(config.aggregator.api_key, "secret");
}

// =============================================================================
// Тесты валидации
// =============================================================================

TEST_F(ConfigTest, RejectsUnknownChain) {
    auto config = Config::parse("[chains.fantom]\nrpc_url = \"https://rpc.ftm.tools\"\n").value();
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
}

TEST_F(ConfigTest, RejectsNonHttpRpcUrl) {
    auto config = Config::parse("[chains.base]\nrpc_url = \"ws://localhost:8546\"\n").value();
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsBadMinGas) {
    auto config = Config::parse(
        "[chains.base]\nrpc_url = \"https://mainnet.base.org\"\nmin_gas = \"lots\"\n").value();
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsZeroIntervals) {
    Config config;
    config.attestation.poll_interval = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.attestation.poll_interval = 30;
    config.attestation.max_wait = 10;
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.transactions.broadcast_attempts = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = Config{};
    config.aggregator.timeout = 0;
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    Config config;
    config.logging.level = "verbose";
    EXPECT_FALSE(config.validate().has_value());
}

} // namespace stablebridge::tests
