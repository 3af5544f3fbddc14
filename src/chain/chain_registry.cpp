/**
 * @file chain_registry.cpp
 * @brief Реализация реестра сетей
 */

#include "chain_registry.hpp"
#include "../log/logger.hpp"

#include <format>

namespace stablebridge::chain {

namespace {

/**
 * @brief Минимальный остаток газа в wei из десятичной строки
 */
[[nodiscard]] core::uint256 native_wei(std::string_view amount) {
    return core::TokenAmount::parse(amount, constants::NATIVE_DECIMALS)
        .value_or(core::TokenAmount::zero(constants::NATIVE_DECIMALS)).raw;
}

} // anonymous namespace

// =============================================================================
// Встроенные параметры
// =============================================================================

std::vector<ChainConfig> ChainRegistry::builtin_chains() {
    std::vector<ChainConfig> chains;

    // Ethereum (domain 0)
    {
        ChainConfig config;
        config.chain = Chain::Ethereum;
        config.display_name = "Ethereum";
        config.chain_id = 1;
        config.native_domain = 0;
        config.stablecoin_address = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
        config.native_protocol = NativeProtocolContracts{
            "0xBd3fa81B58Ba92a82136038B25aDec7066af3155",
            "0x0a992d191DEeC32aFe36203Ad87D7d289a738F81",
        };
        config.native_symbol = "ETH";
        config.min_gas_wei = native_wei("0.005");
        config.fast_relay_eligible = true;
        chains.push_back(std::move(config));
    }

    // Polygon (domain 7)
    {
        ChainConfig config;
        config.chain = Chain::Polygon;
        config.display_name = "Polygon";
        config.chain_id = 137;
        config.native_domain = 7;
        config.stablecoin_address = "0x3c499c542cEF5E3811e1192ce70d8cC03d5c3359";
        config.native_protocol = NativeProtocolContracts{
            "0x9daF8c91AEFAE50b9c0E69629D3F6Ca40cA3B3FE",
            "0xF3be9355363857F3e001be68856A2f96b4C39Ba9",
        };
        config.native_symbol = "POL";
        config.min_gas_wei = native_wei("0.1");
        config.fast_relay_eligible = true;
        chains.push_back(std::move(config));
    }

    // Base (domain 6)
    {
        ChainConfig config;
        config.chain = Chain::Base;
        config.display_name = "Base";
        config.chain_id = 8453;
        config.native_domain = 6;
        config.stablecoin_address = "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913";
        config.native_protocol = NativeProtocolContracts{
            "0x1682Ae6375C4E4A97e4B583BC394c861A46D8962",
            "0xAD09780d193884d503182aD4588450C416D6F9D4",
        };
        config.native_symbol = "ETH";
        config.min_gas_wei = native_wei("0.0001");
        config.fast_relay_eligible = true;
        chains.push_back(std::move(config));
    }

    // Arbitrum (domain 3)
    {
        ChainConfig config;
        config.chain = Chain::Arbitrum;
        config.display_name = "Arbitrum";
        config.chain_id = 42161;
        config.native_domain = 3;
        config.stablecoin_address = "0xaf88d065e77c8cC2239327C5EDb3A432268e5831";
        config.native_protocol = NativeProtocolContracts{
            "0x19330d10D9Cc8751218eaf51E8885D058642E08A",
            "0xC30362313FBBA5cf9163F0bb16a0e01f01A896ca",
        };
        config.native_symbol = "ETH";
        config.min_gas_wei = native_wei("0.0001");
        config.fast_relay_eligible = true;
        chains.push_back(std::move(config));
    }

    // Optimism (domain 2)
    {
        ChainConfig config;
        config.chain = Chain::Optimism;
        config.display_name = "Optimism";
        config.chain_id = 10;
        config.native_domain = 2;
        config.stablecoin_address = "0x0b2C639c533813f4Aa9D7837CAf62653d097Ff85";
        config.native_protocol = NativeProtocolContracts{
            "0x2B4069517957735bE00ceE0fadAE88a26365528f",
            "0x4D41f22c5a0e5c74090899E5a8Fb597a8842b3e8",
        };
        config.native_symbol = "ETH";
        config.min_gas_wei = native_wei("0.0001");
        config.fast_relay_eligible = true;
        chains.push_back(std::move(config));
    }

    // Avalanche (domain 1), в fast relay не участвует
    {
        ChainConfig config;
        config.chain = Chain::Avalanche;
        config.display_name = "Avalanche";
        config.chain_id = 43114;
        config.native_domain = 1;
        config.stablecoin_address = "0xB97EF9Ef8734C71904D8002F8b6Bc66Dd9c48a6E";
        config.native_protocol = NativeProtocolContracts{
            "0x6B25532e1060CE10cc3B0A99e5683b91BFDe6982",
            "0x8186359aF5F57FbB40c6b14A588d2A59C0C29880",
        };
        config.native_symbol = "AVAX";
        config.min_gas_wei = native_wei("0.01");
        config.fast_relay_eligible = false;
        chains.push_back(std::move(config));
    }

    // BNB Chain: USDC с 18 знаками, нативного протокола нет
    {
        ChainConfig config;
        config.chain = Chain::Bsc;
        config.display_name = "BNB Chain";
        config.chain_id = 56;
        config.stablecoin_address = "0x8AC76a51cc950d9822D68b83fE1Ad97B32Cd580d";
        config.stablecoin_decimals = 18;
        config.native_symbol = "BNB";
        config.min_gas_wei = native_wei("0.001");
        config.fast_relay_eligible = true;
        config.aggregator_only = true;
        chains.push_back(std::move(config));
    }

    // Abstract: мостовой USDC.e
    {
        ChainConfig config;
        config.chain = Chain::Abstract;
        config.display_name = "Abstract";
        config.chain_id = 2741;
        config.stablecoin_address = "0x84A71ccD554Cc1b02749b35d22F684CC8ec987e1";
        config.stablecoin_symbol = "USDC.e";
        config.native_symbol = "ETH";
        config.min_gas_wei = native_wei("0.0001");
        config.fast_relay_eligible = true;
        config.aggregator_only = true;
        chains.push_back(std::move(config));
    }

    // Solana: только сеть назначения
    {
        ChainConfig config;
        config.chain = Chain::Solana;
        config.display_name = "Solana";
        config.family = ChainFamily::Solana;
        config.relay_chain_id = 792703809;
        config.aggregator_chain_id = 1151111081099710;
        config.stablecoin_address = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
        config.native_symbol = "SOL";
        config.aggregator_only = true;
        chains.push_back(std::move(config));
    }

    // Для EVM сетей идентификаторы агрегаторов совпадают с chain id
    for (auto& config : chains) {
        if (config.relay_chain_id == 0) {
            config.relay_chain_id = config.chain_id;
        }
        if (config.aggregator_chain_id == 0) {
            config.aggregator_chain_id = config.chain_id;
        }
    }

    return chains;
}

// =============================================================================
// ChainRegistry
// =============================================================================

ChainRegistry::ChainRegistry(std::vector<ChainConfig> configs) {
    for (auto& config : configs) {
        if (config.rpc_url.empty()) {
            continue;
        }
        Chain chain = config.chain;
        chains_.insert_or_assign(chain, std::move(config));
    }
}

Result<ChainRegistry> ChainRegistry::from_config(const Config& config) {
    std::vector<ChainConfig> chains = builtin_chains();

    for (auto& chain : chains) {
        auto it = config.chains.find(std::string(to_string(chain.chain)));
        if (it == config.chains.end()) {
            continue;
        }
        const ChainSettings& settings = it->second;

        chain.rpc_url = settings.rpc_url;
        if (settings.fast_relay) {
            chain.fast_relay_eligible = *settings.fast_relay;
        }
        if (settings.min_gas) {
            auto min_gas = core::TokenAmount::parse(*settings.min_gas, constants::NATIVE_DECIMALS);
            if (!min_gas) {
                return Err<ChainRegistry>(
                    ErrorCode::ConfigInvalidValue,
                    std::format("Некорректный min_gas сети {}: {}",
                                to_string(chain.chain), min_gas.error().message)
                );
            }
            chain.min_gas_wei = min_gas->raw;
        }
    }

    ChainRegistry registry(std::move(chains));
    if (registry.chains_.empty()) {
        log::Logger::instance().warning(
            "Registry", "Ни для одной сети не задан rpc_url, все операции будут отклонены"
        );
    }
    return registry;
}

const ChainConfig* ChainRegistry::config_for(Chain chain) const {
    auto it = chains_.find(chain);
    if (it == chains_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ChainRegistry::is_supported(Chain chain) const {
    return chains_.contains(chain);
}

std::vector<Chain> ChainRegistry::supported_chains() const {
    std::vector<Chain> result;
    for (Chain chain : ALL_CHAINS) {
        if (chains_.contains(chain)) {
            result.push_back(chain);
        }
    }
    return result;
}

} // namespace stablebridge::chain
