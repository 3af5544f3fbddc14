/**
 * @file balance_oracle.cpp
 * @brief Реализация баланс-оракула
 */

#include "balance_oracle.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../evm/abi.hpp"
#include "../log/logger.hpp"

#include <exception>
#include <format>
#include <future>
#include <vector>

namespace stablebridge::bridge {

namespace {

constexpr std::string_view COMPONENT = "Balance";

/**
 * @brief Сбой чтения превращается в ноль с предупреждением в логе
 */
core::TokenAmount or_zero(
    const Result<core::TokenAmount>& result,
    chain::Chain chain,
    uint8_t decimals
) {
    if (result) {
        return *result;
    }
    log::Logger::instance().warning(
        COMPONENT,
        std::format("Баланс в сети {} недоступен: {}",
                    chain::to_string(chain), result.error().message)
    );
    return core::TokenAmount::zero(decimals);
}

} // anonymous namespace

BalanceOracle::BalanceOracle(
    const chain::ChainRegistry& registry,
    const chain::ChainClients& clients
) : registry_(registry), clients_(clients) {}

Result<std::pair<const chain::ChainConfig*, const rpc::ChainNode*>>
BalanceOracle::evm_chain(chain::Chain chain) const {
    using Pair = std::pair<const chain::ChainConfig*, const rpc::ChainNode*>;

    const chain::ChainConfig* config = registry_.config_for(chain);
    if (!config) {
        return Err<Pair>(
            ErrorCode::UnsupportedChain,
            std::format("Сеть {} не настроена", chain::to_string(chain))
        );
    }
    const rpc::ChainNode* node = clients_.node_for(chain);
    if (!config->is_evm() || !node) {
        return Err<Pair>(
            ErrorCode::UnsupportedChain,
            std::format("Чтение балансов в сети {} не поддерживается", chain::to_string(chain))
        );
    }
    return Pair{config, node};
}

// =============================================================================
// Чтение с ошибками
// =============================================================================

Result<core::TokenAmount> BalanceOracle::fetch_token_balance(
    chain::Chain chain,
    const std::string& token,
    uint8_t decimals,
    const std::string& address
) const {
    auto target = evm_chain(chain);
    if (!target) {
        return std::unexpected(target.error());
    }
    auto owner = hex::parse_address(address);
    if (!owner) {
        return std::unexpected(owner.error());
    }
    auto token_address = hex::parse_address(token);
    if (!token_address) {
        return std::unexpected(token_address.error());
    }

    auto data = target->second->call(*token_address, evm::abi::encode_balance_of(*owner));
    if (!data) {
        return std::unexpected(data.error());
    }
    auto raw = evm::abi::decode_uint256(*data);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return core::TokenAmount::from_raw(*raw, decimals);
}

Result<core::TokenAmount> BalanceOracle::fetch_stablecoin_balance(
    chain::Chain chain,
    const std::string& address
) const {
    auto target = evm_chain(chain);
    if (!target) {
        return std::unexpected(target.error());
    }
    const chain::ChainConfig* config = target->first;
    return fetch_token_balance(chain, config->stablecoin_address, config->stablecoin_decimals, address);
}

Result<core::TokenAmount> BalanceOracle::fetch_native_balance(
    chain::Chain chain,
    const std::string& address
) const {
    auto target = evm_chain(chain);
    if (!target) {
        return std::unexpected(target.error());
    }
    auto owner = hex::parse_address(address);
    if (!owner) {
        return std::unexpected(owner.error());
    }
    auto raw = target->second->get_balance(*owner);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return core::TokenAmount::from_raw(*raw, constants::NATIVE_DECIMALS);
}

// =============================================================================
// Чтение с деградацией до нуля
// =============================================================================

core::TokenAmount BalanceOracle::stablecoin_balance(
    chain::Chain chain,
    const std::string& address
) const {
    const chain::ChainConfig* config = registry_.config_for(chain);
    uint8_t decimals = config ? config->stablecoin_decimals : 6;
    return or_zero(fetch_stablecoin_balance(chain, address), chain, decimals);
}

core::TokenAmount BalanceOracle::native_balance(
    chain::Chain chain,
    const std::string& address
) const {
    return or_zero(fetch_native_balance(chain, address), chain, constants::NATIVE_DECIMALS);
}

core::TokenAmount BalanceOracle::token_balance(
    chain::Chain chain,
    const std::string& token,
    uint8_t decimals,
    const std::string& address
) const {
    return or_zero(fetch_token_balance(chain, token, decimals, address), chain, decimals);
}

// =============================================================================
// Все сети
// =============================================================================

std::map<chain::Chain, core::TokenAmount> BalanceOracle::all_stablecoin_balances(
    const std::string& address
) const {
    std::vector<std::pair<chain::Chain, std::future<core::TokenAmount>>> pending;

    for (chain::Chain chain : registry_.supported_chains()) {
        if (!registry_.config_for(chain)->is_evm()) {
            continue;
        }
        pending.emplace_back(chain, std::async(std::launch::async, [this, chain, &address] {
            try {
                return stablecoin_balance(chain, address);
            } catch (const std::exception& e) {
                return or_zero(Err<core::TokenAmount>(ErrorCode::UnknownFailure, e.what()),
                               chain, registry_.config_for(chain)->stablecoin_decimals);
            }
        }));
    }

    std::map<chain::Chain, core::TokenAmount> balances;
    for (auto& [chain, future] : pending) {
        balances.emplace(chain, future.get());
    }
    return balances;
}

std::optional<std::pair<chain::Chain, core::TokenAmount>> BalanceOracle::find_chain_with_balance(
    const std::string& address,
    const core::TokenAmount& required,
    std::optional<chain::Chain> exclude
) const {
    auto balances = all_stablecoin_balances(address);

    // Порядок объявления сетей задаёт приоритет
    for (chain::Chain chain : chain::ALL_CHAINS) {
        if (exclude && *exclude == chain) {
            continue;
        }
        auto it = balances.find(chain);
        if (it != balances.end() && !it->second.is_zero() && it->second >= required) {
            return std::make_pair(chain, it->second);
        }
    }
    return std::nullopt;
}

} // namespace stablebridge::bridge
