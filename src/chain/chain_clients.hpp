/**
 * @file chain_clients.hpp
 * @brief Клиенты нод поддерживаемых EVM сетей
 */

#pragma once

#include "chain.hpp"
#include "chain_registry.hpp"
#include "../rpc/chain_node.hpp"
#include "../rpc/http_transport.hpp"

#include <map>
#include <memory>

namespace stablebridge::chain {

/**
 * @brief Неизменяемый набор клиентов нод
 *
 * Создаётся один раз вместе с реестром и разделяется
 * между всеми операциями.
 */
class ChainClients {
public:
    using NodeMap = std::map<Chain, std::shared_ptr<const rpc::ChainNode>>;

    explicit ChainClients(NodeMap nodes);

    /**
     * @brief JSON-RPC клиенты для всех поддерживаемых EVM сетей реестра
     */
    [[nodiscard]] static ChainClients connect(
        const ChainRegistry& registry,
        std::shared_ptr<const rpc::HttpTransport> transport
    );

    /**
     * @brief Клиент ноды сети
     *
     * @return nullptr если для сети нет клиента
     */
    [[nodiscard]] const rpc::ChainNode* node_for(Chain chain) const;

private:
    NodeMap nodes_;
};

} // namespace stablebridge::chain
