/**
 * @file chain_clients.cpp
 * @brief Реализация набора клиентов нод
 */

#include "chain_clients.hpp"
#include "../rpc/evm_rpc_client.hpp"

namespace stablebridge::chain {

ChainClients::ChainClients(NodeMap nodes)
    : nodes_(std::move(nodes)) {}

ChainClients ChainClients::connect(
    const ChainRegistry& registry,
    std::shared_ptr<const rpc::HttpTransport> transport
) {
    NodeMap nodes;
    for (Chain chain : registry.supported_chains()) {
        const ChainConfig* config = registry.config_for(chain);
        if (!config->is_evm()) {
            continue;
        }
        nodes.emplace(chain, std::make_shared<rpc::EvmRpcClient>(config->rpc_url, transport));
    }
    return ChainClients(std::move(nodes));
}

const rpc::ChainNode* ChainClients::node_for(Chain chain) const {
    auto it = nodes_.find(chain);
    if (it == nodes_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace stablebridge::chain
