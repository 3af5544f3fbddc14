/**
 * @file evm_rpc_client.hpp
 * @brief JSON-RPC 2.0 клиент EVM ноды
 */

#pragma once

#include "chain_node.hpp"
#include "http_transport.hpp"

#include <memory>
#include <string>

namespace stablebridge::rpc {

/**
 * @brief JSON-RPC клиент поверх HttpTransport
 */
class EvmRpcClient final : public ChainNode {
public:
    /**
     * @brief Создать клиент
     *
     * @param url URL ноды (https://...)
     * @param transport HTTP транспорт (общий для всех клиентов)
     */
    EvmRpcClient(std::string url, std::shared_ptr<const HttpTransport> transport);

    [[nodiscard]] Result<core::uint256> get_balance(const Address& owner) const override;

    [[nodiscard]] Result<Bytes> call(const Address& to, ByteSpan data) const override;

    [[nodiscard]] Result<uint64_t> get_transaction_count(const Address& owner) const override;

    [[nodiscard]] Result<core::uint256> gas_price() const override;

    [[nodiscard]] Result<uint64_t> estimate_gas(const CallRequest& request) const override;

    [[nodiscard]] Result<Hash256> send_raw_transaction(ByteSpan signed_tx) const override;

    [[nodiscard]] Result<std::optional<TxReceipt>> get_transaction_receipt(
        const Hash256& tx_hash
    ) const override;

    /**
     * @brief Получить URL
     */
    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    std::shared_ptr<const HttpTransport> transport_;
};

} // namespace stablebridge::rpc
