/**
 * @file evm_rpc_client.cpp
 * @brief Реализация JSON-RPC клиента EVM ноды
 */

#include "evm_rpc_client.hpp"
#include "../core/hex.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace stablebridge::rpc {

using json = nlohmann::json;

namespace {

// =============================================================================
// JSON-RPC
// =============================================================================

/**
 * @brief Преобразовать код ошибки JSON-RPC в ErrorCode
 */
[[nodiscard]] ErrorCode map_rpc_error(int64_t code) noexcept {
    switch (code) {
        case -32700: return ErrorCode::RpcParseError;
        case -32601: return ErrorCode::RpcMethodNotFound;
        case -32602: return ErrorCode::RpcInvalidParams;
        default:     return ErrorCode::RpcInternalError;
    }
}

/**
 * @brief Выполнить JSON-RPC запрос и вернуть поле "result"
 */
Result<json> request(
    const HttpTransport& transport,
    const std::string& url,
    std::string_view method,
    json params
) {
    json body = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", std::string(method)},
        {"params", std::move(params)},
    };

    auto response = transport.post(url, body.dump());
    if (!response) {
        ErrorCode code = response.error().code == ErrorCode::NetworkTimeout
            ? ErrorCode::RpcTimeout
            : ErrorCode::RpcConnectionFailed;
        return Err<json>(code, std::format("{}: {}", method, response.error().message));
    }

    if (response->status == 401 || response->status == 403) {
        return Err<json>(ErrorCode::RpcAuthFailed, "Ошибка авторизации RPC");
    }
    if (!response->ok()) {
        return Err<json>(
            ErrorCode::RpcInternalError,
            std::format("{}: HTTP ошибка {}", method, response->status)
        );
    }

    json parsed = json::parse(response->body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Err<json>(
            ErrorCode::RpcParseError,
            std::format("{}: ответ не является JSON объектом", method)
        );
    }

    if (auto error = parsed.find("error"); error != parsed.end() && !error->is_null()) {
        // Некоторые провайдеры отвечают строкой: {"error": "rate limited"}
        if (!error->is_object()) {
            return Err<json>(
                ErrorCode::RpcInternalError,
                std::format("{}: {}", method, error->is_string() ? error->get<std::string>() : error->dump())
            );
        }
        try {
            int64_t code = error->value("code", int64_t{0});
            std::string message = error->value("message", std::string{"неизвестная ошибка"});
            return Err<json>(map_rpc_error(code), std::format("{}: {}", method, message));
        } catch (const json::exception& e) {
            return Err<json>(
                ErrorCode::RpcParseError,
                std::format("{}: некорректное поле error ({}): {}", method, e.what(), error->dump())
            );
        }
    }

    auto result = parsed.find("result");
    if (result == parsed.end()) {
        return Err<json>(
            ErrorCode::RpcParseError,
            std::format("{}: в ответе нет поля result", method)
        );
    }
    return *result;
}

[[nodiscard]] Result<core::uint256> parse_quantity(const json& value) {
    if (!value.is_string()) {
        return Err<core::uint256>(ErrorCode::RpcParseError, "Ожидалась hex строка");
    }
    auto parsed = core::uint256::from_hex(value.get<std::string>());
    if (!parsed) {
        return Err<core::uint256>(
            ErrorCode::RpcParseError,
            std::format("Некорректное hex число: {}", value.get<std::string>())
        );
    }
    return *parsed;
}

[[nodiscard]] Result<uint64_t> parse_quantity_u64(const json& value) {
    auto parsed = parse_quantity(value);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (!parsed->fits_u64()) {
        return Err<uint64_t>(ErrorCode::RpcParseError, "Число не помещается в 64 бита");
    }
    return parsed->low_u64();
}

[[nodiscard]] Result<Bytes> parse_data(const json& value) {
    if (!value.is_string()) {
        return Err<Bytes>(ErrorCode::RpcParseError, "Ожидались hex данные");
    }
    auto bytes = hex::decode(value.get<std::string>());
    if (!bytes) {
        return Err<Bytes>(ErrorCode::RpcParseError, "Некорректные hex данные");
    }
    return std::move(*bytes);
}

/**
 * @brief Разобрать receipt из ответа eth_getTransactionReceipt
 */
[[nodiscard]] Result<TxReceipt> parse_receipt(const json& value) {
    try {
        TxReceipt receipt;

        auto hash = hex::parse_hash(value.at("transactionHash").get<std::string>());
        if (!hash) {
            return std::unexpected(hash.error());
        }
        receipt.transaction_hash = *hash;

        // До Byzantium поля status нет: считаем такие receipt неуспешными
        if (auto status = value.find("status"); status != value.end() && status->is_string()) {
            auto parsed = parse_quantity_u64(*status);
            receipt.success = parsed && *parsed == 1;
        }
        if (auto block = value.find("blockNumber"); block != value.end() && !block->is_null()) {
            receipt.block_number = parse_quantity_u64(*block).value_or(0);
        }
        if (auto gas = value.find("gasUsed"); gas != value.end() && !gas->is_null()) {
            receipt.gas_used = parse_quantity_u64(*gas).value_or(0);
        }

        for (const auto& entry : value.value("logs", json::array())) {
            LogEntry log;
            auto address = hex::parse_address(entry.at("address").get<std::string>());
            if (!address) {
                return std::unexpected(address.error());
            }
            log.address = *address;

            for (const auto& topic : entry.value("topics", json::array())) {
                auto topic_hash = hex::parse_hash(topic.get<std::string>());
                if (!topic_hash) {
                    return std::unexpected(topic_hash.error());
                }
                log.topics.push_back(*topic_hash);
            }

            auto data = parse_data(entry.value("data", json("0x")));
            if (!data) {
                return std::unexpected(data.error());
            }
            log.data = std::move(*data);
            receipt.logs.push_back(std::move(log));
        }

        return receipt;
    } catch (const json::exception& e) {
        return Err<TxReceipt>(
            ErrorCode::RpcParseError,
            std::format("Некорректный receipt: {}", e.what())
        );
    }
}

} // anonymous namespace

// =============================================================================
// EvmRpcClient
// =============================================================================

EvmRpcClient::EvmRpcClient(std::string url, std::shared_ptr<const HttpTransport> transport)
    : url_(std::move(url))
    , transport_(std::move(transport)) {}

Result<core::uint256> EvmRpcClient::get_balance(const Address& owner) const {
    auto result = request(*transport_, url_, "eth_getBalance",
                          json::array({hex::address_to_string(owner), "latest"}));
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_quantity(*result);
}

Result<Bytes> EvmRpcClient::call(const Address& to, ByteSpan data) const {
    json call_object = {
        {"to", hex::address_to_string(to)},
        {"data", hex::encode(data)},
    };
    auto result = request(*transport_, url_, "eth_call", json::array({call_object, "latest"}));
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_data(*result);
}

Result<uint64_t> EvmRpcClient::get_transaction_count(const Address& owner) const {
    auto result = request(*transport_, url_, "eth_getTransactionCount",
                          json::array({hex::address_to_string(owner), "pending"}));
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_quantity_u64(*result);
}

Result<core::uint256> EvmRpcClient::gas_price() const {
    auto result = request(*transport_, url_, "eth_gasPrice", json::array());
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_quantity(*result);
}

Result<uint64_t> EvmRpcClient::estimate_gas(const CallRequest& call_request) const {
    json call_object = {
        {"to", hex::address_to_string(call_request.to)},
        {"data", hex::encode(call_request.data)},
        {"value", call_request.value.to_quantity()},
    };
    if (call_request.from) {
        call_object["from"] = hex::address_to_string(*call_request.from);
    }

    auto result = request(*transport_, url_, "eth_estimateGas", json::array({call_object}));
    if (!result) {
        return std::unexpected(result.error());
    }
    return parse_quantity_u64(*result);
}

Result<Hash256> EvmRpcClient::send_raw_transaction(ByteSpan signed_tx) const {
    auto result = request(*transport_, url_, "eth_sendRawTransaction",
                          json::array({hex::encode(signed_tx)}));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->is_string()) {
        return Err<Hash256>(ErrorCode::RpcParseError, "eth_sendRawTransaction: ожидался хеш");
    }
    return hex::parse_hash(result->get<std::string>());
}

Result<std::optional<TxReceipt>> EvmRpcClient::get_transaction_receipt(
    const Hash256& tx_hash
) const {
    auto result = request(*transport_, url_, "eth_getTransactionReceipt",
                          json::array({hex::encode(tx_hash)}));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->is_null()) {
        return std::optional<TxReceipt>{};
    }

    auto receipt = parse_receipt(*result);
    if (!receipt) {
        return std::unexpected(receipt.error());
    }
    return std::optional<TxReceipt>{std::move(*receipt)};
}

} // namespace stablebridge::rpc
