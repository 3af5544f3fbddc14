/**
 * @file attestation_client.cpp
 * @brief Реализация клиента сервиса аттестаций
 */

#include "attestation_client.hpp"
#include "../core/hex.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <utility>

namespace stablebridge::bridge {

using json = nlohmann::json;

AttestationClient::AttestationClient(
    std::string base_url,
    std::shared_ptr<const rpc::HttpTransport> transport
) : base_url_(std::move(base_url)), transport_(std::move(transport)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string AttestationClient::url_for(const Hash256& message_hash) const {
    return std::format("{}/attestations/{}", base_url_, hex::encode(message_hash));
}

Result<std::optional<Attestation>> AttestationClient::fetch(const Hash256& message_hash) const {
    using Value = std::optional<Attestation>;

    auto response = transport_->get(url_for(message_hash));
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 404) {
        return Value{};
    }
    if (!response->ok()) {
        return Err<Value>(
            ErrorCode::RpcInternalError,
            std::format("Сервис аттестаций вернул HTTP {}", response->status)
        );
    }

    try {
        json body = json::parse(response->body);

        if (body.value("status", std::string{}) != "complete") {
            return Value{};
        }

        auto attestation_hex = body.value("attestation", std::string{});
        auto attestation = hex::decode(attestation_hex);
        if (!attestation || attestation->empty()) {
            // Сервис отвечает "PENDING" вместо подписи, пока она не собрана
            return Value{};
        }

        Attestation result;
        result.attestation = std::move(*attestation);

        if (body.contains("message") && body["message"].is_string()) {
            auto message = hex::decode(body["message"].get<std::string>());
            if (message) {
                result.message = std::move(*message);
            }
        }
        return Value{std::move(result)};
    } catch (const json::exception& e) {
        return Err<Value>(
            ErrorCode::RpcParseError,
            std::format("Некорректный ответ сервиса аттестаций: {}", e.what())
        );
    }
}

} // namespace stablebridge::bridge
