/**
 * @file attestation_client.hpp
 * @brief Клиент сервиса аттестаций нативного протокола
 */

#pragma once

#include "../rpc/http_transport.hpp"

#include <memory>
#include <optional>
#include <string>

namespace stablebridge::bridge {

/**
 * @brief Готовая аттестация сообщения
 */
struct Attestation {
    /// @brief Сообщение из ответа сервиса; пустое, если сервис его не вернул
    Bytes message;

    /// @brief Подписи аттесторов
    Bytes attestation;
};

/**
 * @brief Клиент сервиса аттестаций
 *
 * GET {base}/attestations/{0x-hash} → {status, attestation, message}.
 * 404 означает, что сообщение ещё не проиндексировано.
 */
class AttestationClient {
public:
    AttestationClient(std::string base_url, std::shared_ptr<const rpc::HttpTransport> transport);

    /**
     * @brief Запросить аттестацию один раз
     *
     * @param message_hash keccak256 сообщения
     * @return Аттестация, std::nullopt если ещё не готова,
     *         ошибка при сбое сети или некорректном ответе
     */
    [[nodiscard]] Result<std::optional<Attestation>> fetch(const Hash256& message_hash) const;

    [[nodiscard]] std::string url_for(const Hash256& message_hash) const;

private:
    std::string base_url_;
    std::shared_ptr<const rpc::HttpTransport> transport_;
};

} // namespace stablebridge::bridge
