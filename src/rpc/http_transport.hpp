/**
 * @file http_transport.hpp
 * @brief HTTP транспорт для JSON-RPC нод и REST API агрегаторов
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace stablebridge::rpc {

/**
 * @brief Заголовки запроса
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief Ответ HTTP сервера
 *
 * Любой код статуса считается успешным ответом транспорта;
 * интерпретация статуса остаётся вызывающему.
 */
struct HttpResponse {
    long status{0};
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Абстрактный HTTP транспорт
 *
 * Ошибка Result означает, что ответ не получен вовсе
 * (соединение, DNS, таймаут).
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual Result<HttpResponse> get(
        const std::string& url,
        const HttpHeaders& headers = {}
    ) const = 0;

    [[nodiscard]] virtual Result<HttpResponse> post(
        const std::string& url,
        std::string_view body,
        const HttpHeaders& headers = {}
    ) const = 0;
};

/**
 * @brief Транспорт на libcurl
 *
 * Каждый запрос открывает свой easy handle, поэтому объект
 * без состояния и безопасен для вызова из нескольких потоков.
 */
class CurlHttpTransport final : public HttpTransport {
public:
    /**
     * @param timeout_seconds Таймаут одного запроса
     */
    explicit CurlHttpTransport(uint32_t timeout_seconds = 30);

    [[nodiscard]] Result<HttpResponse> get(
        const std::string& url,
        const HttpHeaders& headers = {}
    ) const override;

    [[nodiscard]] Result<HttpResponse> post(
        const std::string& url,
        std::string_view body,
        const HttpHeaders& headers = {}
    ) const override;

private:
    [[nodiscard]] Result<HttpResponse> perform(
        const std::string& url,
        const std::string* body,
        const HttpHeaders& headers
    ) const;

    uint32_t timeout_seconds_;
};

} // namespace stablebridge::rpc
