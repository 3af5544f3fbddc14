/**
 * @file http_transport.cpp
 * @brief Реализация HTTP транспорта на libcurl
 */

#include "http_transport.hpp"

#include <curl/curl.h>

#include <atomic>
#include <format>
#include <memory>

namespace stablebridge::rpc {

// =============================================================================
// CURL callback
// =============================================================================

namespace {

std::size_t write_callback(
    char* ptr,
    std::size_t size,
    std::size_t nmemb,
    void* userdata
) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// Глобальная инициализация CURL
std::atomic<bool> curl_initialized{false};

void ensure_curl_init() {
    bool expected = false;
    if (curl_initialized.compare_exchange_strong(expected, true)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
}

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

} // anonymous namespace

// =============================================================================
// CurlHttpTransport
// =============================================================================

CurlHttpTransport::CurlHttpTransport(uint32_t timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
    ensure_curl_init();
}

Result<HttpResponse> CurlHttpTransport::get(
    const std::string& url,
    const HttpHeaders& headers
) const {
    return perform(url, nullptr, headers);
}

Result<HttpResponse> CurlHttpTransport::post(
    const std::string& url,
    std::string_view body,
    const HttpHeaders& headers
) const {
    std::string request_body(body);
    return perform(url, &request_body, headers);
}

Result<HttpResponse> CurlHttpTransport::perform(
    const std::string& url,
    const std::string* body,
    const HttpHeaders& headers
) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Err<HttpResponse>(ErrorCode::NetworkConnectionFailed, "CURL не инициализирован");
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    // Заголовки
    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    if (body) {
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    }
    for (const auto& [name, value] : headers) {
        raw_headers = curl_slist_append(raw_headers, std::format("{}: {}", name, value).c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

    // Выполняем запрос
    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Err<HttpResponse>(
            ErrorCode::NetworkTimeout,
            std::format("Таймаут запроса {}", url)
        );
    }
    if (res != CURLE_OK) {
        return Err<HttpResponse>(
            ErrorCode::NetworkConnectionFailed,
            std::format("CURL ошибка: {}", curl_easy_strerror(res))
        );
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace stablebridge::rpc
