// SPDX-License-Identifier: Apache-2.0
#include "Http.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <array>
#include <format>
#include <limits>
#include <memory>
#include <mutex>

namespace textmic::http
{

namespace
{

    struct CurlEasyDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct CurlSlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    struct CurlFreeDeleter
    {
        void operator()(char* text) const { curl_free(text); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
    using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;
    using CurlString = std::unique_ptr<char, CurlFreeDeleter>;

    auto initOnce = std::once_flag {};
    auto initResult = CURLE_OK;

    auto writeBody(char* data, std::size_t size, std::size_t nmemb, void* userData) -> std::size_t
    {
        auto* body = static_cast<std::vector<std::byte>*>(userData);
        auto const* bytes = reinterpret_cast<const std::byte*>(data);
        body->insert(body->end(), bytes, bytes + size * nmemb);
        return size * nmemb;
    }

} // namespace

auto initialize() -> VoidResult
{
    std::call_once(initOnce, [] { initResult = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (initResult != CURLE_OK)
        return makeError(ErrorCode::NetworkError,
                         std::format("libcurl initialization failed: {}", curl_easy_strerror(initResult)));
    return {};
}

auto post(const std::string& url, const std::vector<std::string>& headers, std::string_view body, long timeoutSeconds)
    -> Result<Response>
{
    if (auto init = initialize(); !init)
        return std::unexpected(init.error());

    auto handle = CurlHandle(curl_easy_init());
    if (!handle)
        return makeError(ErrorCode::NetworkError, "curl_easy_init failed");

    auto headerList = CurlHeaders {};
    for (auto const& header: headers)
    {
        auto* appended = curl_slist_append(headerList.get(), header.c_str());
        if (!appended)
            return makeError(ErrorCode::NetworkError, "Failed to build HTTP header list");
        headerList.release();
        headerList.reset(appended);
    }

    auto response = Response {};
    auto errorBuffer = std::array<char, CURL_ERROR_SIZE> {};

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errorBuffer.data());

    log::trace("POST {} ({} bytes)", url, body.size());
    auto const rc = curl_easy_perform(handle.get());
    if (rc != CURLE_OK)
        return makeError(ErrorCode::NetworkError,
                         std::format("POST {} failed: {}",
                                     url,
                                     errorBuffer[0] != '\0' ? errorBuffer.data() : curl_easy_strerror(rc)));

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    log::trace("POST {} -> HTTP {} ({} bytes)", url, response.status, response.body.size());
    return response;
}

auto formEncode(std::string_view value) -> Result<std::string>
{
    // curl_easy_escape() reads a zero length as "use strlen".
    if (value.empty())
        return std::string {};
    if (value.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        return makeError(ErrorCode::InvalidArgument, "Form value too large to encode");

    if (auto init = initialize(); !init)
        return std::unexpected(init.error());

    auto handle = CurlHandle(curl_easy_init());
    if (!handle)
        return makeError(ErrorCode::NetworkError, "curl_easy_init failed");

    auto escaped = CurlString(curl_easy_escape(handle.get(), value.data(), static_cast<int>(value.size())));
    if (!escaped)
        return makeError(ErrorCode::NetworkError, "curl_easy_escape failed");
    return std::string(escaped.get());
}

} // namespace textmic::http
