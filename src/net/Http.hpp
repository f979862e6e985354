// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace textmic::http
{

struct Response
{
    long status = 0;
    std::vector<std::byte> body;

    [[nodiscard]] auto text() const -> std::string
    {
        return { reinterpret_cast<const char*>(body.data()), body.size() };
    }
};

/// @brief Initializes libcurl for the process. Safe to call repeatedly.
/// @return Success, or a NetworkError if libcurl is unusable.
[[nodiscard]] auto initialize() -> VoidResult;

/// @brief Performs a blocking HTTP POST.
/// @param url Target URL.
/// @param headers Raw header lines, e.g. "Content-Type: application/json".
/// @param body Request body.
/// @param timeoutSeconds Total transfer timeout.
/// @return The response (any status), or a NetworkError on transport failure.
[[nodiscard]] auto post(const std::string& url,
                        const std::vector<std::string>& headers,
                        std::string_view body,
                        long timeoutSeconds) -> Result<Response>;

/// @brief Percent-encodes @p value for an application/x-www-form-urlencoded body with libcurl.
///
/// Every byte outside the unreserved set, space included, becomes a %XX escape.
[[nodiscard]] auto formEncode(std::string_view value) -> Result<std::string>;

} // namespace textmic::http
