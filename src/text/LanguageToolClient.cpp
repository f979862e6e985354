// SPDX-License-Identifier: Apache-2.0
#include "LanguageToolClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/Http.hpp>

#include <format>

namespace textmic
{

auto parseLanguageToolMatches(std::string_view responseBody) -> Result<std::vector<Correction>>
{
    auto parsed = json::parse(responseBody);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto corrections = std::vector<Correction> {};
    auto const it = parsed->find("matches");
    if (it == parsed->end() || !it->is_array())
        return corrections;

    for (auto const& match: *it)
    {
        auto const offset = json::getIntOr(match, "offset", -1);
        auto const length = json::getIntOr(match, "length", -1);
        if (offset < 0 || length < 0)
            continue;

        auto const replacements = match.find("replacements");
        if (replacements == match.end() || !replacements->is_array() || replacements->empty())
            continue;

        corrections.push_back(Correction {
            .offset = static_cast<std::size_t>(offset),
            .length = static_cast<std::size_t>(length),
            .replacement = json::getStringOr(replacements->front(), "value", ""),
        });
    }
    return corrections;
}

LanguageToolClient::LanguageToolClient(LanguageToolConfig config): _config(std::move(config))
{
}

auto LanguageToolClient::correct(std::string_view text) -> Result<std::string>
{
    if (text.empty())
        return std::string {};

    auto const url = _config.url + "/v2/check";
    auto const encodedText = http::formEncode(text);
    if (!encodedText)
        return std::unexpected(encodedText.error());
    auto const encodedLanguage = http::formEncode(_config.language);
    if (!encodedLanguage)
        return std::unexpected(encodedLanguage.error());

    auto const body = std::format("text={}&language={}", *encodedText, *encodedLanguage);

    auto response =
        http::post(url, { "Content-Type: application/x-www-form-urlencoded" }, body, _config.timeoutSeconds);
    if (!response)
        return std::unexpected(response.error());

    if (response->status >= 400)
        return makeError(ErrorCode::NetworkError,
                         std::format("LanguageTool returned HTTP {}: {}", response->status, response->text()));

    auto corrections = parseLanguageToolMatches(response->text());
    if (!corrections)
        return makeError(ErrorCode::NetworkError,
                         std::format("Unexpected LanguageTool response: {}", corrections.error().message));

    log::debug("LanguageTool suggested {} correction(s)", corrections->size());
    return applyCorrections(text, utf16ToByteCorrections(text, *corrections));
}

} // namespace textmic
