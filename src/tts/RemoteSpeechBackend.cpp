// SPDX-License-Identifier: Apache-2.0
#include "RemoteSpeechBackend.hpp"

#include <core/Log.hpp>
#include <net/Http.hpp>

#include <format>
#include <memory>
#include <string>
#include <vector>

namespace textmic
{

namespace
{

    /// @brief Extracts `error.message` from an OpenAI-style error body, or returns the body itself.
    auto describeErrorBody(std::span<const std::byte> body) -> std::string
    {
        auto text = std::string(reinterpret_cast<const char*>(body.data()), body.size());
        try
        {
            auto const parsed = nlohmann::json::parse(text);
            if (parsed.contains("error") && parsed["error"].contains("message")
                && parsed["error"]["message"].is_string())
                return parsed["error"]["message"].get<std::string>();
        }
        catch (const nlohmann::json::exception&)
        {
            // Not JSON: report the raw body.
        }
        if (text.size() > 200)
            text = text.substr(0, 200) + "...";
        return text;
    }

} // namespace

auto makeSpeechRequest(std::string_view model, std::string_view text, std::string_view voiceId)
    -> nlohmann::json
{
    return nlohmann::json {
        { "model", std::string(model) },
        { "voice", std::string(voiceId) },
        { "input", std::string(text) },
        { "response_format", "wav" },
    };
}

auto decodeSpeechResponse(std::span<const std::byte> body, unsigned sampleRateHint) -> Result<AudioBuffer>
{
    if (body.empty())
        return makeError(ErrorCode::NetworkError, "Speech service returned an empty body");

    if (isWav(body))
        return decodeWav(body);

    log::debug("Speech response is not WAV, decoding as {} PCM at {}Hz",
               sampleFormatName(SampleFormat::Int16),
               sampleRateHint);
    return normalize(body, SampleFormat::Int16, sampleRateHint, 1);
}

RemoteSpeechBackend::RemoteSpeechBackend(RemoteSpeechConfig config): _config(std::move(config))
{
}

auto RemoteSpeechBackend::create(RemoteSpeechConfig config) -> Result<std::unique_ptr<RemoteSpeechBackend>>
{
    if (auto init = http::initialize(); !init)
        return std::unexpected(init.error());

    log::debug("Remote speech endpoint: {} (model {})", config.apiBaseUrl, config.model);
    return std::make_unique<RemoteSpeechBackend>(std::move(config));
}

auto RemoteSpeechBackend::synthesize(std::string_view text,
                                     std::string_view voiceId,
                                     std::string_view credentials,
                                     unsigned sampleRateHint) -> Result<AudioBuffer>
{
    auto const url = _config.apiBaseUrl + "/audio/speech";
    auto const payload = makeSpeechRequest(_config.model, text, voiceId).dump();
    auto const headers = std::vector<std::string> {
        "Content-Type: application/json",
        std::format("Authorization: Bearer {}", credentials),
    };

    log::debug("Requesting speech (voice {}, {} chars)", voiceId, text.size());
    auto response = http::post(url, headers, payload, _config.timeoutSeconds);
    if (!response)
        return std::unexpected(response.error());

    if (response->status >= 400)
        return makeError(ErrorCode::NetworkError,
                         std::format("Speech service returned HTTP {}: {}",
                                     response->status,
                                     describeErrorBody(response->body)));

    return decodeSpeechResponse(response->body, sampleRateHint);
}

} // namespace textmic
