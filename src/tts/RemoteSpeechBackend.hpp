// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tts/SpeechBackend.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string>

namespace textmic
{

/// @brief Configuration for the OpenAI-compatible speech endpoint.
struct RemoteSpeechConfig
{
    std::string apiBaseUrl = "https://api.openai.com/v1";
    std::string model = "tts-1";
    long timeoutSeconds = 60;
};

/// @brief Builds the JSON body of a speech request.
[[nodiscard]] auto makeSpeechRequest(std::string_view model, std::string_view text, std::string_view voiceId)
    -> nlohmann::json;

/// @brief Decodes a speech response body.
///
/// WAV bodies are decoded with decodeWav(). Anything else is taken as little-endian
/// int16 mono PCM at @p sampleRateHint.
[[nodiscard]] auto decodeSpeechResponse(std::span<const std::byte> body, unsigned sampleRateHint)
    -> Result<AudioBuffer>;

/// @brief Synthesizes speech with a remote `/audio/speech` endpoint over libcurl.
class RemoteSpeechBackend final: public SpeechBackend
{
  public:
    /// @brief Creates the backend, initializing libcurl once per process.
    /// @return The backend, or a NetworkError if libcurl cannot be initialized.
    [[nodiscard]] static auto create(RemoteSpeechConfig config) -> Result<std::unique_ptr<RemoteSpeechBackend>>;

    [[nodiscard]] auto name() const -> std::string_view override { return "remote"; }

    [[nodiscard]] auto synthesize(std::string_view text,
                                  std::string_view voiceId,
                                  std::string_view credentials,
                                  unsigned sampleRateHint) -> Result<AudioBuffer> override;

    /// @brief Prefer create(), which also initializes libcurl.
    explicit RemoteSpeechBackend(RemoteSpeechConfig config);

  private:
    RemoteSpeechConfig _config;
};

} // namespace textmic
