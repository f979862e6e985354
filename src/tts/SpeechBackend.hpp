// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace textmic
{

/// @brief The voices a job may request.
inline constexpr auto KnownVoices = std::array<std::string_view, 6> {
    "alloy", "echo", "fable", "onyx", "nova", "shimmer",
};

inline constexpr auto DefaultVoice = std::string_view { "alloy" };

/// @brief Sample rate assumed for headerless PCM when the configuration names none.
inline constexpr auto DefaultSampleRateHint = 24000U;

[[nodiscard]] constexpr auto isKnownVoice(std::string_view voiceId) -> bool
{
    return std::ranges::find(KnownVoices, voiceId) != KnownVoices.end();
}

/// @brief Which synthesis backend the adapter will try first, resolved once at startup.
enum class SynthesisBackend : std::uint8_t
{
    Remote,
    Local,
    None,
};

[[nodiscard]] constexpr auto synthesisBackendName(SynthesisBackend backend) -> std::string_view
{
    switch (backend)
    {
        case SynthesisBackend::Remote: return "remote";
        case SynthesisBackend::Local: return "local";
        case SynthesisBackend::None: return "none";
    }
    return "none";
}

/// @brief A text-to-speech engine producing normalized audio.
class SpeechBackend
{
  public:
    virtual ~SpeechBackend() = default;

    /// @brief Short name for log messages.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @brief Synthesizes @p text. Blocking; may take seconds.
    /// @param text The text to speak.
    /// @param voiceId The requested voice.
    /// @param credentials API credentials; ignored by backends that need none.
    /// @param sampleRateHint Rate of audio that arrives without a header.
    [[nodiscard]] virtual auto synthesize(std::string_view text,
                                          std::string_view voiceId,
                                          std::string_view credentials,
                                          unsigned sampleRateHint) -> Result<AudioBuffer> = 0;
};

} // namespace textmic
