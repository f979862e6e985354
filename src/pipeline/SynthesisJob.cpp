// SPDX-License-Identifier: Apache-2.0
#include "SynthesisJob.hpp"

#include <core/Log.hpp>
#include <core/Strings.hpp>
#include <tts/SpeechBackend.hpp>

#include <algorithm>

namespace textmic
{

auto PipelineSettings::targets() const -> std::vector<DeviceTarget>
{
    auto result = std::vector<DeviceTarget> {};
    for (auto const& device: { headphoneDevice, micDevice })
    {
        if (!device)
            continue;
        auto const target = DeviceTarget { .index = *device };
        if (std::ranges::find(result, target) == result.end())
            result.push_back(target);
    }
    return result;
}

auto makeJob(std::string_view text, std::string_view voiceId, const PipelineSettings& settings)
    -> std::optional<SynthesisJob>
{
    auto trimmed = trimText(text);
    if (trimmed.empty())
        return std::nullopt;

    auto voice = std::string(voiceId);
    if (!isKnownVoice(voice))
    {
        log::warning("Unknown voice '{}', using '{}'", voiceId, DefaultVoice);
        voice = std::string(DefaultVoice);
    }

    return SynthesisJob {
        .text = std::move(trimmed),
        .voiceId = std::move(voice),
        .targets = settings.targets(),
        .credentials = settings.apiKey,
        .sampleRateHint = settings.sampleRateHint,
    };
}

} // namespace textmic
