// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioDevices.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textmic
{

/// @brief Pipeline state broadcast to the front end.
enum class PipelineState : std::uint8_t
{
    Idle,
    Synthesizing,
    Queued,
    Playing,
    Error,
};

[[nodiscard]] constexpr auto pipelineStateName(PipelineState state) -> std::string_view
{
    switch (state)
    {
        case PipelineState::Idle: return "Idle";
        case PipelineState::Synthesizing: return "Synthesizing";
        case PipelineState::Queued: return "Queued";
        case PipelineState::Playing: return "Playing";
        case PipelineState::Error: return "Error";
    }
    return "Unknown";
}

struct PipelineStatus
{
    PipelineState state = PipelineState::Idle;

    /// @brief Human readable detail; set for PipelineState::Error.
    std::string message;
};

/// @brief The configuration values the pipeline reads, copied when a job is enqueued.
struct PipelineSettings
{
    std::optional<int> headphoneDevice;
    std::optional<int> micDevice;
    std::optional<std::string> apiKey;

    /// @brief Rate of headerless PCM returned by the speech service.
    unsigned sampleRateHint = 24000;

    /// @brief Headphone then mic device, without duplicates. Empty means the default device.
    [[nodiscard]] auto targets() const -> std::vector<DeviceTarget>;
};

/// @brief One unit of work flowing through the pipeline worker.
struct SynthesisJob
{
    std::string text;
    std::string voiceId;
    std::vector<DeviceTarget> targets;
    std::optional<std::string> credentials;
    unsigned sampleRateHint = 24000;
};

/// @brief Builds a job from user input and a settings snapshot.
///
/// Unknown voices are replaced by the default voice.
/// @return The job, or std::nullopt if @p text is blank.
[[nodiscard]] auto makeJob(std::string_view text, std::string_view voiceId, const PipelineSettings& settings)
    -> std::optional<SynthesisJob>;

} // namespace textmic
