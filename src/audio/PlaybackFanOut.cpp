// SPDX-License-Identifier: Apache-2.0
#include "PlaybackFanOut.hpp"

#include <audio/AudioPlayback.hpp>
#include <core/Log.hpp>

#include <exception>
#include <format>
#include <thread>

namespace textmic
{

namespace
{

    /// @brief Runs one device's playback, turning exceptions into a PlaybackDeviceError.
    auto playGuarded(AudioOutput& output, const DeviceTarget& target, const AudioBuffer& buffer) -> VoidResult
    {
        try
        {
            auto result = output.play(target, buffer);
            if (!result && result.error().code != ErrorCode::PlaybackDeviceError)
                return makeError(ErrorCode::PlaybackDeviceError, std::move(result.error().message));
            return result;
        }
        catch (const std::exception& e)
        {
            return makeError(ErrorCode::PlaybackDeviceError,
                             std::format("Playback on device {} threw: {}", target.toString(), e.what()));
        }
    }

    void report(const DeviceResult& deviceResult)
    {
        if (deviceResult.succeeded())
            log::debug("Playback finished on device {}", deviceResult.target.toString());
        else
            log::warning("Playback failed on device {}: {}",
                         deviceResult.target.toString(),
                         deviceResult.result.error().message);
    }

} // namespace

auto MiniaudioOutput::play(const DeviceTarget& target, const AudioBuffer& buffer) -> VoidResult
{
    auto playback = AudioPlayback {};
    auto result = playback.initialize(buffer.sampleRate, buffer.channels, target);
    if (!result)
        return result;
    return playback.play(buffer.samples);
}

PlaybackFanOut::PlaybackFanOut(std::shared_ptr<AudioOutput> output): _output(std::move(output))
{
}

auto PlaybackFanOut::playToDevices(const AudioBuffer& buffer, std::span<const DeviceTarget> targets)
    -> std::vector<DeviceResult>
{
    if (buffer.empty())
        return {};

    // Shared read-only by every device thread below.
    auto const stereo = toStereo(buffer);

    if (targets.empty())
    {
        auto results = std::vector<DeviceResult> { DeviceResult { .target = {}, .result = {} } };
        results.front().result = playGuarded(*_output, results.front().target, stereo);
        report(results.front());
        return results;
    }

    auto results = std::vector<DeviceResult>(targets.size());
    {
        auto workers = std::vector<std::jthread> {};
        workers.reserve(targets.size());
        for (auto i = std::size_t { 0 }; i < targets.size(); ++i)
        {
            results[i].target = targets[i];
            workers.emplace_back([this, &stereo, &slot = results[i]] {
                slot.result = playGuarded(*_output, slot.target, stereo);
            });
        }
        log::debug("Playing {:.2f}s of audio on {} device(s)", stereo.durationSeconds(), targets.size());
        // jthread joins on destruction: every device has finished once this scope ends.
    }

    for (auto const& deviceResult: results)
        report(deviceResult);

    return results;
}

} // namespace textmic
