// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioDevices.hpp>
#include <core/Error.hpp>

#include <memory>
#include <span>

namespace textmic
{

/// @brief Plays raw PCM audio through one playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. Playback is blocking:
/// play() returns once all samples have been consumed by the audio device.
/// Each instance owns its own miniaudio context, so instances can be driven from
/// different threads at the same time.
class AudioPlayback
{
  public:
    AudioPlayback();
    ~AudioPlayback();

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    /// @brief Opens the playback device.
    /// @param sampleRate Audio sample rate in Hz (e.g. 24000).
    /// @param channels Number of interleaved channels.
    /// @param target The device to open; the default sentinel selects the system default.
    /// @return Success, or a PlaybackDeviceError if the device cannot be opened.
    [[nodiscard]] auto initialize(unsigned sampleRate, unsigned channels, DeviceTarget target = {})
        -> VoidResult;

    /// @brief Plays interleaved float32 PCM audio, blocking until all samples are consumed.
    [[nodiscard]] auto play(std::span<const float> samples) -> VoidResult;

    /// @brief Cancels the current playback immediately.
    void stop();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace textmic
