// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string_view>

namespace textmic
{

/// @brief Callback invoked from the audio thread with captured mono float32 samples.
using AudioCallback = std::function<void(std::span<const float> samples)>;

/// @brief Captures mono float32 audio from a microphone using miniaudio.
class AudioCapture
{
  public:
    AudioCapture();
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Opens the capture device.
    /// @param callback Called with audio chunks from the capture thread.
    /// @param sampleRate Capture rate in Hz.
    /// @param deviceName Optional substring to match against capture device names (case-insensitive).
    ///                   If empty or unmatched, the first non-monitor device is used.
    /// @return Success or an AudioError.
    [[nodiscard]] auto initialize(AudioCallback callback, unsigned sampleRate, std::string_view deviceName = {})
        -> VoidResult;

    [[nodiscard]] auto start() -> VoidResult;

    void stop();

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace textmic
