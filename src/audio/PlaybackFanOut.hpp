// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <audio/AudioDevices.hpp>
#include <core/Error.hpp>

#include <memory>
#include <span>
#include <vector>

namespace textmic
{

/// @brief Abstract sink that plays a whole buffer on one device, blocking until done.
///
/// Implementations must allow concurrent play() calls for different targets.
class AudioOutput
{
  public:
    virtual ~AudioOutput() = default;

    /// @brief Plays @p buffer on @p target and returns once the device consumed it.
    [[nodiscard]] virtual auto play(const DeviceTarget& target, const AudioBuffer& buffer) -> VoidResult = 0;
};

/// @brief AudioOutput that opens a fresh miniaudio device for every call.
class MiniaudioOutput final: public AudioOutput
{
  public:
    [[nodiscard]] auto play(const DeviceTarget& target, const AudioBuffer& buffer) -> VoidResult override;
};

/// @brief Outcome of playing a buffer on one device.
struct DeviceResult
{
    DeviceTarget target;
    VoidResult result;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return result.has_value(); }
};

/// @brief Plays one buffer on several output devices at the same time.
class PlaybackFanOut
{
  public:
    explicit PlaybackFanOut(std::shared_ptr<AudioOutput> output);

    /// @brief Plays @p buffer on every target concurrently and waits for all of them.
    ///
    /// With no targets the buffer is played once on the system default device.
    /// A mono buffer is expanded to stereo once before dispatch. A failing device is
    /// reported in its own DeviceResult and does not affect the others.
    /// @return One result per target (or a single result for the default device).
    ///         Empty if @p buffer holds no samples.
    [[nodiscard]] auto playToDevices(const AudioBuffer& buffer, std::span<const DeviceTarget> targets)
        -> std::vector<DeviceResult>;

  private:
    std::shared_ptr<AudioOutput> _output;
};

} // namespace textmic
