// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayback.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <span>

namespace textmic
{

struct AudioPlayback::Impl
{
    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool initialized = false;
    DeviceTarget target;

    // Buffer state, guarded by mutex and signalled via condvar
    std::span<const float> buffer;
    std::size_t readPos = 0;
    bool drained = false;
    std::mutex mutex;
    std::condition_variable done;
    std::atomic<bool> cancelled { false };
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioPlayback::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const channels = device->playback.channels;
        auto const totalSamples = static_cast<std::size_t>(frameCount) * channels;

        auto lock = std::unique_lock(impl->mutex);
        auto const remaining = impl->buffer.size() - impl->readPos;
        auto const toCopy = std::min(totalSamples, remaining);

        if (toCopy > 0)
        {
            std::copy_n(impl->buffer.data() + impl->readPos, toCopy, out);
            impl->readPos += toCopy;
        }

        if (toCopy < totalSamples)
            std::fill_n(out + toCopy, totalSamples - toCopy, 0.0f);

        // The buffer counts as drained one period after the last sample was handed over,
        // so the device has had a chance to output the tail.
        if (remaining == 0 || impl->cancelled.load(std::memory_order_relaxed))
        {
            impl->drained = true;
            lock.unlock();
            impl->done.notify_one();
        }
    }

    auto findPlaybackDevice(ma_context& context, int index) -> Result<ma_device_id>
    {
        ma_device_info* playbackDevices = nullptr;
        auto playbackCount = ma_uint32 { 0 };
        auto const enumResult =
            ma_context_get_devices(&context, &playbackDevices, &playbackCount, nullptr, nullptr);
        if (enumResult != MA_SUCCESS)
            return makeError(ErrorCode::PlaybackDeviceError,
                             std::format("Failed to enumerate playback devices: {}", static_cast<int>(enumResult)));

        if (index < 0 || static_cast<ma_uint32>(index) >= playbackCount)
            return makeError(
                ErrorCode::PlaybackDeviceError,
                std::format("Playback device {} does not exist ({} device(s) available)", index, playbackCount));

        return playbackDevices[index].id;
    }

} // namespace

AudioPlayback::AudioPlayback(): _impl(std::make_unique<Impl>())
{
}

AudioPlayback::~AudioPlayback()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioPlayback::initialize(unsigned sampleRate, unsigned channels, DeviceTarget target) -> VoidResult
{
    _impl->target = target;

    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackDeviceError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    auto deviceId = std::optional<ma_device_id> {};
    if (target.index)
    {
        auto found = findPlaybackDevice(_impl->context, *target.index);
        if (!found)
            return std::unexpected(found.error());
        deviceId = *found;
    }

    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = channels;
    config.sampleRate = sampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = _impl.get();
    if (deviceId)
        config.playback.pDeviceID = &*deviceId;

    auto const result = ma_device_init(&_impl->context, &config, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackDeviceError,
                         std::format("Failed to open playback device {}: {}",
                                     target.toString(),
                                     static_cast<int>(result)));

    _impl->initialized = true;
    log::debug("Playback device {} opened: {} ({}Hz, {} channel(s), f32)",
               target.toString(),
               _impl->device.playback.name,
               sampleRate,
               channels);
    return {};
}

auto AudioPlayback::play(std::span<const float> samples) -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::PlaybackDeviceError, "Playback device not initialized");

    if (samples.empty())
        return {};

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->buffer = samples;
        _impl->readPos = 0;
        _impl->drained = false;
        _impl->cancelled.store(false, std::memory_order_relaxed);
    }

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackDeviceError,
                         std::format("Failed to start playback on device {}: {}",
                                     _impl->target.toString(),
                                     static_cast<int>(startResult)));

    {
        auto lock = std::unique_lock(_impl->mutex);
        _impl->done.wait(
            lock, [this] { return _impl->drained || _impl->cancelled.load(std::memory_order_relaxed); });
    }

    ma_device_stop(&_impl->device);
    return {};
}

void AudioPlayback::stop()
{
    _impl->cancelled.store(true, std::memory_order_relaxed);
    _impl->done.notify_one();

    if (_impl->initialized)
        ma_device_stop(&_impl->device);
}

} // namespace textmic
