// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>
#include <core/Strings.hpp>

#include <miniaudio.h>

#include <format>
#include <optional>
#include <string>

namespace textmic
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    AudioCallback callback;
    bool contextInitialized = false;
    bool capturing = false;
    bool initialized = false;
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (impl && impl->callback && input)
            impl->callback(std::span<const float>(static_cast<const float*>(input), frameCount));
    }

    /// @brief Picks a capture device by name filter, else the first non-monitor source.
    auto selectCaptureDevice(std::span<const ma_device_info> devices, std::string_view deviceName)
        -> std::optional<ma_device_id>
    {
        if (!deviceName.empty())
        {
            for (auto const& info: devices)
            {
                if (containsIgnoreCase(info.name, deviceName))
                {
                    log::info("Matched capture device '{}' for filter '{}'", info.name, deviceName);
                    return info.id;
                }
            }
            log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        // Monitors are loopback sources, not microphones
        for (auto const& info: devices)
        {
            if (!toLower(info.name).starts_with("monitor"))
            {
                log::debug("Auto-selected capture device '{}'", info.name);
                return info.id;
            }
        }
        return std::nullopt;
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize(AudioCallback callback, unsigned sampleRate, std::string_view deviceName)
    -> VoidResult
{
    _impl->callback = std::move(callback);

    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&_impl->context, nullptr, nullptr, &captureDevices, &captureCount);

    auto deviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
        deviceId = selectCaptureDevice(std::span<const ma_device_info>(captureDevices, captureCount), deviceName);
    else
        log::warning("Failed to enumerate capture devices (code: {}), using default", static_cast<int>(enumResult));

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = sampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();
    if (deviceId)
        deviceConfig.capture.pDeviceID = &*deviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize capture device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    log::debug("Audio capture initialized: {} ({}Hz, mono, float32)", _impl->device.capture.name, sampleRate);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Audio device not initialized");

    if (_impl->capturing)
        return {};

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));

    _impl->capturing = true;
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing)
        return;

    ma_device_stop(&_impl->device);
    _impl->capturing = false;
}

} // namespace textmic
