// SPDX-License-Identifier: Apache-2.0
#include "AudioDevices.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <format>

namespace textmic
{

auto listPlaybackDevices() -> Result<std::vector<DeviceInfo>>
{
    auto context = ma_context {};
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));

    ma_device_info* playbackDevices = nullptr;
    auto playbackCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&context, &playbackDevices, &playbackCount, nullptr, nullptr);
    if (enumResult != MA_SUCCESS)
    {
        ma_context_uninit(&context);
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to enumerate playback devices: {}", static_cast<int>(enumResult)));
    }

    auto devices = std::vector<DeviceInfo> {};
    devices.reserve(playbackCount);
    for (auto i = ma_uint32 { 0 }; i < playbackCount; ++i)
    {
        devices.push_back(DeviceInfo {
            .index = static_cast<int>(i),
            .name = playbackDevices[i].name,
            .isDefault = playbackDevices[i].isDefault != 0,
        });
    }

    ma_context_uninit(&context);
    log::debug("Enumerated {} playback device(s)", devices.size());
    return devices;
}

} // namespace textmic
