// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace textmic
{

/// @brief Identifies an output device by its enumeration index.
///
/// An empty index is the "default" sentinel: the system default playback device.
struct DeviceTarget
{
    std::optional<int> index;

    [[nodiscard]] auto isDefault() const noexcept -> bool { return !index.has_value(); }

    /// @brief Returns "default" or the numeric index, for log messages.
    [[nodiscard]] auto toString() const -> std::string
    {
        return index ? std::to_string(*index) : std::string("default");
    }

    auto operator==(const DeviceTarget&) const -> bool = default;
};

/// @brief A playback device as reported by the audio backend.
struct DeviceInfo
{
    int index = 0;
    std::string name;
    bool isDefault = false;
};

/// @brief Enumerates the playback devices of the system audio backend.
/// @return The devices in enumeration order (the index used by DeviceTarget), or an AudioError.
[[nodiscard]] auto listPlaybackDevices() -> Result<std::vector<DeviceInfo>>;

} // namespace textmic
