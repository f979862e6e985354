// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace textmic
{

/// @brief Encoding of raw little-endian PCM samples.
enum class SampleFormat : std::uint8_t
{
    UInt8,
    Int16,
    Int32,
    Float32,
};

/// @brief Returns the size of one sample in bytes.
[[nodiscard]] constexpr auto bytesPerSample(SampleFormat format) -> std::size_t
{
    switch (format)
    {
        case SampleFormat::UInt8: return 1;
        case SampleFormat::Int16: return 2;
        case SampleFormat::Int32: return 4;
        case SampleFormat::Float32: return 4;
    }
    return 1;
}

[[nodiscard]] constexpr auto sampleFormatName(SampleFormat format) -> std::string_view
{
    switch (format)
    {
        case SampleFormat::UInt8: return "uint8";
        case SampleFormat::Int16: return "int16";
        case SampleFormat::Int32: return "int32";
        case SampleFormat::Float32: return "float32";
    }
    return "unknown";
}

/// @brief Decoded audio in the canonical in-memory form.
///
/// Samples are interleaved float32 in [-1, 1]. A buffer is built once per synthesis call
/// and only read afterwards, so it may be shared by several playback threads at once.
struct AudioBuffer
{
    unsigned sampleRate = 0;
    unsigned channels = 1;
    std::vector<float> samples;

    [[nodiscard]] auto empty() const noexcept -> bool { return samples.empty(); }

    /// @brief Number of sample frames (samples per channel).
    [[nodiscard]] auto frameCount() const noexcept -> std::size_t
    {
        return channels == 0 ? 0 : samples.size() / channels;
    }

    /// @brief Playback duration in seconds.
    [[nodiscard]] auto durationSeconds() const noexcept -> double
    {
        return sampleRate == 0 ? 0.0 : static_cast<double>(frameCount()) / sampleRate;
    }
};

/// @brief Converts raw PCM bytes into a float AudioBuffer.
///
/// uint8 is shifted by 128 and scaled by 1/128, int16 by 1/32768, int32 by 1/2147483648.
/// float32 passes through unchanged. Trailing bytes that do not form a whole sample are
/// ignored; input shorter than one sample yields an empty buffer.
/// @param raw Little-endian sample bytes, interleaved if multi-channel.
/// @param format Encoding of @p raw.
/// @param sampleRate Sample rate in Hz.
/// @param channels Channel count.
[[nodiscard]] auto normalize(std::span<const std::byte> raw,
                             SampleFormat format,
                             unsigned sampleRate,
                             unsigned channels = 1) -> AudioBuffer;

/// @brief Decodes a RIFF/WAVE container holding PCM or IEEE float samples.
/// @param bytes The complete file contents.
/// @return The normalized buffer, or an AudioError for malformed or unsupported data.
[[nodiscard]] auto decodeWav(std::span<const std::byte> bytes) -> Result<AudioBuffer>;

/// @brief Returns true if @p bytes start with a RIFF/WAVE signature.
[[nodiscard]] auto isWav(std::span<const std::byte> bytes) -> bool;

/// @brief Expands a mono buffer to two identical channels. Other buffers are returned as-is.
[[nodiscard]] auto toStereo(const AudioBuffer& buffer) -> AudioBuffer;

/// @brief Resamples mono audio by linear interpolation.
[[nodiscard]] auto resampleLinear(std::span<const float> samples, unsigned fromRate, unsigned toRate)
    -> std::vector<float>;

} // namespace textmic
