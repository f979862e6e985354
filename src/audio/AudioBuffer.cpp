// SPDX-License-Identifier: Apache-2.0
#include "AudioBuffer.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <format>
#include <optional>

namespace textmic
{

namespace
{

    constexpr auto WaveFormatPcm = std::uint16_t { 0x0001 };
    constexpr auto WaveFormatIeeeFloat = std::uint16_t { 0x0003 };
    constexpr auto WaveFormatExtensible = std::uint16_t { 0xFFFE };

    /// @brief Streaming encoders write this in place of the unknown data size.
    constexpr auto WaveUnknownSize = std::uint32_t { 0xFFFFFFFF };

    auto readU16(std::span<const std::byte> bytes, std::size_t offset) -> std::uint16_t
    {
        return static_cast<std::uint16_t>(std::to_integer<unsigned>(bytes[offset])
                                          | (std::to_integer<unsigned>(bytes[offset + 1]) << 8));
    }

    auto readU32(std::span<const std::byte> bytes, std::size_t offset) -> std::uint32_t
    {
        return std::to_integer<std::uint32_t>(bytes[offset])
               | (std::to_integer<std::uint32_t>(bytes[offset + 1]) << 8)
               | (std::to_integer<std::uint32_t>(bytes[offset + 2]) << 16)
               | (std::to_integer<std::uint32_t>(bytes[offset + 3]) << 24);
    }

    auto hasTag(std::span<const std::byte> bytes, std::size_t offset, std::string_view tag) -> bool
    {
        if (offset + tag.size() > bytes.size())
            return false;
        for (auto i = std::size_t { 0 }; i < tag.size(); ++i)
            if (std::to_integer<char>(bytes[offset + i]) != tag[i])
                return false;
        return true;
    }

    auto convertSample(std::span<const std::byte> bytes, std::size_t offset, SampleFormat format) -> float
    {
        switch (format)
        {
            case SampleFormat::UInt8:
                return (static_cast<float>(std::to_integer<unsigned>(bytes[offset])) - 128.0f) / 128.0f;
            case SampleFormat::Int16:
                return static_cast<float>(static_cast<std::int16_t>(readU16(bytes, offset))) / 32768.0f;
            case SampleFormat::Int32:
                return static_cast<float>(static_cast<double>(static_cast<std::int32_t>(readU32(bytes, offset)))
                                          / 2147483648.0);
            case SampleFormat::Float32: return std::bit_cast<float>(readU32(bytes, offset));
        }
        return 0.0f;
    }

    auto formatFromWave(std::uint16_t tag, std::uint16_t bitsPerSample) -> std::optional<SampleFormat>
    {
        if (tag == WaveFormatPcm)
        {
            switch (bitsPerSample)
            {
                case 8: return SampleFormat::UInt8;
                case 16: return SampleFormat::Int16;
                case 32: return SampleFormat::Int32;
                default: return std::nullopt;
            }
        }
        if (tag == WaveFormatIeeeFloat && bitsPerSample == 32)
            return SampleFormat::Float32;
        return std::nullopt;
    }

} // namespace

auto normalize(std::span<const std::byte> raw, SampleFormat format, unsigned sampleRate, unsigned channels)
    -> AudioBuffer
{
    auto buffer = AudioBuffer { .sampleRate = sampleRate, .channels = channels, .samples = {} };

    auto const width = bytesPerSample(format);
    auto const count = raw.size() / width;
    buffer.samples.reserve(count);

    for (auto i = std::size_t { 0 }; i < count; ++i)
        buffer.samples.push_back(convertSample(raw, i * width, format));

    return buffer;
}

auto isWav(std::span<const std::byte> bytes) -> bool
{
    return hasTag(bytes, 0, "RIFF") && hasTag(bytes, 8, "WAVE");
}

auto decodeWav(std::span<const std::byte> bytes) -> Result<AudioBuffer>
{
    if (bytes.size() < 12 || !isWav(bytes))
        return makeError(ErrorCode::AudioError, "Not a RIFF/WAVE container");

    auto format = std::optional<SampleFormat> {};
    auto channels = 0u;
    auto sampleRate = 0u;
    auto data = std::optional<std::span<const std::byte>> {};

    auto offset = std::size_t { 12 };
    while (offset + 8 <= bytes.size() && !data)
    {
        auto const chunkSize = readU32(bytes, offset + 4);
        auto const bodyOffset = offset + 8;
        auto const available = bytes.size() - bodyOffset;

        if (hasTag(bytes, offset, "fmt "))
        {
            if (chunkSize < 16 || available < 16)
                return makeError(ErrorCode::AudioError, "Truncated WAV fmt chunk");

            auto tag = readU16(bytes, bodyOffset);
            channels = readU16(bytes, bodyOffset + 2);
            sampleRate = readU32(bytes, bodyOffset + 4);
            auto const bitsPerSample = readU16(bytes, bodyOffset + 14);

            // WAVE_FORMAT_EXTENSIBLE carries the real format tag in its sub-format GUID.
            if (tag == WaveFormatExtensible && chunkSize >= 26 && available >= 26)
                tag = readU16(bytes, bodyOffset + 24);

            format = formatFromWave(tag, bitsPerSample);
            if (!format)
                return makeError(
                    ErrorCode::AudioError,
                    std::format("Unsupported WAV encoding (format tag {}, {} bits)", tag, bitsPerSample));
        }
        else if (hasTag(bytes, offset, "data"))
        {
            auto const size = chunkSize == WaveUnknownSize
                                  ? available
                                  : std::min<std::size_t>(chunkSize, available);
            data = bytes.subspan(bodyOffset, size);
            break;
        }

        if (chunkSize > available)
            break;

        // Chunks are word aligned.
        offset = bodyOffset + chunkSize + (chunkSize & 1u);
    }

    if (!format)
        return makeError(ErrorCode::AudioError, "WAV data has no fmt chunk");
    if (!data)
        return makeError(ErrorCode::AudioError, "WAV data has no data chunk");
    if (channels == 0 || sampleRate == 0)
        return makeError(ErrorCode::AudioError,
                         std::format("Invalid WAV header ({} channel(s), {} Hz)", channels, sampleRate));

    return normalize(*data, *format, sampleRate, channels);
}

auto toStereo(const AudioBuffer& buffer) -> AudioBuffer
{
    if (buffer.channels != 1)
        return buffer;

    auto stereo = AudioBuffer { .sampleRate = buffer.sampleRate, .channels = 2, .samples = {} };
    stereo.samples.reserve(buffer.samples.size() * 2);
    for (auto const sample: buffer.samples)
    {
        stereo.samples.push_back(sample);
        stereo.samples.push_back(sample);
    }
    return stereo;
}

auto resampleLinear(std::span<const float> samples, unsigned fromRate, unsigned toRate) -> std::vector<float>
{
    if (fromRate == toRate || fromRate == 0 || toRate == 0 || samples.empty())
        return { samples.begin(), samples.end() };

    auto const ratio = static_cast<double>(fromRate) / toRate;
    auto const outCount = static_cast<std::size_t>(std::floor(static_cast<double>(samples.size()) / ratio));

    auto out = std::vector<float> {};
    out.reserve(outCount);
    for (auto i = std::size_t { 0 }; i < outCount; ++i)
    {
        auto const position = static_cast<double>(i) * ratio;
        auto const index = static_cast<std::size_t>(position);
        auto const next = std::min(index + 1, samples.size() - 1);
        auto const frac = static_cast<float>(position - static_cast<double>(index));
        out.push_back(samples[index] + (samples[next] - samples[index]) * frac);
    }
    return out;
}

} // namespace textmic
