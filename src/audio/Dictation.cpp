// SPDX-License-Identifier: Apache-2.0
#include "Dictation.hpp"

#include <audio/AudioBuffer.hpp>
#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <format>
#include <mutex>
#include <vector>

namespace textmic
{

namespace
{

    /// @brief Extra time allowed for the capture device to deliver the requested samples.
    constexpr auto CaptureGrace = std::chrono::seconds(2);

    constexpr auto SilencePeak = 0.001f;

    auto asTranscriptionError(Error error) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::TranscriptionError, std::move(error.message));
    }

} // namespace

auto validateRecordingRequest(double durationSeconds, unsigned sampleRate) -> VoidResult
{
    if (!std::isfinite(durationSeconds) || durationSeconds <= 0.0 || sampleRate == 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Invalid recording request ({}s at {}Hz)", durationSeconds, sampleRate));

    if (durationSeconds > MaxRecordingSeconds)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Recording of {}s exceeds the {}s limit", durationSeconds, MaxRecordingSeconds));

    return {};
}

auto Dictation::initialize(const DictationConfig& config) -> VoidResult
{
    _config = config;
    return _transcriber.initialize(config.transcriber);
}

auto Dictation::recordAndTranscribe(double durationSeconds, unsigned sampleRate) -> Result<std::string>
{
    if (auto valid = validateRecordingRequest(durationSeconds, sampleRate); !valid)
        return std::unexpected(std::move(valid.error()));

    if (!_transcriber.isLoaded())
        return makeError(ErrorCode::TranscriptionError, "Speech-to-text is unavailable: no whisper model loaded");

    auto const wanted = static_cast<std::size_t>(std::llround(durationSeconds * sampleRate));

    auto recording = std::vector<float> {};
    recording.reserve(wanted);
    auto mutex = std::mutex {};
    auto full = std::condition_variable {};

    auto capture = AudioCapture {};
    auto initResult = capture.initialize(
        [&](std::span<const float> samples) {
            auto lock = std::lock_guard(mutex);
            auto const take = std::min(samples.size(), wanted - recording.size());
            recording.insert(recording.end(), samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(take));
            if (recording.size() >= wanted)
                full.notify_one();
        },
        sampleRate,
        _config.captureDevice);
    if (!initResult)
        return asTranscriptionError(std::move(initResult.error()));

    log::info("Recording {:.1f}s...", durationSeconds);
    if (auto startResult = capture.start(); !startResult)
        return asTranscriptionError(std::move(startResult.error()));

    auto const deadline = std::chrono::duration<double>(durationSeconds) + CaptureGrace;
    {
        auto lock = std::unique_lock(mutex);
        full.wait_for(lock, deadline, [&] { return recording.size() >= wanted; });
    }
    capture.stop();

    auto samples = std::vector<float> {};
    {
        auto lock = std::lock_guard(mutex);
        samples = std::move(recording);
    }

    if (samples.size() < wanted)
        log::warning("Capture delivered {} of {} samples", samples.size(), wanted);

    auto peak = 0.0f;
    for (auto const sample: samples)
        peak = std::max(peak, std::abs(sample));
    if (peak < SilencePeak)
        log::warning("Recording is silent, check the capture device");

    log::info("Transcribing...");
    auto text = _transcriber.transcribe(resampleLinear(samples, sampleRate, WhisperSampleRate));
    if (!text)
        return asTranscriptionError(std::move(text.error()));

    log::debug("Transcription: {}", *text);
    return text;
}

} // namespace textmic
