// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Transcriber.hpp>
#include <core/Error.hpp>

#include <string>

namespace textmic
{

/// @brief Longest recording a single dictation may request.
inline constexpr auto MaxRecordingSeconds = 300.0;

/// @brief Checks that a recording of @p durationSeconds at @p sampleRate is possible.
/// @return A TranscriptionError for non-finite, non-positive or overly long durations,
///         or a zero sample rate.
[[nodiscard]] auto validateRecordingRequest(double durationSeconds, unsigned sampleRate) -> VoidResult;

/// @brief Records speech from a microphone and returns it as text.
class SpeechToText
{
  public:
    virtual ~SpeechToText() = default;

    /// @brief Records for @p durationSeconds at @p sampleRate, then transcribes. Blocking.
    /// @return The transcribed text (possibly empty) or a TranscriptionError.
    [[nodiscard]] virtual auto recordAndTranscribe(double durationSeconds, unsigned sampleRate)
        -> Result<std::string> = 0;
};

/// @brief Configuration for microphone dictation.
struct DictationConfig
{
    TranscriberConfig transcriber;

    /// @brief Capture device name filter; empty selects automatically.
    std::string captureDevice;
};

/// @brief SpeechToText backed by miniaudio capture and whisper.cpp.
class Dictation final: public SpeechToText
{
  public:
    /// @brief Loads the whisper model.
    [[nodiscard]] auto initialize(const DictationConfig& config) -> VoidResult;

    [[nodiscard]] auto recordAndTranscribe(double durationSeconds, unsigned sampleRate)
        -> Result<std::string> override;

  private:
    DictationConfig _config;
    Transcriber _transcriber;
};

} // namespace textmic
